//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_table_functions.cpp
// Description: Bind, init and scan callbacks of the LookML table functions.
//              The project is analyzed once per call during global init and
//              the resulting rows are streamed out in vector-sized chunks.
//===----------------------------------------------------------------------===//

#include "lookml_table_functions.hpp"
#include "export_command_builder.hpp"
#include "lineage_analyzer.hpp"
#include "lineage_client.hpp"
#include "view_lineage_emitter.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <stdexcept>

namespace lookml_lineage {

using namespace duckdb;

//===--------------------------------------------------------------------===//
// Configuration
//===--------------------------------------------------------------------===//

static void ReadStringSetting(ClientContext &context, const char *name, std::string &target) {
	Value value;
	if (context.TryGetCurrentSetting(name, value) && !value.IsNull()) {
		target = value.GetValue<string>();
	}
}

static size_t CheckThreadCount(int64_t threads) {
	if (threads < 1) {
		throw InvalidInputException("lookml_lineage: threads must be at least 1, got %s", std::to_string(threads));
	}
	return static_cast<size_t>(threads);
}

LineageConfig ReadLineageConfig(ClientContext &context, const named_parameter_map_t &named_parameters) {
	LineageConfig config;
	ReadStringSetting(context, SETTING_DEFAULT_PROJECT, config.default_project);
	ReadStringSetting(context, SETTING_DEFAULT_DATASET, config.default_dataset);
	ReadStringSetting(context, SETTING_SNAPSHOT_PROJECT, config.snapshot_project);
	ReadStringSetting(context, SETTING_SNAPSHOT_DATASET, config.snapshot_dataset);

	Value value;
	if (context.TryGetCurrentSetting(SETTING_THREADS, value) && !value.IsNull()) {
		config.threads = CheckThreadCount(value.GetValue<int64_t>());
	}
	if (context.TryGetCurrentSetting(SETTING_DEBUG, value) && !value.IsNull()) {
		config.debug = value.GetValue<bool>();
	}

	// Named parameters override the settings for this call only
	for (const auto &entry : named_parameters) {
		if (entry.second.IsNull()) {
			continue;
		}
		if (entry.first == "default_project") {
			config.default_project = entry.second.GetValue<string>();
		} else if (entry.first == "default_dataset") {
			config.default_dataset = entry.second.GetValue<string>();
		} else if (entry.first == "snapshot_project") {
			config.snapshot_project = entry.second.GetValue<string>();
		} else if (entry.first == "snapshot_dataset") {
			config.snapshot_dataset = entry.second.GetValue<string>();
		} else if (entry.first == "threads") {
			config.threads = CheckThreadCount(entry.second.GetValue<int64_t>());
		}
	}
	return config;
}

//===--------------------------------------------------------------------===//
// Bind Data and State
//===--------------------------------------------------------------------===//

enum class LookmlFunctionKind : uint8_t { VIEWS, EXPLORES, EXPLORE_VIEWS, ALIASES, SCAN_WARNINGS, EXPORT_COMMANDS, EMIT };

struct LookmlBindData : public TableFunctionData {
	LookmlFunctionKind kind;
	std::string root;
	std::string bucket;
	LineageConfig config;
};

/// @brief Materialized result rows of one call.
struct LookmlScanState : public GlobalTableFunctionState {
	std::vector<std::vector<Value>> rows;
	idx_t offset = 0;
};

static Value OptionalString(const std::string &str) {
	return str.empty() ? Value(LogicalType::VARCHAR) : Value(str);
}

static Value StringList(const std::vector<std::string> &items) {
	duckdb::vector<Value> values;
	for (const auto &item : items) {
		values.emplace_back(item);
	}
	return Value::LIST(LogicalType::VARCHAR, std::move(values));
}

//===--------------------------------------------------------------------===//
// Bind
//===--------------------------------------------------------------------===//

static unique_ptr<LookmlBindData> BindProject(ClientContext &context, TableFunctionBindInput &input,
                                              LookmlFunctionKind kind) {
	auto result = make_uniq<LookmlBindData>();
	result->kind = kind;
	if (input.inputs[0].IsNull()) {
		throw BinderException("lookml_lineage: project root must not be NULL");
	}
	result->root = input.inputs[0].GetValue<string>();
	result->config = ReadLineageConfig(context, input.named_parameters);

	auto &fs = FileSystem::GetFileSystem(context);
	if (result->root.empty() || !fs.DirectoryExists(result->root)) {
		throw InvalidInputException("lookml_lineage: project root '%s' does not exist or is not a directory",
		                            result->root);
	}
	return result;
}

static void AddColumn(vector<LogicalType> &return_types, vector<string> &names, const char *name,
                      const LogicalType &type) {
	names.emplace_back(name);
	return_types.push_back(type);
}

static unique_ptr<FunctionData> ViewsBind(ClientContext &context, TableFunctionBindInput &input,
                                          vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "view_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "citation_type", LogicalType::VARCHAR);
	AddColumn(return_types, names, "primary_table", LogicalType::VARCHAR);
	AddColumn(return_types, names, "additional_tables", LogicalType::LIST(LogicalType::VARCHAR));
	AddColumn(return_types, names, "derived_from", LogicalType::VARCHAR);
	AddColumn(return_types, names, "source_type", LogicalType::VARCHAR);
	AddColumn(return_types, names, "source_definition", LogicalType::VARCHAR);
	AddColumn(return_types, names, "source_file", LogicalType::VARCHAR);
	AddColumn(return_types, names, "explore_count", LogicalType::BIGINT);
	return BindProject(context, input, LookmlFunctionKind::VIEWS);
}

static unique_ptr<FunctionData> ExploresBind(ClientContext &context, TableFunctionBindInput &input,
                                             vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "explore_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "model_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "base_view", LogicalType::VARCHAR);
	AddColumn(return_types, names, "joined_views", LogicalType::LIST(LogicalType::VARCHAR));
	AddColumn(return_types, names, "source_file", LogicalType::VARCHAR);
	return BindProject(context, input, LookmlFunctionKind::EXPLORES);
}

static unique_ptr<FunctionData> ExploreViewsBind(ClientContext &context, TableFunctionBindInput &input,
                                                 vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "explore_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "model_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "view_name", LogicalType::VARCHAR);
	return BindProject(context, input, LookmlFunctionKind::EXPLORE_VIEWS);
}

static unique_ptr<FunctionData> AliasesBind(ClientContext &context, TableFunctionBindInput &input,
                                            vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "alias_view", LogicalType::VARCHAR);
	AddColumn(return_types, names, "base_view", LogicalType::VARCHAR);
	return BindProject(context, input, LookmlFunctionKind::ALIASES);
}

static unique_ptr<FunctionData> ScanWarningsBind(ClientContext &context, TableFunctionBindInput &input,
                                                 vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "kind", LogicalType::VARCHAR);
	AddColumn(return_types, names, "path", LogicalType::VARCHAR);
	AddColumn(return_types, names, "subject", LogicalType::VARCHAR);
	AddColumn(return_types, names, "message", LogicalType::VARCHAR);
	return BindProject(context, input, LookmlFunctionKind::SCAN_WARNINGS);
}

static unique_ptr<FunctionData> ExportCommandsBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "view_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "table_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "export_sql", LogicalType::VARCHAR);
	AddColumn(return_types, names, "active", LogicalType::BOOLEAN);

	auto result = BindProject(context, input, LookmlFunctionKind::EXPORT_COMMANDS);
	if (input.inputs[1].IsNull() || input.inputs[1].GetValue<string>().empty()) {
		throw InvalidInputException("lookml_export_commands: bucket name must not be empty");
	}
	result->bucket = input.inputs[1].GetValue<string>();
	return std::move(result);
}

static unique_ptr<FunctionData> EmitBind(ClientContext &context, TableFunctionBindInput &input,
                                         vector<LogicalType> &return_types, vector<string> &names) {
	AddColumn(return_types, names, "view_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "job_name", LogicalType::VARCHAR);
	AddColumn(return_types, names, "run_id", LogicalType::VARCHAR);
	AddColumn(return_types, names, "input_count", LogicalType::BIGINT);
	return BindProject(context, input, LookmlFunctionKind::EMIT);
}

//===--------------------------------------------------------------------===//
// Row Producers
//===--------------------------------------------------------------------===//

static void ProduceViewRows(const LineageModel &model, std::vector<std::vector<Value>> &rows) {
	for (const auto &view : model.views.Views()) {
		rows.push_back({Value(view.name), Value(CitationTypeToString(view.citation_type)),
		                OptionalString(view.primary_table), StringList(view.additional_tables),
		                OptionalString(view.derived_from), Value(SourceKindToString(view.source.kind)),
		                OptionalString(view.source.text), OptionalString(view.source_file),
		                Value::BIGINT(static_cast<int64_t>(view.explore_count))});
	}
}

static void ProduceExploreRows(const LineageModel &model, std::vector<std::vector<Value>> &rows) {
	for (const auto &explore : model.explores) {
		rows.push_back({Value(explore.name), Value(explore.model_name), Value(explore.base_view),
		                StringList(explore.joined_views), OptionalString(explore.source_file)});
	}
}

static void ProduceExploreViewRows(const LineageModel &model, std::vector<std::vector<Value>> &rows) {
	for (const auto &explore : model.explores) {
		for (const auto &view : explore.ViewSet()) {
			rows.push_back({Value(explore.name), Value(explore.model_name), Value(view)});
		}
	}
}

static void ProduceAliasRows(const LineageModel &model, std::vector<std::vector<Value>> &rows) {
	for (const auto &alias : model.aliases) {
		rows.push_back({Value(alias.alias_view), Value(alias.base_view)});
	}
}

static void ProduceWarningRows(const LineageModel &model, std::vector<std::vector<Value>> &rows) {
	for (const auto &warning : model.warnings) {
		rows.push_back({Value(ScanWarningKindToString(warning.kind)), OptionalString(warning.path),
		                OptionalString(warning.subject), Value(warning.message)});
	}
}

static void ProduceExportRows(const LineageModel &model, const LookmlBindData &bind_data,
                              std::vector<std::vector<Value>> &rows) {
	std::vector<ExportCommand> commands;
	try {
		commands = BuildExportCommands(model, bind_data.bucket, bind_data.config);
	} catch (const std::invalid_argument &ex) {
		throw InvalidInputException("lookml_export_commands: %s", std::string(ex.what()));
	}
	for (const auto &command : commands) {
		rows.push_back({Value(command.view_name), Value(command.table_name), Value(command.export_sql),
		                Value::BOOLEAN(command.active)});
	}
}

static void ProduceEmitRows(const LineageModel &model, const LookmlBindData &bind_data,
                            std::vector<std::vector<Value>> &rows) {
	auto &client = LineageClient::Get();

	EmitterOptions options;
	options.job_namespace = client.GetNamespace();
	options.debug = bind_data.config.debug;
	options.LoadParentFromEnvironment();

	ViewLineageEmitter emitter(std::move(options));
	for (const auto &event : emitter.Emit(model, client)) {
		rows.push_back({Value(event.view_name), Value(event.job_name), Value(event.run_id),
		                Value::BIGINT(static_cast<int64_t>(event.input_count))});
	}
}

//===--------------------------------------------------------------------===//
// Init and Scan
//===--------------------------------------------------------------------===//

static unique_ptr<GlobalTableFunctionState> LookmlInit(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<LookmlBindData>();
	auto state = make_uniq<LookmlScanState>();

	auto &fs = FileSystem::GetFileSystem(context);
	LineageModel model = AnalyzeProject(fs, bind_data.root, bind_data.config);

	switch (bind_data.kind) {
	case LookmlFunctionKind::VIEWS:
		ProduceViewRows(model, state->rows);
		break;
	case LookmlFunctionKind::EXPLORES:
		ProduceExploreRows(model, state->rows);
		break;
	case LookmlFunctionKind::EXPLORE_VIEWS:
		ProduceExploreViewRows(model, state->rows);
		break;
	case LookmlFunctionKind::ALIASES:
		ProduceAliasRows(model, state->rows);
		break;
	case LookmlFunctionKind::SCAN_WARNINGS:
		ProduceWarningRows(model, state->rows);
		break;
	case LookmlFunctionKind::EXPORT_COMMANDS:
		ProduceExportRows(model, bind_data, state->rows);
		break;
	case LookmlFunctionKind::EMIT:
		ProduceEmitRows(model, bind_data, state->rows);
		break;
	}
	return std::move(state);
}

static void LookmlScan(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<LookmlScanState>();

	idx_t count = 0;
	while (state.offset < state.rows.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &row = state.rows[state.offset];
		for (idx_t col = 0; col < row.size(); col++) {
			output.SetValue(col, count, row[col]);
		}
		state.offset++;
		count++;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//

static TableFunction MakeProjectFunction(const std::string &name, table_function_bind_t bind,
                                         bool with_bucket = false) {
	vector<LogicalType> arguments {LogicalType::VARCHAR};
	if (with_bucket) {
		arguments.push_back(LogicalType::VARCHAR);
	}
	TableFunction function(name, arguments, LookmlScan, bind, LookmlInit);
	function.named_parameters["default_project"] = LogicalType::VARCHAR;
	function.named_parameters["default_dataset"] = LogicalType::VARCHAR;
	function.named_parameters["snapshot_project"] = LogicalType::VARCHAR;
	function.named_parameters["snapshot_dataset"] = LogicalType::VARCHAR;
	function.named_parameters["threads"] = LogicalType::BIGINT;
	return function;
}

void RegisterLookmlTableFunctions(ExtensionLoader &loader) {
	loader.RegisterFunction(MakeProjectFunction("lookml_views", ViewsBind));
	loader.RegisterFunction(MakeProjectFunction("lookml_explores", ExploresBind));
	loader.RegisterFunction(MakeProjectFunction("lookml_explore_views", ExploreViewsBind));
	loader.RegisterFunction(MakeProjectFunction("lookml_aliases", AliasesBind));
	loader.RegisterFunction(MakeProjectFunction("lookml_scan_warnings", ScanWarningsBind));
	loader.RegisterFunction(MakeProjectFunction("lookml_export_commands", ExportCommandsBind, true));
	loader.RegisterFunction(MakeProjectFunction("lookml_lineage_emit", EmitBind));
}

} // namespace lookml_lineage
