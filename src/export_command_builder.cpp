//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: export_command_builder.cpp
// Description: Implementation of the EXPORT DATA statement builder.
//===----------------------------------------------------------------------===//

#include "export_command_builder.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace lookml_lineage {

using duckdb::StringUtil;

std::string RenderExportStatement(const std::string &bucket, const std::string &project, const std::string &dataset,
                                  const std::string &table) {
	std::string short_table = table;
	short_table.erase(std::remove(short_table.begin(), short_table.end(), '*'), short_table.end());

	std::string sql;
	sql += "BEGIN\n";
	sql += "EXPORT DATA\n";
	sql += "  OPTIONS (\n";
	sql += "    uri = 'gs://" + bucket + "/" + project + "/" + dataset + "/" + short_table + "/*.parquet',\n";
	sql += "    format = 'PARQUET',\n";
	sql += "    compression = \"SNAPPY\",\n";
	sql += "    overwrite = true)\n";
	sql += "AS (\n";
	sql += "  SELECT *\n";
	sql += "  FROM `" + project + "." + dataset + "." + short_table + "`\n";
	sql += ");\n";
	sql += "EXCEPTION WHEN ERROR THEN\n";
	sql += "SELECT 1; -- Skip if table does not exist or other issues\n";
	sql += "END;\n";
	return sql;
}

/// Remove surrounding whitespace, '#' and line breaks from a table reference
static std::string CleanTableName(const std::string &table) {
	std::string cleaned;
	for (char c : table) {
		if (c == '#' || c == '\n' || c == '\r') {
			continue;
		}
		cleaned += c;
	}
	StringUtil::Trim(cleaned);
	return cleaned;
}

std::vector<ExportCommand> BuildExportCommands(const LineageModel &model, const std::string &bucket,
                                               const LineageConfig &config) {
	if (bucket.empty()) {
		throw std::invalid_argument("Export bucket name must not be empty");
	}

	std::vector<ExportCommand> commands;
	std::unordered_set<std::string> processed;

	for (const ViewRecord *view : model.ReportOrder()) {
		if (view->citation_type == CitationType::UNNEST || view->citation_type == CitationType::DERIVED_EXPLORE ||
		    model.unnest_views.count(view->name) > 0) {
			continue;
		}

		std::vector<std::string> tables;
		if (!view->primary_table.empty()) {
			tables.push_back(view->primary_table);
		}
		tables.insert(tables.end(), view->additional_tables.begin(), view->additional_tables.end());

		for (const auto &raw : tables) {
			std::string table = CleanTableName(raw);
			if (table.empty()) {
				continue;
			}
			auto parts = StringUtil::Split(table, '.');
			if (parts.size() == 1) {
				table = config.QualifyDefault(parts[0]);
				parts = StringUtil::Split(table, '.');
			}
			// 2-part names (e.g. foreign system schemas) have no project to export from
			if (parts.size() != 3 || processed.count(table) > 0) {
				continue;
			}
			processed.insert(table);

			const std::string &project = parts[0];
			std::string source_project = StringUtil::Contains(StringUtil::Lower(project), "snapshot")
			                                 ? config.snapshot_project
			                                 : config.default_project;

			ExportCommand command;
			command.view_name = view->name;
			command.table_name = table;
			command.export_sql = RenderExportStatement(bucket, source_project, parts[1], parts[2]);
			command.active = view->explore_count > 0;
			commands.push_back(std::move(command));
		}
	}
	return commands;
}

} // namespace lookml_lineage
