//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_lineage_extension.cpp
// Description: Main extension entry point and registration logic.
//===----------------------------------------------------------------------===//

#define DUCKDB_EXTENSION_MAIN

#include "lookml_lineage_extension.hpp"
#include "lineage_client.hpp"
#include "lineage_config.hpp"
#include "lookml_table_functions.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/database.hpp"

namespace lookml_lineage {

using namespace duckdb;

//===--------------------------------------------------------------------===//
// Configuration Setters
//===--------------------------------------------------------------------===//
// Transport settings are pushed into the LineageClient singleton when set.
// Analysis settings are read per call by ReadLineageConfig.

static void SetLineageUrl(ClientContext &context, SetScope scope, Value &parameter) {
	LineageClient::Get().SetUrl(parameter.GetValue<string>());
}

static void SetLineageApiKey(ClientContext &context, SetScope scope, Value &parameter) {
	LineageClient::Get().SetApiKey(parameter.GetValue<string>());
}

static void SetLineageNamespace(ClientContext &context, SetScope scope, Value &parameter) {
	LineageClient::Get().SetNamespace(parameter.GetValue<string>());
}

/// @brief Debug applies to both the scan diagnostics and the HTTP client.
static void SetLineageDebug(ClientContext &context, SetScope scope, Value &parameter) {
	LineageClient::Get().SetDebug(parameter.GetValue<bool>());
}

static void SetLineageMaxRetries(ClientContext &context, SetScope scope, Value &parameter) {
	auto retries = parameter.GetValue<int64_t>();
	if (retries < 0) {
		throw InvalidInputException("lookml_lineage_max_retries must not be negative");
	}
	LineageClient::Get().SetMaxRetries(static_cast<size_t>(retries));
}

static void SetLineageMaxQueueSize(ClientContext &context, SetScope scope, Value &parameter) {
	auto size = parameter.GetValue<int64_t>();
	if (size < 0) {
		throw InvalidInputException("lookml_lineage_max_queue_size must not be negative");
	}
	LineageClient::Get().SetMaxQueueSize(static_cast<size_t>(size));
}

static void SetLineageTimeout(ClientContext &context, SetScope scope, Value &parameter) {
	LineageClient::Get().SetTimeout(parameter.GetValue<int64_t>());
}

static void CheckLineageThreads(ClientContext &context, SetScope scope, Value &parameter) {
	if (parameter.GetValue<int64_t>() < 1) {
		throw InvalidInputException("lookml_lineage_threads must be at least 1");
	}
}

//===--------------------------------------------------------------------===//
// Extension Loading
//===--------------------------------------------------------------------===//

static void LoadInternal(ExtensionLoader &loader) {
	auto &config = loader.GetDatabaseInstance().config;
	LineageConfig defaults;

	// Table-name inference
	config.AddExtensionOption(SETTING_DEFAULT_PROJECT, "Project used to qualify inferred table names",
	                          LogicalType::VARCHAR, Value(defaults.default_project));
	config.AddExtensionOption(SETTING_DEFAULT_DATASET, "Dataset used to qualify inferred table names",
	                          LogicalType::VARCHAR, Value(defaults.default_dataset));
	config.AddExtensionOption(SETTING_SNAPSHOT_PROJECT, "Project used for *_snapshot views and snapshot exports",
	                          LogicalType::VARCHAR, Value(defaults.snapshot_project));
	config.AddExtensionOption(SETTING_SNAPSHOT_DATASET, "Dataset used for *_snapshot views", LogicalType::VARCHAR,
	                          Value(defaults.snapshot_dataset));
	config.AddExtensionOption(SETTING_THREADS, "Worker threads used to scan LookML files", LogicalType::BIGINT,
	                          Value::BIGINT(static_cast<int64_t>(defaults.threads)), CheckLineageThreads);
	config.AddExtensionOption(SETTING_DEBUG, "Enable debug logging for scanning and event publishing",
	                          LogicalType::BOOLEAN, Value(false), SetLineageDebug);

	// OpenLineage transport
	config.AddExtensionOption("lookml_lineage_url", "URL of the OpenLineage backend", LogicalType::VARCHAR, Value(""),
	                          SetLineageUrl);
	config.AddExtensionOption("lookml_lineage_api_key", "API Key for OpenLineage backend", LogicalType::VARCHAR,
	                          Value(""), SetLineageApiKey);
	config.AddExtensionOption("lookml_lineage_namespace", "Namespace for OpenLineage jobs and view datasets",
	                          LogicalType::VARCHAR, Value("lookml"), SetLineageNamespace);
	config.AddExtensionOption("lookml_lineage_max_retries", "Maximum retry attempts for failed HTTP requests",
	                          LogicalType::BIGINT, Value::BIGINT(3), SetLineageMaxRetries);
	config.AddExtensionOption("lookml_lineage_max_queue_size", "Maximum number of events to queue before dropping",
	                          LogicalType::BIGINT, Value::BIGINT(10000), SetLineageMaxQueueSize);
	config.AddExtensionOption("lookml_lineage_timeout", "HTTP request timeout in seconds", LogicalType::BIGINT,
	                          Value::BIGINT(10), SetLineageTimeout);

	RegisterLookmlTableFunctions(loader);
}

//===--------------------------------------------------------------------===//
// Extension Class Implementation
//===--------------------------------------------------------------------===//

void LookmlLineageExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string LookmlLineageExtension::Name() {
	return "lookml_lineage";
}

std::string LookmlLineageExtension::Version() const {
#ifdef EXT_VERSION_LOOKML_LINEAGE
	return EXT_VERSION_LOOKML_LINEAGE;
#else
	return "";
#endif
}

} // namespace lookml_lineage

//===--------------------------------------------------------------------===//
// C Extension Entry Point
//===--------------------------------------------------------------------===//

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(lookml_lineage, loader) {
	lookml_lineage::LoadInternal(loader);
}
}
