//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_table_functions.hpp
// Description: Table functions that expose the provenance model of a LookML
//              project to SQL (views, explores, aliases, warnings, export
//              statements and OpenLineage publishing).
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "lineage_config.hpp"

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Setting Names
//===--------------------------------------------------------------------===//

static constexpr const char *SETTING_DEFAULT_PROJECT = "lookml_lineage_default_project";
static constexpr const char *SETTING_DEFAULT_DATASET = "lookml_lineage_default_dataset";
static constexpr const char *SETTING_SNAPSHOT_PROJECT = "lookml_lineage_snapshot_project";
static constexpr const char *SETTING_SNAPSHOT_DATASET = "lookml_lineage_snapshot_dataset";
static constexpr const char *SETTING_THREADS = "lookml_lineage_threads";
static constexpr const char *SETTING_DEBUG = "lookml_lineage_debug";

/// @brief Build the analysis settings for one call.
/// @param context Client context whose extension settings provide the defaults.
/// @param named_parameters Per-call overrides (default_project, default_dataset,
///        snapshot_project, snapshot_dataset, threads).
/// @throws duckdb::InvalidInputException if the thread count is below 1.
LineageConfig ReadLineageConfig(duckdb::ClientContext &context, const duckdb::named_parameter_map_t &named_parameters);

/// @brief Register lookml_views, lookml_explores, lookml_explore_views, lookml_aliases,
///        lookml_scan_warnings, lookml_export_commands and lookml_lineage_emit.
void RegisterLookmlTableFunctions(duckdb::ExtensionLoader &loader);

} // namespace lookml_lineage
