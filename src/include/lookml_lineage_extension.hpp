//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_lineage_extension.hpp
// Description: Main extension entry point. Registers the analysis and
//              transport settings and the LookML table functions.
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"

namespace lookml_lineage {

/// @class LookmlLineageExtension
/// @brief DuckDB extension that resolves which warehouse tables back each LookML view.
///
/// It registers:
/// - Analysis settings (lookml_lineage_default_project, lookml_lineage_threads, etc.)
/// - OpenLineage transport settings (lookml_lineage_url, lookml_lineage_api_key, etc.)
/// - Table functions lookml_views, lookml_explores, lookml_explore_views, lookml_aliases,
///   lookml_scan_warnings, lookml_export_commands and lookml_lineage_emit
class LookmlLineageExtension : public duckdb::Extension {
public:
	void Load(duckdb::ExtensionLoader &loader) override;

	/// @brief Get the extension name.
	/// @return "lookml_lineage"
	std::string Name() override;

	/// @brief Get the extension version (EXT_VERSION_LOOKML_LINEAGE).
	std::string Version() const override;
};

} // namespace lookml_lineage
