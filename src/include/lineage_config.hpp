//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_config.hpp
// Description: Immutable analysis settings passed explicitly through the
//              provenance pipeline (default and snapshot table qualifiers).
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>

namespace lookml_lineage {

/// @brief Settings that drive table-name inference for views without an explicit source.
/// @note Built once per analysis run (from extension settings or by the caller) and passed
///       by const reference; nothing in the pipeline reads process-wide settings.
struct LineageConfig {
	std::string default_project = "company-dwh";
	std::string default_dataset = "analytics_prod";
	std::string snapshot_project = "company-dwh-snapshot";
	std::string snapshot_dataset = "analytics_prod_snapshots";

	bool debug = false;  // log scanning progress to stderr
	size_t threads = 1;  // worker threads for per-file extraction

	/// @brief Qualify a table name with the default project and dataset.
	std::string QualifyDefault(const std::string &table) const {
		return default_project + "." + default_dataset + "." + table;
	}

	/// @brief Qualify a table name with the snapshot project and dataset.
	std::string QualifySnapshot(const std::string &table) const {
		return snapshot_project + "." + snapshot_dataset + "." + table;
	}
};

} // namespace lookml_lineage
