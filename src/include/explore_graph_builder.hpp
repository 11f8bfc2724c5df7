//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: explore_graph_builder.hpp
// Description: Parses explore blocks into base-view and join-view edges,
//              alias relations and unnest-derived join views.
//===----------------------------------------------------------------------===//

#pragma once

#include "lookml_model.hpp"
#include "scan_diagnostics.hpp"
#include <set>
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief Explore facts found in a single file.
struct ExploreScan {
	std::vector<ExploreRecord> explores;
	std::vector<AliasRelation> aliases;
	std::vector<std::string> unnest_joins; ///< Join views whose `sql:` clause calls unnest(
	std::vector<std::string> views_with_own_source; ///< Views declaring sql_table_name or derived_table
};

/// @brief The merged relationship graph of a project.
struct ExploreGraph {
	std::vector<ExploreRecord> explores;
	std::vector<AliasRelation> aliases; ///< De-duplicated, first-seen order
	std::set<std::string> unnest_views;

	/// @brief Number of explores whose view set contains the view.
	size_t ExploreCount(const std::string &view_name) const;
};

/// @brief Scan the explore blocks of one file (model-like or view-like).
/// @note Joins are collected at any nesting depth by re-applying the block scanner to each
///       join body. View files additionally report which of their views declare their own source.
ExploreScan ScanExplores(const SourceFile &file, ScanDiagnostics &diagnostics);

/// @brief Merge per-file scans in the given order.
/// @note An explore name defined in several files keeps its first definition.
ExploreGraph MergeExploreScans(const std::vector<ExploreScan> &scans, ScanDiagnostics &diagnostics);

/// @brief Scan and merge a whole corpus (model files first, then view files).
ExploreGraph BuildExploreGraph(const SourceCorpus &corpus, ScanDiagnostics &diagnostics);

} // namespace lookml_lineage
