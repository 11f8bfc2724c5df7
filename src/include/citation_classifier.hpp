//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: citation_classifier.hpp
// Description: Combines source definitions, alias relations and extracted
//              table references into one citation type and table list per view.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_config.hpp"
#include "lookml_model.hpp"
#include "scan_diagnostics.hpp"
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lookml_lineage {

/// @brief Result of choosing a primary table among extracted candidates.
struct TableSelection {
	std::string primary_table;
	std::vector<std::string> additional_tables;
	bool ambiguous = false; ///< True when the shortest-name fallback decided
};

/// @brief Choose the primary table for a view among extracted candidates.
/// @param view_name View being classified.
/// @param candidates Extracted table references in extraction order (non-empty).
/// @return The primary table plus the remaining candidates filtered by FilterAdditionalTables.
/// @note With several candidates: (a) drop 3-part names whose first and third segments are equal
///       when an alternative exists; (b) prefer the first candidate whose table segment contains,
///       or is contained in, the view name (ignoring `fact_`/`dim_` prefixes); (c) otherwise take
///       the first candidate with the shortest table segment.
TableSelection SelectPrimaryTable(const std::string &view_name, const std::vector<std::string> &candidates);

/// @brief Keep complete 3-part names whose table segment does not start with '_',
///        drop case-insensitive duplicates and anything equal to the primary table.
std::vector<std::string> FilterAdditionalTables(const std::string &primary_table,
                                                const std::vector<std::string> &candidates);

/// @class CitationClassifier
/// @brief Evaluates the ordered citation decision list for every view of a registry.
///
/// Views that depend on other views (aliases and `parent__child` views) are classified
/// after their dependency. Results are memoized; dependency cycles resolve to "no tables".
class CitationClassifier {
public:
	CitationClassifier(const ViewRegistry &views, const std::set<std::string> &unnest_views,
	                   const LineageConfig &config, ScanDiagnostics &diagnostics);

	/// @brief Classify one view.
	/// @return The final record, or nullptr if the view is not in the registry.
	const ViewRecord *Classify(const std::string &view_name);

	/// @brief Classify every view.
	/// @return A new registry snapshot in the input order.
	ViewRegistry ClassifyAll();

private:
	enum class State : uint8_t { PENDING, IN_PROGRESS, DONE };

	/// @brief Apply the decision list to one view (dependencies are classified on demand).
	void Decide(ViewRecord &view);

	/// @brief Copy the final tables of a dependency into view; empty on cycles or unknown views.
	/// @param evidence_only Leave view empty when the dependency only has a naming-convention guess.
	void CopyTablesFrom(const std::string &dependency, ViewRecord &view, bool evidence_only);

	bool AssignExtractedTables(ViewRecord &view, CitationType type);

	const ViewRegistry &input;
	const std::set<std::string> &unnest_views;
	const LineageConfig &config;
	ScanDiagnostics &diagnostics;

	ViewRegistry output;
	std::unordered_map<std::string, State> states;
};

/// @brief Convenience wrapper: classify every view of a registry.
ViewRegistry ClassifyViews(const ViewRegistry &views, const std::set<std::string> &unnest_views,
                           const LineageConfig &config, ScanDiagnostics &diagnostics);

} // namespace lookml_lineage
