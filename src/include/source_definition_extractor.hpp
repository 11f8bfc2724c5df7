//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: source_definition_extractor.hpp
// Description: Pulls each view's defining clause verbatim: a direct table
//              reference, a derived-table SQL body or an explore source.
//===----------------------------------------------------------------------===//

#pragma once

#include "lookml_model.hpp"
#include "scan_diagnostics.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief A view name paired with its defining clause.
struct NamedSourceDefinition {
	std::string view_name;
	SourceDefinition definition;
};

/// @brief Classify the defining clause of one view body.
/// @param view_body Text between the view's braces, comment lines already stripped.
/// @param path File name used in warnings.
/// @param diagnostics Receives a warning when the derived_table block is unterminated.
/// @return SQL_TABLE_NAME (text up to `;;`), EXPLORE_SOURCE (the explore name),
///         DERIVED_SQL (the SQL body) or UNKNOWN.
SourceDefinition ExtractSourceDefinition(const std::string &view_body, const std::string &path,
                                         ScanDiagnostics &diagnostics);

/// @brief Extract the definitions of every view block in a view file, in textual order.
std::vector<NamedSourceDefinition> ScanSourceDefinitions(const SourceFile &file, ScanDiagnostics &diagnostics);

/// @brief Attach definitions to a registry snapshot.
/// @param views Input snapshot; not modified.
/// @param per_file Definitions grouped by file, in index order. The first definition of a view wins.
/// @return A new snapshot with `source` filled in. Views not yet registered are added.
ViewRegistry ApplySourceDefinitions(const ViewRegistry &views,
                                    const std::vector<std::vector<NamedSourceDefinition>> &per_file);

} // namespace lookml_lineage
