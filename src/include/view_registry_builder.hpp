//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: view_registry_builder.hpp
// Description: Collects every declared view name, from view headers in view
//              files and from explore/join sites in model files.
//===----------------------------------------------------------------------===//

#pragma once

#include "lookml_model.hpp"
#include "scan_diagnostics.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief Longest accepted view name; longer matches are treated as false detections.
static constexpr size_t MAX_VIEW_NAME_LENGTH = 100;

/// @brief A view name found in one file.
struct ViewDeclaration {
	enum class Site : uint8_t {
		VIEW_HEADER, ///< `view: name {` in a view file
		EXPLORE,     ///< `explore: name { from: target }` with target != name
		JOIN         ///< `join: name { ... }` inside an explore
	};

	Site site;
	std::string name;
	std::string from_target; ///< Differing `from:` target, empty when none
};

/// @brief Collect the view declarations of one file, in textual order.
/// @note View files contribute view headers; model files contribute explore and join sites, with joins
/// nested inside joins found at any depth.
std::vector<ViewDeclaration> ScanViewDeclarations(const SourceFile &file, ScanDiagnostics &diagnostics);

/// @brief Apply the declarations of one file to a registry.
void RegisterViewDeclarations(ViewRegistry &registry, const SourceFile &file,
                              const std::vector<ViewDeclaration> &declarations);

/// @brief Build the registry from a whole corpus (view files first, then model files).
ViewRegistry BuildViewRegistry(const SourceCorpus &corpus, ScanDiagnostics &diagnostics);

} // namespace lookml_lineage
