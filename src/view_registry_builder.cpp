//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: view_registry_builder.cpp
// Description: Implementation of view registration.
//===----------------------------------------------------------------------===//

#include "view_registry_builder.hpp"
#include "block_scanner.hpp"
#include <regex>

namespace lookml_lineage {

static void ScanViewHeaders(const SourceFile &file, const std::string &text, std::vector<ViewDeclaration> &result,
                            ScanDiagnostics &diagnostics) {
	static const std::regex view_header("\\bview:\\s+(\\w+)\\s*\\{");
	for (std::sregex_iterator it(text.begin(), text.end(), view_header), last; it != last; ++it) {
		std::string name = (*it)[1].str();
		if (name.size() > MAX_VIEW_NAME_LENGTH) {
			diagnostics.Debug("Skipping implausible view name in " + file.path);
			continue;
		}
		ViewDeclaration declaration;
		declaration.site = ViewDeclaration::Site::VIEW_HEADER;
		declaration.name = std::move(name);
		result.push_back(std::move(declaration));
	}
}

/// @brief Declare every join between begin and end, then recurse into every join body.
static void ScanJoinSites(const SourceFile &file, const std::string &text, size_t begin, size_t end,
                          std::vector<ViewDeclaration> &result, ScanDiagnostics &diagnostics) {
	for (const auto &join : FindBlocks(text, "join", begin, end, file.path, diagnostics)) {
		ViewDeclaration declaration;
		declaration.site = ViewDeclaration::Site::JOIN;
		declaration.name = join.name;
		std::string join_from = FindIdentifierProperty(OwnBody(text, join, "join"), "from");
		if (join_from != join.name) {
			declaration.from_target = join_from;
		}
		result.push_back(std::move(declaration));

		ScanJoinSites(file, text, join.BodyBegin(), join.BodyEnd(), result, diagnostics);
	}
}

static void ScanExploreSites(const SourceFile &file, const std::string &text, std::vector<ViewDeclaration> &result) {
	// The explore graph scans the same blocks and reports the unterminated ones
	ScanDiagnostics block_diagnostics;
	for (const auto &explore : FindBlocks(text, "explore", file.path, block_diagnostics)) {
		std::string from_target = FindIdentifierProperty(OwnBody(text, explore, "join"), "from");
		if (!from_target.empty() && from_target != explore.name) {
			ViewDeclaration declaration;
			declaration.site = ViewDeclaration::Site::EXPLORE;
			declaration.name = explore.name;
			declaration.from_target = from_target;
			result.push_back(std::move(declaration));
		}

		ScanJoinSites(file, text, explore.BodyBegin(), explore.BodyEnd(), result, block_diagnostics);
	}
}

std::vector<ViewDeclaration> ScanViewDeclarations(const SourceFile &file, ScanDiagnostics &diagnostics) {
	std::vector<ViewDeclaration> result;
	std::string text = StripCommentLines(file.text);
	if (file.category == FileCategory::VIEW) {
		ScanViewHeaders(file, text, result, diagnostics);
	} else {
		ScanExploreSites(file, text, result);
	}
	return result;
}

void RegisterViewDeclarations(ViewRegistry &registry, const SourceFile &file,
                              const std::vector<ViewDeclaration> &declarations) {
	for (const auto &declaration : declarations) {
		switch (declaration.site) {
		case ViewDeclaration::Site::VIEW_HEADER: {
			auto &view = registry.GetOrAdd(declaration.name);
			if (view.source_file.empty()) {
				view.source_file = file.path;
			}
			break;
		}
		case ViewDeclaration::Site::EXPLORE: {
			bool inserted = false;
			auto &view = registry.GetOrAdd(declaration.name, &inserted);
			if (inserted) {
				view.citation_type = CitationType::DERIVED_FROM;
				view.derived_from = declaration.from_target;
				view.source_file = file.path;
			}
			break;
		}
		case ViewDeclaration::Site::JOIN: {
			auto &view = registry.GetOrAdd(declaration.name);
			if (view.source_file.empty()) {
				view.source_file = file.path;
			}
			if (!declaration.from_target.empty()) {
				view.citation_type = CitationType::DERIVED_FROM;
				view.derived_from = declaration.from_target;
			}
			break;
		}
		}
	}
}

ViewRegistry BuildViewRegistry(const SourceCorpus &corpus, ScanDiagnostics &diagnostics) {
	ViewRegistry registry;
	for (const auto &file : corpus.view_files) {
		RegisterViewDeclarations(registry, file, ScanViewDeclarations(file, diagnostics));
	}
	for (const auto &file : corpus.model_files) {
		RegisterViewDeclarations(registry, file, ScanViewDeclarations(file, diagnostics));
	}
	return registry;
}

} // namespace lookml_lineage
