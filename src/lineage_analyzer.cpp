//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_analyzer.cpp
// Description: Implementation of the provenance pipeline.
//===----------------------------------------------------------------------===//

#include "lineage_analyzer.hpp"
#include "alias_resolver.hpp"
#include "citation_classifier.hpp"
#include "explore_graph_builder.hpp"
#include "source_definition_extractor.hpp"
#include "source_file_index.hpp"
#include "view_registry_builder.hpp"
#include <atomic>
#include <thread>
#include <unordered_map>

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Per-File Extraction
//===--------------------------------------------------------------------===//

/// @brief Everything extracted from one file without looking at other files.
struct FileScanResult {
	std::vector<ViewDeclaration> declarations;
	ExploreScan explores;
	std::vector<NamedSourceDefinition> definitions;
	ScanDiagnostics diagnostics;
};

static void ScanFile(const SourceFile &file, bool debug, FileScanResult &result) {
	result.diagnostics = ScanDiagnostics(debug);
	try {
		result.declarations = ScanViewDeclarations(file, result.diagnostics);
		result.explores = ScanExplores(file, result.diagnostics);
		if (file.category == FileCategory::VIEW) {
			result.definitions = ScanSourceDefinitions(file, result.diagnostics);
		}
	} catch (const std::exception &ex) {
		// std::regex reports pathological inputs by throwing; the file is skipped like an unreadable one
		result.declarations.clear();
		result.explores = ExploreScan();
		result.definitions.clear();
		result.diagnostics.Warn(ScanWarningKind::FILE_UNREADABLE, file.path, "",
		                        std::string("scan failed: ") + ex.what() + "; file skipped");
	}
}

static std::vector<FileScanResult> ScanFiles(const std::vector<const SourceFile *> &files, const LineageConfig &config) {
	std::vector<FileScanResult> results(files.size());
	size_t thread_count = config.threads == 0 ? 1 : config.threads;
	if (thread_count > files.size()) {
		thread_count = files.size();
	}

	if (thread_count <= 1) {
		for (size_t i = 0; i < files.size(); i++) {
			ScanFile(*files[i], config.debug, results[i]);
		}
		return results;
	}

	std::atomic<size_t> next_file(0);
	std::vector<std::thread> workers;
	for (size_t t = 0; t < thread_count; t++) {
		workers.emplace_back([&]() {
			for (size_t i = next_file++; i < files.size(); i = next_file++) {
				ScanFile(*files[i], config.debug, results[i]);
			}
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}
	return results;
}

static std::unordered_map<std::string, size_t> CountExplores(const std::vector<ExploreRecord> &explores) {
	std::unordered_map<std::string, size_t> counts;
	for (const auto &explore : explores) {
		for (const auto &view : explore.ViewSet()) {
			counts[view]++;
		}
	}
	return counts;
}

//===--------------------------------------------------------------------===//
// Pipeline
//===--------------------------------------------------------------------===//

LineageModel AnalyzeCorpus(const SourceCorpus &corpus, const LineageConfig &config) {
	ScanDiagnostics diagnostics(config.debug);

	// View files first, then model files: this order decides registry order and first-definition wins
	std::vector<const SourceFile *> files;
	for (const auto &file : corpus.view_files) {
		files.push_back(&file);
	}
	for (const auto &file : corpus.model_files) {
		files.push_back(&file);
	}
	auto scans = ScanFiles(files, config);
	for (const auto &scan : scans) {
		diagnostics.Merge(scan.diagnostics);
	}

	// Registry
	ViewRegistry registry;
	for (size_t i = 0; i < files.size(); i++) {
		RegisterViewDeclarations(registry, *files[i], scans[i].declarations);
	}
	diagnostics.Debug("Registered " + std::to_string(registry.Size()) + " views");

	// Explore graph: model files before view files
	std::vector<ExploreScan> explore_scans;
	size_t view_file_count = corpus.view_files.size();
	for (size_t i = view_file_count; i < files.size(); i++) {
		explore_scans.push_back(scans[i].explores);
	}
	for (size_t i = 0; i < view_file_count; i++) {
		explore_scans.push_back(scans[i].explores);
	}
	ExploreGraph graph = MergeExploreScans(explore_scans, diagnostics);
	diagnostics.Debug("Found " + std::to_string(graph.explores.size()) + " explores, " +
	                  std::to_string(graph.aliases.size()) + " alias relations and " +
	                  std::to_string(graph.unnest_views.size()) + " unnest views");

	// Aliases are resolved before any table inference
	ViewRegistry aliased = ResolveAliases(registry, graph.aliases);

	std::vector<std::vector<NamedSourceDefinition>> definitions;
	for (size_t i = 0; i < view_file_count; i++) {
		definitions.push_back(scans[i].definitions);
	}
	ViewRegistry defined = ApplySourceDefinitions(aliased, definitions);

	LineageModel model;
	model.views = ClassifyViews(defined, graph.unnest_views, config, diagnostics);

	auto explore_counts = CountExplores(graph.explores);
	for (auto &view : model.views.Views()) {
		auto it = explore_counts.find(view.name);
		view.explore_count = it == explore_counts.end() ? 0 : it->second;
	}

	model.explores = std::move(graph.explores);
	model.aliases = std::move(graph.aliases);
	model.unnest_views = std::move(graph.unnest_views);
	model.warnings = diagnostics.Warnings();
	return model;
}

LineageModel AnalyzeProject(duckdb::FileSystem &fs, const std::string &root, const LineageConfig &config) {
	ScanDiagnostics load_diagnostics(config.debug);
	SourceFileIndex index(fs, root);
	SourceCorpus corpus = index.Load(load_diagnostics);

	LineageModel model = AnalyzeCorpus(corpus, config);
	model.warnings.insert(model.warnings.begin(), load_diagnostics.Warnings().begin(),
	                      load_diagnostics.Warnings().end());
	return model;
}

} // namespace lookml_lineage
