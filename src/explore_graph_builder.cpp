//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: explore_graph_builder.cpp
// Description: Implementation of the explore graph builder.
//===----------------------------------------------------------------------===//

#include "explore_graph_builder.hpp"
#include "block_scanner.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace lookml_lineage {

using duckdb::StringUtil;

//===--------------------------------------------------------------------===//
// Helper Functions
//===--------------------------------------------------------------------===//

/// @brief True if some `sql:` property of the join calls unnest( on the same line.
static bool HasUnnestSql(const std::string &join_body) {
	std::string lower = StringUtil::Lower(join_body);
	for (size_t pos = lower.find("sql"); pos != std::string::npos; pos = lower.find("sql", pos + 3)) {
		if (pos > 0 && (std::isalnum(static_cast<unsigned char>(lower[pos - 1])) || lower[pos - 1] == '_')) {
			continue;
		}
		size_t colon = pos + 3;
		while (colon < lower.size() && std::isspace(static_cast<unsigned char>(lower[colon]))) {
			colon++;
		}
		if (colon >= lower.size() || lower[colon] != ':') {
			continue;
		}
		size_t line_end = lower.find('\n', colon);
		size_t unnest = lower.find("unnest(", colon);
		if (unnest != std::string::npos && (line_end == std::string::npos || unnest < line_end)) {
			return true;
		}
	}
	return false;
}

static bool HasOwnSource(const std::string &view_body) {
	static const std::regex source_pattern("\\b(sql_table_name|derived_table)\\s*:");
	return std::regex_search(view_body, source_pattern);
}

static void AddUnique(std::vector<std::string> &values, const std::string &value) {
	if (std::find(values.begin(), values.end(), value) == values.end()) {
		values.push_back(value);
	}
}

/// @brief Collect the joins between begin and end, then recurse into every join body.
static void CollectJoins(const SourceFile &file, const std::string &text, size_t begin, size_t end,
                         ExploreRecord &explore, ExploreScan &scan, ScanDiagnostics &diagnostics) {
	for (const auto &join : FindBlocks(text, "join", begin, end, file.path, diagnostics)) {
		AddUnique(explore.joined_views, join.name);

		std::string own_body = OwnBody(text, join, "join");
		std::string from_target = FindIdentifierProperty(own_body, "from");
		if (!from_target.empty() && from_target != join.name) {
			AliasRelation relation;
			relation.alias_view = join.name;
			relation.base_view = from_target;
			scan.aliases.push_back(std::move(relation));
		}
		if (HasUnnestSql(own_body)) {
			scan.unnest_joins.push_back(join.name);
		}

		CollectJoins(file, text, join.BodyBegin(), join.BodyEnd(), explore, scan, diagnostics);
	}
}

//===--------------------------------------------------------------------===//
// Explore Graph
//===--------------------------------------------------------------------===//

size_t ExploreGraph::ExploreCount(const std::string &view_name) const {
	size_t count = 0;
	for (const auto &explore : explores) {
		auto views = explore.ViewSet();
		if (std::find(views.begin(), views.end(), view_name) != views.end()) {
			count++;
		}
	}
	return count;
}

ExploreScan ScanExplores(const SourceFile &file, ScanDiagnostics &diagnostics) {
	ExploreScan scan;
	std::string text = StripCommentLines(file.text);

	for (const auto &block : FindBlocks(text, "explore", file.path, diagnostics)) {
		ExploreRecord explore;
		explore.name = block.name;
		explore.model_name = file.model_name;
		explore.source_file = file.path;

		std::string from_target = FindIdentifierProperty(OwnBody(text, block, "join"), "from");
		explore.base_view = from_target.empty() ? block.name : from_target;
		if (!from_target.empty() && from_target != block.name) {
			AliasRelation relation;
			relation.alias_view = block.name;
			relation.base_view = from_target;
			scan.aliases.push_back(std::move(relation));
		}

		CollectJoins(file, text, block.BodyBegin(), block.BodyEnd(), explore, scan, diagnostics);
		diagnostics.Debug("Explore " + explore.name + " in " + file.path + " reaches " +
		                  std::to_string(explore.ViewSet().size()) + " views");
		scan.explores.push_back(std::move(explore));
	}

	if (file.category == FileCategory::VIEW) {
		for (const auto &view : FindBlocks(text, "view", file.path, diagnostics)) {
			if (HasOwnSource(view.Body(text))) {
				scan.views_with_own_source.push_back(view.name);
			}
		}
	}
	return scan;
}

ExploreGraph MergeExploreScans(const std::vector<ExploreScan> &scans, ScanDiagnostics &diagnostics) {
	ExploreGraph graph;

	std::unordered_set<std::string> views_with_own_source;
	for (const auto &scan : scans) {
		views_with_own_source.insert(scan.views_with_own_source.begin(), scan.views_with_own_source.end());
	}

	std::unordered_set<std::string> explore_names;
	for (const auto &scan : scans) {
		for (const auto &explore : scan.explores) {
			if (!explore_names.insert(explore.name).second) {
				diagnostics.Debug("Explore " + explore.name + " redefined in " + explore.source_file +
				                  "; keeping the first definition");
				continue;
			}
			graph.explores.push_back(explore);
		}
		for (const auto &relation : scan.aliases) {
			if (std::find(graph.aliases.begin(), graph.aliases.end(), relation) == graph.aliases.end()) {
				graph.aliases.push_back(relation);
			}
		}
		for (const auto &view : scan.unnest_joins) {
			if (views_with_own_source.count(view) == 0) {
				graph.unnest_views.insert(view);
			}
		}
	}
	return graph;
}

ExploreGraph BuildExploreGraph(const SourceCorpus &corpus, ScanDiagnostics &diagnostics) {
	std::vector<ExploreScan> scans;
	for (const auto &file : corpus.model_files) {
		scans.push_back(ScanExplores(file, diagnostics));
	}
	for (const auto &file : corpus.view_files) {
		scans.push_back(ScanExplores(file, diagnostics));
	}
	return MergeExploreScans(scans, diagnostics);
}

} // namespace lookml_lineage
