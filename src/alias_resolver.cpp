//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: alias_resolver.cpp
// Description: Implementation of alias resolution.
//===----------------------------------------------------------------------===//

#include "alias_resolver.hpp"
#include <unordered_map>
#include <unordered_set>

namespace lookml_lineage {

static std::unordered_map<std::string, std::string> BuildAliasMap(const std::vector<AliasRelation> &aliases) {
	std::unordered_map<std::string, std::string> alias_map;
	for (const auto &relation : aliases) {
		// First declaration of an alias wins
		alias_map.insert(std::make_pair(relation.alias_view, relation.base_view));
	}
	return alias_map;
}

static std::string FollowChain(const std::string &view_name,
                               const std::unordered_map<std::string, std::string> &alias_map) {
	std::unordered_set<std::string> visited;
	std::string current = view_name;
	while (true) {
		if (!visited.insert(current).second) {
			return "";
		}
		auto it = alias_map.find(current);
		if (it == alias_map.end()) {
			return current;
		}
		current = it->second;
	}
}

std::string FollowAliasChain(const std::string &view_name, const std::vector<AliasRelation> &aliases) {
	return FollowChain(view_name, BuildAliasMap(aliases));
}

ViewRegistry ResolveAliases(const ViewRegistry &views, const std::vector<AliasRelation> &aliases) {
	ViewRegistry result = views;
	auto alias_map = BuildAliasMap(aliases);

	for (const auto &relation : aliases) {
		if (alias_map[relation.alias_view] != relation.base_view) {
			// Conflicting later declaration of the same alias
			continue;
		}
		auto &alias = result.GetOrAdd(relation.alias_view);
		alias.citation_type = CitationType::DERIVED_FROM;
		alias.derived_from = relation.base_view;
		alias.ClearTables();

		std::string base_name = FollowChain(relation.alias_view, alias_map);
		const ViewRecord *base = base_name.empty() ? nullptr : views.Find(base_name);
		if (base && base->HasTables()) {
			alias.primary_table = base->primary_table;
			alias.additional_tables = base->additional_tables;
		}
	}
	return result;
}

} // namespace lookml_lineage
