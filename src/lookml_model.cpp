//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_model.cpp
// Description: Enumeration names, view registry and report ordering.
//===----------------------------------------------------------------------===//

#include "lookml_model.hpp"
#include <algorithm>
#include <unordered_set>

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Enumeration Names
//===--------------------------------------------------------------------===//

std::string CitationTypeToString(CitationType type) {
	switch (type) {
	case CitationType::NATIVE:
		return "native";
	case CitationType::DERIVED:
		return "derived";
	case CitationType::DERIVED_SQL:
		return "derived_sql";
	case CitationType::DERIVED_EXPLORE:
		return "derived_explore";
	case CitationType::DERIVED_FROM:
		return "derived_from";
	case CitationType::NESTED:
		return "nested";
	case CitationType::UNNEST:
		return "unnest";
	}
	return "native";
}

std::string SourceKindToString(SourceKind kind) {
	switch (kind) {
	case SourceKind::SQL_TABLE_NAME:
		return "sql_table_name";
	case SourceKind::EXPLORE_SOURCE:
		return "explore_source";
	case SourceKind::DERIVED_SQL:
		return "derived_sql";
	case SourceKind::UNKNOWN:
		return "unknown";
	}
	return "unknown";
}

//===--------------------------------------------------------------------===//
// Explores
//===--------------------------------------------------------------------===//

std::vector<std::string> ExploreRecord::ViewSet() const {
	std::vector<std::string> result;
	std::unordered_set<std::string> seen;
	if (!base_view.empty()) {
		result.push_back(base_view);
		seen.insert(base_view);
	}
	for (const auto &view : joined_views) {
		if (seen.insert(view).second) {
			result.push_back(view);
		}
	}
	return result;
}

//===--------------------------------------------------------------------===//
// View Registry
//===--------------------------------------------------------------------===//

ViewRecord &ViewRegistry::GetOrAdd(const std::string &name, bool *inserted) {
	auto it = index.find(name);
	if (it != index.end()) {
		if (inserted) {
			*inserted = false;
		}
		return views[it->second];
	}
	index[name] = views.size();
	ViewRecord record;
	record.name = name;
	views.push_back(std::move(record));
	if (inserted) {
		*inserted = true;
	}
	return views.back();
}

ViewRecord *ViewRegistry::Find(const std::string &name) {
	auto it = index.find(name);
	return it == index.end() ? nullptr : &views[it->second];
}

const ViewRecord *ViewRegistry::Find(const std::string &name) const {
	auto it = index.find(name);
	return it == index.end() ? nullptr : &views[it->second];
}

//===--------------------------------------------------------------------===//
// Report Ordering
//===--------------------------------------------------------------------===//

std::vector<const ViewRecord *> LineageModel::ReportOrder() const {
	std::vector<const ViewRecord *> ordered;
	ordered.reserve(views.Size());
	for (const auto &view : views.Views()) {
		ordered.push_back(&view);
	}
	std::stable_sort(ordered.begin(), ordered.end(), [](const ViewRecord *a, const ViewRecord *b) {
		if (a->explore_count != b->explore_count) {
			return a->explore_count > b->explore_count;
		}
		return a->name > b->name;
	});
	return ordered;
}

} // namespace lookml_lineage
