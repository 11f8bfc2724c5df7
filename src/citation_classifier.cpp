//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: citation_classifier.cpp
// Description: Implementation of the citation decision list and the primary
//              table tie-break.
//===----------------------------------------------------------------------===//

#include "citation_classifier.hpp"
#include "table_reference_extractor.hpp"
#include "duckdb/common/string_util.hpp"
#include <unordered_set>

namespace lookml_lineage {

using duckdb::StringUtil;

//===--------------------------------------------------------------------===//
// Primary Table Selection
//===--------------------------------------------------------------------===//

static std::string StripFactDimPrefix(const std::string &name) {
	std::string lowered = StringUtil::Lower(name);
	if (StringUtil::StartsWith(lowered, "fact_")) {
		return lowered.substr(5);
	}
	if (StringUtil::StartsWith(lowered, "dim_")) {
		return lowered.substr(4);
	}
	return lowered;
}

static bool ProjectEqualsTable(const std::string &candidate) {
	auto parts = SplitIdentifier(candidate);
	return parts.size() == 3 && parts[0] == parts[2];
}

std::vector<std::string> FilterAdditionalTables(const std::string &primary_table,
                                                const std::vector<std::string> &candidates) {
	std::vector<std::string> result;
	std::unordered_set<std::string> seen;
	seen.insert(StringUtil::Lower(primary_table));
	for (const auto &candidate : candidates) {
		auto parts = SplitIdentifier(candidate);
		if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
			continue;
		}
		if (StringUtil::StartsWith(parts[2], "_")) {
			continue;
		}
		if (!seen.insert(StringUtil::Lower(candidate)).second) {
			continue;
		}
		result.push_back(candidate);
	}
	return result;
}

TableSelection SelectPrimaryTable(const std::string &view_name, const std::vector<std::string> &candidates) {
	TableSelection selection;
	if (candidates.empty()) {
		return selection;
	}
	if (candidates.size() == 1) {
		selection.primary_table = candidates[0];
		return selection;
	}

	// (a) project segment repeated as table segment is usually a mis-split reference
	std::vector<std::string> pool;
	for (const auto &candidate : candidates) {
		if (!ProjectEqualsTable(candidate)) {
			pool.push_back(candidate);
		}
	}
	if (pool.empty()) {
		pool = candidates;
	}

	// (b) table segment related to the view name
	std::string view_key = StripFactDimPrefix(view_name);
	for (const auto &candidate : pool) {
		std::string table_key = StripFactDimPrefix(TerminalSegment(candidate));
		if (table_key.empty() || view_key.empty()) {
			continue;
		}
		if (StringUtil::Contains(table_key, view_key) || StringUtil::Contains(view_key, table_key)) {
			selection.primary_table = candidate;
			break;
		}
	}

	// (c) shortest table segment, first one on ties
	if (selection.primary_table.empty()) {
		const std::string *shortest = &pool[0];
		for (const auto &candidate : pool) {
			if (TerminalSegment(candidate).size() < TerminalSegment(*shortest).size()) {
				shortest = &candidate;
			}
		}
		selection.primary_table = *shortest;
		selection.ambiguous = true;
	}

	selection.additional_tables = FilterAdditionalTables(selection.primary_table, candidates);
	return selection;
}

//===--------------------------------------------------------------------===//
// Classifier
//===--------------------------------------------------------------------===//

CitationClassifier::CitationClassifier(const ViewRegistry &views, const std::set<std::string> &unnest_views,
                                       const LineageConfig &config, ScanDiagnostics &diagnostics)
    : input(views), unnest_views(unnest_views), config(config), diagnostics(diagnostics), output(views) {
}

const ViewRecord *CitationClassifier::Classify(const std::string &view_name) {
	ViewRecord *view = output.Find(view_name);
	if (!view) {
		return nullptr;
	}
	auto &state = states[view_name];
	if (state == State::DONE) {
		return view;
	}
	if (state == State::IN_PROGRESS) {
		// Cycle: the caller sees the record as it stands, which carries no tables yet
		return view;
	}
	state = State::IN_PROGRESS;
	Decide(*view);
	states[view_name] = State::DONE;
	return view;
}

ViewRegistry CitationClassifier::ClassifyAll() {
	for (const auto &view : input.Views()) {
		Classify(view.name);
	}
	return output;
}

void CitationClassifier::CopyTablesFrom(const std::string &dependency, ViewRecord &view, bool evidence_only) {
	view.ClearTables();
	auto dependency_state = states.find(dependency);
	bool in_cycle = dependency_state != states.end() && dependency_state->second == State::IN_PROGRESS;
	const ViewRecord *source = in_cycle ? nullptr : Classify(dependency);
	if (!source || !source->HasTables()) {
		return;
	}
	if (evidence_only && source->citation_type == CitationType::DERIVED) {
		return;
	}
	view.primary_table = source->primary_table;
	view.additional_tables = source->additional_tables;
}

bool CitationClassifier::AssignExtractedTables(ViewRecord &view, CitationType type) {
	auto candidates = ExtractTableReferences(view.source.text);
	if (candidates.empty()) {
		return false;
	}
	auto selection = SelectPrimaryTable(view.name, candidates);
	if (selection.ambiguous) {
		diagnostics.Warn(ScanWarningKind::AMBIGUOUS_TABLE_CANDIDATES, view.source_file, view.name,
		                 "picked " + selection.primary_table + " (shortest table name) among " +
		                     std::to_string(candidates.size()) + " candidates");
	}
	view.citation_type = type;
	view.primary_table = selection.primary_table;
	view.additional_tables = selection.additional_tables;
	return true;
}

void CitationClassifier::Decide(ViewRecord &view) {
	view.ClearTables();

	// 1. Built from another explore
	if (view.source.kind == SourceKind::EXPLORE_SOURCE) {
		view.citation_type = CitationType::DERIVED_EXPLORE;
		return;
	}

	// 2. Plain table identifier
	std::string identifier;
	if (view.source.kind == SourceKind::SQL_TABLE_NAME && ParseTableIdentifier(view.source.text, identifier)) {
		if (view.citation_type == CitationType::DERIVED_FROM) {
			diagnostics.Debug("View " + view.name + " is declared from " + view.derived_from +
			                  " but has its own sql_table_name; classifying as native");
		}
		view.citation_type = CitationType::NATIVE;
		view.primary_table = identifier;
		return;
	}

	// 3. Alias of another view; a guessed base table is not inherited
	if (view.citation_type == CitationType::DERIVED_FROM) {
		CopyTablesFrom(view.derived_from, view, true);
		return;
	}

	// 4. Flattened array
	if (unnest_views.count(view.name) > 0) {
		view.citation_type = CitationType::UNNEST;
		return;
	}

	// 5. Tables named in the definition
	if (view.source.kind == SourceKind::DERIVED_SQL && AssignExtractedTables(view, CitationType::DERIVED_SQL)) {
		return;
	}
	if (view.source.kind == SourceKind::SQL_TABLE_NAME && AssignExtractedTables(view, CitationType::NATIVE)) {
		return;
	}

	// 6. Child of a parent view
	auto separator = view.name.find("__");
	if (separator != std::string::npos && separator > 0) {
		std::string parent = view.name.substr(0, separator);
		if (input.Contains(parent)) {
			CopyTablesFrom(parent, view, false);
			if (view.HasTables()) {
				view.citation_type = CitationType::NESTED;
				return;
			}
		}
	}

	// 7-9. Naming conventions
	view.citation_type = CitationType::DERIVED;
	if (StringUtil::EndsWith(view.name, "_snapshot")) {
		view.primary_table = config.QualifySnapshot(view.name);
		return;
	}
	if (StringUtil::StartsWith(view.name, "dim_") || StringUtil::StartsWith(view.name, "fact_")) {
		std::string table = view.name;
		if (StringUtil::EndsWith(table, "_v2")) {
			table = table.substr(0, table.size() - 3);
		}
		view.primary_table = config.QualifyDefault(table);
		return;
	}
	view.primary_table = config.QualifyDefault(view.name);
}

ViewRegistry ClassifyViews(const ViewRegistry &views, const std::set<std::string> &unnest_views,
                           const LineageConfig &config, ScanDiagnostics &diagnostics) {
	CitationClassifier classifier(views, unnest_views, config, diagnostics);
	return classifier.ClassifyAll();
}

} // namespace lookml_lineage
