//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: source_definition_extractor.cpp
// Description: Implementation of source definition extraction.
//===----------------------------------------------------------------------===//

#include "source_definition_extractor.hpp"
#include "block_scanner.hpp"
#include "duckdb/common/string_util.hpp"
#include <regex>
#include <unordered_set>

namespace lookml_lineage {

using duckdb::StringUtil;

static const char *const CLAUSE_TERMINATOR = ";;";

static std::string Trimmed(std::string text) {
	StringUtil::Trim(text);
	return text;
}

/// @brief Find the end offset of a `key:` clause header, or npos.
static size_t FindClauseStart(const std::string &text, const std::string &key) {
	const std::regex clause_pattern("\\b" + key + "\\s*:\\s*");
	std::smatch match;
	if (!std::regex_search(text, match, clause_pattern)) {
		return std::string::npos;
	}
	return static_cast<size_t>(match.position(0) + match.length(0));
}

/// @brief Read the text between an opening and a closing delimiter that starts at pos.
static bool ReadDelimited(const std::string &text, size_t pos, const std::string &open, const std::string &close,
                          std::string &result) {
	if (text.compare(pos, open.size(), open) != 0) {
		return false;
	}
	size_t body_start = pos + open.size();
	size_t body_end = text.find(close, body_start);
	if (body_end == std::string::npos) {
		return false;
	}
	result = text.substr(body_start, body_end - body_start);
	return true;
}

/// @brief Extract the SQL body of a derived_table block.
/// @note `;;` terminates the clause; the brace and quote forms are fallbacks for bodies without it.
static bool ExtractDerivedSql(const std::string &derived_body, std::string &sql) {
	size_t start = FindClauseStart(derived_body, "sql");
	if (start == std::string::npos) {
		return false;
	}

	size_t terminator = derived_body.find(CLAUSE_TERMINATOR, start);
	if (terminator != std::string::npos) {
		sql = Trimmed(derived_body.substr(start, terminator - start));
		return true;
	}
	if (ReadDelimited(derived_body, start, "{{{", "}}}", sql) ||
	    ReadDelimited(derived_body, start, "\"\"\"", "\"\"\"", sql)) {
		sql = Trimmed(sql);
		return true;
	}
	if (derived_body.compare(start, 1, "{") == 0) {
		size_t close = FindBlockEnd(derived_body, start);
		if (close != std::string::npos) {
			sql = Trimmed(derived_body.substr(start + 1, close - start - 1));
			return true;
		}
		return false;
	}
	if (ReadDelimited(derived_body, start, "\"", "\"", sql)) {
		sql = Trimmed(sql);
		return true;
	}
	return false;
}

SourceDefinition ExtractSourceDefinition(const std::string &view_body, const std::string &path,
                                         ScanDiagnostics &diagnostics) {
	SourceDefinition definition;

	size_t table_start = FindClauseStart(view_body, "sql_table_name");
	if (table_start != std::string::npos) {
		size_t terminator = view_body.find(CLAUSE_TERMINATOR, table_start);
		if (terminator == std::string::npos) {
			terminator = view_body.find('\n', table_start);
		}
		if (terminator == std::string::npos) {
			terminator = view_body.size();
		}
		definition.kind = SourceKind::SQL_TABLE_NAME;
		definition.text = Trimmed(view_body.substr(table_start, terminator - table_start));
		return definition;
	}

	size_t derived_start = FindClauseStart(view_body, "derived_table");
	if (derived_start == std::string::npos || derived_start >= view_body.size() || view_body[derived_start] != '{') {
		return definition;
	}
	size_t derived_end = FindBlockEnd(view_body, derived_start);
	if (derived_end == std::string::npos) {
		diagnostics.Warn(ScanWarningKind::BLOCK_UNTERMINATED, path, "derived_table",
		                 "derived_table has no matching closing brace; definition skipped");
		return definition;
	}
	std::string derived_body = view_body.substr(derived_start + 1, derived_end - derived_start - 1);

	std::string explore_name = FindIdentifierProperty(derived_body, "explore_source");
	if (!explore_name.empty()) {
		definition.kind = SourceKind::EXPLORE_SOURCE;
		definition.text = explore_name;
		return definition;
	}

	std::string sql;
	if (ExtractDerivedSql(derived_body, sql)) {
		definition.kind = SourceKind::DERIVED_SQL;
		definition.text = sql;
	}
	return definition;
}

std::vector<NamedSourceDefinition> ScanSourceDefinitions(const SourceFile &file, ScanDiagnostics &diagnostics) {
	std::vector<NamedSourceDefinition> result;
	std::string text = StripCommentLines(file.text);
	for (const auto &block : FindBlocks(text, "view", file.path, diagnostics)) {
		NamedSourceDefinition named;
		named.view_name = block.name;
		named.definition = ExtractSourceDefinition(block.Body(text), file.path, diagnostics);
		result.push_back(std::move(named));
	}
	return result;
}

ViewRegistry ApplySourceDefinitions(const ViewRegistry &views,
                                    const std::vector<std::vector<NamedSourceDefinition>> &per_file) {
	ViewRegistry result = views;
	std::unordered_set<std::string> assigned;
	for (const auto &definitions : per_file) {
		for (const auto &named : definitions) {
			if (!assigned.insert(named.view_name).second) {
				continue;
			}
			result.GetOrAdd(named.view_name).source = named.definition;
		}
	}
	return result;
}

} // namespace lookml_lineage
