//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: table_reference_extractor.cpp
// Description: Implementation of table reference extraction.
//===----------------------------------------------------------------------===//

#include "table_reference_extractor.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace lookml_lineage {

using duckdb::StringUtil;

static const auto PATTERN_FLAGS = std::regex::ECMAScript | std::regex::icase;

//===--------------------------------------------------------------------===//
// Helper Functions
//===--------------------------------------------------------------------===//

static void AddUnique(std::vector<std::string> &tables, const std::string &table) {
	if (std::find(tables.begin(), tables.end(), table) == tables.end()) {
		tables.push_back(table);
	}
}

/// @brief Case-insensitive find of a keyword starting at pos.
static size_t FindKeyword(const std::string &text, const std::string &keyword, size_t pos) {
	auto it = std::search(text.begin() + static_cast<std::ptrdiff_t>(std::min(pos, text.size())), text.end(),
	                      keyword.begin(), keyword.end(), [](char a, char b) {
		                      return std::tolower(static_cast<unsigned char>(a)) ==
		                             std::tolower(static_cast<unsigned char>(b));
	                      });
	return it == text.end() ? std::string::npos : static_cast<size_t>(it - text.begin());
}

static size_t SkipSpaces(const std::string &text, size_t pos) {
	while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
		pos++;
	}
	return pos;
}

/// @brief Characters of an unquoted identifier segment: `[A-Za-z0-9_-]`.
static bool IsNameChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

static size_t ReadNameRun(const std::string &text, size_t pos) {
	while (pos < text.size() && IsNameChar(text[pos])) {
		pos++;
	}
	return pos;
}

/// @brief Read an optionally backticked dotted name after `FROM\s+` at pos.
/// @return The name if it has at least min_parts non-empty segments, otherwise an empty string.
static std::string ReadQualifiedName(const std::string &text, size_t pos, size_t min_parts) {
	pos = SkipSpaces(text, pos);
	if (pos < text.size() && text[pos] == '`') {
		pos++;
	}
	size_t end = pos;
	while (end < text.size() && text[end] != '`' && text[end] != ')' &&
	       !std::isspace(static_cast<unsigned char>(text[end]))) {
		end++;
	}
	std::string name = text.substr(pos, end - pos);
	if (name.empty() || name.front() == '.' || name.back() == '.' || name.find("..") != std::string::npos) {
		return "";
	}
	if (IdentifierPartCount(name) < min_parts) {
		return "";
	}
	return name;
}

/// @brief Collect the first `FROM <name>` after every opener match.
/// @note Equivalent to `opener .*? FROM\s+name` without backtracking over long SQL bodies.
static void ExtractAfterOpener(const std::string &sql, const std::regex &opener, const std::string &from_keyword,
                               size_t min_parts, std::vector<std::string> &tables) {
	for (std::sregex_iterator it(sql.begin(), sql.end(), opener), last; it != last; ++it) {
		size_t search_from = static_cast<size_t>(it->position(0) + it->length(0));
		// Like a lazy `.*?`, move on to the next FROM until one is followed by a qualifying name
		for (size_t from_pos = FindKeyword(sql, from_keyword, search_from); from_pos != std::string::npos;
		     from_pos = FindKeyword(sql, from_keyword, from_pos + 1)) {
			size_t name_pos = from_pos + from_keyword.size();
			if (name_pos >= sql.size() || !std::isspace(static_cast<unsigned char>(sql[name_pos]))) {
				continue;
			}
			std::string name = ReadQualifiedName(sql, name_pos, min_parts);
			if (!name.empty()) {
				AddUnique(tables, name);
				break;
			}
		}
	}
}

//===--------------------------------------------------------------------===//
// Identifiers
//===--------------------------------------------------------------------===//

std::vector<std::string> SplitIdentifier(const std::string &identifier) {
	return StringUtil::Split(identifier, '.');
}

size_t IdentifierPartCount(const std::string &identifier) {
	if (identifier.empty()) {
		return 0;
	}
	return static_cast<size_t>(std::count(identifier.begin(), identifier.end(), '.')) + 1;
}

std::string TerminalSegment(const std::string &identifier) {
	auto dot = identifier.find_last_of('.');
	return dot == std::string::npos ? identifier : identifier.substr(dot + 1);
}

bool ParseTableIdentifier(const std::string &text, std::string &identifier) {
	std::string cleaned;
	cleaned.reserve(text.size());
	for (char c : text) {
		if (c != '`' && c != '"' && c != '\'') {
			cleaned += c;
		}
	}
	StringUtil::Trim(cleaned);
	while (!cleaned.empty() && cleaned.back() == ';') {
		cleaned.pop_back();
	}
	StringUtil::Trim(cleaned);

	// 2 or 3 non-empty segments of [A-Za-z0-9_*$-]
	size_t parts = 1;
	bool segment_empty = true;
	for (char c : cleaned) {
		if (c == '.') {
			if (segment_empty) {
				return false;
			}
			parts++;
			segment_empty = true;
		} else if (IsNameChar(c) || c == '*' || c == '$') {
			segment_empty = false;
		} else {
			return false;
		}
	}
	if (segment_empty || parts < 2 || parts > 3) {
		return false;
	}
	identifier = cleaned;
	return true;
}

//===--------------------------------------------------------------------===//
// Backtick Quoting
//===--------------------------------------------------------------------===//

/// @brief One backtick-quoted span; open and close are the offsets of the two backticks.
struct QuotedSpan {
	size_t open;
	size_t close;

	std::string Content(const std::string &text) const {
		return text.substr(open + 1, close - open - 1);
	}
};

/// @brief Pair backticks left to right.
/// @note A candidate with whitespace inside is not a quoted name, so its closing backtick opens the
/// next candidate instead. A stray backtick in a string literal therefore costs one candidate and
/// does not shift the pairing of everything after it.
static std::vector<QuotedSpan> FindQuotedSpans(const std::string &text) {
	std::vector<QuotedSpan> spans;
	size_t open = text.find('`');
	while (open != std::string::npos) {
		size_t close = text.find('`', open + 1);
		if (close == std::string::npos) {
			break;
		}
		bool is_name = close > open + 1;
		for (size_t i = open + 1; i < close && is_name; i++) {
			is_name = !std::isspace(static_cast<unsigned char>(text[i]));
		}
		if (!is_name) {
			open = close;
			continue;
		}
		spans.push_back(QuotedSpan {open, close});
		open = text.find('`', close + 1);
	}
	return spans;
}

/// @brief Add every quoted span that is a table identifier with exactly part_count segments.
static void AddQuotedIdentifiers(const std::string &text, const std::vector<QuotedSpan> &spans, size_t part_count,
                                 std::vector<std::string> &tables) {
	for (const auto &span : spans) {
		std::string identifier;
		if (ParseTableIdentifier(span.Content(text), identifier) && IdentifierPartCount(identifier) == part_count) {
			AddUnique(tables, identifier);
		}
	}
}

/// @brief Match `\s*\.\s*dataset.table` right after a quoted project.
/// @return The `.dataset.table` text, or an empty string.
static std::string ReadDatasetAndTable(const std::string &text, size_t pos) {
	pos = SkipSpaces(text, pos);
	if (pos >= text.size() || text[pos] != '.') {
		return "";
	}
	pos = SkipSpaces(text, pos + 1);
	size_t dataset_end = ReadNameRun(text, pos);
	if (dataset_end == pos || dataset_end >= text.size() || text[dataset_end] != '.') {
		return "";
	}
	size_t table_end = ReadNameRun(text, dataset_end + 1);
	if (table_end == dataset_end + 1) {
		return "";
	}
	return "." + text.substr(pos, table_end - pos);
}

/// @brief True if the text before offset is `keyword` followed by at least one whitespace character.
static bool FollowsKeyword(const std::string &text, size_t offset, const std::string &keyword) {
	size_t end = offset;
	while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		end--;
	}
	if (end == offset || end < keyword.size()) {
		return false;
	}
	return StringUtil::CIEquals(text.substr(end - keyword.size(), keyword.size()), keyword);
}

//===--------------------------------------------------------------------===//
// Normalization
//===--------------------------------------------------------------------===//

std::string NormalizeSql(const std::string &sql) {
	std::string unquoted;
	unquoted.reserve(sql.size());
	for (char c : sql) {
		if (c != '"') {
			unquoted += c;
		}
	}

	std::string without_comments;
	without_comments.reserve(unquoted.size());
	size_t pos = 0;
	while (pos < unquoted.size()) {
		if (unquoted.compare(pos, 2, "--") == 0) {
			size_t line_end = unquoted.find('\n', pos);
			without_comments += ' ';
			pos = line_end == std::string::npos ? unquoted.size() : line_end + 1;
			continue;
		}
		if (unquoted.compare(pos, 2, "/*") == 0) {
			size_t comment_end = unquoted.find("*/", pos + 2);
			if (comment_end != std::string::npos) {
				without_comments += ' ';
				pos = comment_end + 2;
				continue;
			}
		}
		without_comments += unquoted[pos];
		pos++;
	}

	std::string result;
	result.reserve(without_comments.size());
	bool in_whitespace = false;
	for (char c : without_comments) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			if (!in_whitespace) {
				result += ' ';
			}
			in_whitespace = true;
			continue;
		}
		result += c;
		in_whitespace = false;
	}
	return result;
}

//===--------------------------------------------------------------------===//
// Templated Conditionals
//===--------------------------------------------------------------------===//

/// @brief Find the next `{% if ... %}` tag at or after pos.
/// @return The tag offset (tag_end set past its `%}`), or npos.
static size_t FindIfTag(const std::string &sql, size_t pos, size_t &tag_end) {
	while ((pos = sql.find("{%", pos)) != std::string::npos) {
		size_t keyword = SkipSpaces(sql, pos + 2);
		if (sql.compare(keyword, 2, "if") == 0) {
			size_t percent = sql.find('%', keyword + 2);
			if (percent == std::string::npos) {
				return std::string::npos;
			}
			if (percent + 1 < sql.size() && sql[percent + 1] == '}') {
				tag_end = percent + 2;
				return pos;
			}
		}
		pos += 2;
	}
	return std::string::npos;
}

/// @brief Find the next `{% endif %}` tag at or after pos.
static size_t FindEndifTag(const std::string &sql, size_t pos, size_t &tag_end) {
	while ((pos = sql.find("{%", pos)) != std::string::npos) {
		size_t keyword = SkipSpaces(sql, pos + 2);
		if (sql.compare(keyword, 5, "endif") == 0) {
			size_t close = SkipSpaces(sql, keyword + 5);
			if (sql.compare(close, 2, "%}") == 0) {
				tag_end = close + 2;
				return pos;
			}
		}
		pos += 2;
	}
	return std::string::npos;
}

static std::vector<std::string> FindConditionalRegions(const std::string &sql) {
	std::vector<std::string> regions;
	size_t pos = 0;
	while (pos < sql.size()) {
		size_t body_start = 0;
		size_t open_start = FindIfTag(sql, pos, body_start);
		if (open_start == std::string::npos) {
			break;
		}
		size_t close_end = 0;
		if (FindEndifTag(sql, body_start, close_end) == std::string::npos) {
			break;
		}
		regions.push_back(sql.substr(open_start, close_end - open_start));
		pos = close_end;
	}
	if (!regions.empty()) {
		return regions;
	}

	// Truncated conditionals: `{% if ...}` followed by text up to the next '{'
	pos = 0;
	while ((pos = sql.find("{%", pos)) != std::string::npos) {
		size_t keyword = sql.find_first_not_of(' ', pos + 2);
		if (keyword == std::string::npos || sql.compare(keyword, 2, "if") != 0) {
			pos += 2;
			continue;
		}
		size_t close = sql.find('}', keyword + 2);
		if (close == std::string::npos || close == keyword + 2) {
			break;
		}
		size_t next_open = sql.find('{', close + 1);
		size_t region_end = next_open == std::string::npos ? sql.size() : next_open;
		if (region_end > close + 1) {
			regions.push_back(sql.substr(pos, region_end - pos));
		}
		pos = region_end;
	}
	return regions;
}

std::vector<std::string> ExtractTemplatedTableRefs(const std::string &normalized_sql) {
	static const std::vector<std::regex> keyword_patterns = {
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)", PATTERN_FLAGS),
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?![.\\w-])", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?![.\\w-])", PATTERN_FLAGS)};

	std::vector<std::string> tables;
	for (const auto &region : FindConditionalRegions(normalized_sql)) {
		auto spans = FindQuotedSpans(region);
		AddQuotedIdentifiers(region, spans, 3, tables);
		AddQuotedIdentifiers(region, spans, 2, tables);
		for (const auto &pattern : keyword_patterns) {
			for (std::sregex_iterator it(region.begin(), region.end(), pattern), last; it != last; ++it) {
				AddUnique(tables, (*it)[1].str());
			}
		}
	}
	return tables;
}

//===--------------------------------------------------------------------===//
// Direct SQL
//===--------------------------------------------------------------------===//

std::vector<std::string> ExtractSqlTableRefs(const std::string &normalized_sql) {
	// Order matters: earlier patterns decide the order of the result
	static const std::vector<std::regex> keyword_patterns = {
	    // FROM/JOIN with an alias
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS),
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS),
	    // FROM/JOIN without an alias
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?!\\s*AS|\\s*\\w)", PATTERN_FLAGS),
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?![.\\w-])(?!\\s*AS|\\s*\\w)", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?!\\s*AS|\\s*\\w)", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)(?![.\\w-])(?!\\s*AS|\\s*\\w)", PATTERN_FLAGS)};
	static const std::vector<std::regex> as_alias_patterns = {
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+AS\\s+[A-Za-z][A-Za-z0-9_]*",
	               PATTERN_FLAGS),
	    std::regex("FROM\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+AS\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+AS\\s+[A-Za-z][A-Za-z0-9_]*",
	               PATTERN_FLAGS),
	    std::regex("JOIN\\s+([a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+)\\s+AS\\s+[A-Za-z][A-Za-z0-9_]*", PATTERN_FLAGS)};
	static const std::regex unnest_opener("UNNEST\\(\\(SELECT ", PATTERN_FLAGS);
	static const std::regex with_opener("WITH\\s+\\w+\\s+AS\\s*\\(", PATTERN_FLAGS);

	std::vector<std::string> tables;
	const std::string &sql = normalized_sql;
	auto spans = FindQuotedSpans(sql);

	// `project`.dataset.table
	for (const auto &span : spans) {
		std::string dataset_and_table = ReadDatasetAndTable(sql, span.close + 1);
		if (!dataset_and_table.empty()) {
			AddUnique(tables, span.Content(sql) + dataset_and_table);
		}
	}
	AddQuotedIdentifiers(sql, spans, 3, tables);
	AddQuotedIdentifiers(sql, spans, 2, tables);
	for (const auto &pattern : keyword_patterns) {
		for (std::sregex_iterator it(sql.begin(), sql.end(), pattern), last; it != last; ++it) {
			AddUnique(tables, (*it)[1].str());
		}
	}
	// FROM `name` and JOIN `name`, kept as written
	for (const auto &keyword : {"FROM", "JOIN"}) {
		for (const auto &span : spans) {
			if (FollowsKeyword(sql, span.open, keyword)) {
				AddUnique(tables, span.Content(sql));
			}
		}
	}
	for (const auto &pattern : as_alias_patterns) {
		for (std::sregex_iterator it(sql.begin(), sql.end(), pattern), last; it != last; ++it) {
			AddUnique(tables, (*it)[1].str());
		}
	}

	// UNNEST((SELECT ... FROM x)) and WITH x AS (... FROM y), three-part before two-part
	ExtractAfterOpener(sql, unnest_opener, " FROM", 3, tables);
	ExtractAfterOpener(sql, unnest_opener, " FROM", 2, tables);
	ExtractAfterOpener(sql, with_opener, "FROM", 3, tables);
	ExtractAfterOpener(sql, with_opener, "FROM", 2, tables);
	return tables;
}

//===--------------------------------------------------------------------===//
// Post-Processing
//===--------------------------------------------------------------------===//

/// @brief Strip a trailing `_streaming`, then a trailing `_YYYYMMDD`.
static std::string BaseTableForm(const std::string &table) {
	std::string base = table;
	static const std::string streaming_suffix = "_streaming";
	if (StringUtil::EndsWith(base, streaming_suffix)) {
		base = base.substr(0, base.size() - streaming_suffix.size());
	}
	if (base.size() > 9 && base[base.size() - 9] == '_') {
		bool all_digits = true;
		for (size_t i = base.size() - 8; i < base.size(); i++) {
			if (!std::isdigit(static_cast<unsigned char>(base[i]))) {
				all_digits = false;
				break;
			}
		}
		if (all_digits) {
			base = base.substr(0, base.size() - 9);
		}
	}
	return base;
}

std::vector<std::string> AppendBaseTableForms(const std::vector<std::string> &tables) {
	std::vector<std::string> result = tables;
	for (const auto &table : tables) {
		std::string base = BaseTableForm(table);
		if (base != table) {
			AddUnique(result, base);
		}
	}
	return result;
}

std::vector<std::string> ExtractTableReferences(const std::string &sql) {
	std::string normalized = NormalizeSql(sql);
	std::vector<std::string> tables = ExtractTemplatedTableRefs(normalized);
	for (const auto &table : ExtractSqlTableRefs(normalized)) {
		AddUnique(tables, table);
	}
	return AppendBaseTableForms(tables);
}

} // namespace lookml_lineage
