//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: table_reference_extractor.hpp
// Description: Best-effort extraction of dotted table identifiers from SQL
//              text and from Liquid conditional blocks embedded in it.
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Identifiers
//===--------------------------------------------------------------------===//

/// @brief Split a dotted identifier into its segments.
std::vector<std::string> SplitIdentifier(const std::string &identifier);

/// @brief Number of dot-separated segments (1 for a bare name).
size_t IdentifierPartCount(const std::string &identifier);

/// @brief Last segment of a dotted identifier (the table name).
std::string TerminalSegment(const std::string &identifier);

/// @brief Parse a `sql_table_name` clause as a plain 2- or 3-part identifier.
/// @param text Clause text; quotes, backticks, a trailing ';' and surrounding whitespace are ignored.
/// @param identifier Receives the unquoted identifier on success.
/// @return False when the clause is anything other than a 2- or 3-part dotted name.
bool ParseTableIdentifier(const std::string &text, std::string &identifier);

//===--------------------------------------------------------------------===//
// Extraction
//===--------------------------------------------------------------------===//

/// @brief Normalize SQL before extraction.
/// @note Removes double quotes, then `--` and block comments, then collapses whitespace runs.
///       Applying it twice gives the same result as applying it once.
std::string NormalizeSql(const std::string &sql);

/// @brief Table references inside `{% if %} ... {% endif %}` regions of normalized SQL.
/// @note When no complete region exists, `{% if ...}` followed by text up to the next '{' is used.
std::vector<std::string> ExtractTemplatedTableRefs(const std::string &normalized_sql);

/// @brief Table references found by the ordered direct-SQL patterns in normalized SQL.
/// @note No pattern adds a project prefix: 2-part names are returned as written.
std::vector<std::string> ExtractSqlTableRefs(const std::string &normalized_sql);

/// @brief Append the base form of `_streaming` and `_YYYYMMDD` tables after all entries.
std::vector<std::string> AppendBaseTableForms(const std::vector<std::string> &tables);

/// @brief Normalize, run both passes, union them (first seen wins) and append base forms.
std::vector<std::string> ExtractTableReferences(const std::string &sql);

} // namespace lookml_lineage
