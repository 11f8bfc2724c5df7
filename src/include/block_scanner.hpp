//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: block_scanner.hpp
// Description: Brace-depth-aware extraction of named LookML blocks.
//              Nesting is positional only: callers re-scan a parent's body
//              span to find its children.
//===----------------------------------------------------------------------===//

#pragma once

#include "scan_diagnostics.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief A named, brace-delimited region such as `view: orders { ... }`.
struct Block {
	std::string kind;    ///< Keyword before the colon ("view", "explore", "join", ...)
	std::string name;    ///< Identifier after the colon
	size_t header_start; ///< Offset of the keyword
	size_t open_brace;   ///< Offset of the opening '{'
	size_t close_brace;  ///< Offset of the matching '}'

	/// @brief Offset of the first body character.
	size_t BodyBegin() const {
		return open_brace + 1;
	}

	/// @brief Offset one past the last body character.
	size_t BodyEnd() const {
		return close_brace;
	}

	/// @brief Copy of the text between the braces.
	std::string Body(const std::string &text) const {
		return text.substr(BodyBegin(), BodyEnd() - BodyBegin());
	}
};

/// @brief Find the brace matching the '{' at open_brace.
/// @param text Text to scan.
/// @param open_brace Offset of an opening brace.
/// @param limit Offset at which the scan stops (defaults to the end of the text).
/// @return Offset of the matching '}', or std::string::npos if depth never returns to zero.
/// @note Braces inside string or SQL literals are counted like any other brace.
size_t FindBlockEnd(const std::string &text, size_t open_brace, size_t limit = std::string::npos);

/// @brief Find every `kind: name {` block whose header lies in [begin, end).
/// @param text Text to scan.
/// @param kind Block keyword to look for.
/// @param begin Start of the range.
/// @param end End of the range; blocks must also close before it.
/// @param path File name used in warnings.
/// @param diagnostics Receives a BlockUnterminated warning for every unbalanced block.
/// @return Blocks in textual order. Headers nested inside an earlier returned block are skipped,
///         so only the outermost matches within the range are returned.
std::vector<Block> FindBlocks(const std::string &text, const std::string &kind, size_t begin, size_t end,
                              const std::string &path, ScanDiagnostics &diagnostics);

/// @brief Find every `kind: name {` block in the whole text.
std::vector<Block> FindBlocks(const std::string &text, const std::string &kind, const std::string &path,
                              ScanDiagnostics &diagnostics);

/// @brief Copy a block body with every nested `kind:` block blanked out.
/// @note Keeps a block's own properties apart from those of its children; offsets stay valid.
std::string OwnBody(const std::string &text, const Block &block, const std::string &kind);

/// @brief Find the first `key: identifier` property in a text span.
/// @return The identifier, or an empty string if the property is absent.
/// @note Used for `from:` and `explore_source:` targets, which are opaque identifiers.
std::string FindIdentifierProperty(const std::string &text, const std::string &key);

/// @brief Blank out every line whose first non-blank character is '#'.
/// @return Text of the same length with line breaks preserved, so offsets stay valid.
std::string StripCommentLines(const std::string &text);

} // namespace lookml_lineage
