//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: block_scanner.cpp
// Description: Implementation of the brace-depth block scanner.
//===----------------------------------------------------------------------===//

#include "block_scanner.hpp"
#include <algorithm>
#include <cstdint>
#include <regex>

namespace lookml_lineage {

size_t FindBlockEnd(const std::string &text, size_t open_brace, size_t limit) {
	if (open_brace >= text.size() || text[open_brace] != '{') {
		return std::string::npos;
	}
	size_t stop = limit < text.size() ? limit : text.size();
	int64_t depth = 0;
	for (size_t pos = open_brace; pos < stop; pos++) {
		char c = text[pos];
		if (c == '{') {
			depth++;
		} else if (c == '}') {
			depth--;
			if (depth == 0) {
				return pos;
			}
		}
	}
	return std::string::npos;
}

std::vector<Block> FindBlocks(const std::string &text, const std::string &kind, size_t begin, size_t end,
                              const std::string &path, ScanDiagnostics &diagnostics) {
	std::vector<Block> blocks;
	if (end > text.size()) {
		end = text.size();
	}
	if (begin >= end) {
		return blocks;
	}

	const std::regex header_pattern("\\b" + kind + "\\s*:\\s*(\\w+)\\s*\\{");
	auto range_begin = text.begin() + static_cast<std::ptrdiff_t>(begin);
	auto range_end = text.begin() + static_cast<std::ptrdiff_t>(end);

	// Headers before this offset belong to a block that was already returned
	size_t skip_until = begin;
	for (std::sregex_iterator it(range_begin, range_end, header_pattern), last; it != last; ++it) {
		const std::smatch &match = *it;
		size_t header_start = begin + static_cast<size_t>(match.position(0));
		if (header_start < skip_until) {
			continue;
		}

		Block block;
		block.kind = kind;
		block.name = match[1].str();
		block.header_start = header_start;
		block.open_brace = header_start + static_cast<size_t>(match.length(0)) - 1;
		block.close_brace = FindBlockEnd(text, block.open_brace, end);
		if (block.close_brace == std::string::npos) {
			diagnostics.Warn(ScanWarningKind::BLOCK_UNTERMINATED, path, block.name,
			                 "'" + kind + ": " + block.name + "' has no matching closing brace; block skipped");
			continue;
		}

		skip_until = block.close_brace + 1;
		blocks.push_back(std::move(block));
	}
	return blocks;
}

std::vector<Block> FindBlocks(const std::string &text, const std::string &kind, const std::string &path,
                              ScanDiagnostics &diagnostics) {
	return FindBlocks(text, kind, 0, text.size(), path, diagnostics);
}

std::string OwnBody(const std::string &text, const Block &block, const std::string &kind) {
	std::string body = block.Body(text);
	ScanDiagnostics silent;
	for (const auto &child : FindBlocks(text, kind, block.BodyBegin(), block.BodyEnd(), "", silent)) {
		size_t offset = child.header_start - block.BodyBegin();
		size_t length = child.close_brace + 1 - child.header_start;
		std::fill(body.begin() + static_cast<std::ptrdiff_t>(offset),
		          body.begin() + static_cast<std::ptrdiff_t>(offset + length), ' ');
	}
	return body;
}

std::string FindIdentifierProperty(const std::string &text, const std::string &key) {
	const std::regex property_pattern("\\b" + key + "\\s*:\\s*(\\w+)");
	std::smatch match;
	if (std::regex_search(text, match, property_pattern)) {
		return match[1].str();
	}
	return "";
}

std::string StripCommentLines(const std::string &text) {
	std::string result = text;
	size_t line_start = 0;
	while (line_start < result.size()) {
		size_t line_end = result.find('\n', line_start);
		if (line_end == std::string::npos) {
			line_end = result.size();
		}
		size_t first = result.find_first_not_of(" \t\r", line_start);
		if (first != std::string::npos && first < line_end && result[first] == '#') {
			for (size_t pos = line_start; pos < line_end; pos++) {
				if (result[pos] != '\r') {
					result[pos] = ' ';
				}
			}
		}
		line_start = line_end + 1;
	}
	return result;
}

} // namespace lookml_lineage
