//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: scan_diagnostics.cpp
// Description: Implementation of the scan warning collector.
//===----------------------------------------------------------------------===//

#include "scan_diagnostics.hpp"
#include <iostream>

namespace lookml_lineage {

const char *ScanWarningKindToString(ScanWarningKind kind) {
	switch (kind) {
	case ScanWarningKind::FILE_UNREADABLE:
		return "FileUnreadable";
	case ScanWarningKind::BLOCK_UNTERMINATED:
		return "BlockUnterminated";
	case ScanWarningKind::AMBIGUOUS_TABLE_CANDIDATES:
		return "AmbiguousTableCandidates";
	}
	return "Unknown";
}

ScanDiagnostics::ScanDiagnostics(bool debug) : debug(debug) {
}

void ScanDiagnostics::Warn(ScanWarningKind kind, const std::string &path, const std::string &subject,
                           const std::string &message) {
	if (debug) {
		std::cerr << "LookML Lineage Debug: [" << ScanWarningKindToString(kind) << "] " << path;
		if (!subject.empty()) {
			std::cerr << " (" << subject << ")";
		}
		std::cerr << ": " << message << '\n';
	}
	ScanWarning warning;
	warning.kind = kind;
	warning.path = path;
	warning.subject = subject;
	warning.message = message;
	warnings.push_back(std::move(warning));
}

void ScanDiagnostics::Debug(const std::string &message) const {
	if (debug) {
		std::cerr << "LookML Lineage Debug: " << message << '\n';
	}
}

void ScanDiagnostics::Merge(const ScanDiagnostics &other) {
	warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

size_t ScanDiagnostics::Count(ScanWarningKind kind) const {
	size_t count = 0;
	for (const auto &warning : warnings) {
		if (warning.kind == kind) {
			count++;
		}
	}
	return count;
}

} // namespace lookml_lineage
