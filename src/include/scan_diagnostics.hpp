//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: scan_diagnostics.hpp
// Description: Non-fatal warning collection and debug logging for the scan.
//              Content problems are recorded here instead of thrown so that a
//              scan always returns partial results.
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief Recorded warning categories.
enum class ScanWarningKind {
	FILE_UNREADABLE,           ///< File could not be opened or read; skipped
	BLOCK_UNTERMINATED,        ///< Braces never balanced; block skipped
	AMBIGUOUS_TABLE_CANDIDATES ///< Primary table picked by the shortest-name fallback
};

/// @brief Get the display name of a warning kind (e.g., "BlockUnterminated").
const char *ScanWarningKindToString(ScanWarningKind kind);

/// @brief One recorded warning.
struct ScanWarning {
	ScanWarningKind kind;
	std::string path;    ///< File the warning refers to (may be empty)
	std::string subject; ///< View, explore or join name the warning refers to
	std::string message;
};

/// @class ScanDiagnostics
/// @brief Collects warnings for one scan and emits debug output.
///
/// Thread Safety: not thread-safe. Parallel stages give every worker its own
/// instance and merge them in a fixed order afterwards.
class ScanDiagnostics {
public:
	explicit ScanDiagnostics(bool debug = false);

	/// @brief Record a warning (also logged when debug is enabled).
	void Warn(ScanWarningKind kind, const std::string &path, const std::string &subject, const std::string &message);

	/// @brief Log a debug message to stderr if debug is enabled.
	void Debug(const std::string &message) const;

	/// @brief Append all warnings of another collector, preserving their order.
	void Merge(const ScanDiagnostics &other);

	const std::vector<ScanWarning> &Warnings() const {
		return warnings;
	}

	/// @brief Count the warnings of one kind.
	size_t Count(ScanWarningKind kind) const;

private:
	bool debug;
	std::vector<ScanWarning> warnings;
};

} // namespace lookml_lineage
