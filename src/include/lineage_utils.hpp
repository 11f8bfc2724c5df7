//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_utils.hpp
// Description: Utility functions for OpenLineage publishing.
//              Provides cryptographic hashing, UUID generation, timestamp
//              formatting and job naming for view lineage events.
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace lookml_lineage {

/// @brief Dataset namespace used for warehouse tables referenced by views.
static constexpr const char *WAREHOUSE_NAMESPACE = "bigquery";

/// @brief Calculate the SHA-256 hash of a string using OpenSSL.
/// @param str Input string to hash.
/// @return Hexadecimal string representation of the SHA-256 hash (64 characters).
/// @throws std::runtime_error if OpenSSL operations fail.
/// @note Used to generate deterministic job names from view definitions.
std::string CalculateSHA256(const std::string &str);

/// @brief Generate a random UUID version 7 (RFC 9562).
/// @return String representation of the UUID in the format:
///         xxxxxxxx-xxxx-7xxx-yxxx-xxxxxxxxxxxx
///         where 7 indicates version 7 and y is one of 8, 9, A, or B.
/// @note Format: 48-bit timestamp (ms) + 12-bit random + 62-bit random
/// @note Used to generate unique run IDs for OpenLineage events.
std::string GenerateUUID();

/// @brief Get the current timestamp in ISO 8601 format with UTC timezone.
/// @return String in the format: YYYY-MM-DDTHH:MM:SS.ffffffZ
/// @note Uses DuckDB's internal Timestamp type for consistency.
std::string GetCurrentISOTime();

/// @brief Sanitize a string for use in a job name by replacing invalid characters.
/// @param str Input string to sanitize.
/// @return Sanitized string with only alphanumeric characters and single underscores.
std::string SanitizeJobNamePart(const std::string &str);

/// @brief Generate the job name for a view's lineage events.
/// @param view_name Name of the view.
/// @param definition Source definition text; the view name is hashed when empty.
/// @param max_length Maximum length of the generated job name (default: 64).
/// @return Job name in format: VIEW_<sanitized view name>_<8-char hash>
/// @example "VIEW_orders_3fa2b1c0"
std::string GenerateViewJobName(const std::string &view_name, const std::string &definition,
                                size_t max_length = 64);

} // namespace lookml_lineage
