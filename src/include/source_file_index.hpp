//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: source_file_index.hpp
// Description: Enumerates the LookML files of a project through DuckDB's
//              FileSystem, merging conventional and catch-all locations.
//===----------------------------------------------------------------------===//

#pragma once

#include "lookml_model.hpp"
#include "scan_diagnostics.hpp"
#include "duckdb/common/file_system.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @class SourceFileIndex
/// @brief Finds and reads the model-like and view-like files below a project root.
///
/// View-like files are `views/**/*.view.lkml` merged with `**/*.view.lkml`.
/// Model-like files are `models/*.lkml`, root-level `*.lkml` files that are not
/// view files, and `*.model.lkml` anywhere. Each list is de-duplicated by path
/// and sorted, so enumeration order does not depend on the file system.
class SourceFileIndex {
public:
	SourceFileIndex(duckdb::FileSystem &fs, std::string root);

	/// @brief Relative paths of all view-like files.
	std::vector<std::string> ViewFilePaths() const;

	/// @brief Relative paths of all model-like files.
	std::vector<std::string> ModelFilePaths() const;

	/// @brief Read every indexed file.
	/// @param diagnostics Receives a FileUnreadable warning for each file that cannot be read.
	/// @return The readable files; unreadable ones are skipped.
	SourceCorpus Load(ScanDiagnostics &diagnostics) const;

	/// @brief Check whether a relative path names a view file (`*.view.lkml`).
	static bool IsViewFile(const std::string &relative_path);

	/// @brief Derive the owning model name of a file.
	/// @return Basename without `.model.lkml`; for files under `models/`, basename without
	///         `.lkml`; otherwise "unknown_model".
	static std::string DeriveModelName(const std::string &relative_path);

private:
	/// @brief List the `.lkml` files below a directory relative to the root.
	void CollectFiles(const std::string &relative_dir, bool recursive, std::vector<std::string> &result) const;

	std::string AbsolutePath(const std::string &relative_path) const;

	bool ReadFile(const std::string &relative_path, std::string &contents, ScanDiagnostics &diagnostics) const;

	duckdb::FileSystem &fs;
	std::string root;
};

} // namespace lookml_lineage
