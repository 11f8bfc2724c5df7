//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: source_file_index.cpp
// Description: Implementation of project file enumeration and loading.
//===----------------------------------------------------------------------===//

#include "source_file_index.hpp"
#include "duckdb/common/string_util.hpp"
#include <set>

namespace lookml_lineage {

using duckdb::StringUtil;

static const char *const LKML_SUFFIX = ".lkml";
static const char *const VIEW_SUFFIX = ".view.lkml";
static const char *const MODEL_SUFFIX = ".model.lkml";
static const char *const UNKNOWN_MODEL = "unknown_model";

static std::string Basename(const std::string &relative_path) {
	auto slash = relative_path.find_last_of('/');
	return slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
}

static bool IsRootLevel(const std::string &relative_path) {
	return relative_path.find('/') == std::string::npos;
}

static std::string JoinRelative(const std::string &dir, const std::string &name) {
	return dir.empty() ? name : dir + "/" + name;
}

SourceFileIndex::SourceFileIndex(duckdb::FileSystem &fs, std::string root) : fs(fs), root(std::move(root)) {
}

bool SourceFileIndex::IsViewFile(const std::string &relative_path) {
	return StringUtil::EndsWith(relative_path, VIEW_SUFFIX);
}

std::string SourceFileIndex::DeriveModelName(const std::string &relative_path) {
	std::string basename = Basename(relative_path);
	if (StringUtil::EndsWith(basename, MODEL_SUFFIX)) {
		return basename.substr(0, basename.size() - std::string(MODEL_SUFFIX).size());
	}
	if ((StringUtil::StartsWith(relative_path, "models/") || StringUtil::Contains(relative_path, "/models/")) &&
	    StringUtil::EndsWith(basename, LKML_SUFFIX)) {
		return basename.substr(0, basename.size() - std::string(LKML_SUFFIX).size());
	}
	return UNKNOWN_MODEL;
}

std::string SourceFileIndex::AbsolutePath(const std::string &relative_path) const {
	if (relative_path.empty()) {
		return root;
	}
	return fs.JoinPath(root, relative_path);
}

void SourceFileIndex::CollectFiles(const std::string &relative_dir, bool recursive,
                                   std::vector<std::string> &result) const {
	std::string directory = AbsolutePath(relative_dir);
	if (!fs.DirectoryExists(directory)) {
		return;
	}

	std::vector<std::string> subdirectories;
	fs.ListFiles(directory, [&](const std::string &name, bool is_directory) {
		if (is_directory) {
			if (name != ".git" && name != "node_modules") {
				subdirectories.push_back(name);
			}
			return;
		}
		if (StringUtil::EndsWith(name, LKML_SUFFIX)) {
			result.push_back(JoinRelative(relative_dir, name));
		}
	});

	if (!recursive) {
		return;
	}
	for (const auto &subdirectory : subdirectories) {
		CollectFiles(JoinRelative(relative_dir, subdirectory), true, result);
	}
}

std::vector<std::string> SourceFileIndex::ViewFilePaths() const {
	std::vector<std::string> conventional;
	CollectFiles("views", true, conventional);
	std::vector<std::string> catch_all;
	CollectFiles("", true, catch_all);

	std::set<std::string> merged;
	for (const auto &path : conventional) {
		if (IsViewFile(path)) {
			merged.insert(path);
		}
	}
	for (const auto &path : catch_all) {
		if (IsViewFile(path)) {
			merged.insert(path);
		}
	}
	return std::vector<std::string>(merged.begin(), merged.end());
}

std::vector<std::string> SourceFileIndex::ModelFilePaths() const {
	std::vector<std::string> conventional;
	CollectFiles("models", false, conventional);
	std::vector<std::string> catch_all;
	CollectFiles("", true, catch_all);

	std::set<std::string> merged;
	for (const auto &path : conventional) {
		if (!IsViewFile(path)) {
			merged.insert(path);
		}
	}
	for (const auto &path : catch_all) {
		if (IsViewFile(path)) {
			continue;
		}
		if (IsRootLevel(path) || StringUtil::EndsWith(path, MODEL_SUFFIX)) {
			merged.insert(path);
		}
	}
	return std::vector<std::string>(merged.begin(), merged.end());
}

bool SourceFileIndex::ReadFile(const std::string &relative_path, std::string &contents,
                               ScanDiagnostics &diagnostics) const {
	try {
		auto handle = fs.OpenFile(AbsolutePath(relative_path), duckdb::FileFlags::FILE_FLAGS_READ);
		auto size = handle->GetFileSize();
		contents.assign(size, '\0');
		if (size > 0) {
			auto bytes_read = handle->Read(&contents[0], size);
			if (bytes_read < 0) {
				diagnostics.Warn(ScanWarningKind::FILE_UNREADABLE, relative_path, "", "read failed; file skipped");
				return false;
			}
			contents.resize(static_cast<size_t>(bytes_read));
		}
		return true;
	} catch (const std::exception &ex) {
		diagnostics.Warn(ScanWarningKind::FILE_UNREADABLE, relative_path, "",
		                 std::string(ex.what()) + "; file skipped");
		return false;
	}
}

SourceCorpus SourceFileIndex::Load(ScanDiagnostics &diagnostics) const {
	SourceCorpus corpus;

	auto view_paths = ViewFilePaths();
	auto model_paths = ModelFilePaths();
	diagnostics.Debug("Found " + std::to_string(model_paths.size()) + " model files and " +
	                  std::to_string(view_paths.size()) + " view files under " + root);

	for (const auto &path : view_paths) {
		SourceFile file;
		if (!ReadFile(path, file.text, diagnostics)) {
			continue;
		}
		file.path = path;
		file.category = FileCategory::VIEW;
		file.model_name = DeriveModelName(path);
		corpus.view_files.push_back(std::move(file));
	}
	for (const auto &path : model_paths) {
		SourceFile file;
		if (!ReadFile(path, file.text, diagnostics)) {
			continue;
		}
		file.path = path;
		file.category = FileCategory::MODEL;
		file.model_name = DeriveModelName(path);
		corpus.model_files.push_back(std::move(file));
	}
	return corpus;
}

} // namespace lookml_lineage
