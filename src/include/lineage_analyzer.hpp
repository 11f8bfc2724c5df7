//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_analyzer.hpp
// Description: Pipeline driver. Runs registry, explore graph, alias, source
//              definition and classification stages over a project.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_config.hpp"
#include "lookml_model.hpp"
#include "duckdb/common/file_system.hpp"
#include <string>

namespace lookml_lineage {

/// @brief Resolve the provenance of every view in an in-memory corpus.
/// @param corpus Project files.
/// @param config Table qualifiers, debug flag and worker thread count.
/// @return The resolved model. Content problems are reported in `warnings`; nothing is thrown for them.
/// @note Per-file extraction runs on `config.threads` workers; results are merged in file order,
///       so the model is identical for every thread count.
LineageModel AnalyzeCorpus(const SourceCorpus &corpus, const LineageConfig &config);

/// @brief Index and read the project below root, then analyze it.
/// @param fs File system used for listing and reading.
/// @param root Project root directory.
/// @param config Analysis settings.
LineageModel AnalyzeProject(duckdb::FileSystem &fs, const std::string &root, const LineageConfig &config);

} // namespace lookml_lineage
