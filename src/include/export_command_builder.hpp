//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: export_command_builder.hpp
// Description: Builds BigQuery EXPORT DATA statements that copy every table
//              referenced by the analyzed views to Parquet files in GCS.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_config.hpp"
#include "lookml_model.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief One generated export statement.
struct ExportCommand {
	std::string view_name;  ///< First view (in report order) that referenced the table
	std::string table_name; ///< Fully qualified table, as referenced by the view
	std::string export_sql;
	bool active = false; ///< The view is reached by at least one explore
};

/// @brief Render the EXPORT DATA statement for one table.
/// @param bucket GCS bucket name (without the gs:// scheme).
/// @param project Source project.
/// @param dataset Source dataset.
/// @param table Table name; wildcard characters are removed.
std::string RenderExportStatement(const std::string &bucket, const std::string &project, const std::string &dataset,
                                  const std::string &table);

/// @brief Build one export statement per distinct 3-part table of the model.
///
/// Views are visited in report order. Unnest and derived_explore views are skipped, bare table
/// names are completed with the default project and dataset, 2-part names are skipped and each
/// 3-part name is emitted once. A table whose project contains "snapshot" is exported from the
/// snapshot project, every other table from the default project.
///
/// @param model Analysis result.
/// @param bucket GCS bucket name.
/// @param config Default and snapshot project names.
/// @throws std::invalid_argument if bucket is empty.
std::vector<ExportCommand> BuildExportCommands(const LineageModel &model, const std::string &bucket,
                                               const LineageConfig &config);

} // namespace lookml_lineage
