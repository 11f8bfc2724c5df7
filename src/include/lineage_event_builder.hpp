//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_event_builder.hpp
// Description: Builder for OpenLineage run events that describe how a LookML
//              view is derived from warehouse tables.
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lookml_lineage {

using json = nlohmann::json;

/// @class LineageEventBuilder
/// @brief Fluent builder for OpenLineage COMPLETE run events.
///
/// A view event has one job (the view definition), the view's tables as input
/// datasets and the view itself as the single output dataset.
///
/// Example usage:
/// @code
///   auto event = LineageEventBuilder::CreateComplete()
///                    .WithRunId(GenerateUUID())
///                    .WithEventTime(GetCurrentISOTime())
///                    .WithJob("lookml", "VIEW_orders_3fa2b1c0")
///                    .AddInputDataset("bigquery", "proj.ds.orders")
///                    .AddInputDatasetFacet_DatasetType("bigquery", "proj.ds.orders", "TABLE")
///                    .AddOutputDataset("lookml", "orders")
///                    .AddOutputDatasetFacet_DatasetType("lookml", "orders", "VIEW", "native")
///                    .Build();
/// @endcode
class LineageEventBuilder {
public:
	//===--------------------------------------------------------------------===//
	// Factory Methods
	//===--------------------------------------------------------------------===//

	/// @brief Create a builder for a COMPLETE event
	static LineageEventBuilder CreateComplete();

	//===--------------------------------------------------------------------===//
	// Base Event Metadata (Required)
	//===--------------------------------------------------------------------===//

	/// @brief Set the run ID (typically a UUIDv7)
	LineageEventBuilder &WithRunId(const std::string &run_id);

	/// @brief Set the event timestamp (ISO 8601)
	LineageEventBuilder &WithEventTime(const std::string &event_time);

	/// @brief Set the job namespace and name
	/// @param namespace_ Namespace for the job (e.g., "lookml")
	/// @param name Job name (see GenerateViewJobName)
	LineageEventBuilder &WithJob(const std::string &namespace_, const std::string &name);

	//===--------------------------------------------------------------------===//
	// Job Facets
	//===--------------------------------------------------------------------===//

	/// @brief Add SQL facet holding a derived table's SQL body
	LineageEventBuilder &AddJobFacet_Sql(const std::string &query);

	/// @brief Add jobType facet (processing type BATCH, integration LOOKML)
	/// @param job_type Job type within the integration (e.g., "VIEW")
	LineageEventBuilder &AddJobFacet_JobType(const std::string &job_type);

	//===--------------------------------------------------------------------===//
	// Run Facets
	//===--------------------------------------------------------------------===//

	/// @brief Add parent run facet for orchestration integration
	/// @param parent_run_id UUID of the parent run
	/// @param parent_namespace Optional parent job namespace
	/// @param parent_name Optional parent job name
	/// @note The parent job is only written when both namespace and name are given.
	LineageEventBuilder &AddRunFacet_Parent(const std::string &parent_run_id, const std::string &parent_namespace = "",
	                                        const std::string &parent_name = "");

	//===--------------------------------------------------------------------===//
	// Datasets
	//===--------------------------------------------------------------------===//

	LineageEventBuilder &AddInputDataset(const std::string &namespace_, const std::string &name);
	LineageEventBuilder &AddOutputDataset(const std::string &namespace_, const std::string &name);

	//===--------------------------------------------------------------------===//
	// Dataset Facets
	//===--------------------------------------------------------------------===//

	/// @brief Add DatasetType facet to a previously added input dataset
	/// @param dataset_type Dataset type (e.g., "TABLE", "VIEW")
	/// @param sub_type Optional sub-type within the dataset type
	/// @note Does nothing if the dataset was not added.
	LineageEventBuilder &AddInputDatasetFacet_DatasetType(const std::string &dataset_namespace,
	                                                      const std::string &dataset_name,
	                                                      const std::string &dataset_type,
	                                                      const std::string &sub_type = "");

	/// @brief Add DatasetType facet to a previously added output dataset
	LineageEventBuilder &AddOutputDatasetFacet_DatasetType(const std::string &dataset_namespace,
	                                                       const std::string &dataset_name,
	                                                       const std::string &dataset_type,
	                                                       const std::string &sub_type = "");

	/// @brief Add a symlink identifier to a previously added output dataset
	/// @note Repeated calls append identifiers to the same facet.
	LineageEventBuilder &AddOutputDatasetFacet_SymlinksIdentifiers(const std::string &dataset_namespace,
	                                                               const std::string &dataset_name,
	                                                               const std::string &identifier_namespace,
	                                                               const std::string &identifier_name,
	                                                               const std::string &identifier_type);

	//===--------------------------------------------------------------------===//
	// Producer Information
	//===--------------------------------------------------------------------===//

	/// @brief Set custom producer URL (defaults to extension URL)
	LineageEventBuilder &WithProducer(const std::string &producer_url);

	//===--------------------------------------------------------------------===//
	// Build
	//===--------------------------------------------------------------------===//

	/// @brief Create a dataset JSON object
	static json CreateDataset(const std::string &namespace_, const std::string &name);

	/// @brief Build the final JSON event
	/// @throws std::runtime_error if runId, eventTime or job is missing
	json Build() const;

	/// @brief Build and serialize to JSON string
	/// @param indent Number of spaces for indentation (-1 for compact)
	std::string BuildString(int indent = -1) const;

private:
	explicit LineageEventBuilder(const char *event_type);

	void Validate() const;

	// Dataset of the "inputs" or "outputs" list, or nullptr
	json *FindDataset(const char *list, const std::string &namespace_, const std::string &name);

	json &DatasetFacets(json &dataset);

	// "facets" object of the "job" or "run" section, created on demand
	json &FacetsOf(const char *section);

	static json MakeFacet(const char *schema_url);
	static json MakeDatasetTypeFacet(const std::string &dataset_type, const std::string &sub_type);

	json event_json;
	bool has_run_id = false;
	bool has_event_time = false;
	bool has_job = false;

	static constexpr const char *DEFAULT_PRODUCER = "https://github.com/lookml-lineage/duckdb-lookml-lineage";
	static constexpr const char *DEFAULT_SCHEMA_URL =
	    "https://openlineage.io/spec/2-0-2/OpenLineage.json#/$defs/RunEvent";
	static constexpr const char *SQL_FACET_SCHEMA = "https://openlineage.io/spec/facets/1-1-0/SQLJobFacet.json";
	static constexpr const char *JOB_TYPE_FACET_SCHEMA = "https://openlineage.io/spec/facets/2-0-3/JobTypeJobFacet.json";
	static constexpr const char *PARENT_FACET_SCHEMA = "https://openlineage.io/spec/facets/1-0-0/ParentRunFacet.json";
	static constexpr const char *SYMLINKS_FACET_SCHEMA =
	    "https://openlineage.io/spec/facets/1-0-1/SymlinksDatasetFacet.json";
	static constexpr const char *DATASET_TYPE_FACET_SCHEMA =
	    "https://openlineage.io/spec/facets/1-0-0/DatasetTypeDatasetFacet.json";
};

} // namespace lookml_lineage
