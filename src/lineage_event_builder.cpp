//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_event_builder.cpp
// Description: Implementation of the LineageEventBuilder class.
//===----------------------------------------------------------------------===//

#include "lineage_event_builder.hpp"
#include <stdexcept>

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Static member definitions (required for C++11 constexpr)
//===--------------------------------------------------------------------===//

constexpr const char *LineageEventBuilder::DEFAULT_PRODUCER;
constexpr const char *LineageEventBuilder::DEFAULT_SCHEMA_URL;
constexpr const char *LineageEventBuilder::SQL_FACET_SCHEMA;
constexpr const char *LineageEventBuilder::JOB_TYPE_FACET_SCHEMA;
constexpr const char *LineageEventBuilder::PARENT_FACET_SCHEMA;
constexpr const char *LineageEventBuilder::SYMLINKS_FACET_SCHEMA;
constexpr const char *LineageEventBuilder::DATASET_TYPE_FACET_SCHEMA;

LineageEventBuilder LineageEventBuilder::CreateComplete() {
	return LineageEventBuilder("COMPLETE");
}

LineageEventBuilder::LineageEventBuilder(const char *event_type) {
	event_json = {{"eventType", event_type}, {"producer", DEFAULT_PRODUCER}, {"schemaURL", DEFAULT_SCHEMA_URL}};
}

//===--------------------------------------------------------------------===//
// Core Metadata
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::WithRunId(const std::string &run_id) {
	event_json["run"]["runId"] = run_id;
	has_run_id = true;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithEventTime(const std::string &event_time) {
	event_json["eventTime"] = event_time;
	has_event_time = true;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithJob(const std::string &namespace_, const std::string &name) {
	json facets = json::object();
	if (event_json.contains("job") && event_json["job"].contains("facets")) {
		facets = event_json["job"]["facets"];
	}
	event_json["job"] = {{"namespace", namespace_}, {"name", name}};
	if (!facets.empty()) {
		event_json["job"]["facets"] = facets;
	}
	has_job = true;
	return *this;
}

//===--------------------------------------------------------------------===//
// Job Facets
//===--------------------------------------------------------------------===//

json &LineageEventBuilder::FacetsOf(const char *section) {
	json &owner = event_json[section];
	if (!owner.contains("facets")) {
		owner["facets"] = json::object();
	}
	return owner["facets"];
}

json LineageEventBuilder::MakeFacet(const char *schema_url) {
	return json {{"_producer", DEFAULT_PRODUCER}, {"_schemaURL", schema_url}};
}

LineageEventBuilder &LineageEventBuilder::AddJobFacet_Sql(const std::string &query) {
	json facet = MakeFacet(SQL_FACET_SCHEMA);
	facet["query"] = query;
	FacetsOf("job")["sql"] = facet;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::AddJobFacet_JobType(const std::string &job_type) {
	json facet = MakeFacet(JOB_TYPE_FACET_SCHEMA);
	facet["processingType"] = "BATCH";
	facet["integration"] = "LOOKML";
	facet["jobType"] = job_type;
	FacetsOf("job")["jobType"] = facet;
	return *this;
}

//===--------------------------------------------------------------------===//
// Run Facets
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::AddRunFacet_Parent(const std::string &parent_run_id,
                                                             const std::string &parent_namespace,
                                                             const std::string &parent_name) {
	json facet = MakeFacet(PARENT_FACET_SCHEMA);
	facet["run"] = {{"runId", parent_run_id}};
	// The job reference is only valid with both parts
	if (!parent_namespace.empty() && !parent_name.empty()) {
		facet["job"] = {{"namespace", parent_namespace}, {"name", parent_name}};
	}
	FacetsOf("run")["parent"] = facet;
	return *this;
}

//===--------------------------------------------------------------------===//
// Datasets
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::AddInputDataset(const std::string &namespace_, const std::string &name) {
	if (!event_json.contains("inputs")) {
		event_json["inputs"] = json::array();
	}
	event_json["inputs"].push_back(CreateDataset(namespace_, name));
	return *this;
}

LineageEventBuilder &LineageEventBuilder::AddOutputDataset(const std::string &namespace_, const std::string &name) {
	if (!event_json.contains("outputs")) {
		event_json["outputs"] = json::array();
	}
	event_json["outputs"].push_back(CreateDataset(namespace_, name));
	return *this;
}

json *LineageEventBuilder::FindDataset(const char *list, const std::string &namespace_, const std::string &name) {
	if (!event_json.contains(list)) {
		return nullptr;
	}
	for (auto &dataset : event_json[list]) {
		if (dataset["namespace"] == namespace_ && dataset["name"] == name) {
			return &dataset;
		}
	}
	return nullptr;
}

json &LineageEventBuilder::DatasetFacets(json &dataset) {
	if (!dataset.contains("facets")) {
		dataset["facets"] = json::object();
	}
	return dataset["facets"];
}

//===--------------------------------------------------------------------===//
// Dataset Facets
//===--------------------------------------------------------------------===//

json LineageEventBuilder::MakeDatasetTypeFacet(const std::string &dataset_type, const std::string &sub_type) {
	json facet = MakeFacet(DATASET_TYPE_FACET_SCHEMA);
	facet["datasetType"] = dataset_type;
	if (!sub_type.empty()) {
		facet["subType"] = sub_type;
	}
	return facet;
}

LineageEventBuilder &LineageEventBuilder::AddInputDatasetFacet_DatasetType(const std::string &dataset_namespace,
                                                                           const std::string &dataset_name,
                                                                           const std::string &dataset_type,
                                                                           const std::string &sub_type) {
	json *dataset = FindDataset("inputs", dataset_namespace, dataset_name);
	if (dataset) {
		DatasetFacets(*dataset)["datasetType"] = MakeDatasetTypeFacet(dataset_type, sub_type);
	}
	return *this;
}

LineageEventBuilder &LineageEventBuilder::AddOutputDatasetFacet_DatasetType(const std::string &dataset_namespace,
                                                                            const std::string &dataset_name,
                                                                            const std::string &dataset_type,
                                                                            const std::string &sub_type) {
	json *dataset = FindDataset("outputs", dataset_namespace, dataset_name);
	if (dataset) {
		DatasetFacets(*dataset)["datasetType"] = MakeDatasetTypeFacet(dataset_type, sub_type);
	}
	return *this;
}

LineageEventBuilder &LineageEventBuilder::AddOutputDatasetFacet_SymlinksIdentifiers(
    const std::string &dataset_namespace, const std::string &dataset_name, const std::string &identifier_namespace,
    const std::string &identifier_name, const std::string &identifier_type) {
	json *dataset = FindDataset("outputs", dataset_namespace, dataset_name);
	if (!dataset) {
		return *this;
	}

	json &facets = DatasetFacets(*dataset);
	if (!facets.contains("symlinks")) {
		facets["symlinks"] = MakeFacet(SYMLINKS_FACET_SCHEMA);
		facets["symlinks"]["identifiers"] = json::array();
	}
	facets["symlinks"]["identifiers"].push_back(
	    {{"namespace", identifier_namespace}, {"name", identifier_name}, {"type", identifier_type}});
	return *this;
}

//===--------------------------------------------------------------------===//
// Producer Information
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::WithProducer(const std::string &producer_url) {
	event_json["producer"] = producer_url;
	return *this;
}

//===--------------------------------------------------------------------===//
// Build
//===--------------------------------------------------------------------===//

json LineageEventBuilder::CreateDataset(const std::string &namespace_, const std::string &name) {
	return json {{"namespace", namespace_}, {"name", name}};
}

void LineageEventBuilder::Validate() const {
	if (!has_run_id) {
		throw std::runtime_error("LineageEventBuilder: runId is required");
	}
	if (!has_event_time) {
		throw std::runtime_error("LineageEventBuilder: eventTime is required");
	}
	if (!has_job) {
		throw std::runtime_error("LineageEventBuilder: job information is required");
	}
}

json LineageEventBuilder::Build() const {
	Validate();
	return event_json;
}

std::string LineageEventBuilder::BuildString(int indent) const {
	Validate();
	return event_json.dump(indent);
}

} // namespace lookml_lineage
