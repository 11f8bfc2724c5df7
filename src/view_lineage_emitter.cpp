//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: view_lineage_emitter.cpp
// Description: Implementation of the ViewLineageEmitter.
//===----------------------------------------------------------------------===//

#include "view_lineage_emitter.hpp"
#include "lineage_utils.hpp"
#include <cstdlib>
#include <iostream>

namespace lookml_lineage {

void EmitterOptions::LoadParentFromEnvironment() {
	const char *parent_run_id_env = std::getenv("OPENLINEAGE_PARENT_RUN_ID");
	if (!parent_run_id_env) {
		return;
	}
	const char *parent_job_ns = std::getenv("OPENLINEAGE_PARENT_JOB_NAMESPACE");
	const char *parent_job_name_env = std::getenv("OPENLINEAGE_PARENT_JOB_NAME");

	parent_run_id = parent_run_id_env;
	parent_job_namespace = parent_job_ns ? parent_job_ns : "";
	parent_job_name = parent_job_name_env ? parent_job_name_env : "";
}

ViewLineageEmitter::ViewLineageEmitter(EmitterOptions options_p) : options(std::move(options_p)) {
	if (options.job_namespace.empty()) {
		options.job_namespace = "lookml";
	}
}

json ViewLineageEmitter::BuildViewEvent(const ViewRecord &view, const std::string &run_id,
                                        const std::string &event_time) const {
	std::string job_name = GenerateViewJobName(view.name, view.source.text);

	auto builder = LineageEventBuilder::CreateComplete();
	builder.WithRunId(run_id).WithEventTime(event_time).WithJob(options.job_namespace, job_name).AddJobFacet_JobType(
	    "VIEW");

	if (view.source.kind == SourceKind::DERIVED_SQL && !view.source.text.empty()) {
		builder.AddJobFacet_Sql(view.source.text);
	}

	std::vector<std::string> tables;
	if (!view.primary_table.empty()) {
		tables.push_back(view.primary_table);
	}
	tables.insert(tables.end(), view.additional_tables.begin(), view.additional_tables.end());
	for (const auto &table : tables) {
		builder.AddInputDataset(WAREHOUSE_NAMESPACE, table)
		    .AddInputDatasetFacet_DatasetType(WAREHOUSE_NAMESPACE, table, "TABLE");
	}

	builder.AddOutputDataset(options.job_namespace, view.name)
	    .AddOutputDatasetFacet_DatasetType(options.job_namespace, view.name, "VIEW",
	                                       CitationTypeToString(view.citation_type));
	if (view.citation_type == CitationType::DERIVED_FROM && !view.derived_from.empty()) {
		builder.AddOutputDatasetFacet_SymlinksIdentifiers(options.job_namespace, view.name, options.job_namespace,
		                                                  view.derived_from, "VIEW");
	}

	if (!options.parent_run_id.empty()) {
		builder.AddRunFacet_Parent(options.parent_run_id, options.parent_job_namespace, options.parent_job_name);
	}

	return builder.Build();
}

std::vector<EmittedEvent> ViewLineageEmitter::Emit(const LineageModel &model, LineageClient &client) const {
	std::vector<EmittedEvent> emitted;
	for (const ViewRecord *view : model.ReportOrder()) {
		if (!view->HasTables()) {
			continue;
		}
		try {
			EmittedEvent entry;
			entry.view_name = view->name;
			entry.run_id = GenerateUUID();
			json event = BuildViewEvent(*view, entry.run_id, GetCurrentISOTime());
			entry.job_name = event["job"]["name"].get<std::string>();
			entry.input_count = event.contains("inputs") ? event["inputs"].size() : 0;

			client.SendEvent(event.dump());
			emitted.push_back(std::move(entry));
		} catch (const std::exception &ex) {
			std::cerr << "LookML Lineage: Error building event for view " << view->name << ": " << ex.what() << '\n';
		}
	}
	if (options.debug) {
		std::cerr << "LookML Lineage Debug: Queued " << emitted.size() << " view events" << '\n';
	}
	return emitted;
}

} // namespace lookml_lineage
