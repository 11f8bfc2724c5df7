//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: view_lineage_emitter.hpp
// Description: Turns resolved view records into OpenLineage COMPLETE events
//              and queues them on the LineageClient.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_client.hpp"
#include "lineage_event_builder.hpp"
#include "lookml_model.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief Job namespace and optional parent run for emitted events.
struct EmitterOptions {
	std::string job_namespace = "lookml";
	std::string parent_run_id; ///< No parent facet when empty
	std::string parent_job_namespace;
	std::string parent_job_name;
	bool debug = false;

	/// @brief Fill the parent run fields from OPENLINEAGE_PARENT_RUN_ID,
	///        OPENLINEAGE_PARENT_JOB_NAMESPACE and OPENLINEAGE_PARENT_JOB_NAME.
	void LoadParentFromEnvironment();
};

/// @brief Summary of one queued event.
struct EmittedEvent {
	std::string view_name;
	std::string job_name;
	std::string run_id;
	size_t input_count = 0;
};

/// @class ViewLineageEmitter
/// @brief Publishes one lineage event per view that resolved to at least one table.
///
/// Inputs are the view's primary and additional tables (dataset type TABLE in the
/// warehouse namespace); the output is the view itself (dataset type VIEW, sub-type
/// set to its citation type).
///
/// Thread Safety: const methods may be called concurrently; the LineageClient
/// handles synchronization of the queue.
class ViewLineageEmitter {
public:
	explicit ViewLineageEmitter(EmitterOptions options);

	/// @brief Build the event for one view.
	/// @param view Classified view record (should have a primary table).
	/// @param run_id Run identifier for the event.
	/// @param event_time ISO 8601 event time.
	/// @throws std::runtime_error if the event cannot be built.
	json BuildViewEvent(const ViewRecord &view, const std::string &run_id, const std::string &event_time) const;

	/// @brief Build and queue events for every view with tables, in report order.
	/// @return One entry per queued event. Views whose event failed to build are logged and skipped.
	std::vector<EmittedEvent> Emit(const LineageModel &model, LineageClient &client) const;

private:
	EmitterOptions options;
};

} // namespace lookml_lineage
