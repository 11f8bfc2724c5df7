//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_client.hpp
// Description: HTTP transport for view lineage events. A background worker
//              thread drains a bounded queue and POSTs each event to the
//              configured OpenLineage backend.
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace lookml_lineage {

/// @brief Transport configuration, copied out of the client as one snapshot.
struct TransportSettings {
	std::string url;                     ///< Empty disables delivery
	std::string api_key;                 ///< Sent as a Bearer token when set
	std::string job_namespace = "lookml";
	bool debug = false;
	size_t max_retries = 3;
	size_t max_queue_size = 10000;
	int64_t timeout_seconds = 10;
};

/// @brief Delivery counters since the process started.
struct DeliveryStats {
	size_t delivered = 0; ///< Accepted with a 2xx response
	size_t failed = 0;    ///< Given up after retries or a non-retryable response
	size_t dropped = 0;   ///< Rejected because the queue was full
	size_t pending = 0;   ///< Still waiting in the queue
};

/// @class LineageClient
/// @brief Process-wide asynchronous publisher for OpenLineage events.
///
/// Events are queued by SendEvent and delivered by a single worker thread, so
/// table functions never wait on the network. All public methods are thread-safe.
/// Settings changed with SET apply to the next delivery attempt.
class LineageClient {
public:
	static LineageClient &Get();

	/// @brief Queue one serialized event.
	/// @note Drops the event and counts it when the queue is at capacity.
	void SendEvent(std::string event_json);

	//===--------------------------------------------------------------------===//
	// Configuration
	//===--------------------------------------------------------------------===//

	void SetUrl(std::string url);
	void SetApiKey(std::string key);
	void SetNamespace(std::string ns);
	void SetDebug(bool debug);
	void SetMaxRetries(size_t retries);
	void SetMaxQueueSize(size_t size);
	void SetTimeout(int64_t timeout);

	TransportSettings GetSettings() const;

	/// @brief Namespace for jobs and view datasets; "lookml" when unset.
	std::string GetNamespace() const;

	DeliveryStats GetStats() const;

	/// @brief Ask the worker to stop once the queue is drained.
	void Shutdown();

private:
	LineageClient();
	~LineageClient();

	void BackgroundWorker();

	/// @return True if the backend accepted the payload.
	bool Deliver(const std::string &payload, const TransportSettings &settings);

	mutable std::mutex queue_mutex;
	std::condition_variable queue_cv;
	std::deque<std::string> pending_events;
	std::thread worker_thread;
	std::atomic<bool> shutdown_requested;

	mutable std::mutex settings_mutex; ///< Guards settings and stats
	TransportSettings settings;
	DeliveryStats stats;
};

} // namespace lookml_lineage
