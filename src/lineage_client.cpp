//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_client.cpp
// Description: Implementation of the LineageClient HTTP transport (libcurl).
//===----------------------------------------------------------------------===//

#include "lineage_client.hpp"
#include <chrono>
#include <curl/curl.h>
#include <iostream>

namespace lookml_lineage {

static constexpr const char *DEFAULT_NAMESPACE = "lookml";
static constexpr size_t MAX_BACKOFF_MS = 5000;

LineageClient &LineageClient::Get() {
	static LineageClient instance;
	return instance;
}

LineageClient::LineageClient() : shutdown_requested(false) {
	worker_thread = std::thread(&LineageClient::BackgroundWorker, this);
}

LineageClient::~LineageClient() {
	Shutdown();
	if (worker_thread.joinable()) {
		worker_thread.join();
	}
}

void LineageClient::Shutdown() {
	shutdown_requested = true;
	queue_cv.notify_all();
}

//===--------------------------------------------------------------------===//
// Queueing
//===--------------------------------------------------------------------===//

void LineageClient::SendEvent(std::string event_json) {
	TransportSettings current = GetSettings();
	if (current.debug) {
		std::cout << "LookML Lineage Debug: " << event_json << '\n';
	}

	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		if (pending_events.size() >= current.max_queue_size) {
			size_t dropped;
			{
				std::lock_guard<std::mutex> settings_lock(settings_mutex);
				dropped = ++stats.dropped;
			}
			if (current.debug) {
				std::cerr << "LookML Lineage Debug: Queue full (" << current.max_queue_size
				          << "), event dropped. Total dropped: " << dropped << '\n';
			}
			return;
		}
		pending_events.push_back(std::move(event_json));
	}
	queue_cv.notify_one();
}

//===--------------------------------------------------------------------===//
// Configuration
//===--------------------------------------------------------------------===//

void LineageClient::SetUrl(std::string url) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.url = std::move(url);
}

void LineageClient::SetApiKey(std::string key) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.api_key = std::move(key);
}

void LineageClient::SetNamespace(std::string ns) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.job_namespace = std::move(ns);
}

void LineageClient::SetDebug(bool debug) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.debug = debug;
}

void LineageClient::SetMaxRetries(size_t retries) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.max_retries = retries;
}

void LineageClient::SetMaxQueueSize(size_t size) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.max_queue_size = size;
}

void LineageClient::SetTimeout(int64_t timeout) {
	std::lock_guard<std::mutex> lock(settings_mutex);
	settings.timeout_seconds = timeout;
}

TransportSettings LineageClient::GetSettings() const {
	std::lock_guard<std::mutex> lock(settings_mutex);
	return settings;
}

std::string LineageClient::GetNamespace() const {
	std::lock_guard<std::mutex> lock(settings_mutex);
	return settings.job_namespace.empty() ? DEFAULT_NAMESPACE : settings.job_namespace;
}

DeliveryStats LineageClient::GetStats() const {
	DeliveryStats result;
	{
		std::lock_guard<std::mutex> lock(settings_mutex);
		result = stats;
	}
	std::lock_guard<std::mutex> lock(queue_mutex);
	result.pending = pending_events.size();
	return result;
}

//===--------------------------------------------------------------------===//
// HTTP Delivery
//===--------------------------------------------------------------------===//

enum class ResponseAction { ACCEPTED, RETRY, GIVE_UP };

/// @brief 2xx is accepted; 429 and 5xx are retried; other codes are final.
static ResponseAction ClassifyResponse(long response_code) {
	if (response_code >= 200 && response_code < 300) {
		return ResponseAction::ACCEPTED;
	}
	if (response_code == 429 || response_code >= 500) {
		return ResponseAction::RETRY;
	}
	return ResponseAction::GIVE_UP;
}

/// @brief 100ms doubled per attempt, capped at MAX_BACKOFF_MS.
static size_t BackoffMilliseconds(size_t attempt) {
	if (attempt >= 6) {
		return MAX_BACKOFF_MS;
	}
	size_t delay = static_cast<size_t>(100) << attempt;
	return delay > MAX_BACKOFF_MS ? MAX_BACKOFF_MS : delay;
}

static size_t DiscardResponseBody(void *, size_t size, size_t nmemb, void *) {
	return size * nmemb;
}

/// @brief Owns one easy handle and its header list.
class CurlRequest {
public:
	CurlRequest() : handle(curl_easy_init()) {
	}
	~CurlRequest() {
		if (headers) {
			curl_slist_free_all(headers);
		}
		if (handle) {
			curl_easy_cleanup(handle);
		}
	}
	CurlRequest(const CurlRequest &) = delete;
	CurlRequest &operator=(const CurlRequest &) = delete;

	void AddHeader(const std::string &header) {
		headers = curl_slist_append(headers, header.c_str());
	}

	CURL *handle;
	struct curl_slist *headers = nullptr;
};

bool LineageClient::Deliver(const std::string &payload, const TransportSettings &current) {
	if (current.url.empty()) {
		if (current.debug) {
			std::cerr << "LookML Lineage Debug: lookml_lineage_url is not set, event not sent" << '\n';
		}
		return false;
	}

	CurlRequest request;
	if (!request.handle) {
		std::cerr << "LookML Lineage: could not initialize libcurl" << '\n';
		return false;
	}
	request.AddHeader("Content-Type: application/json");
	if (!current.api_key.empty()) {
		request.AddHeader("Authorization: Bearer " + current.api_key);
	}

	curl_easy_setopt(request.handle, CURLOPT_URL, current.url.c_str());
	curl_easy_setopt(request.handle, CURLOPT_POSTFIELDS, payload.c_str());
	curl_easy_setopt(request.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
	curl_easy_setopt(request.handle, CURLOPT_HTTPHEADER, request.headers);
	curl_easy_setopt(request.handle, CURLOPT_WRITEFUNCTION, DiscardResponseBody);
	curl_easy_setopt(request.handle, CURLOPT_TIMEOUT, static_cast<long>(current.timeout_seconds));
	curl_easy_setopt(request.handle, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(request.handle, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(request.handle, CURLOPT_MAXREDIRS, 5L);

	for (size_t attempt = 0; attempt <= current.max_retries; attempt++) {
		if (attempt > 0) {
			size_t delay = BackoffMilliseconds(attempt - 1);
			if (current.debug) {
				std::cout << "LookML Lineage Debug: Retry " << attempt << "/" << current.max_retries << " after "
				          << delay << "ms" << '\n';
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(delay));
		}

		CURLcode res = curl_easy_perform(request.handle);
		if (res != CURLE_OK) {
			if (current.debug) {
				std::cerr << "LookML Lineage Debug: " << current.url << ": " << curl_easy_strerror(res) << '\n';
			}
			continue;
		}

		long response_code = 0;
		curl_easy_getinfo(request.handle, CURLINFO_RESPONSE_CODE, &response_code);
		if (current.debug) {
			std::cout << "LookML Lineage Debug: " << current.url << " answered " << response_code << '\n';
		}
		switch (ClassifyResponse(response_code)) {
		case ResponseAction::ACCEPTED:
			return true;
		case ResponseAction::GIVE_UP:
			return false;
		case ResponseAction::RETRY:
			break;
		}
	}

	if (current.debug) {
		std::cerr << "LookML Lineage Debug: Giving up after " << (current.max_retries + 1) << " attempts" << '\n';
	}
	return false;
}

//===--------------------------------------------------------------------===//
// Worker
//===--------------------------------------------------------------------===//

void LineageClient::BackgroundWorker() {
	while (true) {
		std::string payload;
		{
			std::unique_lock<std::mutex> lock(queue_mutex);
			queue_cv.wait(lock, [this] { return !pending_events.empty() || shutdown_requested; });
			if (pending_events.empty()) {
				return;
			}
			payload = std::move(pending_events.front());
			pending_events.pop_front();
		}

		bool accepted = Deliver(payload, GetSettings());
		std::lock_guard<std::mutex> lock(settings_mutex);
		if (accepted) {
			stats.delivered++;
		} else {
			stats.failed++;
		}
	}
}

} // namespace lookml_lineage
