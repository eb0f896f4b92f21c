//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_dispatcher.cpp
// Description: Implementation of the lineage dispatchers and their registry.
//              The OpenLineage dispatcher sends events asynchronously via CURL.
//===----------------------------------------------------------------------===//

#include "lineage_dispatcher.hpp"
#include "lineage_event_builder.hpp"
#include "lineage_utils.hpp"
#include "duckdb/common/printer.hpp"
#include <curl/curl.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace column_lineage {

//===--------------------------------------------------------------------===//
// LogDispatcher
//===--------------------------------------------------------------------===//

void LogDispatcher::Send(const Lineage &lineage, const DispatchContext &context) {
	duckdb::Printer::Print(lineage.ToString());
}

//===--------------------------------------------------------------------===//
// OpenLineageDispatcher
//===--------------------------------------------------------------------===//

OpenLineageDispatcher::OpenLineageDispatcher(SettingsProvider settings_provider)
    : settings_provider(std::move(settings_provider)), dropped_events(0), shutdown_requested(false) {
	worker_thread = std::thread(&OpenLineageDispatcher::BackgroundWorker, this);
}

OpenLineageDispatcher::~OpenLineageDispatcher() {
	Shutdown();
	if (worker_thread.joinable()) {
		worker_thread.join();
	}
}

void OpenLineageDispatcher::Shutdown() {
	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		shutdown_requested = true;
	}
	queue_cv.notify_all();
}

static std::string GetEnvironment(const char *name) {
	const char *value = std::getenv(name);
	return value ? std::string(value) : std::string();
}

std::string OpenLineageDispatcher::BuildEvent(const Lineage &lineage, const DispatchContext &context,
                                              const DispatcherSettings &settings) const {
	auto builder = LineageEventBuilder::Start();
	builder.WithProducer(settings.producer)
	    .WithRunId(GenerateUUID())
	    .WithEventTime(GetCurrentISOTime())
	    .WithJob(settings.lineage_namespace, GenerateJobName(context.statement_type, lineage, context.query))
	    .WithSqlFacet(context.query)
	    .WithProcessingEngine(context.engine_version, "DuckDB")
	    .WithLineage(settings.lineage_namespace, lineage);

	auto parent_run_id = GetEnvironment("OPENLINEAGE_PARENT_RUN_ID");
	if (!parent_run_id.empty()) {
		builder.WithParentRun(parent_run_id, GetEnvironment("OPENLINEAGE_PARENT_JOB_NAMESPACE"),
		                      GetEnvironment("OPENLINEAGE_PARENT_JOB_NAME"));
	}
	return builder.Build().dump();
}

void OpenLineageDispatcher::Send(const Lineage &lineage, const DispatchContext &context) {
	SendEvent(BuildEvent(lineage, context, settings_provider()));
}

void OpenLineageDispatcher::SendEvent(std::string event_json) {
	PendingEvent event;
	event.payload = std::move(event_json);
	event.settings = settings_provider();
	bool debug = event.settings.debug;
	if (debug) {
		std::cout << "ColumnLineage Debug: " << event.payload << '\n';
	}

	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		if (event_queue.size() >= event.settings.max_queue_size) {
			size_t dropped = ++dropped_events;
			if (debug) {
				std::cerr << "ColumnLineage Debug: Queue full (" << event.settings.max_queue_size
				          << "). Event dropped. Total dropped: " << dropped << '\n';
			}
			return;
		}
		event_queue.push(std::move(event));
	}
	queue_cv.notify_one();
}

size_t OpenLineageDispatcher::GetDroppedEvents() const {
	return dropped_events;
}

/// @brief CURL write callback; the response body is discarded.
static size_t DiscardResponse(void *contents, size_t size, size_t nmemb, void *userp) {
	return size * nmemb;
}

void OpenLineageDispatcher::PostToBackend(const PendingEvent &event) {
	auto &settings = event.settings;
	bool debug = settings.debug;

	if (settings.url.empty()) {
		if (debug) {
			std::cerr << "ColumnLineage Debug: OpenLineage URL is not configured. Event not sent." << '\n';
		}
		return;
	}

	CURL *curl = curl_easy_init();
	if (!curl) {
		if (debug) {
			std::cerr << "ColumnLineage Debug: Failed to initialize CURL." << '\n';
		}
		return;
	}

	struct curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, "Content-Type: application/json");
	if (!settings.api_key.empty()) {
		std::string auth = "Authorization: Bearer " + settings.api_key;
		headers = curl_slist_append(headers, auth.c_str());
	}

	curl_easy_setopt(curl, CURLOPT_URL, settings.url.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, event.payload.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, DiscardResponse);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings.timeout_seconds));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

	bool success = false;
	for (size_t attempt = 0; attempt <= settings.max_retries && !success; ++attempt) {
		if (debug) {
			if (attempt == 0) {
				std::cout << "ColumnLineage Debug: Sending to URL: " << settings.url << '\n';
			} else {
				std::cout << "ColumnLineage Debug: Retry attempt " << attempt << "/" << settings.max_retries << '\n';
			}
		}

		CURLcode res = curl_easy_perform(curl);
		if (res == CURLE_OK) {
			long response_code = 0;
			curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
			if (response_code >= 200 && response_code < 300) {
				success = true;
				if (debug) {
					std::cout << "ColumnLineage Debug: Event accepted. Response Code: " << response_code << '\n';
				}
			} else if (response_code >= 400 && response_code < 500 && response_code != 429) {
				if (debug) {
					std::cerr << "ColumnLineage Debug: Client error " << response_code << ". Not retrying." << '\n';
				}
				break;
			} else if (debug) {
				std::cerr << "ColumnLineage Debug: Response " << response_code << ". Will retry." << '\n';
			}
		} else if (debug) {
			std::cerr << "ColumnLineage Debug: CURL error: " << curl_easy_strerror(res) << ". Will retry." << '\n';
		}

		if (!success && attempt < settings.max_retries) {
			// 100ms, 200ms, 400ms, ... capped at 5 seconds
			size_t backoff_ms = attempt < 6 ? static_cast<size_t>(100) << attempt : 5000;
			std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
		}
	}

	if (!success && debug) {
		std::cerr << "ColumnLineage Debug: Failed to send event after " << (settings.max_retries + 1) << " attempts."
		          << '\n';
	}

	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);
}

void OpenLineageDispatcher::BackgroundWorker() {
	while (true) {
		PendingEvent event;
		{
			std::unique_lock<std::mutex> lock(queue_mutex);
			queue_cv.wait(lock, [this] { return !event_queue.empty() || shutdown_requested; });
			if (event_queue.empty()) {
				// Shutdown with nothing left to send
				return;
			}
			event = std::move(event_queue.front());
			event_queue.pop();
		}
		PostToBackend(event);
	}
}

//===--------------------------------------------------------------------===//
// DispatcherRegistry
//===--------------------------------------------------------------------===//

DispatcherRegistry &DispatcherRegistry::Get() {
	static DispatcherRegistry instance;
	return instance;
}

DispatcherRegistry::DispatcherRegistry() {
	RegisterFactory("log", []() { return std::make_shared<LogDispatcher>(); });
	RegisterFactory("openlineage", [this]() { return GetOpenLineageDispatcher(); });
}

std::shared_ptr<LineageDispatcher> DispatcherRegistry::GetOpenLineageDispatcher() {
	std::lock_guard<std::mutex> lock(registry_mutex);
	if (!openlineage_dispatcher) {
		openlineage_dispatcher = std::make_shared<OpenLineageDispatcher>([this]() { return GetSettings(); });
	}
	return openlineage_dispatcher;
}

static std::string Trim(const std::string &str) {
	auto start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) {
		return "";
	}
	auto end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

void DispatcherRegistry::SetDispatchers(const std::string &names) {
	// Resolve every name before touching the active list
	std::vector<std::pair<std::string, DispatcherFactory>> requested;
	{
		std::lock_guard<std::mutex> lock(registry_mutex);
		size_t start = 0;
		while (start <= names.size()) {
			auto comma = names.find(',', start);
			if (comma == std::string::npos) {
				comma = names.size();
			}
			auto name = Lower(Trim(names.substr(start, comma - start)));
			start = comma + 1;
			if (name.empty()) {
				continue;
			}
			auto entry = factories.find(name);
			if (entry == factories.end()) {
				throw std::invalid_argument("Unknown lineage dispatcher \"" + name + "\"");
			}
			bool duplicate = false;
			for (auto &existing : requested) {
				duplicate = duplicate || existing.first == name;
			}
			if (!duplicate) {
				requested.emplace_back(name, entry->second);
			}
		}
	}

	// Factories may take the registry lock themselves
	std::vector<std::shared_ptr<LineageDispatcher>> dispatchers;
	for (auto &entry : requested) {
		dispatchers.push_back(entry.second());
	}

	std::lock_guard<std::mutex> lock(registry_mutex);
	active = std::move(dispatchers);
}

void DispatcherRegistry::RegisterFactory(const std::string &name, DispatcherFactory factory) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	factories[Lower(name)] = std::move(factory);
}

void DispatcherRegistry::SetUrl(std::string url) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.url = std::move(url);
}

void DispatcherRegistry::SetApiKey(std::string key) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.api_key = std::move(key);
}

void DispatcherRegistry::SetNamespace(std::string ns) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.lineage_namespace = ns.empty() ? std::string("duckdb") : std::move(ns);
}

void DispatcherRegistry::SetProducer(std::string producer) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.producer = producer.empty() ? std::string(LineageEventBuilder::DEFAULT_PRODUCER) : std::move(producer);
}

void DispatcherRegistry::SetDebug(bool debug) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.debug = debug;
}

void DispatcherRegistry::SetMaxRetries(size_t retries) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.max_retries = retries;
}

void DispatcherRegistry::SetMaxQueueSize(size_t size) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.max_queue_size = size;
}

void DispatcherRegistry::SetTimeout(int64_t timeout) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	settings.timeout_seconds = timeout;
}

DispatcherSettings DispatcherRegistry::GetSettings() const {
	std::lock_guard<std::mutex> lock(registry_mutex);
	return settings;
}

bool DispatcherRegistry::IsDebug() const {
	std::lock_guard<std::mutex> lock(registry_mutex);
	return settings.debug;
}

bool DispatcherRegistry::HasDispatchers() const {
	std::lock_guard<std::mutex> lock(registry_mutex);
	return !active.empty();
}

std::vector<std::string> DispatcherRegistry::GetDispatcherNames() const {
	std::lock_guard<std::mutex> lock(registry_mutex);
	std::vector<std::string> names;
	for (auto &dispatcher : active) {
		names.push_back(dispatcher->GetName());
	}
	return names;
}

void DispatcherRegistry::Dispatch(const Lineage &lineage, const DispatchContext &context) {
	std::vector<std::shared_ptr<LineageDispatcher>> dispatchers;
	bool debug;
	{
		std::lock_guard<std::mutex> lock(registry_mutex);
		dispatchers = active;
		debug = settings.debug;
	}
	if (lineage.IsEmpty()) {
		if (debug) {
			std::cerr << "ColumnLineage Debug: Statement has no lineage, nothing dispatched" << '\n';
		}
		return;
	}

	for (auto &dispatcher : dispatchers) {
		try {
			dispatcher->Send(lineage, context);
		} catch (std::exception &ex) {
			if (debug) {
				std::cerr << "ColumnLineage Debug: Dispatcher " << dispatcher->GetName() << " failed: " << ex.what()
				          << '\n';
			}
		}
	}
}

} // namespace column_lineage
