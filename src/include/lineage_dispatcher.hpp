//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_dispatcher.hpp
// Description: Destinations for extracted lineage. The OpenLineage dispatcher
//              posts RunEvents over HTTP from a background worker; the log
//              dispatcher prints the raw lineage record. The registry holds the
//              settings and the configured dispatcher list.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_event_builder.hpp"
#include "lineage_types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace column_lineage {

/// @brief Statement metadata handed to dispatchers next to its lineage.
struct DispatchContext {
	std::string query;
	//! e.g. "SELECT", "INSERT", "CREATE_TABLE"
	std::string statement_type;
	std::string engine_version;
};

/// @brief Settings shared by all dispatchers, mirrored from the extension options.
struct DispatcherSettings {
	std::string url;
	std::string api_key;
	std::string lineage_namespace = "duckdb";
	//! URI stamped on events and facets as their producer
	std::string producer = LineageEventBuilder::DEFAULT_PRODUCER;
	bool debug = false;
	size_t max_retries = 3;
	size_t max_queue_size = 10000;
	int64_t timeout_seconds = 10;
};

/// @class LineageDispatcher
/// @brief A destination for the lineage of executed statements.
class LineageDispatcher {
public:
	virtual ~LineageDispatcher() {
	}

	virtual std::string GetName() const = 0;

	/// @brief Publish the lineage of one statement.
	/// @note Must not block the calling query on I/O.
	virtual void Send(const Lineage &lineage, const DispatchContext &context) = 0;
};

/// @brief Prints the lineage JSON record of every statement.
class LogDispatcher : public LineageDispatcher {
public:
	std::string GetName() const override {
		return "log";
	}
	void Send(const Lineage &lineage, const DispatchContext &context) override;
};

/// @class OpenLineageDispatcher
/// @brief Posts OpenLineage START events carrying column lineage to an HTTP endpoint.
///
/// Events are queued and sent by a background worker thread. The queue is
/// bounded; events arriving while it is full are dropped and counted. Failed
/// posts are retried with exponential backoff, except on 4xx responses other
/// than 429. Settings are read through the provider when an event is queued, so
/// changes apply without restarting the worker.
///
/// Thread Safety: Send and SendEvent may be called from any thread.
class OpenLineageDispatcher : public LineageDispatcher {
public:
	typedef std::function<DispatcherSettings()> SettingsProvider;

	explicit OpenLineageDispatcher(SettingsProvider settings_provider);
	~OpenLineageDispatcher() override;

	std::string GetName() const override {
		return "openlineage";
	}
	void Send(const Lineage &lineage, const DispatchContext &context) override;

	/// @brief Build the serialized RunEvent of a statement.
	/// @note The parent run facet is filled from OPENLINEAGE_PARENT_RUN_ID,
	///       OPENLINEAGE_PARENT_JOB_NAMESPACE and OPENLINEAGE_PARENT_JOB_NAME.
	std::string BuildEvent(const Lineage &lineage, const DispatchContext &context,
	                       const DispatcherSettings &settings) const;

	/// @brief Queue a serialized event for the worker.
	void SendEvent(std::string event_json);

	/// @brief Number of events dropped because the queue was full.
	size_t GetDroppedEvents() const;

	/// @brief Signal the worker to stop once the queue is drained.
	void Shutdown();

private:
	//! Events carry the settings in effect when they were queued
	struct PendingEvent {
		std::string payload;
		DispatcherSettings settings;
	};

	void BackgroundWorker();
	void PostToBackend(const PendingEvent &event);

	SettingsProvider settings_provider;

	std::mutex queue_mutex;
	std::condition_variable queue_cv;
	std::queue<PendingEvent> event_queue;
	std::atomic<size_t> dropped_events;

	std::thread worker_thread;
	std::atomic<bool> shutdown_requested;
};

/// @class DispatcherRegistry
/// @brief Process-wide registry of dispatcher settings and the active dispatchers.
///
/// Dispatchers are created by name from registered factories. The OpenLineage
/// dispatcher is created on first use and kept for the life of the process so
/// that queued events survive reconfiguration.
class DispatcherRegistry {
public:
	typedef std::function<std::shared_ptr<LineageDispatcher>()> DispatcherFactory;

	static DispatcherRegistry &Get();

	/// @brief Activate the dispatchers named in a comma-separated list.
	/// @throws std::invalid_argument if a name has no registered factory.
	/// @note An empty list deactivates lineage publication.
	void SetDispatchers(const std::string &names);

	/// @brief Make a dispatcher available to SetDispatchers under a (case-insensitive) name.
	void RegisterFactory(const std::string &name, DispatcherFactory factory);

	void SetUrl(std::string url);
	void SetApiKey(std::string key);
	void SetNamespace(std::string ns);
	void SetProducer(std::string producer);
	void SetDebug(bool debug);
	void SetMaxRetries(size_t retries);
	void SetMaxQueueSize(size_t size);
	void SetTimeout(int64_t timeout);

	DispatcherSettings GetSettings() const;
	bool IsDebug() const;
	bool HasDispatchers() const;
	std::vector<std::string> GetDispatcherNames() const;

	/// @brief Send a statement's lineage to every active dispatcher.
	/// @note Empty lineage is not dispatched. Dispatcher failures are logged, never raised.
	void Dispatch(const Lineage &lineage, const DispatchContext &context);

private:
	DispatcherRegistry();

	std::shared_ptr<LineageDispatcher> GetOpenLineageDispatcher();

	mutable std::mutex registry_mutex;
	DispatcherSettings settings;
	std::unordered_map<std::string, DispatcherFactory> factories;
	std::vector<std::shared_ptr<LineageDispatcher>> active;
	std::shared_ptr<LineageDispatcher> openlineage_dispatcher;
};

} // namespace column_lineage
