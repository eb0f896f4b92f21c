#include <catch2/catch.hpp>
#include "lineage_dispatcher.hpp"
#include <cstdlib>

using namespace column_lineage;

static Lineage InsertLineage() {
	QualifiedName t("main", "t");
	Lineage lineage;
	lineage.AddSource(t);
	lineage.AddTarget(QualifiedName("main", "sink"));
	lineage.AddColumn("main.sink.x", ColumnSourceSet {SourceColumnRef(t, "a")});
	return lineage;
}

static DispatchContext InsertContext() {
	DispatchContext context;
	context.query = "INSERT INTO sink SELECT a FROM t";
	context.statement_type = "INSERT";
	context.engine_version = "v1.4.0";
	return context;
}

// Settings that never reach the network
static DispatcherSettings OfflineSettings() {
	DispatcherSettings settings;
	settings.lineage_namespace = "lake";
	return settings;
}

TEST_CASE("OpenLineage events carry the statement and its lineage", "[dispatcher]") {
	OpenLineageDispatcher dispatcher(OfflineSettings);
	auto event = nlohmann::json::parse(dispatcher.BuildEvent(InsertLineage(), InsertContext(), OfflineSettings()));

	REQUIRE(event["eventType"] == "START");
	REQUIRE(event["producer"] == LineageEventBuilder::DEFAULT_PRODUCER);
	REQUIRE(event["job"]["namespace"] == "lake");
	std::string job_name = event["job"]["name"];
	REQUIRE(job_name.find("INSERT_sink_t_") == 0);
	REQUIRE(event["job"]["facets"]["sql"]["query"] == "INSERT INTO sink SELECT a FROM t");
	REQUIRE(event["run"]["facets"]["processing_engine"]["version"] == "v1.4.0");
	REQUIRE(event["run"]["runId"].get<std::string>().size() == 36);
	REQUIRE(event["outputs"][0]["name"] == "main.sink");
	REQUIRE(event["outputs"][0]["facets"]["columnLineage"]["fields"]["x"]["inputFields"][0]["namespace"] == "lake");
}

TEST_CASE("Events carry the configured producer", "[dispatcher]") {
	auto settings = OfflineSettings();
	settings.producer = "https://lineage.example.com/duckdb";
	OpenLineageDispatcher dispatcher(OfflineSettings);
	auto event = nlohmann::json::parse(dispatcher.BuildEvent(InsertLineage(), InsertContext(), settings));

	REQUIRE(event["producer"] == "https://lineage.example.com/duckdb");
	REQUIRE(event["run"]["facets"]["processing_engine"]["_producer"] == "https://lineage.example.com/duckdb");
}

TEST_CASE("The parent run facet is read from the environment", "[dispatcher]") {
	OpenLineageDispatcher dispatcher(OfflineSettings);

	unsetenv("OPENLINEAGE_PARENT_RUN_ID");
	auto without_parent =
	    nlohmann::json::parse(dispatcher.BuildEvent(InsertLineage(), InsertContext(), OfflineSettings()));
	REQUIRE_FALSE(without_parent["run"]["facets"].contains("parent"));

	setenv("OPENLINEAGE_PARENT_RUN_ID", "parent-run", 1);
	setenv("OPENLINEAGE_PARENT_JOB_NAMESPACE", "airflow", 1);
	setenv("OPENLINEAGE_PARENT_JOB_NAME", "dag.task", 1);
	auto with_parent = nlohmann::json::parse(dispatcher.BuildEvent(InsertLineage(), InsertContext(), OfflineSettings()));
	unsetenv("OPENLINEAGE_PARENT_RUN_ID");
	unsetenv("OPENLINEAGE_PARENT_JOB_NAMESPACE");
	unsetenv("OPENLINEAGE_PARENT_JOB_NAME");

	auto &parent = with_parent["run"]["facets"]["parent"];
	REQUIRE(parent["run"]["runId"] == "parent-run");
	REQUIRE(parent["job"]["name"] == "dag.task");
}

TEST_CASE("Events beyond the queue limit are dropped", "[dispatcher]") {
	OpenLineageDispatcher dispatcher([]() {
		auto settings = OfflineSettings();
		settings.max_queue_size = 0;
		return settings;
	});
	dispatcher.Send(InsertLineage(), InsertContext());
	dispatcher.Send(InsertLineage(), InsertContext());
	REQUIRE(dispatcher.GetDroppedEvents() == 2);
}

TEST_CASE("Shutdown drains the queue without a backend", "[dispatcher]") {
	OpenLineageDispatcher dispatcher(OfflineSettings);
	dispatcher.Send(InsertLineage(), InsertContext());
	dispatcher.Shutdown();
	REQUIRE(dispatcher.GetDroppedEvents() == 0);
}

TEST_CASE("The registry activates dispatchers by name", "[dispatcher]") {
	auto &registry = DispatcherRegistry::Get();

	registry.SetDispatchers(" LOG , log,");
	REQUIRE(registry.GetDispatcherNames() == std::vector<std::string> {"log"});
	REQUIRE(registry.HasDispatchers());

	REQUIRE_THROWS_AS(registry.SetDispatchers("log,kafka"), std::invalid_argument);
	// A rejected list leaves the active dispatchers untouched
	REQUIRE(registry.GetDispatcherNames() == std::vector<std::string> {"log"});

	registry.SetDispatchers("");
	REQUIRE_FALSE(registry.HasDispatchers());
}

namespace {

class CountingDispatcher : public LineageDispatcher {
public:
	std::string GetName() const override {
		return "counting";
	}
	void Send(const Lineage &lineage, const DispatchContext &context) override {
		++sent;
	}

	size_t sent = 0;
};

} // namespace

TEST_CASE("Registered factories become dispatchers", "[dispatcher]") {
	auto &registry = DispatcherRegistry::Get();
	auto counting = std::make_shared<CountingDispatcher>();
	registry.RegisterFactory("Counting", [counting]() { return counting; });

	registry.SetDispatchers("counting,log");
	REQUIRE(registry.GetDispatcherNames() == std::vector<std::string> {"counting", "log"});

	registry.Dispatch(InsertLineage(), InsertContext());
	// Empty lineage is not dispatched
	registry.Dispatch(Lineage(), InsertContext());
	REQUIRE(counting->sent == 1);

	registry.SetDispatchers("");
}

TEST_CASE("Registry settings", "[dispatcher]") {
	auto &registry = DispatcherRegistry::Get();
	auto original = registry.GetSettings();

	registry.SetNamespace("");
	REQUIRE(registry.GetSettings().lineage_namespace == "duckdb");
	registry.SetNamespace("lake");
	registry.SetProducer("");
	REQUIRE(registry.GetSettings().producer == LineageEventBuilder::DEFAULT_PRODUCER);
	registry.SetProducer("https://lineage.example.com/duckdb");
	REQUIRE(registry.GetSettings().producer == "https://lineage.example.com/duckdb");
	registry.SetMaxRetries(5);
	registry.SetTimeout(30);
	auto settings = registry.GetSettings();
	REQUIRE(settings.lineage_namespace == "lake");
	REQUIRE(settings.max_retries == 5);
	REQUIRE(settings.timeout_seconds == 30);

	registry.SetNamespace(original.lineage_namespace);
	registry.SetProducer(original.producer);
	registry.SetMaxRetries(original.max_retries);
	registry.SetTimeout(original.timeout_seconds);
}
