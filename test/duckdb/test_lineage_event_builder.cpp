#include <catch2/catch.hpp>
#include "lineage_event_builder.hpp"

using namespace column_lineage;

static Lineage InsertLineage() {
	QualifiedName t("main", "t");
	Lineage lineage;
	lineage.AddSource(t);
	lineage.AddTarget(QualifiedName("main", "sink"));
	lineage.AddColumn("main.sink.x", ColumnSourceSet {SourceColumnRef(t, "a")});
	lineage.AddColumn("main.sink.y", ColumnSourceSet {SourceColumnRef(t, "a"), SourceColumnRef(t, COUNT_STAR_COLUMN)});
	return lineage;
}

static LineageEventBuilder StartEvent() {
	auto builder = LineageEventBuilder::Start();
	builder.WithRunId("run").WithEventTime("2024-01-01T00:00:00Z").WithJob("duckdb", "job");
	return builder;
}

TEST_CASE("Events require run id, event time and job", "[event]") {
	REQUIRE_THROWS_AS(LineageEventBuilder::Start().Build(), std::runtime_error);
	REQUIRE_THROWS_AS(LineageEventBuilder::Start().WithRunId("run").WithJob("ns", "job").Build(),
	                  std::runtime_error);

	auto event = StartEvent().Build();
	REQUIRE(event["eventType"] == "START");
	REQUIRE(event["run"]["runId"] == "run");
	REQUIRE(event["job"]["namespace"] == "duckdb");
	REQUIRE(event["job"]["name"] == "job");
	REQUIRE(event["producer"] == LineageEventBuilder::DEFAULT_PRODUCER);
}

TEST_CASE("The producer is stamped on the event and its facets", "[event]") {
	auto event = LineageEventBuilder::Start()
	                 .WithProducer("https://lineage.example.com/duckdb")
	                 .WithRunId("run")
	                 .WithEventTime("2024-01-01T00:00:00Z")
	                 .WithJob("duckdb", "job")
	                 .WithSqlFacet("INSERT INTO sink SELECT a FROM t")
	                 .WithLineage("duckdb", InsertLineage())
	                 .Build();

	REQUIRE(event["producer"] == "https://lineage.example.com/duckdb");
	REQUIRE(event["job"]["facets"]["sql"]["_producer"] == "https://lineage.example.com/duckdb");
	REQUIRE(event["inputs"][0]["facets"]["schema"]["_producer"] == "https://lineage.example.com/duckdb");
	REQUIRE(event["outputs"][0]["facets"]["columnLineage"]["_producer"] == "https://lineage.example.com/duckdb");

	REQUIRE_THROWS_AS(LineageEventBuilder::Start().WithProducer(""), std::invalid_argument);
}

TEST_CASE("Write lineage becomes input and output datasets", "[event]") {
	auto event = StartEvent().WithLineage("duckdb", InsertLineage()).Build();

	REQUIRE(event["inputs"].size() == 1);
	auto &input = event["inputs"][0];
	REQUIRE(input["namespace"] == "duckdb");
	REQUIRE(input["name"] == "main.t");
	// count(*) is not a column of the input schema
	REQUIRE(input["facets"]["schema"]["fields"] == nlohmann::json::array({{{"name", "a"}}}));

	REQUIRE(event["outputs"].size() == 1);
	auto &output = event["outputs"][0];
	REQUIRE(output["name"] == "main.sink");
	REQUIRE(output["facets"]["schema"]["fields"] == nlohmann::json::array({{{"name", "x"}}, {{"name", "y"}}}));

	auto &fields = output["facets"]["columnLineage"]["fields"];
	REQUIRE(fields["x"]["inputFields"] ==
	        nlohmann::json::array({{{"namespace", "duckdb"}, {"name", "main.t"}, {"field", "a"}}}));
	REQUIRE(fields["y"]["inputFields"].size() == 2);
	REQUIRE(fields["y"]["inputFields"][0]["field"] == COUNT_STAR_COLUMN);
}

TEST_CASE("Query lineage is reported on a synthetic output", "[event]") {
	QualifiedName t("main", "t");
	Lineage lineage;
	lineage.AddSource(t);
	lineage.AddColumn("total", ColumnSourceSet {SourceColumnRef(t, "a"), SourceColumnRef(t, "b")});
	lineage.AddColumn("answer", ColumnSourceSet());

	auto event = StartEvent().WithLineage("duckdb", lineage).Build();
	REQUIRE(event["outputs"].size() == 1);
	auto &output = event["outputs"][0];
	REQUIRE(output["name"] == LineageEventBuilder::QUERY_DATASET_NAME);
	auto &fields = output["facets"]["columnLineage"]["fields"];
	REQUIRE(fields["total"]["inputFields"].size() == 2);
	REQUIRE(fields["answer"]["inputFields"].empty());
}

TEST_CASE("Directory targets are named by their path", "[event]") {
	auto target = QualifiedName::Path("/tmp/out");
	Lineage lineage;
	lineage.AddTarget(target);
	lineage.AddColumn(target.ToString() + ".x", ColumnSourceSet());

	auto event = StartEvent().WithLineage("duckdb", lineage).Build();
	REQUIRE(event["outputs"][0]["name"] == "/tmp/out");
	REQUIRE(event["outputs"][0]["facets"]["columnLineage"]["fields"].contains("x"));
}

TEST_CASE("Run and job facets", "[event]") {
	SECTION("sql facet") {
		auto event = StartEvent().WithSqlFacet("SELECT 1").Build();
		REQUIRE(event["job"]["facets"]["sql"]["query"] == "SELECT 1");
		REQUIRE(event["job"]["facets"]["sql"]["dialect"] == "duckdb");
	}
	SECTION("facets added before the job survive naming it") {
		auto builder = LineageEventBuilder::Start();
		builder.WithSqlFacet("SELECT 1").WithRunId("run").WithEventTime("now").WithJob("duckdb", "job");
		REQUIRE(builder.Build()["job"]["facets"].contains("sql"));
	}
	SECTION("parent without a job") {
		auto event = StartEvent().WithParentRun("parent-run").Build();
		auto &parent = event["run"]["facets"]["parent"];
		REQUIRE(parent["run"]["runId"] == "parent-run");
		REQUIRE_FALSE(parent.contains("job"));
	}
	SECTION("parent with a job") {
		auto event = StartEvent().WithParentRun("parent-run", "airflow", "dag.task").Build();
		auto &job = event["run"]["facets"]["parent"]["job"];
		REQUIRE(job["namespace"] == "airflow");
		REQUIRE(job["name"] == "dag.task");
	}
	SECTION("processing engine") {
		auto event = StartEvent().WithProcessingEngine("v1.4.0", "DuckDB").Build();
		auto &engine = event["run"]["facets"]["processing_engine"];
		REQUIRE(engine["version"] == "v1.4.0");
		REQUIRE(engine["name"] == "DuckDB");
	}
}
