//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_event_builder.cpp
// Description: OpenLineage RunEvent assembly.
//===----------------------------------------------------------------------===//

#include "lineage_event_builder.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

namespace column_lineage {

constexpr const char *LineageEventBuilder::QUERY_DATASET_NAME;
constexpr const char *LineageEventBuilder::DEFAULT_PRODUCER;

namespace {

const char *const RUN_EVENT_SCHEMA = "https://openlineage.io/spec/2-0-2/OpenLineage.json#/$defs/RunEvent";
const char *const SQL_FACET = "https://openlineage.io/spec/facets/1-1-0/SQLJobFacet.json";
const char *const PARENT_FACET = "https://openlineage.io/spec/facets/1-0-0/ParentRunFacet.json";
const char *const ENGINE_FACET = "https://openlineage.io/spec/facets/1-1-1/ProcessingEngineRunFacet.json";
const char *const SCHEMA_FACET = "https://openlineage.io/spec/facets/1-0-0/SchemaDatasetFacet.json";
const char *const COLUMN_LINEAGE_FACET = "https://openlineage.io/spec/facets/1-2-0/ColumnLineageDatasetFacet.json";

// Column of a write, named `<target>.<column>`, without its table prefix
bool ColumnOfTarget(const std::string &column, const QualifiedName &target, std::string &result) {
	auto prefix = target.ToString() + ".";
	if (column.size() <= prefix.size() || !EqualsIgnoreCase(column.substr(0, prefix.size()), prefix)) {
		return false;
	}
	result = column.substr(prefix.size());
	return true;
}

} // namespace

LineageEventBuilder LineageEventBuilder::Start() {
	return LineageEventBuilder("START");
}

LineageEventBuilder::LineageEventBuilder(const char *event_type)
    : producer(DEFAULT_PRODUCER), inputs(json::array()), outputs(json::array()) {
	event["eventType"] = event_type;
	event["producer"] = producer;
	event["schemaURL"] = RUN_EVENT_SCHEMA;
}

json LineageEventBuilder::Facet(const char *schema_url) const {
	return json {{"_producer", producer}, {"_schemaURL", schema_url}};
}

json LineageEventBuilder::Dataset(const std::string &dataset_namespace, const std::string &name,
                                  const json &fields) const {
	json dataset = {{"namespace", dataset_namespace}, {"name", name}};
	if (!fields.empty()) {
		auto schema = Facet(SCHEMA_FACET);
		schema["fields"] = fields;
		dataset["facets"]["schema"] = schema;
	}
	return dataset;
}

std::string LineageEventBuilder::DatasetName(const QualifiedName &name) {
	return name.is_path ? name.table : name.ToString();
}

//===--------------------------------------------------------------------===//
// Run and job
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::WithProducer(const std::string &producer_uri) {
	if (producer_uri.empty()) {
		throw std::invalid_argument("LineageEventBuilder: producer must not be empty");
	}
	producer = producer_uri;
	event["producer"] = producer;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithRunId(const std::string &run_id) {
	event["run"]["runId"] = run_id;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithEventTime(const std::string &event_time) {
	event["eventTime"] = event_time;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithJob(const std::string &job_namespace, const std::string &job_name) {
	auto &job = event["job"];
	job["namespace"] = job_namespace;
	job["name"] = job_name;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithSqlFacet(const std::string &query) {
	auto facet = Facet(SQL_FACET);
	facet["query"] = query;
	facet["dialect"] = "duckdb";
	event["job"]["facets"]["sql"] = facet;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithParentRun(const std::string &run_id, const std::string &job_namespace,
                                                        const std::string &job_name) {
	auto facet = Facet(PARENT_FACET);
	facet["run"]["runId"] = run_id;
	if (!job_namespace.empty() && !job_name.empty()) {
		facet["job"]["namespace"] = job_namespace;
		facet["job"]["name"] = job_name;
	}
	event["run"]["facets"]["parent"] = facet;
	return *this;
}

LineageEventBuilder &LineageEventBuilder::WithProcessingEngine(const std::string &version, const std::string &name) {
	auto facet = Facet(ENGINE_FACET);
	facet["version"] = version;
	if (!name.empty()) {
		facet["name"] = name;
	}
	event["run"]["facets"]["processing_engine"] = facet;
	return *this;
}

//===--------------------------------------------------------------------===//
// Datasets
//===--------------------------------------------------------------------===//

LineageEventBuilder &LineageEventBuilder::WithLineage(const std::string &dataset_namespace, const Lineage &lineage) {
	for (auto &source : lineage.sources) {
		json fields = json::array();
		std::set<std::string> listed;
		for (auto &column : lineage.columns) {
			for (auto &ref : column.second) {
				if (ref.table == source && ref.column != COUNT_STAR_COLUMN && listed.insert(Lower(ref.column)).second) {
					fields.push_back(json {{"name", ref.column}});
				}
			}
		}
		inputs.push_back(Dataset(dataset_namespace, DatasetName(source), fields));
	}

	auto targets = lineage.targets;
	bool query_output = targets.empty();
	if (query_output) {
		targets.emplace_back();
	}

	for (auto &target : targets) {
		json fields = json::array();
		json column_lineage = json::object();
		for (auto &column : lineage.columns) {
			auto name = column.first;
			if (!query_output && !ColumnOfTarget(column.first, target, name)) {
				continue;
			}
			if (!column_lineage.contains(name)) {
				fields.push_back(json {{"name", name}});
				column_lineage[name]["inputFields"] = json::array();
			}
			auto &input_fields = column_lineage[name]["inputFields"];
			for (auto &ref : column.second) {
				json field = {{"namespace", dataset_namespace}, {"name", DatasetName(ref.table)}, {"field", ref.column}};
				if (std::find(input_fields.begin(), input_fields.end(), field) == input_fields.end()) {
					input_fields.push_back(field);
				}
			}
		}

		auto dataset = Dataset(dataset_namespace, query_output ? QUERY_DATASET_NAME : DatasetName(target), fields);
		auto facet = Facet(COLUMN_LINEAGE_FACET);
		facet["fields"] = column_lineage;
		dataset["facets"]["columnLineage"] = facet;
		outputs.push_back(dataset);
	}
	return *this;
}

//===--------------------------------------------------------------------===//
// Build
//===--------------------------------------------------------------------===//

json LineageEventBuilder::Build() const {
	if (!event.contains("run") || !event["run"].contains("runId")) {
		throw std::runtime_error("LineageEventBuilder: runId is required");
	}
	if (!event.contains("eventTime")) {
		throw std::runtime_error("LineageEventBuilder: eventTime is required");
	}
	if (!event.contains("job") || !event["job"].contains("name")) {
		throw std::runtime_error("LineageEventBuilder: job information is required");
	}
	auto result = event;
	result["inputs"] = inputs;
	result["outputs"] = outputs;
	return result;
}

} // namespace column_lineage
