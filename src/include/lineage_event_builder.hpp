//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_event_builder.hpp
// Description: Assembles the OpenLineage RunEvent published for one statement.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace column_lineage {

/// @class LineageEventBuilder
/// @brief Chained construction of an OpenLineage RunEvent from a Lineage record.
///
/// Source tables become input datasets and targets become output datasets with a
/// ColumnLineageDatasetFacet. Build() refuses events without a run id, an event
/// time or a job.
///
/// @code
///   auto event = LineageEventBuilder::Start()
///                    .WithProducer(producer)
///                    .WithRunId(GenerateUUID())
///                    .WithEventTime(GetCurrentISOTime())
///                    .WithJob("duckdb", job_name)
///                    .WithSqlFacet(query)
///                    .WithLineage("duckdb", lineage)
///                    .Build();
/// @endcode
class LineageEventBuilder {
public:
	//! Output dataset standing for the result of a statement without targets
	static constexpr const char *QUERY_DATASET_NAME = "query";
	//! Producer URI used until WithProducer is called
	static constexpr const char *DEFAULT_PRODUCER = "urn:duckdb:extension:column_lineage";

	static LineageEventBuilder Start();

	/// @brief Set the URI identifying the software that produced the event.
	/// @note Call before adding facets; facets are stamped with the producer current when added.
	/// @throws std::invalid_argument if the URI is empty
	LineageEventBuilder &WithProducer(const std::string &producer_uri);

	LineageEventBuilder &WithRunId(const std::string &run_id);
	/// @param event_time ISO 8601 timestamp
	LineageEventBuilder &WithEventTime(const std::string &event_time);
	LineageEventBuilder &WithJob(const std::string &job_namespace, const std::string &job_name);

	LineageEventBuilder &WithSqlFacet(const std::string &query);
	/// @brief Link the run to the run that triggered it.
	/// @note The parent job is written only when both its namespace and name are set.
	LineageEventBuilder &WithParentRun(const std::string &run_id, const std::string &job_namespace = "",
	                                   const std::string &job_name = "");
	LineageEventBuilder &WithProcessingEngine(const std::string &version, const std::string &name = "");

	/// @brief Describe the datasets of a lineage record.
	///
	/// Each source is an input whose schema lists the columns read from it, the
	/// row count pseudo column excepted. Each target is an output whose schema and
	/// column lineage facet are keyed by column name without the table prefix. A
	/// record without targets reports its columns on QUERY_DATASET_NAME.
	LineageEventBuilder &WithLineage(const std::string &dataset_namespace, const Lineage &lineage);

	/// @throws std::runtime_error if the run id, event time or job is missing
	nlohmann::json Build() const;

	/// @brief Dataset name of a table: its rendered name, or the bare path of a directory.
	static std::string DatasetName(const QualifiedName &name);

private:
	explicit LineageEventBuilder(const char *event_type);

	//! Facet object stamped with the producer and the facet schema
	nlohmann::json Facet(const char *schema_url) const;
	nlohmann::json Dataset(const std::string &dataset_namespace, const std::string &name,
	                       const nlohmann::json &fields) const;

	std::string producer;
	nlohmann::json event;
	nlohmann::json inputs;
	nlohmann::json outputs;
};

} // namespace column_lineage
