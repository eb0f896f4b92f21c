//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: column_lineage_extension.cpp
// Description: Extension loading: configuration options, table functions and
//              the optimizer hook.
//===----------------------------------------------------------------------===//

#define DUCKDB_EXTENSION_MAIN

#include "column_lineage_extension.hpp"
#include "column_lineage_optimizer.hpp"
#include "lineage_dispatcher.hpp"
#include "lineage_event_builder.hpp"
#include "lineage_functions.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/database.hpp"
#include <stdexcept>

namespace duckdb {

using column_lineage::DispatcherRegistry;
using column_lineage::LineageEventBuilder;

//===--------------------------------------------------------------------===//
// Configuration Setters
//===--------------------------------------------------------------------===//
// Called when users execute SET statements or configure the extension via the
// configuration API.

static int64_t GetNonNegative(const Value &parameter, const std::string &option) {
	auto value = parameter.GetValue<int64_t>();
	if (value < 0) {
		throw InvalidInputException("%s must not be negative", option);
	}
	return value;
}

static void SetColumnLineageDispatchers(ClientContext &context, SetScope scope, Value &parameter) {
	try {
		DispatcherRegistry::Get().SetDispatchers(parameter.GetValue<string>());
	} catch (std::invalid_argument &ex) {
		throw InvalidInputException(ex.what());
	}
}

static void SetColumnLineageUrl(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetUrl(parameter.GetValue<string>());
}

static void SetColumnLineageApiKey(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetApiKey(parameter.GetValue<string>());
}

static void SetColumnLineageNamespace(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetNamespace(parameter.GetValue<string>());
}

static void SetColumnLineageProducer(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetProducer(parameter.GetValue<string>());
}

static void SetColumnLineageDebug(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetDebug(parameter.GetValue<bool>());
}

static void SetColumnLineageMaxRetries(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetMaxRetries(GetNonNegative(parameter, "column_lineage_max_retries"));
}

static void SetColumnLineageMaxQueueSize(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetMaxQueueSize(GetNonNegative(parameter, "column_lineage_max_queue_size"));
}

static void SetColumnLineageTimeout(ClientContext &context, SetScope scope, Value &parameter) {
	DispatcherRegistry::Get().SetTimeout(GetNonNegative(parameter, "column_lineage_timeout"));
}

//===--------------------------------------------------------------------===//
// Extension Loading
//===--------------------------------------------------------------------===//

static void LoadInternal(ExtensionLoader &loader) {
	auto &config = loader.GetDatabaseInstance().config;

	// SET column_lineage_dispatchers = 'openlineage,log'
	config.AddExtensionOption("column_lineage_dispatchers",
	                          "Comma-separated lineage dispatchers (openlineage, log); empty disables publication",
	                          LogicalType::VARCHAR, Value(""), SetColumnLineageDispatchers);

	config.AddExtensionOption("column_lineage_url", "URL of the OpenLineage backend", LogicalType::VARCHAR, Value(""),
	                          SetColumnLineageUrl);

	config.AddExtensionOption("column_lineage_api_key", "API Key for the OpenLineage backend", LogicalType::VARCHAR,
	                          Value(""), SetColumnLineageApiKey);

	config.AddExtensionOption("column_lineage_namespace", "Namespace for OpenLineage events", LogicalType::VARCHAR,
	                          Value("duckdb"), SetColumnLineageNamespace);

	config.AddExtensionOption("column_lineage_producer", "Producer URI stamped on OpenLineage events",
	                          LogicalType::VARCHAR, Value(LineageEventBuilder::DEFAULT_PRODUCER), SetColumnLineageProducer);

	config.AddExtensionOption("column_lineage_debug", "Enable debug logging for lineage extraction and dispatch",
	                          LogicalType::BOOLEAN, Value(false), SetColumnLineageDebug);

	config.AddExtensionOption("column_lineage_max_retries", "Maximum retry attempts for failed HTTP requests",
	                          LogicalType::BIGINT, Value::BIGINT(3), SetColumnLineageMaxRetries);

	config.AddExtensionOption("column_lineage_max_queue_size", "Maximum number of events to queue before dropping",
	                          LogicalType::BIGINT, Value::BIGINT(10000), SetColumnLineageMaxQueueSize);

	config.AddExtensionOption("column_lineage_timeout", "HTTP request timeout in seconds", LogicalType::BIGINT,
	                          Value::BIGINT(10), SetColumnLineageTimeout);

	column_lineage::RegisterLineageFunctions(loader);

	// Lineage is read from the optimized plan, so the hook runs after the built-in optimizers
	OptimizerExtension extension;
	extension.optimize_function = column_lineage::ColumnLineageOptimizer::Optimize;
	OptimizerExtension::Register(config, extension);
}

//===--------------------------------------------------------------------===//
// Extension Class Implementation
//===--------------------------------------------------------------------===//

void ColumnLineageExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string ColumnLineageExtension::Name() {
	return "column_lineage";
}

std::string ColumnLineageExtension::Version() const {
#ifdef EXT_VERSION_COLUMN_LINEAGE
	return EXT_VERSION_COLUMN_LINEAGE;
#else
	return "";
#endif
}

} // namespace duckdb

//===--------------------------------------------------------------------===//
// C Extension Entry Point
//===--------------------------------------------------------------------===//

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(column_lineage, loader) {
	duckdb::LoadInternal(loader);
}
}
