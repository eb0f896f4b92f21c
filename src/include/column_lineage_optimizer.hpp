//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: column_lineage_optimizer.hpp
// Description: Optimizer extension that extracts the column lineage of every
//              optimized plan and hands it to the configured dispatchers.
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include "duckdb/optimizer/optimizer_extension.hpp"

namespace column_lineage {

/// @class ColumnLineageOptimizer
/// @brief Post-optimization hook that publishes lineage.
///
/// The plan is never modified. The hook does nothing while no dispatcher is
/// configured, and never raises into the user's query: conversion and
/// extraction failures are only logged in debug mode.
class ColumnLineageOptimizer {
public:
	static void Optimize(duckdb::OptimizerExtensionInput &input, duckdb::unique_ptr<duckdb::LogicalOperator> &plan);
};

/// @class LineagePlanningGuard
/// @brief Marks the current thread as planning a statement for lineage extraction.
///
/// The table functions plan statements through the regular optimizer, which
/// would otherwise run the hook on them and publish lineage for queries that are
/// never executed.
class LineagePlanningGuard {
public:
	LineagePlanningGuard() : previous(active) {
		active = true;
	}
	~LineagePlanningGuard() {
		active = previous;
	}

	static bool IsActive() {
		return active;
	}

private:
	LineagePlanningGuard(const LineagePlanningGuard &) = delete;
	LineagePlanningGuard &operator=(const LineagePlanningGuard &) = delete;

	bool previous;
	static thread_local bool active;
};

} // namespace column_lineage
