//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: column_lineage_optimizer.cpp
// Description: Lineage extraction and dispatch from the optimizer hook.
//===----------------------------------------------------------------------===//

#include "column_lineage_optimizer.hpp"
#include "lineage_dispatcher.hpp"
#include "lineage_functions.hpp"
#include "lineage_utils.hpp"
#include "plan_converter.hpp"
#include "duckdb/main/client_context.hpp"
#include <iostream>

namespace column_lineage {

thread_local bool LineagePlanningGuard::active = false;

void ColumnLineageOptimizer::Optimize(duckdb::OptimizerExtensionInput &input,
                                      duckdb::unique_ptr<duckdb::LogicalOperator> &plan) {
	auto &registry = DispatcherRegistry::Get();
	if (!plan || LineagePlanningGuard::IsActive() || !registry.HasDispatchers()) {
		return;
	}
	bool debug = registry.IsDebug();

	DispatchContext dispatch;
	try {
		dispatch.query = input.context.GetCurrentQuery();
	} catch (std::exception &ex) {
		// Some clients plan without an active query
		if (debug) {
			std::cerr << "ColumnLineage Debug: No current query: " << ex.what() << '\n';
		}
		return;
	}
	if (dispatch.query.empty()) {
		return;
	}
	dispatch.statement_type = InferStatementType(*plan);
	dispatch.engine_version = duckdb::DuckDB::LibraryVersion();

	try {
		PlanConverter converter(input.context);
		auto lineage_plan = converter.Convert(*plan);
		auto result = ExtractPlanLineage(input.context, *lineage_plan);
		if (result.HasError()) {
			if (debug) {
				std::cerr << "ColumnLineage Debug: Lineage extraction failed: " << result.GetError().ToString()
				          << '\n';
			}
			return;
		}
		if (debug) {
			for (auto &warning : result.GetWarnings()) {
				std::cerr << "ColumnLineage Debug: " << warning.ToString() << '\n';
			}
		}
		registry.Dispatch(result.GetLineage(), dispatch);
	} catch (std::exception &ex) {
		if (debug) {
			std::cerr << "ColumnLineage Debug: Failed to convert plan: " << ex.what() << '\n';
		}
	}
}

} // namespace column_lineage
