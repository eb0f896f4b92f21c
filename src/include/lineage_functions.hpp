//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_functions.hpp
// Description: Lineage extraction for DuckDB statements and the table functions
//              that expose it to SQL.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_error.hpp"
#include "plan_node.hpp"
#include "duckdb.hpp"

namespace column_lineage {

/// @brief Extract the lineage of a converted DuckDB plan.
/// @note Names are canonicalized against DuckDB's default schema and catalog.
LineageResult ExtractPlanLineage(duckdb::ClientContext &context, const PlanNode &plan);

/// @brief Plan a single SQL statement and extract its lineage.
///
/// The statement is bound and optimized on a separate connection of the same
/// database and never executed. CREATE VIEW statements get the lineage of their
/// defining query.
///
/// @throws duckdb::InvalidInputException if the text is not exactly one statement.
/// @note Parser and binder errors propagate as DuckDB exceptions.
LineageResult ExtractQueryLineage(duckdb::ClientContext &context, const std::string &query);

/// @brief Register the `column_lineage` and `lineage_tables` table functions.
void RegisterLineageFunctions(duckdb::ExtensionLoader &loader);

} // namespace column_lineage
