//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_utils.hpp
// Description: Helpers shared by the DuckDB host layer: query hashing, run ids,
//              event timestamps, statement classification and job naming.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_types.hpp"
#include "duckdb/planner/logical_operator.hpp"
#include <cstddef>
#include <string>

namespace column_lineage {

/// @brief Hex-encoded SHA-256 digest of a string (64 characters).
/// @throws std::runtime_error if the OpenSSL digest cannot be computed.
std::string CalculateSHA256(const std::string &str);

/// @brief Generate a UUID version 7 (RFC 9562): 48-bit millisecond timestamp
///        followed by random bits, so run ids sort by creation time.
std::string GenerateUUID();

/// @brief Current UTC time as `YYYY-MM-DDTHH:MM:SS.ffffffZ`.
std::string GetCurrentISOTime();

/// @brief Keep alphanumerics, collapse separators into single underscores.
std::string SanitizeJobNamePart(const std::string &str);

/// @brief Classify a plan by its root operator ("INSERT", "CREATE_TABLE", "COPY", ...).
/// @return "SELECT" for plain queries.
std::string InferStatementType(const duckdb::LogicalOperator &plan);

/// @brief Build a readable, stable job name for a statement.
///
/// The name is the statement type, then the table part of up to three target and
/// source tables (targets first), then an underscore and the first 8 hex digits of
/// the query hash. Table parts are dropped once the name would exceed `max_length`.
/// @example "INSERT_sales_orders_1f2e3d4c"
std::string GenerateJobName(const std::string &statement_type, const Lineage &lineage, const std::string &query,
                            size_t max_length = 64);

} // namespace column_lineage
