//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: column_lineage_extension.hpp
// Description: Extension entry point. Registers the lineage settings, the
//              lineage table functions and the optimizer hook that publishes
//              lineage.
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"

namespace duckdb {

/// @class ColumnLineageExtension
/// @brief DuckDB extension for column-level lineage.
///
/// Registers:
/// - Configuration options (column_lineage_dispatchers, column_lineage_url, etc.)
/// - The column_lineage(query) and lineage_tables(query) table functions
/// - An optimizer extension that publishes the lineage of executed statements
class ColumnLineageExtension : public Extension {
public:
	void Load(ExtensionLoader &loader) override;

	/// @return "column_lineage"
	std::string Name() override;

	/// @return Version string (defined by the EXT_VERSION_COLUMN_LINEAGE macro).
	std::string Version() const override;
};

} // namespace duckdb
