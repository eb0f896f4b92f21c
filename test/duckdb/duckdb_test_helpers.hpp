//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: duckdb_test_helpers.hpp
// Description: In-memory database with the extension loaded, and a dispatcher
//              that records what the optimizer hook publishes.
//===----------------------------------------------------------------------===//

#pragma once

#include "column_lineage_extension.hpp"
#include "lineage_dispatcher.hpp"
#include "duckdb.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace column_lineage {
namespace test {

/// @brief In-memory database with the extension loaded and a small schema.
struct TestDatabase {
	TestDatabase() : db(nullptr), con(db) {
		db.LoadStaticExtension<duckdb::ColumnLineageExtension>();
		Execute("CREATE TABLE t (a INTEGER, b INTEGER)");
		Execute("CREATE TABLE u (a INTEGER, c VARCHAR)");
		Execute("CREATE TABLE sink (x INTEGER, y INTEGER)");
	}

	void Execute(const std::string &sql) {
		auto result = con.Query(sql);
		if (result->HasError()) {
			result->ThrowError();
		}
	}

	duckdb::DuckDB db;
	duckdb::Connection con;
};

inline std::string Quote(const std::string &query) {
	std::string result = "'";
	for (auto c : query) {
		result += c;
		if (c == '\'') {
			result += '\'';
		}
	}
	return result + "'";
}

/// @brief (column_name, comma-joined source_columns) rows of column_lineage(query).
inline std::vector<std::pair<std::string, std::string>> ColumnLineageRows(duckdb::Connection &con,
                                                                          const std::string &query) {
	auto result = con.Query("SELECT column_name, array_to_string(source_columns, ',') FROM column_lineage(" +
	                        Quote(query) + ")");
	if (result->HasError()) {
		result->ThrowError();
	}
	std::vector<std::pair<std::string, std::string>> rows;
	for (duckdb::idx_t row = 0; row < result->RowCount(); row++) {
		rows.emplace_back(result->GetValue(0, row).ToString(), result->GetValue(1, row).ToString());
	}
	return rows;
}

/// @brief (role, table_name) rows of lineage_tables(query).
inline std::vector<std::pair<std::string, std::string>> LineageTableRows(duckdb::Connection &con,
                                                                         const std::string &query) {
	auto result = con.Query("SELECT role, table_name FROM lineage_tables(" + Quote(query) + ")");
	if (result->HasError()) {
		result->ThrowError();
	}
	std::vector<std::pair<std::string, std::string>> rows;
	for (duckdb::idx_t row = 0; row < result->RowCount(); row++) {
		rows.emplace_back(result->GetValue(0, row).ToString(), result->GetValue(1, row).ToString());
	}
	return rows;
}

typedef std::vector<std::pair<std::string, std::string>> Rows;

//===--------------------------------------------------------------------===//
// Capturing dispatcher
//===--------------------------------------------------------------------===//

struct CapturedStatement {
	Lineage lineage;
	DispatchContext context;
};

/// @brief Records every dispatched statement.
class CaptureDispatcher : public LineageDispatcher {
public:
	std::string GetName() const override {
		return "capture";
	}
	void Send(const Lineage &lineage, const DispatchContext &context) override {
		std::lock_guard<std::mutex> lock(capture_mutex);
		captured.push_back(CapturedStatement {lineage, context});
	}

	std::vector<CapturedStatement> GetCaptured() {
		std::lock_guard<std::mutex> lock(capture_mutex);
		return captured;
	}

private:
	std::mutex capture_mutex;
	std::vector<CapturedStatement> captured;
};

/// @brief Activates a fresh CaptureDispatcher; deactivates all dispatchers on destruction.
class ScopedCapture {
public:
	ScopedCapture() : dispatcher(std::make_shared<CaptureDispatcher>()) {
		auto instance = dispatcher;
		DispatcherRegistry::Get().RegisterFactory("capture", [instance]() { return instance; });
		DispatcherRegistry::Get().SetDispatchers("capture");
	}
	~ScopedCapture() {
		DispatcherRegistry::Get().SetDispatchers("");
	}

	/// @brief Captured statements that write to `target`.
	std::vector<CapturedStatement> Writing(const std::string &target) {
		std::vector<CapturedStatement> result;
		for (auto &statement : dispatcher->GetCaptured()) {
			for (auto &name : statement.lineage.targets) {
				if (name.ToString() == target) {
					result.push_back(statement);
					break;
				}
			}
		}
		return result;
	}

	std::shared_ptr<CaptureDispatcher> dispatcher;
};

} // namespace test
} // namespace column_lineage
