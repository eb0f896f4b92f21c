//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_functions.cpp
// Description: Statement planning for lineage extraction and the
//              column_lineage / lineage_tables table functions.
//===----------------------------------------------------------------------===//

#include "lineage_functions.hpp"
#include "column_lineage_optimizer.hpp"
#include "lineage_dispatcher.hpp"
#include "lineage_extractor.hpp"
#include "plan_converter.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/optimizer/optimizer.hpp"
#include "duckdb/parser/parsed_data/create_view_info.hpp"
#include "duckdb/parser/parser.hpp"
#include "duckdb/planner/operator/logical_create.hpp"
#include "duckdb/planner/planner.hpp"

namespace column_lineage {

//===--------------------------------------------------------------------===//
// Extraction
//===--------------------------------------------------------------------===//

LineageResult ExtractPlanLineage(duckdb::ClientContext &context, const PlanNode &plan) {
	InMemoryCatalog catalog(duckdb::DEFAULT_SCHEMA, PlanConverter::GetDefaultCatalog(context));
	ExtractorOptions options;
	options.debug = DispatcherRegistry::Get().IsDebug();
	options.default_database = duckdb::DEFAULT_SCHEMA;
	return ExtractLineage(plan, catalog, options);
}

// Bind, optimize and convert one statement
static PlanNodePtr PlanStatement(duckdb::ClientContext &context, duckdb::unique_ptr<duckdb::SQLStatement> statement) {
	duckdb::Planner planner(context);
	planner.CreatePlan(std::move(statement));
	auto op = std::move(planner.plan);
	duckdb::Optimizer optimizer(*planner.binder, context);
	op = optimizer.Optimize(std::move(op));

	PlanConverter converter(context);
	auto plan = converter.Convert(*op);
	if (plan->type != PlanNodeType::COMMAND) {
		return PlanConverter::RenameOutputs(plan, planner.names);
	}

	auto &command = plan->Cast<CommandNode>();
	if (command.command_type != CommandType::CREATE_VIEW) {
		return plan;
	}
	// A created view carries its defining query only as a statement
	auto &view = op->Cast<duckdb::LogicalCreate>().info->Cast<duckdb::CreateViewInfo>();
	if (!view.query) {
		return plan;
	}
	auto query = PlanStatement(context, view.query->Copy());
	return std::make_shared<CommandNode>(CommandType::CREATE_VIEW, command.target, command.destination_columns,
	                                     std::vector<PlanNodePtr> {query});
}

LineageResult ExtractQueryLineage(duckdb::ClientContext &context, const std::string &query) {
	duckdb::Parser parser(context.GetParserOptions());
	parser.ParseQuery(query);
	if (parser.statements.size() != 1) {
		throw duckdb::InvalidInputException("column_lineage: expected exactly one statement, got " +
		                                    std::to_string(parser.statements.size()));
	}
	auto statement = std::move(parser.statements[0]);

	LineagePlanningGuard guard;
	duckdb::Connection connection(*context.db);
	PlanNodePtr plan;
	connection.context->RunFunctionInTransaction(
	    [&]() { plan = PlanStatement(*connection.context, std::move(statement)); });
	return ExtractPlanLineage(*connection.context, *plan);
}

//===--------------------------------------------------------------------===//
// Table functions
//===--------------------------------------------------------------------===//

struct ColumnLineageRow {
	std::string column_name;
	std::vector<std::string> sources;
};

struct ColumnLineageBindData : public duckdb::TableFunctionData {
	std::vector<ColumnLineageRow> rows;

	duckdb::unique_ptr<duckdb::FunctionData> Copy() const override {
		auto result = duckdb::make_uniq<ColumnLineageBindData>();
		result->rows = rows;
		return std::move(result);
	}
	bool Equals(const duckdb::FunctionData &other) const override {
		return false;
	}
};

struct LineageTablesBindData : public duckdb::TableFunctionData {
	//! (role, table name) pairs
	std::vector<std::pair<std::string, std::string>> rows;

	duckdb::unique_ptr<duckdb::FunctionData> Copy() const override {
		auto result = duckdb::make_uniq<LineageTablesBindData>();
		result->rows = rows;
		return std::move(result);
	}
	bool Equals(const duckdb::FunctionData &other) const override {
		return false;
	}
};

struct LineageScanState : public duckdb::GlobalTableFunctionState {
	idx_t offset = 0;
};

static Lineage BindLineage(duckdb::ClientContext &context, duckdb::TableFunctionBindInput &input,
                           const std::string &function_name) {
	auto &argument = input.inputs[0];
	if (argument.IsNull()) {
		throw duckdb::BinderException("%s: query must not be NULL", function_name);
	}
	auto result = ExtractQueryLineage(context, argument.GetValue<std::string>());
	if (result.HasError()) {
		throw duckdb::InvalidInputException("%s: %s", function_name, result.GetError().ToString());
	}
	return result.GetLineage();
}

static duckdb::unique_ptr<duckdb::FunctionData> ColumnLineageBind(duckdb::ClientContext &context,
                                                                  duckdb::TableFunctionBindInput &input,
                                                                  duckdb::vector<duckdb::LogicalType> &return_types,
                                                                  duckdb::vector<std::string> &names) {
	auto lineage = BindLineage(context, input, "column_lineage");
	auto result = duckdb::make_uniq<ColumnLineageBindData>();
	for (auto &column : lineage.columns) {
		ColumnLineageRow row;
		row.column_name = column.first;
		for (auto &source : column.second) {
			row.sources.push_back(source.ToString());
		}
		result->rows.push_back(std::move(row));
	}

	names.emplace_back("column_name");
	return_types.emplace_back(duckdb::LogicalType::VARCHAR);
	names.emplace_back("source_columns");
	return_types.emplace_back(duckdb::LogicalType::LIST(duckdb::LogicalType::VARCHAR));
	return std::move(result);
}

static duckdb::unique_ptr<duckdb::FunctionData> LineageTablesBind(duckdb::ClientContext &context,
                                                                  duckdb::TableFunctionBindInput &input,
                                                                  duckdb::vector<duckdb::LogicalType> &return_types,
                                                                  duckdb::vector<std::string> &names) {
	auto lineage = BindLineage(context, input, "lineage_tables");
	auto result = duckdb::make_uniq<LineageTablesBindData>();
	for (auto &source : lineage.sources) {
		result->rows.emplace_back("input", source.ToString());
	}
	for (auto &target : lineage.targets) {
		result->rows.emplace_back("output", target.ToString());
	}

	names.emplace_back("role");
	return_types.emplace_back(duckdb::LogicalType::VARCHAR);
	names.emplace_back("table_name");
	return_types.emplace_back(duckdb::LogicalType::VARCHAR);
	return std::move(result);
}

static duckdb::unique_ptr<duckdb::GlobalTableFunctionState> LineageScanInit(duckdb::ClientContext &context,
                                                                           duckdb::TableFunctionInitInput &input) {
	return duckdb::make_uniq<LineageScanState>();
}

static void ColumnLineageScan(duckdb::ClientContext &context, duckdb::TableFunctionInput &data_p,
                              duckdb::DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<ColumnLineageBindData>();
	auto &state = data_p.global_state->Cast<LineageScanState>();

	idx_t count = 0;
	while (state.offset < bind_data.rows.size() && count < STANDARD_VECTOR_SIZE) {
		auto &row = bind_data.rows[state.offset++];
		duckdb::vector<duckdb::Value> sources;
		for (auto &source : row.sources) {
			sources.emplace_back(source);
		}
		output.SetValue(0, count, duckdb::Value(row.column_name));
		output.SetValue(1, count, duckdb::Value::LIST(duckdb::LogicalType::VARCHAR, std::move(sources)));
		count++;
	}
	output.SetCardinality(count);
}

static void LineageTablesScan(duckdb::ClientContext &context, duckdb::TableFunctionInput &data_p,
                              duckdb::DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<LineageTablesBindData>();
	auto &state = data_p.global_state->Cast<LineageScanState>();

	idx_t count = 0;
	while (state.offset < bind_data.rows.size() && count < STANDARD_VECTOR_SIZE) {
		auto &row = bind_data.rows[state.offset++];
		output.SetValue(0, count, duckdb::Value(row.first));
		output.SetValue(1, count, duckdb::Value(row.second));
		count++;
	}
	output.SetCardinality(count);
}

void RegisterLineageFunctions(duckdb::ExtensionLoader &loader) {
	duckdb::TableFunction column_lineage("column_lineage", {duckdb::LogicalType::VARCHAR}, ColumnLineageScan,
	                                     ColumnLineageBind, LineageScanInit);
	loader.RegisterFunction(column_lineage);

	duckdb::TableFunction lineage_tables("lineage_tables", {duckdb::LogicalType::VARCHAR}, LineageTablesScan,
	                                     LineageTablesBind, LineageScanInit);
	loader.RegisterFunction(lineage_tables);
}

} // namespace column_lineage
