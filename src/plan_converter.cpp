//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: plan_converter.cpp
// Description: Mapping of DuckDB logical operators and bound expressions onto
//              plan nodes and lineage expressions.
//===----------------------------------------------------------------------===//

#include "plan_converter.hpp"
#include "duckdb/catalog/catalog.hpp"
#include "duckdb/catalog/catalog_entry/schema_catalog_entry.hpp"
#include "duckdb/common/enums/logical_operator_type.hpp"
#include "duckdb/main/database_manager.hpp"
#include "duckdb/parser/parsed_data/create_table_info.hpp"
#include "duckdb/parser/parsed_data/create_view_info.hpp"
#include "duckdb/planner/expression/list.hpp"
#include "duckdb/planner/expression_iterator.hpp"
#include "duckdb/planner/operator/list.hpp"
#include "duckdb/planner/parsed_data/bound_create_table_info.hpp"

namespace column_lineage {

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

static ExpressionPtr Ref(const OutputColumn &column) {
	return std::make_shared<ColumnRefExpression>(column.id, column.name);
}

static ExpressionPtr NullLiteral() {
	return std::make_shared<LiteralExpression>("NULL", true);
}

// AND of all conditions; null when there are none
static ExpressionPtr Conjunction(std::vector<ExpressionPtr> conditions) {
	if (conditions.empty()) {
		return nullptr;
	}
	if (conditions.size() == 1) {
		return conditions[0];
	}
	return std::make_shared<FunctionExpression>("and", std::move(conditions));
}

static std::string PositionalName(size_t index) {
	return "col" + std::to_string(index);
}

// Alias first, then the referenced column, then DuckDB's rendering
static std::string ExpressionName(const duckdb::Expression &expr, const Expression &converted) {
	if (!expr.alias.empty()) {
		return expr.alias;
	}
	if (converted.type == ExpressionType::COLUMN_REF) {
		return converted.Cast<ColumnRefExpression>().name;
	}
	return expr.GetName();
}

// A call to error() never produces a value
static bool IsErrorCall(const duckdb::Expression &expr) {
	auto *target = &expr;
	while (target->GetExpressionClass() == duckdb::ExpressionClass::BOUND_CAST) {
		target = target->Cast<duckdb::BoundCastExpression>().child.get();
	}
	return target->GetExpressionClass() == duckdb::ExpressionClass::BOUND_FUNCTION &&
	       target->Cast<duckdb::BoundFunctionExpression>().function.name == "error";
}

static duckdb::LogicalOperator &SkipOperators(duckdb::LogicalOperator &op, duckdb::LogicalOperatorType first,
                                              duckdb::LogicalOperatorType second) {
	auto *node = &op;
	while ((node->type == first || node->type == second) && node->children.size() == 1) {
		node = node->children[0].get();
	}
	return *node;
}

// DuckDB plans an uncorrelated EXISTS or scalar subquery as a cross product with
// an ungrouped aggregate over a LIMIT of the subquery: count_star for EXISTS,
// first for a scalar value
static bool IsUncorrelatedSubquery(duckdb::LogicalOperator &op, SubqueryType &subquery_type) {
	auto &node = SkipOperators(op, duckdb::LogicalOperatorType::LOGICAL_PROJECTION,
	                           duckdb::LogicalOperatorType::LOGICAL_FILTER);
	if (node.type != duckdb::LogicalOperatorType::LOGICAL_AGGREGATE_AND_GROUP_BY || node.children.size() != 1) {
		return false;
	}
	auto &aggregate = node.Cast<duckdb::LogicalAggregate>();
	if (!aggregate.groups.empty() || aggregate.expressions.empty()) {
		return false;
	}
	auto &input = SkipOperators(*node.children[0], duckdb::LogicalOperatorType::LOGICAL_PROJECTION,
	                            duckdb::LogicalOperatorType::LOGICAL_PROJECTION);
	if (input.type != duckdb::LogicalOperatorType::LOGICAL_LIMIT) {
		return false;
	}
	// LIMIT 1, or LIMIT 2 when a scalar subquery checks for extra rows
	auto &limit = input.Cast<duckdb::LogicalLimit>();
	if (limit.limit_val.Type() != duckdb::LimitNodeType::CONSTANT_VALUE || limit.limit_val.GetConstantValue() > 2) {
		return false;
	}

	bool has_first = false;
	for (auto &expr : aggregate.expressions) {
		if (expr->GetExpressionClass() != duckdb::ExpressionClass::BOUND_AGGREGATE) {
			return false;
		}
		auto &name = expr->Cast<duckdb::BoundAggregateExpression>().function.name;
		if (name == "first") {
			has_first = true;
		} else if (name != "count_star") {
			return false;
		}
	}
	subquery_type = has_first ? SubqueryType::SCALAR : SubqueryType::EXISTS;
	return true;
}

static std::vector<OutputColumn> Concat(const std::vector<OutputColumn> &left, const std::vector<OutputColumn> &right) {
	auto result = left;
	result.insert(result.end(), right.begin(), right.end());
	return result;
}

//===--------------------------------------------------------------------===//
// Bindings
//===--------------------------------------------------------------------===//

OutputColumn PlanConverter::Define(const duckdb::ColumnBinding &binding, const std::string &name) {
	OutputColumn column(ids.NextId(), name);
	bindings.erase(binding);
	bindings.emplace(binding, column);
	return column;
}

OutputColumn PlanConverter::Lookup(const duckdb::ColumnBinding &binding) const {
	auto entry = bindings.find(binding);
	if (entry == bindings.end()) {
		return OutputColumn(INVALID_COLUMN_ID, binding.ToString());
	}
	return entry->second;
}

PlanNodePtr PlanConverter::AlignOutputs(duckdb::LogicalOperator &op, PlanNodePtr node) {
	auto op_bindings = op.GetColumnBindings();
	std::vector<OutputColumn> columns;
	bool aligned = op_bindings.size() == node->columns.size();
	for (idx_t i = 0; i < op_bindings.size(); i++) {
		auto column = Lookup(op_bindings[i]);
		aligned = aligned && column.id == node->columns[i].id;
		columns.push_back(column);
	}
	if (aligned) {
		return node;
	}
	// Projection maps drop or reorder columns
	std::vector<ExpressionPtr> expressions;
	for (auto &column : columns) {
		expressions.push_back(Ref(column));
	}
	return std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(node));
}

QualifiedName PlanConverter::TableName(duckdb::TableCatalogEntry &table) {
	return QualifiedName(table.catalog.GetName(), table.ParentSchema().name, table.name);
}

std::string PlanConverter::GetDefaultCatalog(duckdb::ClientContext &context) {
	return duckdb::DatabaseManager::GetDefaultDatabase(context);
}

PlanNodePtr PlanConverter::RenameOutputs(PlanNodePtr plan, const std::vector<std::string> &names) {
	if (!plan || plan->columns.size() != names.size()) {
		return plan;
	}
	std::vector<ExpressionPtr> expressions;
	std::vector<OutputColumn> columns;
	for (size_t i = 0; i < names.size(); i++) {
		expressions.push_back(Ref(plan->columns[i]));
		columns.emplace_back(plan->columns[i].id, names[i]);
	}
	return std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(plan));
}

//===--------------------------------------------------------------------===//
// Operators
//===--------------------------------------------------------------------===//

PlanNodePtr PlanConverter::Convert(duckdb::LogicalOperator &op) {
	return ConvertOperator(op);
}

PlanNodePtr PlanConverter::ConvertOperator(duckdb::LogicalOperator &op) {
	switch (op.type) {
	case duckdb::LogicalOperatorType::LOGICAL_GET:
		return ConvertGet(op);
	case duckdb::LogicalOperatorType::LOGICAL_PROJECTION:
		return ConvertProjection(op);
	case duckdb::LogicalOperatorType::LOGICAL_FILTER:
		return ConvertFilter(op);
	case duckdb::LogicalOperatorType::LOGICAL_AGGREGATE_AND_GROUP_BY:
		return ConvertAggregate(op);
	case duckdb::LogicalOperatorType::LOGICAL_WINDOW:
		return ConvertWindow(op);
	case duckdb::LogicalOperatorType::LOGICAL_COMPARISON_JOIN:
	case duckdb::LogicalOperatorType::LOGICAL_DELIM_JOIN:
	case duckdb::LogicalOperatorType::LOGICAL_ASOF_JOIN:
	case duckdb::LogicalOperatorType::LOGICAL_ANY_JOIN:
		return ConvertComparisonJoin(op);
	case duckdb::LogicalOperatorType::LOGICAL_CROSS_PRODUCT:
	case duckdb::LogicalOperatorType::LOGICAL_POSITIONAL_JOIN:
		return ConvertCrossProduct(op);
	case duckdb::LogicalOperatorType::LOGICAL_UNION:
	case duckdb::LogicalOperatorType::LOGICAL_EXCEPT:
	case duckdb::LogicalOperatorType::LOGICAL_INTERSECT:
		return ConvertSetOperation(op);
	case duckdb::LogicalOperatorType::LOGICAL_ORDER_BY:
		return ConvertPassthrough(op, PlanNodeType::SORT);
	case duckdb::LogicalOperatorType::LOGICAL_LIMIT:
	case duckdb::LogicalOperatorType::LOGICAL_TOP_N:
	case duckdb::LogicalOperatorType::LOGICAL_SAMPLE:
		return ConvertPassthrough(op, PlanNodeType::LIMIT);
	case duckdb::LogicalOperatorType::LOGICAL_DISTINCT:
		return ConvertPassthrough(op, PlanNodeType::DISTINCT);
	case duckdb::LogicalOperatorType::LOGICAL_MATERIALIZED_CTE:
		return ConvertMaterializedCTE(op);
	case duckdb::LogicalOperatorType::LOGICAL_CTE_REF:
		return ConvertCTERef(op);
	case duckdb::LogicalOperatorType::LOGICAL_RECURSIVE_CTE:
		return ConvertRecursiveCTE(op);
	case duckdb::LogicalOperatorType::LOGICAL_INSERT:
		return ConvertInsert(op);
	case duckdb::LogicalOperatorType::LOGICAL_CREATE_TABLE:
		return ConvertCreateTable(op);
	case duckdb::LogicalOperatorType::LOGICAL_COPY_TO_FILE:
		return ConvertCopyToFile(op);
	case duckdb::LogicalOperatorType::LOGICAL_CREATE_VIEW:
		return ConvertCreateView(op);
	case duckdb::LogicalOperatorType::LOGICAL_DUMMY_SCAN:
	case duckdb::LogicalOperatorType::LOGICAL_EXPRESSION_GET:
	case duckdb::LogicalOperatorType::LOGICAL_CHUNK_GET:
	case duckdb::LogicalOperatorType::LOGICAL_DELIM_GET:
	case duckdb::LogicalOperatorType::LOGICAL_EMPTY_RESULT:
		return ConvertLocalRelation(op);
	case duckdb::LogicalOperatorType::LOGICAL_DELETE:
	case duckdb::LogicalOperatorType::LOGICAL_UPDATE:
	case duckdb::LogicalOperatorType::LOGICAL_MERGE_INTO:
		// These bind (0, 0) placeholders that would alias unrelated columns
		return ConvertUnknown(op, true);
	default:
		return ConvertUnknown(op, false);
	}
}

PlanNodePtr PlanConverter::ConvertGet(duckdb::LogicalOperator &op) {
	auto &get = op.Cast<duckdb::LogicalGet>();
	auto &column_ids = get.GetColumnIds();

	std::vector<OutputColumn> columns;
	for (auto &binding : op.GetColumnBindings()) {
		std::string name = "rowid";
		if (binding.column_index < column_ids.size()) {
			auto primary = column_ids[binding.column_index].GetPrimaryIndex();
			if (primary < get.names.size()) {
				name = get.names[primary];
			}
		}
		columns.push_back(Define(binding, name));
	}

	auto table = get.GetTable();
	if (!table) {
		// Table functions and file scans read no catalog table
		return std::make_shared<PlanNode>(PlanNodeType::LOCAL_RELATION, std::move(columns));
	}
	return std::make_shared<RelationNode>(TableName(*table), std::move(columns));
}

PlanNodePtr PlanConverter::ConvertLocalRelation(duckdb::LogicalOperator &op) {
	auto op_bindings = op.GetColumnBindings();
	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < op_bindings.size(); i++) {
		columns.push_back(Define(op_bindings[i], PositionalName(i)));
	}
	return std::make_shared<PlanNode>(PlanNodeType::LOCAL_RELATION, std::move(columns));
}

PlanNodePtr PlanConverter::ConvertProjection(duckdb::LogicalOperator &op) {
	auto &projection = op.Cast<duckdb::LogicalProjection>();
	auto child = ConvertOperator(*op.children[0]);

	std::vector<ExpressionPtr> expressions;
	for (auto &expr : projection.expressions) {
		expressions.push_back(ConvertExpression(*expr, child->columns));
	}
	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < expressions.size(); i++) {
		columns.push_back(Define(duckdb::ColumnBinding(projection.table_index, i),
		                         ExpressionName(*projection.expressions[i], *expressions[i])));
	}
	return std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(child));
}

PlanNodePtr PlanConverter::ConvertFilter(duckdb::LogicalOperator &op) {
	auto child = ConvertOperator(*op.children[0]);
	std::vector<ExpressionPtr> conditions;
	for (auto &expr : op.expressions) {
		conditions.push_back(ConvertExpression(*expr, child->columns));
	}
	return AlignOutputs(op, std::make_shared<FilterNode>(Conjunction(std::move(conditions)), child));
}

PlanNodePtr PlanConverter::ConvertAggregate(duckdb::LogicalOperator &op) {
	auto &aggregate = op.Cast<duckdb::LogicalAggregate>();
	auto child = ConvertOperator(*op.children[0]);

	std::vector<ExpressionPtr> groups;
	std::vector<ExpressionPtr> outputs;
	std::vector<std::string> names;
	std::vector<duckdb::ColumnBinding> output_bindings;
	for (idx_t i = 0; i < aggregate.groups.size(); i++) {
		auto group = ConvertExpression(*aggregate.groups[i], child->columns);
		groups.push_back(group);
		outputs.push_back(group);
		names.push_back(ExpressionName(*aggregate.groups[i], *group));
		output_bindings.emplace_back(aggregate.group_index, i);
	}
	for (idx_t i = 0; i < aggregate.expressions.size(); i++) {
		auto expr = ConvertExpression(*aggregate.expressions[i], child->columns);
		outputs.push_back(expr);
		names.push_back(ExpressionName(*aggregate.expressions[i], *expr));
		output_bindings.emplace_back(aggregate.aggregate_index, i);
	}
	// GROUPING() only reports which keys are active
	for (idx_t i = 0; i < aggregate.grouping_functions.size(); i++) {
		outputs.push_back(std::make_shared<LiteralExpression>("grouping"));
		names.push_back("grouping");
		output_bindings.emplace_back(aggregate.groupings_index, i);
	}

	if (aggregate.grouping_sets.size() <= 1) {
		std::vector<OutputColumn> columns;
		for (idx_t i = 0; i < output_bindings.size(); i++) {
			columns.push_back(Define(output_bindings[i], names[i]));
		}
		return std::make_shared<AggregateNode>(std::move(groups), std::move(outputs), std::move(columns),
		                                       std::move(child));
	}

	// Several grouping sets: aggregate over all keys, then expand one row per set
	// with the keys outside the set nulled out
	std::vector<OutputColumn> internal;
	for (idx_t i = 0; i < outputs.size(); i++) {
		internal.emplace_back(ids.NextId(), names[i]);
	}
	std::vector<std::vector<ExpressionPtr>> projections;
	for (auto &grouping_set : aggregate.grouping_sets) {
		std::vector<ExpressionPtr> projection;
		for (idx_t i = 0; i < internal.size(); i++) {
			if (i < groups.size() && grouping_set.find(i) == grouping_set.end()) {
				projection.push_back(NullLiteral());
			} else {
				projection.push_back(Ref(internal[i]));
			}
		}
		projections.push_back(std::move(projection));
	}
	auto node = std::make_shared<AggregateNode>(std::move(groups), std::move(outputs), internal, std::move(child));

	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < output_bindings.size(); i++) {
		columns.push_back(Define(output_bindings[i], names[i]));
	}
	return std::make_shared<ExpandNode>(std::move(projections), std::move(columns), std::move(node));
}

PlanNodePtr PlanConverter::ConvertWindow(duckdb::LogicalOperator &op) {
	auto &window = op.Cast<duckdb::LogicalWindow>();
	auto child = ConvertOperator(*op.children[0]);

	std::vector<ExpressionPtr> expressions;
	std::vector<OutputColumn> window_columns;
	for (idx_t i = 0; i < window.expressions.size(); i++) {
		auto expr = ConvertExpression(*window.expressions[i], child->columns);
		window_columns.push_back(
		    Define(duckdb::ColumnBinding(window.window_index, i), ExpressionName(*window.expressions[i], *expr)));
		expressions.push_back(std::move(expr));
	}
	return AlignOutputs(op, std::make_shared<WindowNode>(std::move(expressions), window_columns, std::move(child)));
}

PlanNodePtr PlanConverter::ConvertComparisonJoin(duckdb::LogicalOperator &op) {
	auto &join = op.Cast<duckdb::LogicalJoin>();
	auto left = ConvertOperator(*op.children[0]);
	auto right = ConvertOperator(*op.children[1]);

	std::vector<ExpressionPtr> conditions;
	if (op.type == duckdb::LogicalOperatorType::LOGICAL_ANY_JOIN) {
		auto &any_join = op.Cast<duckdb::LogicalAnyJoin>();
		conditions.push_back(ConvertExpression(*any_join.condition, Concat(left->columns, right->columns)));
	} else {
		// Delim and ASOF joins share the comparison join class under another type
		auto &comparison = static_cast<duckdb::LogicalComparisonJoin &>(op);
		for (auto &condition : comparison.conditions) {
			std::vector<ExpressionPtr> sides {ConvertExpression(*condition.left, left->columns),
			                                  ConvertExpression(*condition.right, right->columns)};
			conditions.push_back(std::make_shared<FunctionExpression>(
			    duckdb::ExpressionTypeToString(condition.comparison), std::move(sides)));
		}
	}
	return MakeJoin(op, join.join_type, std::move(left), std::move(right), std::move(conditions));
}

PlanNodePtr PlanConverter::ConvertCrossProduct(duckdb::LogicalOperator &op) {
	auto left = ConvertOperator(*op.children[0]);
	auto right = ConvertOperator(*op.children[1]);
	if (op.type == duckdb::LogicalOperatorType::LOGICAL_CROSS_PRODUCT) {
		// Join reordering may put the subquery on either side
		SubqueryType subquery_type;
		if (IsUncorrelatedSubquery(*op.children[1], subquery_type)) {
			return AttachSubquery(op, std::move(left), *op.children[1], std::move(right), subquery_type);
		}
		if (IsUncorrelatedSubquery(*op.children[0], subquery_type)) {
			return AttachSubquery(op, std::move(right), *op.children[0], std::move(left), subquery_type);
		}
	}
	return AlignOutputs(op, std::make_shared<JoinNode>(JoinType::CROSS, nullptr, std::move(left), std::move(right)));
}

PlanNodePtr PlanConverter::AttachSubquery(duckdb::LogicalOperator &op, PlanNodePtr outer,
                                          duckdb::LogicalOperator &subquery_op, PlanNodePtr subquery,
                                          SubqueryType subquery_type) {
	std::vector<ExpressionPtr> expressions;
	std::vector<OutputColumn> columns = outer->columns;
	for (auto &column : outer->columns) {
		expressions.push_back(Ref(column));
	}

	auto subquery_bindings = subquery_op.GetColumnBindings();
	for (idx_t i = 0; i < subquery->columns.size(); i++) {
		auto &name = subquery->columns[i].name;
		auto plan = subquery;
		if (subquery->columns.size() != 1) {
			// A scalar subquery yields exactly one column
			plan = std::make_shared<ProjectNode>(std::vector<ExpressionPtr> {Ref(subquery->columns[i])},
			                                     std::vector<OutputColumn> {OutputColumn(ids.NextId(), name)}, subquery);
		}
		expressions.push_back(std::make_shared<SubqueryExpression>(subquery_type, plan));
		columns.push_back(i < subquery_bindings.size() ? Define(subquery_bindings[i], name)
		                                               : OutputColumn(ids.NextId(), name));
	}
	return AlignOutputs(op, std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(outer)));
}

PlanNodePtr PlanConverter::MakeJoin(duckdb::LogicalOperator &op, duckdb::JoinType join_type, PlanNodePtr left,
                                    PlanNodePtr right, std::vector<ExpressionPtr> conditions) {
	switch (join_type) {
	case duckdb::JoinType::SEMI:
	case duckdb::JoinType::ANTI:
	case duckdb::JoinType::MARK: {
		// Decorrelated IN and EXISTS: the right side only restricts the rows of the left
		auto exists = std::make_shared<SubqueryExpression>(SubqueryType::EXISTS, right, std::move(conditions), true);
		PlanNodePtr result = std::make_shared<FilterNode>(exists, left);
		if (join_type == duckdb::JoinType::MARK) {
			auto &join = op.Cast<duckdb::LogicalJoin>();
			std::vector<ExpressionPtr> expressions;
			std::vector<OutputColumn> columns = left->columns;
			for (auto &column : left->columns) {
				expressions.push_back(Ref(column));
			}
			expressions.push_back(std::make_shared<LiteralExpression>("mark"));
			columns.push_back(Define(duckdb::ColumnBinding(join.mark_index, 0), "mark"));
			result = std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(result));
		}
		return AlignOutputs(op, std::move(result));
	}
	case duckdb::JoinType::RIGHT_SEMI:
	case duckdb::JoinType::RIGHT_ANTI: {
		auto exists = std::make_shared<SubqueryExpression>(SubqueryType::EXISTS, left, std::move(conditions), true);
		return AlignOutputs(op, std::make_shared<FilterNode>(exists, right));
	}
	default:
		break;
	}

	JoinType type;
	switch (join_type) {
	case duckdb::JoinType::LEFT:
	case duckdb::JoinType::SINGLE:
		type = JoinType::LEFT;
		break;
	case duckdb::JoinType::RIGHT:
		type = JoinType::RIGHT;
		break;
	case duckdb::JoinType::OUTER:
		type = JoinType::FULL;
		break;
	default:
		type = JoinType::INNER;
		break;
	}
	return AlignOutputs(op, std::make_shared<JoinNode>(type, Conjunction(std::move(conditions)), std::move(left),
	                                                   std::move(right)));
}

PlanNodePtr PlanConverter::ConvertSetOperation(duckdb::LogicalOperator &op) {
	auto &setop = op.Cast<duckdb::LogicalSetOperation>();
	std::vector<PlanNodePtr> children;
	for (auto &child : op.children) {
		children.push_back(ConvertOperator(*child));
	}

	SetOperationType type;
	switch (op.type) {
	case duckdb::LogicalOperatorType::LOGICAL_EXCEPT:
		type = SetOperationType::EXCEPT;
		break;
	case duckdb::LogicalOperatorType::LOGICAL_INTERSECT:
		type = SetOperationType::INTERSECT;
		break;
	default:
		type = setop.setop_all ? SetOperationType::UNION_ALL : SetOperationType::UNION;
		break;
	}

	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < setop.column_count; i++) {
		auto name = !children.empty() && i < children[0]->columns.size() ? children[0]->columns[i].name
		                                                                   : PositionalName(i);
		columns.push_back(Define(duckdb::ColumnBinding(setop.table_index, i), name));
	}
	return std::make_shared<SetOperationNode>(type, std::move(columns), std::move(children));
}

PlanNodePtr PlanConverter::ConvertPassthrough(duckdb::LogicalOperator &op, PlanNodeType type) {
	auto child = ConvertOperator(*op.children[0]);
	return AlignOutputs(op, PlanNode::MakePassthrough(type, std::move(child)));
}

PlanNodePtr PlanConverter::ConvertMaterializedCTE(duckdb::LogicalOperator &op) {
	auto &cte = op.Cast<duckdb::LogicalMaterializedCTE>();
	auto definition = ConvertOperator(*op.children[0]);
	auto main = ConvertOperator(*op.children[1]);
	return AlignOutputs(op, std::make_shared<WithCTENode>(std::vector<uint64_t> {cte.table_index},
	                                                      std::vector<PlanNodePtr> {definition}, main));
}

PlanNodePtr PlanConverter::ConvertCTERef(duckdb::LogicalOperator &op) {
	auto &ref = op.Cast<duckdb::LogicalCTERef>();
	auto op_bindings = op.GetColumnBindings();
	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < op_bindings.size(); i++) {
		auto name = i < ref.bound_columns.size() ? ref.bound_columns[i] : PositionalName(i);
		columns.push_back(Define(op_bindings[i], name));
	}
	return std::make_shared<CTERefNode>(ref.cte_index, std::move(columns));
}

PlanNodePtr PlanConverter::ConvertRecursiveCTE(duckdb::LogicalOperator &op) {
	// Only the anchor is followed; the recursive part reads the CTE itself
	auto anchor = ConvertOperator(*op.children[0]);
	auto op_bindings = op.GetColumnBindings();
	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < op_bindings.size(); i++) {
		auto name = i < anchor->columns.size() ? anchor->columns[i].name : PositionalName(i);
		columns.push_back(Define(op_bindings[i], name));
	}
	return std::make_shared<UnknownNode>(duckdb::LogicalOperatorToString(op.type), std::move(columns),
	                                     std::vector<PlanNodePtr> {anchor});
}

PlanNodePtr PlanConverter::ConvertInsert(duckdb::LogicalOperator &op) {
	auto &insert = op.Cast<duckdb::LogicalInsert>();
	std::vector<std::string> destination;
	for (auto &column : insert.table.GetColumns().Physical()) {
		destination.push_back(column.Name());
	}

	std::vector<PlanNodePtr> children;
	if (!op.children.empty()) {
		auto query = ConvertOperator(*op.children[0]);
		if (!insert.column_index_map.empty()) {
			// Reorder the query onto the table layout; unlisted columns take their default
			std::vector<ExpressionPtr> expressions;
			std::vector<OutputColumn> columns;
			for (idx_t i = 0; i < destination.size(); i++) {
				auto index = insert.column_index_map[duckdb::PhysicalIndex(i)];
				if (index == duckdb::DConstants::INVALID_INDEX || index >= query->columns.size()) {
					expressions.push_back(NullLiteral());
				} else {
					expressions.push_back(Ref(query->columns[index]));
				}
				columns.emplace_back(ids.NextId(), destination[i]);
			}
			query = std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(query));
		}
		children.push_back(std::move(query));
	}
	return std::make_shared<CommandNode>(CommandType::INSERT, TableName(insert.table), std::move(destination),
	                                     std::move(children));
}

PlanNodePtr PlanConverter::ConvertCreateTable(duckdb::LogicalOperator &op) {
	auto &create = op.Cast<duckdb::LogicalCreateTable>();
	auto &base = create.info->Base();
	QualifiedName name(create.schema.catalog.GetName(), create.schema.name, base.table);

	std::vector<std::string> destination;
	for (auto &column : base.columns.Physical()) {
		destination.push_back(column.Name());
	}
	if (op.children.empty()) {
		return std::make_shared<CommandNode>(CommandType::CREATE_TABLE, std::move(name), std::move(destination));
	}
	return std::make_shared<CommandNode>(CommandType::CREATE_TABLE_AS_SELECT, std::move(name), std::move(destination),
	                                     std::vector<PlanNodePtr> {ConvertOperator(*op.children[0])});
}

PlanNodePtr PlanConverter::ConvertCopyToFile(duckdb::LogicalOperator &op) {
	auto &copy = op.Cast<duckdb::LogicalCopyToFile>();
	return std::make_shared<CommandNode>(CommandType::INSERT_DIRECTORY, QualifiedName::Path(copy.file_path),
	                                     copy.names, std::vector<PlanNodePtr> {ConvertOperator(*op.children[0])});
}

PlanNodePtr PlanConverter::ConvertCreateView(duckdb::LogicalOperator &op) {
	auto &create = op.Cast<duckdb::LogicalCreate>();
	if (!create.info || create.info->type != duckdb::CatalogType::VIEW_ENTRY) {
		return ConvertUnknown(op, true);
	}
	// The bound view query is not part of the plan; see ExtractQueryLineage
	auto &view = create.info->Cast<duckdb::CreateViewInfo>();
	std::vector<std::string> destination;
	for (idx_t i = 0; i < view.names.size(); i++) {
		destination.push_back(i < view.aliases.size() ? view.aliases[i] : view.names[i]);
	}
	return std::make_shared<CommandNode>(CommandType::CREATE_VIEW,
	                                     QualifiedName(view.catalog, view.schema, view.view_name), destination);
}

PlanNodePtr PlanConverter::ConvertUnknown(duckdb::LogicalOperator &op, bool fresh_columns) {
	std::vector<PlanNodePtr> children;
	for (auto &child : op.children) {
		children.push_back(ConvertOperator(*child));
	}

	auto op_bindings = op.GetColumnBindings();
	std::vector<OutputColumn> columns;
	for (idx_t i = 0; i < op_bindings.size(); i++) {
		if (fresh_columns) {
			columns.emplace_back(ids.NextId(), PositionalName(i));
			continue;
		}
		auto entry = bindings.find(op_bindings[i]);
		if (entry != bindings.end()) {
			columns.push_back(entry->second);
		} else {
			columns.push_back(Define(op_bindings[i], PositionalName(i)));
		}
	}
	return std::make_shared<UnknownNode>(duckdb::LogicalOperatorToString(op.type), std::move(columns),
	                                     std::move(children));
}

//===--------------------------------------------------------------------===//
// Expressions
//===--------------------------------------------------------------------===//

ExpressionPtr PlanConverter::ConvertExpression(const duckdb::Expression &expr, const std::vector<OutputColumn> &input) {
	auto convert = [&](const duckdb::Expression &child) { return ConvertExpression(child, input); };

	switch (expr.GetExpressionClass()) {
	case duckdb::ExpressionClass::BOUND_COLUMN_REF: {
		auto &colref = expr.Cast<duckdb::BoundColumnRefExpression>();
		auto column = Lookup(colref.binding);
		return std::make_shared<ColumnRefExpression>(column.id, column.id == INVALID_COLUMN_ID ? colref.GetName()
		                                                                                       : column.name);
	}
	case duckdb::ExpressionClass::BOUND_REF: {
		auto &ref = expr.Cast<duckdb::BoundReferenceExpression>();
		if (ref.index >= input.size()) {
			return std::make_shared<ColumnRefExpression>(INVALID_COLUMN_ID, ref.GetName());
		}
		return Ref(input[ref.index]);
	}
	case duckdb::ExpressionClass::BOUND_CONSTANT: {
		auto &constant = expr.Cast<duckdb::BoundConstantExpression>();
		return std::make_shared<LiteralExpression>(constant.value.ToString(), constant.value.IsNull());
	}
	case duckdb::ExpressionClass::BOUND_CASE: {
		auto &case_expr = expr.Cast<duckdb::BoundCaseExpression>();
		std::vector<CaseCheck> checks;
		for (auto &check : case_expr.case_checks) {
			// Branches that raise an error, such as DuckDB's check for a scalar
			// subquery returning several rows, yield no value
			if (IsErrorCall(*check.then_expr)) {
				continue;
			}
			checks.emplace_back(convert(*check.when_expr), convert(*check.then_expr));
		}
		ExpressionPtr else_expr;
		if (case_expr.else_expr) {
			else_expr = convert(*case_expr.else_expr);
		}
		return std::make_shared<CaseExpression>(std::move(checks), std::move(else_expr));
	}
	case duckdb::ExpressionClass::BOUND_AGGREGATE: {
		auto &aggregate = expr.Cast<duckdb::BoundAggregateExpression>();
		std::vector<ExpressionPtr> children;
		bool constant_arguments = !aggregate.children.empty();
		for (auto &child : aggregate.children) {
			constant_arguments =
			    constant_arguments && child->GetExpressionClass() == duckdb::ExpressionClass::BOUND_CONSTANT;
			children.push_back(convert(*child));
		}
		auto &function_name = aggregate.function.name;
		bool is_count_star =
		    function_name == "count_star" || (function_name == "count" && constant_arguments);
		if (aggregate.filter && !is_count_star) {
			children.push_back(convert(*aggregate.filter));
		}
		auto result = std::make_shared<AggregateExpression>(function_name, std::move(children), aggregate.IsDistinct());
		result->is_count_star = is_count_star;
		return result;
	}
	case duckdb::ExpressionClass::BOUND_WINDOW: {
		auto &window = expr.Cast<duckdb::BoundWindowExpression>();
		auto function_name =
		    window.aggregate ? window.aggregate->name : duckdb::ExpressionTypeToString(window.GetExpressionType());
		std::vector<ExpressionPtr> children;
		for (auto &child : window.children) {
			children.push_back(convert(*child));
		}
		std::vector<ExpressionPtr> partitions;
		for (auto &partition : window.partitions) {
			partitions.push_back(convert(*partition));
		}
		std::vector<ExpressionPtr> orders;
		for (auto &order : window.orders) {
			orders.push_back(convert(*order.expression));
		}
		return std::make_shared<WindowExpression>(function_name, std::move(children), std::move(partitions),
		                                          std::move(orders));
	}
	default:
		break;
	}

	std::string function_name;
	if (expr.GetExpressionClass() == duckdb::ExpressionClass::BOUND_FUNCTION) {
		function_name = expr.Cast<duckdb::BoundFunctionExpression>().function.name;
	} else {
		function_name = duckdb::ExpressionTypeToString(expr.GetExpressionType());
	}
	std::vector<ExpressionPtr> children;
	duckdb::ExpressionIterator::EnumerateChildren(
	    expr, [&](const duckdb::Expression &child) { children.push_back(convert(child)); });
	return std::make_shared<FunctionExpression>(function_name, std::move(children));
}

} // namespace column_lineage
