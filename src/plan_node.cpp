//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: plan_node.cpp
// Description: Plan node and expression construction and debug rendering.
//===----------------------------------------------------------------------===//

#include "plan_node.hpp"

namespace column_lineage {

//===--------------------------------------------------------------------===//
// Static member definitions (required for C++11 constexpr)
//===--------------------------------------------------------------------===//

constexpr const ExpressionType ColumnRefExpression::TYPE;
constexpr const ExpressionType LiteralExpression::TYPE;
constexpr const ExpressionType FunctionExpression::TYPE;
constexpr const ExpressionType CaseExpression::TYPE;
constexpr const ExpressionType AggregateExpression::TYPE;
constexpr const ExpressionType WindowExpression::TYPE;
constexpr const ExpressionType SubqueryExpression::TYPE;

constexpr const PlanNodeType RelationNode::TYPE;
constexpr const PlanNodeType ProjectNode::TYPE;
constexpr const PlanNodeType FilterNode::TYPE;
constexpr const PlanNodeType AggregateNode::TYPE;
constexpr const PlanNodeType ExpandNode::TYPE;
constexpr const PlanNodeType JoinNode::TYPE;
constexpr const PlanNodeType SetOperationNode::TYPE;
constexpr const PlanNodeType WindowNode::TYPE;
constexpr const PlanNodeType SubqueryAliasNode::TYPE;
constexpr const PlanNodeType WithCTENode::TYPE;
constexpr const PlanNodeType CTERefNode::TYPE;
constexpr const PlanNodeType CommandNode::TYPE;
constexpr const PlanNodeType UnknownNode::TYPE;

//===--------------------------------------------------------------------===//
// Enum names
//===--------------------------------------------------------------------===//

std::string ExpressionTypeToString(ExpressionType type) {
	switch (type) {
	case ExpressionType::COLUMN_REF:
		return "COLUMN_REF";
	case ExpressionType::LITERAL:
		return "LITERAL";
	case ExpressionType::FUNCTION:
		return "FUNCTION";
	case ExpressionType::CASE:
		return "CASE";
	case ExpressionType::AGGREGATE:
		return "AGGREGATE";
	case ExpressionType::WINDOW:
		return "WINDOW";
	case ExpressionType::SUBQUERY:
		return "SUBQUERY";
	}
	return "INVALID";
}

std::string PlanNodeTypeToString(PlanNodeType type) {
	switch (type) {
	case PlanNodeType::RELATION:
		return "RELATION";
	case PlanNodeType::LOCAL_RELATION:
		return "LOCAL_RELATION";
	case PlanNodeType::PROJECT:
		return "PROJECT";
	case PlanNodeType::FILTER:
		return "FILTER";
	case PlanNodeType::AGGREGATE:
		return "AGGREGATE";
	case PlanNodeType::EXPAND:
		return "EXPAND";
	case PlanNodeType::JOIN:
		return "JOIN";
	case PlanNodeType::SET_OPERATION:
		return "SET_OPERATION";
	case PlanNodeType::WINDOW:
		return "WINDOW";
	case PlanNodeType::SUBQUERY_ALIAS:
		return "SUBQUERY_ALIAS";
	case PlanNodeType::SORT:
		return "SORT";
	case PlanNodeType::LIMIT:
		return "LIMIT";
	case PlanNodeType::DISTINCT:
		return "DISTINCT";
	case PlanNodeType::WITH_CTE:
		return "WITH_CTE";
	case PlanNodeType::CTE_REF:
		return "CTE_REF";
	case PlanNodeType::COMMAND:
		return "COMMAND";
	case PlanNodeType::UNKNOWN:
		return "UNKNOWN";
	}
	return "INVALID";
}

std::string JoinTypeToString(JoinType type) {
	switch (type) {
	case JoinType::INNER:
		return "INNER";
	case JoinType::LEFT:
		return "LEFT";
	case JoinType::RIGHT:
		return "RIGHT";
	case JoinType::FULL:
		return "FULL";
	case JoinType::CROSS:
		return "CROSS";
	case JoinType::SEMI:
		return "SEMI";
	case JoinType::ANTI:
		return "ANTI";
	}
	return "INVALID";
}

std::string CommandTypeToString(CommandType type) {
	switch (type) {
	case CommandType::INSERT:
		return "INSERT";
	case CommandType::INSERT_OVERWRITE:
		return "INSERT_OVERWRITE";
	case CommandType::CREATE_TABLE_AS_SELECT:
		return "CREATE_TABLE_AS_SELECT";
	case CommandType::CREATE_VIEW:
		return "CREATE_VIEW";
	case CommandType::ALTER_VIEW:
		return "ALTER_VIEW";
	case CommandType::MERGE_INTO:
		return "MERGE_INTO";
	case CommandType::INSERT_DIRECTORY:
		return "INSERT_DIRECTORY";
	case CommandType::CREATE_TABLE:
		return "CREATE_TABLE";
	}
	return "INVALID";
}

//===--------------------------------------------------------------------===//
// Expression rendering
//===--------------------------------------------------------------------===//

static std::string JoinExpressions(const std::vector<ExpressionPtr> &expressions) {
	std::string result;
	for (size_t i = 0; i < expressions.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += expressions[i] ? expressions[i]->ToString() : "NULL";
	}
	return result;
}

std::string ColumnRefExpression::ToString() const {
	return name + "#" + std::to_string(column_id);
}

std::string LiteralExpression::ToString() const {
	return is_null ? "NULL" : value;
}

std::string FunctionExpression::ToString() const {
	return function_name + "(" + JoinExpressions(children) + ")";
}

std::string CaseExpression::ToString() const {
	std::string result = "CASE";
	for (auto &check : case_checks) {
		result += " WHEN " + check.when_expr->ToString() + " THEN " + check.then_expr->ToString();
	}
	if (else_expr) {
		result += " ELSE " + else_expr->ToString();
	}
	return result + " END";
}

std::string AggregateExpression::ToString() const {
	if (is_count_star) {
		return function_name + "(*)";
	}
	return function_name + "(" + std::string(is_distinct ? "DISTINCT " : "") + JoinExpressions(children) + ")";
}

std::string WindowExpression::ToString() const {
	return function_name + "(" + JoinExpressions(children) + ") OVER (PARTITION BY " + JoinExpressions(partitions) +
	       " ORDER BY " + JoinExpressions(orders) + ")";
}

std::string SubqueryExpression::ToString() const {
	switch (subquery_type) {
	case SubqueryType::SCALAR:
		return "SCALAR_SUBQUERY";
	case SubqueryType::EXISTS:
		return "EXISTS(SUBQUERY)";
	case SubqueryType::IN:
		return JoinExpressions(children) + " IN (SUBQUERY)";
	}
	return "SUBQUERY";
}

//===--------------------------------------------------------------------===//
// Plan nodes
//===--------------------------------------------------------------------===//

PlanNodePtr PlanNode::MakePassthrough(PlanNodeType type, PlanNodePtr child) {
	auto columns = child->columns;
	return std::make_shared<PlanNode>(type, std::move(columns), std::vector<PlanNodePtr> {std::move(child)});
}

std::string PlanNode::GetName() const {
	return PlanNodeTypeToString(type);
}

std::string PlanNode::ToString(size_t depth) const {
	std::string result(depth * 2, ' ');
	result += GetName();
	auto params = ParamsToString();
	if (!params.empty()) {
		result += " " + params;
	}
	result += " [";
	for (size_t i = 0; i < columns.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += columns[i].name + "#" + std::to_string(columns[i].id);
	}
	result += "]\n";
	for (auto &child : children) {
		result += child->ToString(depth + 1);
	}
	return result;
}

std::string RelationNode::ParamsToString() const {
	if (!cache_key.empty()) {
		return table.ToString() + " (cached " + cache_key + ")";
	}
	return table.ToString();
}

static std::vector<OutputColumn> JoinOutputColumns(JoinType join_type, const PlanNode &left, const PlanNode &right) {
	auto columns = left.columns;
	if (join_type != JoinType::SEMI && join_type != JoinType::ANTI) {
		columns.insert(columns.end(), right.columns.begin(), right.columns.end());
	}
	return columns;
}

JoinNode::JoinNode(JoinType join_type, ExpressionPtr condition, PlanNodePtr left, PlanNodePtr right)
    : PlanNode(TYPE, JoinOutputColumns(join_type, *left, *right), std::vector<PlanNodePtr> {left, right}),
      join_type(join_type), condition(std::move(condition)) {
}

std::string JoinNode::ParamsToString() const {
	return JoinTypeToString(join_type);
}

static std::vector<OutputColumn> WindowOutputColumns(const PlanNode &child,
                                                     const std::vector<OutputColumn> &window_columns) {
	auto columns = child.columns;
	columns.insert(columns.end(), window_columns.begin(), window_columns.end());
	return columns;
}

WindowNode::WindowNode(std::vector<ExpressionPtr> window_expressions, const std::vector<OutputColumn> &window_columns,
                       PlanNodePtr child)
    : PlanNode(TYPE, WindowOutputColumns(*child, window_columns), std::vector<PlanNodePtr> {child}),
      window_expressions(std::move(window_expressions)) {
}

static std::vector<PlanNodePtr> CTEChildren(std::vector<PlanNodePtr> definitions, PlanNodePtr main) {
	definitions.push_back(std::move(main));
	return definitions;
}

WithCTENode::WithCTENode(std::vector<uint64_t> cte_ids, std::vector<PlanNodePtr> definitions, PlanNodePtr main)
    : PlanNode(TYPE, main->columns, CTEChildren(std::move(definitions), main)), cte_ids(std::move(cte_ids)) {
}

std::string CommandNode::GetName() const {
	return CommandTypeToString(command_type);
}

} // namespace column_lineage
