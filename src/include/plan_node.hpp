//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: plan_node.hpp
// Description: Typed relational plan consumed by the lineage engine.
//              Operator nodes carry ordered output columns and a kind-specific
//              payload; expressions are trees over column identities.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_error.hpp"
#include "lineage_types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace column_lineage {

class PlanNode;
class Expression;

typedef std::shared_ptr<const PlanNode> PlanNodePtr;
typedef std::shared_ptr<const Expression> ExpressionPtr;

//===--------------------------------------------------------------------===//
// Expressions
//===--------------------------------------------------------------------===//

enum class ExpressionType : uint8_t { COLUMN_REF, LITERAL, FUNCTION, CASE, AGGREGATE, WINDOW, SUBQUERY };

enum class SubqueryType : uint8_t { SCALAR, EXISTS, IN };

std::string ExpressionTypeToString(ExpressionType type);

/// @class Expression
/// @brief Base class of all expression kinds.
class Expression {
public:
	explicit Expression(ExpressionType type) : type(type) {
	}
	virtual ~Expression() {
	}

	ExpressionType type;

	virtual std::string ToString() const = 0;

	/// @brief Downcast to a concrete expression kind.
	/// @throws InvalidPlanException if the kind does not match.
	template <class TARGET>
	const TARGET &Cast() const {
		if (type != TARGET::TYPE) {
			throw InvalidPlanException("Failed to cast expression to type " + ExpressionTypeToString(TARGET::TYPE) +
			                           " - expression type mismatch");
		}
		return static_cast<const TARGET &>(*this);
	}
};

class ColumnRefExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::COLUMN_REF;

	ColumnRefExpression(ColumnId column_id, std::string name)
	    : Expression(TYPE), column_id(column_id), name(std::move(name)) {
	}

	ColumnId column_id;
	//! Display name only; lineage never resolves by name
	std::string name;

	bool IsResolved() const {
		return column_id != INVALID_COLUMN_ID;
	}
	std::string ToString() const override;
};

class LiteralExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::LITERAL;

	explicit LiteralExpression(std::string value, bool is_null = false)
	    : Expression(TYPE), value(std::move(value)), is_null(is_null) {
	}

	std::string value;
	bool is_null;

	std::string ToString() const override;
};

class FunctionExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::FUNCTION;

	FunctionExpression(std::string function_name, std::vector<ExpressionPtr> children)
	    : Expression(TYPE), function_name(std::move(function_name)), children(std::move(children)) {
	}

	std::string function_name;
	std::vector<ExpressionPtr> children;

	std::string ToString() const override;
};

struct CaseCheck {
	ExpressionPtr when_expr;
	ExpressionPtr then_expr;

	CaseCheck(ExpressionPtr when_expr, ExpressionPtr then_expr)
	    : when_expr(std::move(when_expr)), then_expr(std::move(then_expr)) {
	}
};

class CaseExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::CASE;

	CaseExpression(std::vector<CaseCheck> case_checks, ExpressionPtr else_expr)
	    : Expression(TYPE), case_checks(std::move(case_checks)), else_expr(std::move(else_expr)) {
	}

	std::vector<CaseCheck> case_checks;
	//! May be null
	ExpressionPtr else_expr;

	std::string ToString() const override;
};

class AggregateExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::AGGREGATE;

	AggregateExpression(std::string function_name, std::vector<ExpressionPtr> children, bool is_distinct = false)
	    : Expression(TYPE), function_name(std::move(function_name)), children(std::move(children)),
	      is_distinct(is_distinct) {
	}

	std::string function_name;
	std::vector<ExpressionPtr> children;
	bool is_distinct;
	//! count(*) and count(<literal>) read no column
	bool is_count_star = false;

	std::string ToString() const override;
};

class WindowExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::WINDOW;

	WindowExpression(std::string function_name, std::vector<ExpressionPtr> children,
	                 std::vector<ExpressionPtr> partitions, std::vector<ExpressionPtr> orders)
	    : Expression(TYPE), function_name(std::move(function_name)), children(std::move(children)),
	      partitions(std::move(partitions)), orders(std::move(orders)) {
	}

	std::string function_name;
	std::vector<ExpressionPtr> children;
	std::vector<ExpressionPtr> partitions;
	std::vector<ExpressionPtr> orders;

	std::string ToString() const override;
};

class SubqueryExpression : public Expression {
public:
	static constexpr const ExpressionType TYPE = ExpressionType::SUBQUERY;

	SubqueryExpression(SubqueryType subquery_type, PlanNodePtr subquery,
	                   std::vector<ExpressionPtr> children = std::vector<ExpressionPtr>(), bool correlated_only = false)
	    : Expression(TYPE), subquery_type(subquery_type), subquery(std::move(subquery)), children(std::move(children)),
	      correlated_only(correlated_only) {
	}

	SubqueryType subquery_type;
	PlanNodePtr subquery;
	//! The tested values of an IN subquery
	std::vector<ExpressionPtr> children;
	bool correlated_only;

	std::string ToString() const override;
};

//===--------------------------------------------------------------------===//
// Plan nodes
//===--------------------------------------------------------------------===//

enum class PlanNodeType : uint8_t {
	RELATION,
	LOCAL_RELATION,
	PROJECT,
	FILTER,
	AGGREGATE,
	EXPAND,
	JOIN,
	SET_OPERATION,
	WINDOW,
	SUBQUERY_ALIAS,
	SORT,
	LIMIT,
	DISTINCT,
	WITH_CTE,
	CTE_REF,
	COMMAND,
	UNKNOWN
};

enum class JoinType : uint8_t { INNER, LEFT, RIGHT, FULL, CROSS, SEMI, ANTI };

enum class SetOperationType : uint8_t { UNION, UNION_ALL, EXCEPT, INTERSECT };

enum class CommandType : uint8_t {
	INSERT,
	INSERT_OVERWRITE,
	CREATE_TABLE_AS_SELECT,
	CREATE_VIEW,
	ALTER_VIEW,
	MERGE_INTO,
	INSERT_DIRECTORY,
	CREATE_TABLE
};

std::string PlanNodeTypeToString(PlanNodeType type);
std::string JoinTypeToString(JoinType type);
std::string CommandTypeToString(CommandType type);

/// @brief A column produced by an operator.
struct OutputColumn {
	ColumnId id;
	std::string name;

	OutputColumn(ColumnId id, std::string name) : id(id), name(std::move(name)) {
	}
};

/// @class PlanNode
/// @brief Base of all operator kinds.
///
/// Sort, limit, distinct and local relations carry no payload and are plain
/// PlanNodes; every other kind has a subclass.
class PlanNode {
public:
	PlanNode(PlanNodeType type, std::vector<OutputColumn> columns,
	         std::vector<PlanNodePtr> children = std::vector<PlanNodePtr>())
	    : type(type), columns(std::move(columns)), children(std::move(children)) {
	}
	virtual ~PlanNode() {
	}

	PlanNodeType type;
	std::vector<OutputColumn> columns;
	std::vector<PlanNodePtr> children;

	/// @brief Build a payload-free unary node that passes its child's columns through.
	static PlanNodePtr MakePassthrough(PlanNodeType type, PlanNodePtr child);

	virtual std::string GetName() const;
	virtual std::string ParamsToString() const {
		return "";
	}
	/// @brief Render the subtree, one operator per line.
	std::string ToString(size_t depth = 0) const;

	template <class TARGET>
	const TARGET &Cast() const {
		if (type != TARGET::TYPE) {
			throw InvalidPlanException("Failed to cast plan node to type " + PlanNodeTypeToString(TARGET::TYPE) +
			                           " - node type mismatch");
		}
		return static_cast<const TARGET &>(*this);
	}
};

class RelationNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::RELATION;

	RelationNode(QualifiedName table, std::vector<OutputColumn> columns, std::string cache_key = "")
	    : PlanNode(TYPE, std::move(columns)), table(std::move(table)), cache_key(std::move(cache_key)) {
	}

	QualifiedName table;
	//! Instance key of a cached relation, empty for catalog relations
	std::string cache_key;

	std::string ParamsToString() const override;
};

class ProjectNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::PROJECT;

	ProjectNode(std::vector<ExpressionPtr> expressions, std::vector<OutputColumn> columns, PlanNodePtr child)
	    : PlanNode(TYPE, std::move(columns), std::vector<PlanNodePtr> {std::move(child)}),
	      expressions(std::move(expressions)) {
	}

	//! One expression per output column
	std::vector<ExpressionPtr> expressions;
};

class FilterNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::FILTER;

	FilterNode(ExpressionPtr condition, PlanNodePtr child)
	    : PlanNode(TYPE, child->columns, std::vector<PlanNodePtr> {child}), condition(std::move(condition)) {
	}

	ExpressionPtr condition;
};

class AggregateNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::AGGREGATE;

	AggregateNode(std::vector<ExpressionPtr> groups, std::vector<ExpressionPtr> aggregates,
	              std::vector<OutputColumn> columns, PlanNodePtr child)
	    : PlanNode(TYPE, std::move(columns), std::vector<PlanNodePtr> {std::move(child)}), groups(std::move(groups)),
	      aggregates(std::move(aggregates)) {
	}

	//! Grouping keys; they produce output only through `aggregates`
	std::vector<ExpressionPtr> groups;
	//! One expression per output column; grouping columns appear as references
	std::vector<ExpressionPtr> aggregates;
};

class ExpandNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::EXPAND;

	ExpandNode(std::vector<std::vector<ExpressionPtr>> projections, std::vector<OutputColumn> columns,
	           PlanNodePtr child)
	    : PlanNode(TYPE, std::move(columns), std::vector<PlanNodePtr> {std::move(child)}),
	      projections(std::move(projections)) {
	}

	//! One projection per grouping set, each with one expression per output column
	std::vector<std::vector<ExpressionPtr>> projections;
};

class JoinNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::JOIN;

	JoinNode(JoinType join_type, ExpressionPtr condition, PlanNodePtr left, PlanNodePtr right);

	JoinType join_type;
	//! May be null for cross joins
	ExpressionPtr condition;

	bool IsSemiOrAnti() const {
		return join_type == JoinType::SEMI || join_type == JoinType::ANTI;
	}
	std::string ParamsToString() const override;
};

class SetOperationNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::SET_OPERATION;

	SetOperationNode(SetOperationType setop_type, std::vector<OutputColumn> columns, std::vector<PlanNodePtr> children)
	    : PlanNode(TYPE, std::move(columns), std::move(children)), setop_type(setop_type) {
	}

	SetOperationType setop_type;
};

class WindowNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::WINDOW;

	/// @param window_columns Columns produced by the window expressions; the
	///        child's columns are passed through in front of them.
	WindowNode(std::vector<ExpressionPtr> window_expressions, const std::vector<OutputColumn> &window_columns,
	           PlanNodePtr child);

	std::vector<ExpressionPtr> window_expressions;
};

class SubqueryAliasNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::SUBQUERY_ALIAS;

	SubqueryAliasNode(std::string alias, PlanNodePtr child)
	    : PlanNode(TYPE, child->columns, std::vector<PlanNodePtr> {child}), alias(std::move(alias)) {
	}

	std::string alias;

	std::string ParamsToString() const override {
		return alias;
	}
};

class WithCTENode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::WITH_CTE;

	/// @param cte_ids Identifier of each definition, in the order of `definitions`.
	WithCTENode(std::vector<uint64_t> cte_ids, std::vector<PlanNodePtr> definitions, PlanNodePtr main);

	std::vector<uint64_t> cte_ids;

	//! Definitions come first, the main query is the last child
	const PlanNode &GetMain() const {
		return *children.back();
	}
};

class CTERefNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::CTE_REF;

	CTERefNode(uint64_t cte_id, std::vector<OutputColumn> columns) : PlanNode(TYPE, std::move(columns)), cte_id(cte_id) {
	}

	uint64_t cte_id;

	std::string ParamsToString() const override {
		return "cte " + std::to_string(cte_id);
	}
};

enum class MergeActionType : uint8_t { UPDATE, DELETE, INSERT };

enum class MergeClause : uint8_t { MATCHED, NOT_MATCHED, NOT_MATCHED_BY_SOURCE };

/// @brief `column = value` inside a merge clause.
struct MergeAssignment {
	std::string column;
	ExpressionPtr value;

	MergeAssignment(std::string column, ExpressionPtr value) : column(std::move(column)), value(std::move(value)) {
	}
};

/// @brief One WHEN clause of a MERGE statement.
struct MergeAction {
	MergeClause clause = MergeClause::MATCHED;
	MergeActionType action_type = MergeActionType::UPDATE;
	//! UPDATE SET * / INSERT *
	bool is_star = false;
	std::vector<MergeAssignment> assignments;
	//! May be null
	ExpressionPtr condition;
};

/// @class CommandNode
/// @brief A write command whose destination binds the child's outputs.
///
/// children[0] is the query (absent for plain CREATE TABLE). For MERGE_INTO,
/// children[0] is the source plan and an optional children[1] is the target
/// relation, whose columns clauses may reference but which is never a source.
class CommandNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::COMMAND;

	CommandNode(CommandType command_type, QualifiedName target, std::vector<std::string> destination_columns,
	            std::vector<PlanNodePtr> children = std::vector<PlanNodePtr>())
	    : PlanNode(TYPE, std::vector<OutputColumn>(), std::move(children)), command_type(command_type),
	      target(std::move(target)), destination_columns(std::move(destination_columns)) {
	}

	CommandType command_type;
	QualifiedName target;
	//! Destination schema in order, partition columns included; empty means the query's output names
	std::vector<std::string> destination_columns;
	//! Static partition values keyed by lower-cased column name
	std::map<std::string, std::string> static_partitions;
	std::vector<MergeAction> merge_actions;

	bool IsStaticPartition(const std::string &column) const {
		return static_partitions.find(Lower(column)) != static_partitions.end();
	}
	std::string GetName() const override;
	std::string ParamsToString() const override {
		return target.ToString();
	}
};

class UnknownNode : public PlanNode {
public:
	static constexpr const PlanNodeType TYPE = PlanNodeType::UNKNOWN;

	UnknownNode(std::string operator_name, std::vector<OutputColumn> columns,
	            std::vector<PlanNodePtr> children = std::vector<PlanNodePtr>())
	    : PlanNode(TYPE, std::move(columns), std::move(children)), operator_name(std::move(operator_name)) {
	}

	//! Name of the host operator with no dedicated rule
	std::string operator_name;

	std::string GetName() const override {
		return operator_name;
	}
};

} // namespace column_lineage
