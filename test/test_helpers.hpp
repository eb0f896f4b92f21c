//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: test_helpers.hpp
// Description: Plan construction shortcuts and lineage accessors for tests.
//===----------------------------------------------------------------------===//

#pragma once

#include "attribute_resolver.hpp"
#include "lineage_extractor.hpp"
#include "plan_node.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace column_lineage {
namespace test {

typedef std::pair<std::string, ExpressionPtr> NamedExpression;

//===--------------------------------------------------------------------===//
// Expressions
//===--------------------------------------------------------------------===//

inline ExpressionPtr Ref(const PlanNodePtr &node, const std::string &name) {
	for (auto &column : node->columns) {
		if (EqualsIgnoreCase(column.name, name)) {
			return std::make_shared<ColumnRefExpression>(column.id, column.name);
		}
	}
	throw std::runtime_error("No column '" + name + "' in " + node->GetName());
}

inline ExpressionPtr Ref(const PlanNodePtr &node, size_t position) {
	auto &column = node->columns.at(position);
	return std::make_shared<ColumnRefExpression>(column.id, column.name);
}

inline ExpressionPtr Unresolved(const std::string &name) {
	return std::make_shared<ColumnRefExpression>(INVALID_COLUMN_ID, name);
}

inline ExpressionPtr Lit(const std::string &value) {
	return std::make_shared<LiteralExpression>(value);
}

inline ExpressionPtr Null() {
	return std::make_shared<LiteralExpression>("", true);
}

inline ExpressionPtr Func(const std::string &name, std::vector<ExpressionPtr> args) {
	return std::make_shared<FunctionExpression>(name, std::move(args));
}

inline ExpressionPtr Agg(const std::string &name, std::vector<ExpressionPtr> args, bool is_distinct = false) {
	return std::make_shared<AggregateExpression>(name, std::move(args), is_distinct);
}

inline ExpressionPtr CountStar() {
	auto count = std::make_shared<AggregateExpression>("count", std::vector<ExpressionPtr>());
	count->is_count_star = true;
	return count;
}

inline ExpressionPtr Case(std::vector<CaseCheck> checks, ExpressionPtr else_expr) {
	return std::make_shared<CaseExpression>(std::move(checks), std::move(else_expr));
}

inline ExpressionPtr Over(const std::string &name, std::vector<ExpressionPtr> args,
                          std::vector<ExpressionPtr> partitions, std::vector<ExpressionPtr> orders) {
	return std::make_shared<WindowExpression>(name, std::move(args), std::move(partitions), std::move(orders));
}

inline ExpressionPtr Scalar(PlanNodePtr plan) {
	return std::make_shared<SubqueryExpression>(SubqueryType::SCALAR, std::move(plan));
}

inline ExpressionPtr Exists(PlanNodePtr plan) {
	return std::make_shared<SubqueryExpression>(SubqueryType::EXISTS, std::move(plan), std::vector<ExpressionPtr>(),
	                                            true);
}

inline ExpressionPtr In(std::vector<ExpressionPtr> values, PlanNodePtr plan) {
	return std::make_shared<SubqueryExpression>(SubqueryType::IN, std::move(plan), std::move(values));
}

//===--------------------------------------------------------------------===//
// Plans
//===--------------------------------------------------------------------===//

/// @class TestPlanBuilder
/// @brief Builds plans with fresh identities for every produced column.
class TestPlanBuilder {
public:
	OutputColumn Column(const std::string &name) {
		return OutputColumn(ids.NextId(), name);
	}

	PlanNodePtr Table(const std::string &name, const std::vector<std::string> &columns,
	                  const std::string &cache_key = "") {
		return std::make_shared<RelationNode>(QualifiedName::Parse(name), Columns(columns), cache_key);
	}

	PlanNodePtr Values(const std::vector<std::string> &columns) {
		return std::make_shared<PlanNode>(PlanNodeType::LOCAL_RELATION, Columns(columns));
	}

	/// A bare reference under its own name keeps its identity; anything else mints one.
	PlanNodePtr Project(PlanNodePtr child, const std::vector<NamedExpression> &items) {
		std::vector<ExpressionPtr> expressions;
		std::vector<OutputColumn> columns;
		for (auto &item : items) {
			expressions.push_back(item.second);
			columns.push_back(OutputFor(item));
		}
		return std::make_shared<ProjectNode>(std::move(expressions), std::move(columns), std::move(child));
	}

	PlanNodePtr Filter(PlanNodePtr child, ExpressionPtr condition) {
		return std::make_shared<FilterNode>(std::move(condition), std::move(child));
	}

	PlanNodePtr Aggregate(PlanNodePtr child, std::vector<ExpressionPtr> groups,
	                      const std::vector<NamedExpression> &items) {
		std::vector<ExpressionPtr> aggregates;
		std::vector<OutputColumn> columns;
		for (auto &item : items) {
			aggregates.push_back(item.second);
			columns.push_back(OutputFor(item));
		}
		return std::make_shared<AggregateNode>(std::move(groups), std::move(aggregates), std::move(columns),
		                                       std::move(child));
	}

	PlanNodePtr Expand(PlanNodePtr child, std::vector<std::vector<ExpressionPtr>> projections,
	                   const std::vector<std::string> &names) {
		return std::make_shared<ExpandNode>(std::move(projections), Columns(names), std::move(child));
	}

	PlanNodePtr Join(JoinType join_type, PlanNodePtr left, PlanNodePtr right, ExpressionPtr condition = nullptr) {
		return std::make_shared<JoinNode>(join_type, std::move(condition), std::move(left), std::move(right));
	}

	PlanNodePtr SetOperation(SetOperationType setop_type, std::vector<PlanNodePtr> children) {
		std::vector<std::string> names;
		for (auto &column : children.at(0)->columns) {
			names.push_back(column.name);
		}
		return std::make_shared<SetOperationNode>(setop_type, Columns(names), std::move(children));
	}

	PlanNodePtr Window(PlanNodePtr child, const std::vector<NamedExpression> &items) {
		std::vector<ExpressionPtr> expressions;
		std::vector<OutputColumn> columns;
		for (auto &item : items) {
			expressions.push_back(item.second);
			columns.push_back(Column(item.first));
		}
		return std::make_shared<WindowNode>(std::move(expressions), columns, std::move(child));
	}

	PlanNodePtr Alias(PlanNodePtr child, const std::string &alias) {
		return std::make_shared<SubqueryAliasNode>(alias, std::move(child));
	}

	PlanNodePtr Sort(PlanNodePtr child) {
		return PlanNode::MakePassthrough(PlanNodeType::SORT, std::move(child));
	}

	PlanNodePtr Limit(PlanNodePtr child) {
		return PlanNode::MakePassthrough(PlanNodeType::LIMIT, std::move(child));
	}

	PlanNodePtr Distinct(PlanNodePtr child) {
		return PlanNode::MakePassthrough(PlanNodeType::DISTINCT, std::move(child));
	}

	/// A reference to a view, CTE or cache exposing `definition`'s column names under fresh identities.
	PlanNodePtr CTERef(uint64_t cte_id, const PlanNodePtr &definition) {
		return std::make_shared<CTERefNode>(cte_id, Columns(NamesOf(definition)));
	}

	PlanNodePtr With(std::vector<uint64_t> cte_ids, std::vector<PlanNodePtr> definitions, PlanNodePtr main) {
		return std::make_shared<WithCTENode>(std::move(cte_ids), std::move(definitions), std::move(main));
	}

	PlanNodePtr Unknown(const std::string &name, std::vector<PlanNodePtr> children,
	                    const std::vector<std::string> &columns) {
		return std::make_shared<UnknownNode>(name, Columns(columns), std::move(children));
	}

	std::shared_ptr<CommandNode> Command(CommandType command_type, const std::string &target,
	                                     std::vector<std::string> destination, PlanNodePtr query) {
		std::vector<PlanNodePtr> children;
		if (query) {
			children.push_back(std::move(query));
		}
		return std::make_shared<CommandNode>(command_type, QualifiedName::Parse(target), std::move(destination),
		                                     std::move(children));
	}

	static std::vector<std::string> NamesOf(const PlanNodePtr &node) {
		std::vector<std::string> names;
		for (auto &column : node->columns) {
			names.push_back(column.name);
		}
		return names;
	}

private:
	std::vector<OutputColumn> Columns(const std::vector<std::string> &names) {
		std::vector<OutputColumn> columns;
		for (auto &name : names) {
			columns.push_back(Column(name));
		}
		return columns;
	}

	OutputColumn OutputFor(const NamedExpression &item) {
		if (item.second && item.second->type == ExpressionType::COLUMN_REF) {
			auto &ref = item.second->Cast<ColumnRefExpression>();
			if (ref.name == item.first) {
				return OutputColumn(ref.column_id, item.first);
			}
		}
		return Column(item.first);
	}

	ColumnIdGenerator ids;
};

//===--------------------------------------------------------------------===//
// Accessors
//===--------------------------------------------------------------------===//

inline std::vector<std::string> Names(const std::vector<QualifiedName> &names) {
	std::vector<std::string> result;
	for (auto &name : names) {
		result.push_back(name.ToString());
	}
	return result;
}

inline std::set<std::string> SourcesOf(const Lineage &lineage, size_t index) {
	std::set<std::string> result;
	for (auto &source : lineage.columns.at(index).second) {
		result.insert(source.ToString());
	}
	return result;
}

inline std::vector<std::string> ColumnNames(const Lineage &lineage) {
	std::vector<std::string> result;
	for (auto &column : lineage.columns) {
		result.push_back(column.first);
	}
	return result;
}

inline std::set<std::string> NoSources() {
	return std::set<std::string>();
}

} // namespace test
} // namespace column_lineage
