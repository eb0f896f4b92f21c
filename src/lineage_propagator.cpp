//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_propagator.cpp
// Description: Implementation of the per-operator lineage propagation rules.
//===----------------------------------------------------------------------===//

#include "lineage_propagator.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace column_lineage {

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

namespace {

/// @brief Pushes a definition identity for the lifetime of the guard.
class ExpansionGuard {
public:
	ExpansionGuard(std::vector<std::string> &stack, const std::string &identity) : stack(stack) {
		if (std::find(stack.begin(), stack.end(), identity) != stack.end()) {
			std::string chain;
			for (auto &entry : stack) {
				chain += entry + " -> ";
			}
			throw CyclicDefinitionException("Cyclic definition: " + chain + identity);
		}
		stack.push_back(identity);
	}
	~ExpansionGuard() {
		stack.pop_back();
	}

private:
	std::vector<std::string> &stack;
};

void RequireChildren(const PlanNode &node, size_t count) {
	if (node.children.size() != count) {
		throw InvalidPlanException(node.GetName() + " expects " + std::to_string(count) + " children but has " +
		                           std::to_string(node.children.size()));
	}
	for (auto &child : node.children) {
		if (!child) {
			throw InvalidPlanException(node.GetName() + " has a missing child");
		}
	}
}

void RequireExpression(const ExpressionPtr &expression, const PlanNode &node) {
	if (!expression) {
		throw InvalidPlanException(node.GetName() + " has a missing expression");
	}
}

void Merge(ColumnSourceSet &target, const ColumnSourceSet &source) {
	target.insert(source.begin(), source.end());
}

std::vector<QualifiedName> Concat(std::vector<QualifiedName> first, const std::vector<QualifiedName> &second) {
	AppendAllUnique(first, second);
	return first;
}

} // namespace

//===--------------------------------------------------------------------===//
// Public interface
//===--------------------------------------------------------------------===//

LineagePropagator::LineagePropagator(const CatalogBridge *catalog, const CacheRegistry *cache_registry,
                                     const ExtractorOptions &options)
    : catalog(catalog), cache_registry(cache_registry), options(options) {
}

PropagatedPlan LineagePropagator::Propagate(const PlanNode &plan) {
	PropagatedPlan result;
	result.tables = Visit(plan, root_scope);
	for (size_t i = 0; i < plan.columns.size(); i++) {
		result.names.push_back(plan.columns[i].name);
		result.columns.push_back(resolver.SourcesOf(plan, i, root_scope.lineage));
	}
	return result;
}

ColumnSourceSet LineagePropagator::Evaluate(const Expression &expression, std::vector<QualifiedName> &encountered) {
	return Evaluate(expression, root_scope, std::vector<QualifiedName>(), encountered);
}

void LineagePropagator::BindOpaque(const PlanNode &node) {
	for (size_t i = 0; i < node.columns.size(); i++) {
		root_scope.lineage[resolver.IdentityOf(node, i)] = ColumnSourceSet();
	}
}

QualifiedName LineagePropagator::CanonicalName(const QualifiedName &name) const {
	if (catalog) {
		return catalog->CanonicalName(name);
	}
	return CanonicalizeName(name, options.default_database);
}

void LineagePropagator::Debug(const std::string &message) const {
	if (options.debug) {
		std::cerr << "ColumnLineage Debug: " << message << '\n';
	}
}

//===--------------------------------------------------------------------===//
// Dispatch
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::Visit(const PlanNode &node, Scope &scope) {
	auto tables = VisitOperator(node, scope);
	if (node.type != PlanNodeType::RELATION && node.type != PlanNodeType::CTE_REF) {
		RecordRowTables(node);
	}
	return tables;
}

std::vector<QualifiedName> LineagePropagator::VisitOperator(const PlanNode &node, Scope &scope) {
	switch (node.type) {
	case PlanNodeType::RELATION:
		return VisitRelation(node, scope);
	case PlanNodeType::LOCAL_RELATION:
		return VisitLocalRelation(node, scope);
	case PlanNodeType::PROJECT:
		return VisitProject(node, scope);
	case PlanNodeType::FILTER:
		return VisitFilter(node, scope);
	case PlanNodeType::AGGREGATE:
		return VisitAggregate(node, scope);
	case PlanNodeType::EXPAND:
		return VisitExpand(node, scope);
	case PlanNodeType::JOIN:
		return VisitJoin(node, scope);
	case PlanNodeType::SET_OPERATION:
		return VisitSetOperation(node, scope);
	case PlanNodeType::WINDOW:
		return VisitWindow(node, scope);
	case PlanNodeType::SUBQUERY_ALIAS:
	case PlanNodeType::SORT:
	case PlanNodeType::LIMIT:
	case PlanNodeType::DISTINCT:
		return VisitPassthrough(node, scope);
	case PlanNodeType::WITH_CTE:
		return VisitWithCTE(node, scope);
	case PlanNodeType::CTE_REF:
		return VisitCTERef(node, scope);
	case PlanNodeType::COMMAND:
	case PlanNodeType::UNKNOWN:
		return VisitFallback(node, scope);
	}
	return VisitFallback(node, scope);
}

const std::vector<QualifiedName> &LineagePropagator::RowTables(const PlanNode &node) const {
	static const std::vector<QualifiedName> NONE;
	auto entry = row_tables.find(&node);
	return entry == row_tables.end() ? NONE : entry->second;
}

void LineagePropagator::RecordRowTables(const PlanNode &node) {
	std::vector<QualifiedName> tables;
	switch (node.type) {
	case PlanNodeType::LOCAL_RELATION:
		break;
	case PlanNodeType::JOIN: {
		auto &join = node.Cast<JoinNode>();
		AppendAllUnique(tables, RowTables(*join.children[0]));
		if (!join.IsSemiOrAnti()) {
			AppendAllUnique(tables, RowTables(*join.children[1]));
		}
		break;
	}
	case PlanNodeType::SET_OPERATION:
	case PlanNodeType::COMMAND:
	case PlanNodeType::UNKNOWN:
		for (auto &child : node.children) {
			AppendAllUnique(tables, RowTables(*child));
		}
		break;
	case PlanNodeType::WITH_CTE:
		tables = RowTables(*node.children.back());
		break;
	default:
		if (!node.children.empty()) {
			tables = RowTables(*node.children[0]);
		}
		break;
	}
	row_tables[&node] = std::move(tables);
}

//===--------------------------------------------------------------------===//
// Leaves
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::VisitRelation(const PlanNode &node, Scope &scope) {
	auto &relation = node.Cast<RelationNode>();
	if (relation.table.IsEmpty() && relation.cache_key.empty()) {
		throw UnresolvedPlanException("Relation without a table name or cache key");
	}

	// A cached instance resolves by its own key first
	if (!relation.cache_key.empty()) {
		auto definition = cache_registry ? cache_registry->Lookup(relation.cache_key) : nullptr;
		if (definition) {
			return Inline(*definition, relation, "cache " + relation.cache_key, scope);
		}
		if (relation.table.IsEmpty()) {
			throw InvalidPlanException("Cached relation '" + relation.cache_key + "' is not registered");
		}
	}

	auto name = CanonicalName(relation.table);
	if (catalog && !name.is_path) {
		auto definition = catalog->ResolveDefiningPlan(name);
		if (definition) {
			return Inline(*definition, relation, "view " + name.ToString(), scope);
		}
	}
	if (cache_registry && !name.is_path) {
		auto definition = cache_registry->Lookup(name.ToString());
		if (definition) {
			return Inline(*definition, relation, "cache " + name.ToString(), scope);
		}
	}

	for (size_t i = 0; i < relation.columns.size(); i++) {
		ColumnSourceSet sources;
		sources.insert(SourceColumnRef(name, relation.columns[i].name));
		scope.lineage[resolver.IdentityOf(relation, i)] = std::move(sources);
	}
	row_tables[&relation] = std::vector<QualifiedName> {name};
	return std::vector<QualifiedName> {name};
}

std::vector<QualifiedName> LineagePropagator::Inline(const PlanNode &definition, const PlanNode &reference,
                                                     const std::string &identity, Scope &scope) {
	ExpansionGuard guard(expansion_stack, identity);
	if (definition.type == PlanNodeType::COMMAND) {
		throw InvalidPlanException("Definition of " + identity + " is a command, not a query");
	}
	Debug("Inlining " + identity);

	Scope inner;
	auto tables = Visit(definition, inner);
	resolver.Remap(definition, inner.lineage, reference, scope.lineage);
	row_tables[&reference] = RowTables(definition);
	return tables;
}

std::vector<QualifiedName> LineagePropagator::VisitLocalRelation(const PlanNode &node, Scope &scope) {
	for (size_t i = 0; i < node.columns.size(); i++) {
		scope.lineage[resolver.IdentityOf(node, i)] = ColumnSourceSet();
	}
	return std::vector<QualifiedName>();
}

//===--------------------------------------------------------------------===//
// Unary operators
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::VisitProject(const PlanNode &node, Scope &scope) {
	auto &project = node.Cast<ProjectNode>();
	RequireChildren(project, 1);
	if (project.expressions.size() != project.columns.size()) {
		throw InvalidPlanException("PROJECT has " + std::to_string(project.expressions.size()) +
		                           " expressions for " + std::to_string(project.columns.size()) + " columns");
	}
	auto child_tables = Visit(*project.children[0], scope);

	std::vector<QualifiedName> encountered;
	for (size_t i = 0; i < project.expressions.size(); i++) {
		RequireExpression(project.expressions[i], project);
		auto sources = Evaluate(*project.expressions[i], scope, RowTables(*project.children[0]), encountered);
		scope.lineage[resolver.IdentityOf(project, i)] = std::move(sources);
	}
	// Scalar subquery tables come before the child's
	return Concat(std::move(encountered), child_tables);
}

std::vector<QualifiedName> LineagePropagator::VisitFilter(const PlanNode &node, Scope &scope) {
	auto &filter = node.Cast<FilterNode>();
	RequireChildren(filter, 1);
	auto tables = VisitPassthrough(filter, scope);
	if (filter.condition) {
		Inspect(*filter.condition, scope);
	}
	return tables;
}

std::vector<QualifiedName> LineagePropagator::VisitAggregate(const PlanNode &node, Scope &scope) {
	auto &aggregate = node.Cast<AggregateNode>();
	RequireChildren(aggregate, 1);
	if (aggregate.aggregates.size() != aggregate.columns.size()) {
		throw InvalidPlanException("AGGREGATE has " + std::to_string(aggregate.aggregates.size()) +
		                           " output expressions for " + std::to_string(aggregate.columns.size()) + " columns");
	}
	auto child_tables = Visit(*aggregate.children[0], scope);

	for (auto &group : aggregate.groups) {
		RequireExpression(group, aggregate);
		Inspect(*group, scope);
	}
	std::vector<QualifiedName> encountered;
	for (size_t i = 0; i < aggregate.aggregates.size(); i++) {
		RequireExpression(aggregate.aggregates[i], aggregate);
		auto sources = Evaluate(*aggregate.aggregates[i], scope, RowTables(*aggregate.children[0]), encountered);
		scope.lineage[resolver.IdentityOf(aggregate, i)] = std::move(sources);
	}
	return Concat(std::move(encountered), child_tables);
}

std::vector<QualifiedName> LineagePropagator::VisitExpand(const PlanNode &node, Scope &scope) {
	auto &expand = node.Cast<ExpandNode>();
	RequireChildren(expand, 1);
	if (expand.projections.empty()) {
		throw InvalidPlanException("EXPAND without projections");
	}
	for (auto &projection : expand.projections) {
		if (projection.size() != expand.columns.size()) {
			throw InvalidPlanException("EXPAND projection has " + std::to_string(projection.size()) +
			                           " expressions for " + std::to_string(expand.columns.size()) + " columns");
		}
	}
	auto child_tables = Visit(*expand.children[0], scope);

	std::vector<QualifiedName> encountered;
	for (size_t i = 0; i < expand.columns.size(); i++) {
		ColumnSourceSet sources;
		bool null_filled = false;
		for (auto &projection : expand.projections) {
			RequireExpression(projection[i], expand);
			if (projection[i]->type == ExpressionType::LITERAL) {
				// The column is absent from this grouping set
				null_filled = true;
				continue;
			}
			Merge(sources, Evaluate(*projection[i], scope, RowTables(*expand.children[0]), encountered));
		}
		scope.lineage[resolver.IdentityOf(expand, i)] = null_filled ? ColumnSourceSet() : std::move(sources);
	}
	return Concat(std::move(encountered), child_tables);
}

std::vector<QualifiedName> LineagePropagator::VisitWindow(const PlanNode &node, Scope &scope) {
	auto &window = node.Cast<WindowNode>();
	RequireChildren(window, 1);
	auto &child = *window.children[0];
	if (window.columns.size() != child.columns.size() + window.window_expressions.size()) {
		throw InvalidPlanException("WINDOW has " + std::to_string(window.window_expressions.size()) +
		                           " window expressions but " +
		                           std::to_string(window.columns.size() - std::min(window.columns.size(),
		                                                                            child.columns.size())) +
		                           " window columns");
	}
	auto child_tables = VisitPassthrough(window, scope);

	std::vector<QualifiedName> encountered;
	auto offset = child.columns.size();
	for (size_t i = 0; i < window.window_expressions.size(); i++) {
		RequireExpression(window.window_expressions[i], window);
		auto sources = Evaluate(*window.window_expressions[i], scope, RowTables(child), encountered);
		scope.lineage[resolver.IdentityOf(window, offset + i)] = std::move(sources);
	}
	return Concat(std::move(encountered), child_tables);
}

/// Passes the child's columns through by position. Nodes that reuse their
/// child's identities (the common case) leave the scope unchanged. Also handles
/// the leading child columns of FILTER and WINDOW.
std::vector<QualifiedName> LineagePropagator::VisitPassthrough(const PlanNode &node, Scope &scope) {
	RequireChildren(node, 1);
	auto &child = *node.children[0];
	auto tables = Visit(child, scope);

	auto count = node.type == PlanNodeType::WINDOW ? child.columns.size() : node.columns.size();
	if (node.type != PlanNodeType::WINDOW && node.columns.size() != child.columns.size()) {
		throw InvalidPlanException(node.GetName() + " exposes " + std::to_string(node.columns.size()) +
		                           " columns but its child produces " + std::to_string(child.columns.size()));
	}
	for (size_t i = 0; i < count; i++) {
		auto id = resolver.IdentityOf(node, i);
		if (id != resolver.IdentityOf(child, i)) {
			scope.lineage[id] = resolver.SourcesOf(child, i, scope.lineage);
		}
	}
	return tables;
}

//===--------------------------------------------------------------------===//
// Binary and n-ary operators
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::VisitJoin(const PlanNode &node, Scope &scope) {
	auto &join = node.Cast<JoinNode>();
	RequireChildren(join, 2);
	auto &left = *join.children[0];
	auto &right = *join.children[1];
	auto left_tables = Visit(left, scope);
	auto right_tables = Visit(right, scope);
	if (join.condition) {
		Inspect(*join.condition, scope);
	}

	auto expected = left.columns.size() + (join.IsSemiOrAnti() ? 0 : right.columns.size());
	if (join.columns.size() != expected) {
		throw InvalidPlanException(join.GetName() + " " + JoinTypeToString(join.join_type) + " exposes " +
		                           std::to_string(join.columns.size()) + " columns, expected " +
		                           std::to_string(expected));
	}
	for (size_t i = 0; i < join.columns.size(); i++) {
		auto &input = i < left.columns.size() ? left : right;
		auto position = i < left.columns.size() ? i : i - left.columns.size();
		auto id = resolver.IdentityOf(join, i);
		if (id != resolver.IdentityOf(input, position)) {
			scope.lineage[id] = resolver.SourcesOf(input, position, scope.lineage);
		}
	}

	if (join.IsSemiOrAnti()) {
		// The right side only filters rows
		return left_tables;
	}
	return Concat(std::move(left_tables), right_tables);
}

std::vector<QualifiedName> LineagePropagator::VisitSetOperation(const PlanNode &node, Scope &scope) {
	auto &setop = node.Cast<SetOperationNode>();
	if (setop.children.empty()) {
		throw InvalidPlanException("SET_OPERATION without children");
	}
	RequireChildren(setop, setop.children.size());

	std::vector<QualifiedName> tables;
	for (auto &child : setop.children) {
		if (child->columns.size() != setop.columns.size()) {
			throw InvalidPlanException("SET_OPERATION arity mismatch: child produces " +
			                           std::to_string(child->columns.size()) + " columns, expected " +
			                           std::to_string(setop.columns.size()));
		}
		AppendAllUnique(tables, Visit(*child, scope));
	}
	for (size_t i = 0; i < setop.columns.size(); i++) {
		ColumnSourceSet sources;
		for (auto &child : setop.children) {
			Merge(sources, resolver.SourcesOf(*child, i, scope.lineage));
		}
		scope.lineage[resolver.IdentityOf(setop, i)] = std::move(sources);
	}
	return tables;
}

//===--------------------------------------------------------------------===//
// Common table expressions
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::VisitWithCTE(const PlanNode &node, Scope &scope) {
	auto &with = node.Cast<WithCTENode>();
	if (with.children.empty() || with.cte_ids.size() != with.children.size() - 1) {
		throw InvalidPlanException("WITH_CTE has " + std::to_string(with.cte_ids.size()) + " CTE ids for " +
		                           std::to_string(with.children.size()) + " children");
	}
	RequireChildren(with, with.children.size());

	for (size_t i = 0; i < with.cte_ids.size(); i++) {
		auto &definition = *with.children[i];
		CTEBinding binding;
		binding.definition = &definition;
		{
			ExpansionGuard guard(expansion_stack, "cte " + std::to_string(with.cte_ids[i]));
			binding.tables = Visit(definition, scope);
		}
		scope.ctes[with.cte_ids[i]] = std::move(binding);
	}
	auto &main = with.GetMain();
	auto tables = Visit(main, scope);
	for (size_t i = 0; i < with.columns.size(); i++) {
		auto id = resolver.IdentityOf(with, i);
		if (id != resolver.IdentityOf(main, i)) {
			scope.lineage[id] = resolver.SourcesOf(main, i, scope.lineage);
		}
	}
	return tables;
}

std::vector<QualifiedName> LineagePropagator::VisitCTERef(const PlanNode &node, Scope &scope) {
	auto &ref = node.Cast<CTERefNode>();
	auto identity = "cte " + std::to_string(ref.cte_id);
	if (std::find(expansion_stack.begin(), expansion_stack.end(), identity) != expansion_stack.end()) {
		throw CyclicDefinitionException("CTE " + std::to_string(ref.cte_id) + " references itself");
	}
	auto entry = scope.ctes.find(ref.cte_id);
	if (entry == scope.ctes.end()) {
		throw InvalidPlanException("Reference to undefined CTE " + std::to_string(ref.cte_id));
	}
	resolver.Remap(*entry->second.definition, scope.lineage, ref, scope.lineage);
	row_tables[&ref] = RowTables(*entry->second.definition);
	return entry->second.tables;
}

//===--------------------------------------------------------------------===//
// Fallback
//===--------------------------------------------------------------------===//

std::vector<QualifiedName> LineagePropagator::VisitFallback(const PlanNode &node, Scope &scope) {
	std::vector<QualifiedName> tables;
	for (auto &child : node.children) {
		if (!child) {
			throw InvalidPlanException(node.GetName() + " has a missing child");
		}
		AppendAllUnique(tables, Visit(*child, scope));
	}

	bool passthrough = !node.children.empty() && node.children[0]->columns.size() == node.columns.size();
	// Identities of the first child keep their sources wherever the node places them
	std::set<ColumnId> child_ids;
	std::vector<ColumnSourceSet> forwarded;
	if (passthrough) {
		auto &child = *node.children[0];
		for (size_t i = 0; i < child.columns.size(); i++) {
			child_ids.insert(resolver.IdentityOf(child, i));
			forwarded.push_back(resolver.SourcesOf(child, i, scope.lineage));
		}
	}
	for (size_t i = 0; i < node.columns.size(); i++) {
		auto id = resolver.IdentityOf(node, i);
		if (passthrough) {
			if (child_ids.find(id) == child_ids.end()) {
				scope.lineage[id] = std::move(forwarded[i]);
			}
		} else if (scope.lineage.find(id) == scope.lineage.end()) {
			// Columns forwarded from a child under their own identity keep their sources
			scope.lineage[id] = ColumnSourceSet();
		}
	}

	std::string message = "No lineage rule for operator '" + node.GetName() + "'; " +
	                      (passthrough ? "columns passed through from its first child" : "columns have no sources");
	Debug(message);
	warnings.push_back(LineageError(LineageErrorType::UNSUPPORTED_OPERATOR, message));
	return tables;
}

//===--------------------------------------------------------------------===//
// Expressions
//===--------------------------------------------------------------------===//

ColumnSourceSet LineagePropagator::Evaluate(const Expression &expression, Scope &scope,
                                            const std::vector<QualifiedName> &input_tables,
                                            std::vector<QualifiedName> &encountered) {
	ColumnSourceSet result;
	auto evaluate_all = [&](const std::vector<ExpressionPtr> &expressions) {
		for (auto &child : expressions) {
			if (!child) {
				throw InvalidPlanException("Missing operand in " + expression.ToString());
			}
			Merge(result, Evaluate(*child, scope, input_tables, encountered));
		}
	};

	switch (expression.type) {
	case ExpressionType::COLUMN_REF:
		return resolver.Resolve(expression.Cast<ColumnRefExpression>(), scope.lineage);
	case ExpressionType::LITERAL:
		return result;
	case ExpressionType::FUNCTION:
		evaluate_all(expression.Cast<FunctionExpression>().children);
		return result;
	case ExpressionType::CASE: {
		auto &case_expr = expression.Cast<CaseExpression>();
		for (auto &check : case_expr.case_checks) {
			evaluate_all(std::vector<ExpressionPtr> {check.when_expr, check.then_expr});
		}
		if (case_expr.else_expr) {
			Merge(result, Evaluate(*case_expr.else_expr, scope, input_tables, encountered));
		}
		return result;
	}
	case ExpressionType::AGGREGATE: {
		auto &aggregate = expression.Cast<AggregateExpression>();
		if (aggregate.is_count_star) {
			// Every table producing the aggregate's input rows contributes its row count
			for (auto &table : input_tables) {
				result.insert(SourceColumnRef(table, COUNT_STAR_COLUMN));
			}
			return result;
		}
		evaluate_all(aggregate.children);
		return result;
	}
	case ExpressionType::WINDOW: {
		auto &window = expression.Cast<WindowExpression>();
		evaluate_all(window.children);
		evaluate_all(window.partitions);
		evaluate_all(window.orders);
		return result;
	}
	case ExpressionType::SUBQUERY: {
		auto &subquery = expression.Cast<SubqueryExpression>();
		if (!subquery.subquery) {
			throw InvalidPlanException("Subquery expression without a plan");
		}
		auto &plan = *subquery.subquery;
		if (subquery.subquery_type != SubqueryType::SCALAR) {
			// EXISTS / IN only filter rows; the subquery is checked and dropped
			Visit(plan, scope);
			evaluate_all(subquery.children);
			return result;
		}
		auto tables = Visit(plan, scope);
		if (plan.columns.size() != 1) {
			throw InvalidPlanException("Scalar subquery produces " + std::to_string(plan.columns.size()) +
			                           " columns");
		}
		AppendAllUnique(encountered, tables);
		return resolver.SourcesOf(plan, 0, scope.lineage);
	}
	}
	throw InvalidPlanException("Unknown expression type");
}

void LineagePropagator::Inspect(const Expression &predicate, Scope &scope) {
	std::vector<QualifiedName> discarded;
	Evaluate(predicate, scope, std::vector<QualifiedName>(), discarded);
}

} // namespace column_lineage
