//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_propagator.hpp
// Description: Post-order traversal of a plan that maps every output column
//              to the base columns it is derived from and collects the base
//              tables each operator touches.
//===----------------------------------------------------------------------===//

#pragma once

#include "attribute_resolver.hpp"
#include "catalog_bridge.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace column_lineage {

/// @brief Options controlling one extraction.
struct ExtractorOptions {
	/// Log traversal decisions to stderr
	bool debug = false;
	/// Database filled into unqualified names when no catalog is available
	std::string default_database = DEFAULT_DATABASE;
};

/// @brief Lineage of the root of a propagated plan, by output position.
struct PropagatedPlan {
	std::vector<std::string> names;
	std::vector<ColumnSourceSet> columns;
	std::vector<QualifiedName> tables;
};

/// @class LineagePropagator
/// @brief Applies the per-operator propagation rules.
///
/// One propagator serves one extraction. Operators without a dedicated rule get
/// the fallback rule (tables of all children, positional passthrough of the first
/// child) and a warning is recorded.
class LineagePropagator {
public:
	LineagePropagator(const CatalogBridge *catalog, const CacheRegistry *cache_registry,
	                  const ExtractorOptions &options);

	/// @brief Propagate a (non-command) plan in the root scope.
	PropagatedPlan Propagate(const PlanNode &plan);

	/// @brief Evaluate an expression against the root scope.
	/// @param encountered Tables of scalar subqueries met while evaluating, appended in order.
	ColumnSourceSet Evaluate(const Expression &expression, std::vector<QualifiedName> &encountered);

	/// @brief Bring a node's output columns into the root scope as constant-derived.
	/// @note Used for relations whose columns may be referenced but must never become sources.
	void BindOpaque(const PlanNode &node);

	/// @brief Canonical form of a table name, through the catalog when there is one.
	QualifiedName CanonicalName(const QualifiedName &name) const;

	const std::vector<LineageError> &GetWarnings() const {
		return warnings;
	}

private:
	struct CTEBinding {
		const PlanNode *definition;
		std::vector<QualifiedName> tables;
	};

	//! Identity space of one plan instance
	struct Scope {
		ColumnLineage lineage;
		std::unordered_map<uint64_t, CTEBinding> ctes;
	};

	std::vector<QualifiedName> Visit(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitOperator(const PlanNode &node, Scope &scope);

	std::vector<QualifiedName> VisitRelation(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitLocalRelation(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitProject(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitFilter(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitAggregate(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitExpand(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitJoin(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitSetOperation(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitWindow(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitPassthrough(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitWithCTE(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitCTERef(const PlanNode &node, Scope &scope);
	std::vector<QualifiedName> VisitFallback(const PlanNode &node, Scope &scope);

	/// @brief Propagate a view or cache definition in a fresh scope and bind it onto `reference`.
	std::vector<QualifiedName> Inline(const PlanNode &definition, const PlanNode &reference,
	                                  const std::string &identity, Scope &scope);

	/// @brief Tables whose rows flow into a visited node, excluding tables read
	///        only by subqueries.
	const std::vector<QualifiedName> &RowTables(const PlanNode &node) const;
	void RecordRowTables(const PlanNode &node);

	/// @brief Value-context evaluation of an expression.
	/// @param input_tables Tables producing the operator's input rows (for count(*)).
	ColumnSourceSet Evaluate(const Expression &expression, Scope &scope,
	                         const std::vector<QualifiedName> &input_tables,
	                         std::vector<QualifiedName> &encountered);

	/// @brief Check a predicate for well-formedness; its tables and columns are discarded.
	void Inspect(const Expression &predicate, Scope &scope);

	void Debug(const std::string &message) const;

	const CatalogBridge *catalog;
	const CacheRegistry *cache_registry;
	ExtractorOptions options;
	AttributeResolver resolver;

	Scope root_scope;
	//! Identities of the view, cache and CTE definitions being expanded
	std::vector<std::string> expansion_stack;
	std::vector<LineageError> warnings;
	//! Row-producing tables per visited node
	std::unordered_map<const PlanNode *, std::vector<QualifiedName>> row_tables;
};

} // namespace column_lineage
