//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: plan_converter.hpp
// Description: Converts bound and optimized DuckDB logical plans into the
//              lineage plan model. Column identities follow DuckDB column
//              bindings.
//===----------------------------------------------------------------------===//

#pragma once

#include "attribute_resolver.hpp"
#include "plan_node.hpp"
#include "duckdb.hpp"
#include "duckdb/catalog/catalog_entry/table_catalog_entry.hpp"
#include "duckdb/common/enums/join_type.hpp"
#include "duckdb/planner/column_binding_map.hpp"
#include "duckdb/planner/logical_operator.hpp"

namespace column_lineage {

/// @class PlanConverter
/// @brief Translates a DuckDB LogicalOperator tree into a PlanNode tree.
///
/// Every ColumnBinding produced by an operator is given a ColumnId the first
/// time it is defined; BoundColumnRefExpressions resolve through that map and
/// BoundReferenceExpressions by position in the operator's input. Operators
/// without a dedicated mapping become UNKNOWN nodes so the fallback rule
/// applies.
///
/// A converter holds binding state and converts one plan.
class PlanConverter {
public:
	explicit PlanConverter(duckdb::ClientContext &context) : context(context) {
	}

	/// @brief Convert the plan rooted at `op`.
	/// @note References to bindings no operator defines become unresolved column
	///       references, which extraction reports as an unresolved plan.
	PlanNodePtr Convert(duckdb::LogicalOperator &op);

	/// @brief Give the root's output columns their statement-level names.
	/// @return The plan unchanged if the arity does not match.
	static PlanNodePtr RenameOutputs(PlanNodePtr plan, const std::vector<std::string> &names);

	/// @brief Name of the catalog that unqualified table names resolve to.
	static std::string GetDefaultCatalog(duckdb::ClientContext &context);

private:
	PlanNodePtr ConvertOperator(duckdb::LogicalOperator &op);

	PlanNodePtr ConvertGet(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertProjection(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertFilter(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertAggregate(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertWindow(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertComparisonJoin(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertCrossProduct(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertSetOperation(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertPassthrough(duckdb::LogicalOperator &op, PlanNodeType type);
	PlanNodePtr ConvertMaterializedCTE(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertCTERef(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertInsert(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertCreateTable(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertCopyToFile(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertCreateView(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertRecursiveCTE(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertLocalRelation(duckdb::LogicalOperator &op);
	PlanNodePtr ConvertUnknown(duckdb::LogicalOperator &op, bool fresh_columns);

	//! Cross product with an uncorrelated subquery, as a projection of `outer`
	//! that evaluates the subquery once per subquery column
	PlanNodePtr AttachSubquery(duckdb::LogicalOperator &op, PlanNodePtr outer, duckdb::LogicalOperator &subquery_op,
	                           PlanNodePtr subquery, SubqueryType subquery_type);
	//! Join of `left` and `right` with the given DuckDB join type and condition
	PlanNodePtr MakeJoin(duckdb::LogicalOperator &op, duckdb::JoinType join_type, PlanNodePtr left, PlanNodePtr right,
	                     std::vector<ExpressionPtr> conditions);

	ExpressionPtr ConvertExpression(const duckdb::Expression &expr, const std::vector<OutputColumn> &input);

	//! Define a binding with a new identity
	OutputColumn Define(const duckdb::ColumnBinding &binding, const std::string &name);
	//! Column of a defined binding; an undefined binding yields an unresolved column
	OutputColumn Lookup(const duckdb::ColumnBinding &binding) const;
	//! Project `node` onto the operator's bindings when they differ from its columns
	PlanNodePtr AlignOutputs(duckdb::LogicalOperator &op, PlanNodePtr node);

	static QualifiedName TableName(duckdb::TableCatalogEntry &table);

	duckdb::ClientContext &context;
	ColumnIdGenerator ids;
	duckdb::column_binding_map_t<OutputColumn> bindings;
};

} // namespace column_lineage
