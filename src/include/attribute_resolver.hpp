//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: attribute_resolver.hpp
// Description: Column identity for the lineage engine. Mints ColumnIds for plan
//              builders and converters, resolves references against a lineage
//              scope, and remaps inlined definitions onto referencing leaves.
//===----------------------------------------------------------------------===//

#pragma once

#include "plan_node.hpp"
#include <atomic>

namespace column_lineage {

/// @class ColumnIdGenerator
/// @brief Arena of column identities. Ids start at 1 and are never reused.
/// @note Thread-safe.
class ColumnIdGenerator {
public:
	ColumnIdGenerator() : next_id(INVALID_COLUMN_ID + 1) {
	}

	ColumnId NextId() {
		return next_id++;
	}

private:
	std::atomic<ColumnId> next_id;
};

/// @class AttributeResolver
/// @brief Resolves column identities during one traversal.
///
/// A reference resolves to the identity it points to. Each inlining of a view,
/// cache or CTE definition is propagated in its own scope and bound onto the
/// referencing node positionally, so two inlinings of the same definition never
/// share identities.
class AttributeResolver {
public:
	/// @brief Identity of the column at `position` in the node's output.
	/// @throws InvalidPlanException if the position is out of range.
	/// @throws UnresolvedPlanException if the column carries no identity.
	ColumnId IdentityOf(const PlanNode &node, size_t position) const;

	/// @brief Check every output column of the node carries an identity.
	void ValidateOutputs(const PlanNode &node) const;

	/// @brief Look up the sources of a referenced column.
	/// @throws UnresolvedPlanException for unresolved references.
	/// @throws InvalidPlanException if the identity is not in scope.
	const ColumnSourceSet &Resolve(const ColumnRefExpression &ref, const ColumnLineage &scope) const;

	/// @brief Sources of a node's output column in the given scope.
	const ColumnSourceSet &SourcesOf(const PlanNode &node, size_t position, const ColumnLineage &scope) const;

	/// @brief Bind the outputs of a definition (propagated into `definition_scope`)
	///        onto the columns of the node that references it.
	/// @throws InvalidPlanException on arity mismatch.
	void Remap(const PlanNode &definition, const ColumnLineage &definition_scope, const PlanNode &reference,
	           ColumnLineage &target_scope) const;
};

} // namespace column_lineage
