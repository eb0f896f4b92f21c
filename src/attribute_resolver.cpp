//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: attribute_resolver.cpp
// Description: Implementation of column identity resolution and remapping.
//===----------------------------------------------------------------------===//

#include "attribute_resolver.hpp"

namespace column_lineage {

ColumnId AttributeResolver::IdentityOf(const PlanNode &node, size_t position) const {
	if (position >= node.columns.size()) {
		throw InvalidPlanException("Column position " + std::to_string(position) + " is out of range for " +
		                           node.GetName() + " with " + std::to_string(node.columns.size()) + " columns");
	}
	auto &column = node.columns[position];
	if (column.id == INVALID_COLUMN_ID) {
		throw UnresolvedPlanException("Output column '" + column.name + "' of " + node.GetName() +
		                              " has no resolved identity");
	}
	return column.id;
}

void AttributeResolver::ValidateOutputs(const PlanNode &node) const {
	for (size_t i = 0; i < node.columns.size(); i++) {
		IdentityOf(node, i);
	}
}

const ColumnSourceSet &AttributeResolver::Resolve(const ColumnRefExpression &ref, const ColumnLineage &scope) const {
	if (!ref.IsResolved()) {
		throw UnresolvedPlanException("Unresolved column reference '" + ref.name + "'");
	}
	auto entry = scope.find(ref.column_id);
	if (entry == scope.end()) {
		throw InvalidPlanException("Column reference " + ref.ToString() + " is not in scope");
	}
	return entry->second;
}

const ColumnSourceSet &AttributeResolver::SourcesOf(const PlanNode &node, size_t position,
                                                    const ColumnLineage &scope) const {
	auto id = IdentityOf(node, position);
	auto entry = scope.find(id);
	if (entry == scope.end()) {
		throw InvalidPlanException("Output column '" + node.columns[position].name + "' of " + node.GetName() +
		                           " was never propagated");
	}
	return entry->second;
}

void AttributeResolver::Remap(const PlanNode &definition, const ColumnLineage &definition_scope,
                              const PlanNode &reference, ColumnLineage &target_scope) const {
	if (definition.columns.size() != reference.columns.size()) {
		throw InvalidPlanException(reference.GetName() + " exposes " + std::to_string(reference.columns.size()) +
		                           " columns but its definition produces " +
		                           std::to_string(definition.columns.size()));
	}
	for (size_t i = 0; i < reference.columns.size(); i++) {
		auto id = IdentityOf(reference, i);
		target_scope[id] = SourcesOf(definition, i, definition_scope);
	}
}

} // namespace column_lineage
