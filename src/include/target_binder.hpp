//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: target_binder.hpp
// Description: Binds the outputs of a write command's query onto the
//              destination schema and builds the statement's Lineage record.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_propagator.hpp"

namespace column_lineage {

/// @class TargetBinder
/// @brief Produces the Lineage of a command node.
///
/// Destination columns are zipped positionally against the query's outputs.
/// Static partition columns map to no sources and consume no query position;
/// surplus query outputs are ignored and unbound destination columns map to no
/// sources. MERGE_INTO unions the assignments of every clause per column.
class TargetBinder {
public:
	explicit TargetBinder(LineagePropagator &propagator) : propagator(propagator) {
	}

	/// @throws InvalidPlanException if the command has no target or a malformed merge clause.
	Lineage Bind(const CommandNode &command);

private:
	QualifiedName BindTarget(const CommandNode &command) const;
	void BindInsert(const CommandNode &command, const QualifiedName &target, Lineage &lineage);
	void BindMerge(const CommandNode &command, const QualifiedName &target, Lineage &lineage);

	LineagePropagator &propagator;
};

} // namespace column_lineage
