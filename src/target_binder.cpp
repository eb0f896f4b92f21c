//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: target_binder.cpp
// Description: Implementation of destination binding for write commands.
//===----------------------------------------------------------------------===//

#include "target_binder.hpp"

namespace column_lineage {

Lineage TargetBinder::Bind(const CommandNode &command) {
	// DDL without a query (CREATE TABLE t(a int)) moves no data
	if (command.command_type != CommandType::MERGE_INTO && command.children.empty()) {
		return Lineage();
	}
	for (auto &child : command.children) {
		if (!child) {
			throw InvalidPlanException(command.GetName() + " has a missing child");
		}
	}

	auto target = BindTarget(command);
	Lineage lineage;
	if (command.command_type == CommandType::MERGE_INTO) {
		BindMerge(command, target, lineage);
	} else {
		BindInsert(command, target, lineage);
	}
	return lineage;
}

QualifiedName TargetBinder::BindTarget(const CommandNode &command) const {
	if (command.target.IsEmpty()) {
		throw InvalidPlanException(command.GetName() + " has no target");
	}
	if (command.target.is_path) {
		return command.target;
	}
	return propagator.CanonicalName(command.target);
}

void TargetBinder::BindInsert(const CommandNode &command, const QualifiedName &target, Lineage &lineage) {
	if (command.children.size() != 1) {
		throw InvalidPlanException(command.GetName() + " expects a single query child but has " +
		                           std::to_string(command.children.size()));
	}
	auto input = propagator.Propagate(*command.children[0]);
	for (auto &table : input.tables) {
		lineage.AddSource(table);
	}
	lineage.AddTarget(target);

	auto &destination = command.destination_columns.empty() ? input.names : command.destination_columns;
	size_t position = 0;
	for (auto &column : destination) {
		ColumnSourceSet sources;
		if (!command.IsStaticPartition(column)) {
			if (position < input.columns.size()) {
				sources = input.columns[position];
			}
			position++;
		}
		lineage.AddColumn(target.ToString() + "." + column, std::move(sources));
	}
}

void TargetBinder::BindMerge(const CommandNode &command, const QualifiedName &target, Lineage &lineage) {
	if (command.children.empty() || command.children.size() > 2) {
		throw InvalidPlanException("MERGE_INTO expects a source and an optional target relation but has " +
		                           std::to_string(command.children.size()) + " children");
	}
	if (command.destination_columns.empty()) {
		throw InvalidPlanException("MERGE_INTO into " + target.ToString() + " has no destination schema");
	}
	auto input = propagator.Propagate(*command.children[0]);
	if (command.children.size() == 2) {
		// Target columns may appear in clauses but are never sources
		propagator.BindOpaque(*command.children[1]);
	}

	auto &destination = command.destination_columns;
	std::vector<ColumnSourceSet> assigned(destination.size());
	std::vector<QualifiedName> encountered;
	for (auto &action : command.merge_actions) {
		if (action.condition) {
			std::vector<QualifiedName> discarded;
			propagator.Evaluate(*action.condition, discarded);
		}
		if (action.action_type == MergeActionType::DELETE) {
			continue;
		}
		if (action.is_star) {
			for (size_t i = 0; i < destination.size() && i < input.columns.size(); i++) {
				assigned[i].insert(input.columns[i].begin(), input.columns[i].end());
			}
			continue;
		}
		for (auto &assignment : action.assignments) {
			size_t index = destination.size();
			for (size_t i = 0; i < destination.size(); i++) {
				if (EqualsIgnoreCase(destination[i], assignment.column)) {
					index = i;
					break;
				}
			}
			if (index == destination.size()) {
				throw InvalidPlanException("MERGE_INTO assigns unknown column '" + assignment.column + "' of " +
				                           target.ToString());
			}
			if (!assignment.value) {
				throw InvalidPlanException("MERGE_INTO assignment to '" + assignment.column + "' has no value");
			}
			auto sources = propagator.Evaluate(*assignment.value, encountered);
			assigned[index].insert(sources.begin(), sources.end());
		}
	}

	for (auto &table : input.tables) {
		lineage.AddSource(table);
	}
	for (auto &table : encountered) {
		lineage.AddSource(table);
	}
	lineage.AddTarget(target);
	for (size_t i = 0; i < destination.size(); i++) {
		lineage.AddColumn(target.ToString() + "." + destination[i], std::move(assigned[i]));
	}
}

} // namespace column_lineage
