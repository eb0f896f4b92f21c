//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_extractor.cpp
// Description: Implementation of the extraction entry point and its error
//              boundary.
//===----------------------------------------------------------------------===//

#include "lineage_extractor.hpp"
#include "target_binder.hpp"
#include <iostream>

namespace column_lineage {

//===--------------------------------------------------------------------===//
// Errors
//===--------------------------------------------------------------------===//

std::string LineageErrorTypeToString(LineageErrorType type) {
	switch (type) {
	case LineageErrorType::UNRESOLVED_PLAN:
		return "Unresolved plan";
	case LineageErrorType::CYCLIC_DEFINITION:
		return "Cyclic definition";
	case LineageErrorType::UNSUPPORTED_OPERATOR:
		return "Unsupported operator";
	case LineageErrorType::INVALID_PLAN:
		return "Invalid plan";
	}
	return "Unknown";
}

const LineageError &LineageResult::GetError() const {
	if (!has_error) {
		throw std::logic_error("LineageResult: extraction succeeded, there is no error");
	}
	return error;
}

const Lineage &LineageResult::GetLineage() const {
	if (has_error) {
		throw std::logic_error("LineageResult: extraction failed with " + error.ToString());
	}
	return lineage;
}

//===--------------------------------------------------------------------===//
// Extraction
//===--------------------------------------------------------------------===//

LineageResult LineageExtractor::Extract(const PlanNode &plan) const {
	try {
		LineagePropagator propagator(catalog, cache_registry, options);
		Lineage lineage;
		if (plan.type == PlanNodeType::COMMAND) {
			TargetBinder binder(propagator);
			lineage = binder.Bind(plan.Cast<CommandNode>());
		} else {
			auto propagated = propagator.Propagate(plan);
			for (auto &table : propagated.tables) {
				lineage.AddSource(table);
			}
			for (size_t i = 0; i < propagated.columns.size(); i++) {
				lineage.AddColumn(propagated.names[i], std::move(propagated.columns[i]));
			}
		}
		return LineageResult(std::move(lineage), propagator.GetWarnings());
	} catch (const LineageException &ex) {
		if (options.debug) {
			std::cerr << "ColumnLineage Debug: Extraction failed: " << ex.ToError().ToString() << '\n';
			std::cerr << "ColumnLineage Debug: Plan:\n" << plan.ToString();
		}
		return LineageResult(ex.ToError());
	}
}

LineageResult ExtractLineage(const PlanNode &plan, const CatalogBridge *catalog, const ExtractorOptions &options,
                             const CacheRegistry *cache_registry) {
	return LineageExtractor(catalog, cache_registry, options).Extract(plan);
}

LineageResult ExtractLineage(const PlanNode &plan, const InMemoryCatalog &catalog, const ExtractorOptions &options) {
	return LineageExtractor(&catalog, &catalog, options).Extract(plan);
}

} // namespace column_lineage
