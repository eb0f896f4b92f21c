//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_extractor.hpp
// Description: Entry point of the lineage engine. Extracts the Lineage record
//              of one resolved and optimized plan.
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog_bridge.hpp"
#include "lineage_error.hpp"
#include "lineage_propagator.hpp"
#include "plan_node.hpp"

namespace column_lineage {

/// @class LineageExtractor
/// @brief Extracts column lineage from plans against a fixed catalog and cache registry.
///
/// Extraction is synchronous and keeps no state between calls, so one extractor
/// may serve concurrent callers as long as the catalog does.
class LineageExtractor {
public:
	LineageExtractor(const CatalogBridge *catalog, const CacheRegistry *cache_registry,
	                 ExtractorOptions options = ExtractorOptions())
	    : catalog(catalog), cache_registry(cache_registry), options(std::move(options)) {
	}

	/// @brief Extract the lineage of a plan.
	/// @return The Lineage record, or the error that made extraction impossible.
	/// @note Never throws LineageException; errors are carried by the result.
	LineageResult Extract(const PlanNode &plan) const;

private:
	const CatalogBridge *catalog;
	const CacheRegistry *cache_registry;
	ExtractorOptions options;
};

/// @brief Extract the lineage of a plan.
/// @param plan Root of a resolved and optimized plan.
/// @param catalog Catalog used to inline views (may be null).
/// @param options Extraction options.
/// @param cache_registry Registry used to inline cached relations (may be null).
LineageResult ExtractLineage(const PlanNode &plan, const CatalogBridge *catalog,
                             const ExtractorOptions &options = ExtractorOptions(),
                             const CacheRegistry *cache_registry = nullptr);

/// @brief Extract with an InMemoryCatalog serving as both catalog and cache registry.
LineageResult ExtractLineage(const PlanNode &plan, const InMemoryCatalog &catalog,
                             const ExtractorOptions &options = ExtractorOptions());

} // namespace column_lineage
