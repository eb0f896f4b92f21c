//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: catalog_bridge.hpp
// Description: Interfaces through which the lineage engine inlines views and
//              cached relations, plus an in-memory implementation for hosts
//              and tests.
//===----------------------------------------------------------------------===//

#pragma once

#include "plan_node.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace column_lineage {

/// @class CatalogBridge
/// @brief Read-only view of the host catalog.
class CatalogBridge {
public:
	virtual ~CatalogBridge() {
	}

	/// @brief Get the defining plan of a view.
	/// @return The optimized plan of the view, or null for a base table.
	virtual PlanNodePtr ResolveDefiningPlan(const QualifiedName &name) const = 0;

	/// @brief Normalize a name: lower-case, default database filled in, default
	///        catalog dropped.
	virtual QualifiedName CanonicalName(const QualifiedName &name) const = 0;
};

/// @class CacheRegistry
/// @brief Lookup of cached relations by registered name or instance key.
class CacheRegistry {
public:
	virtual ~CacheRegistry() {
	}

	/// @return The plan the cache was built from, or null if nothing is registered.
	virtual PlanNodePtr Lookup(const std::string &key) const = 0;
};

/// @brief Canonicalize a name without a catalog: lower-case and fill the default database.
QualifiedName CanonicalizeName(const QualifiedName &name, const std::string &default_database,
                               const std::string &default_catalog = "");

/// @class InMemoryCatalog
/// @brief Catalog and cache registry backed by hash maps.
///
/// Registration is thread-safe. Every registration is its own identity: two
/// caches of the same definition under different keys stay distinct sources.
class InMemoryCatalog : public CatalogBridge, public CacheRegistry {
public:
	explicit InMemoryCatalog(std::string default_database = DEFAULT_DATABASE, std::string default_catalog = "");

	/// @brief Register (or replace) the defining plan of a view.
	void RegisterView(const QualifiedName &name, PlanNodePtr plan);

	/// @brief Register (or replace) a cached relation.
	void RegisterCache(const std::string &key, PlanNodePtr plan);

	void DropView(const QualifiedName &name);
	void DropCache(const std::string &key);

	PlanNodePtr ResolveDefiningPlan(const QualifiedName &name) const override;
	QualifiedName CanonicalName(const QualifiedName &name) const override;
	PlanNodePtr Lookup(const std::string &key) const override;

	const std::string &GetDefaultDatabase() const {
		return default_database;
	}

private:
	std::string default_database;
	std::string default_catalog;

	mutable std::mutex catalog_mutex;
	std::unordered_map<std::string, PlanNodePtr> views;  ///< Keyed by canonical name
	std::unordered_map<std::string, PlanNodePtr> caches; ///< Keyed by lower-cased key
};

} // namespace column_lineage
