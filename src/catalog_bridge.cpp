//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: catalog_bridge.cpp
// Description: Implementation of the in-memory catalog and cache registry.
//===----------------------------------------------------------------------===//

#include "catalog_bridge.hpp"

namespace column_lineage {

QualifiedName CanonicalizeName(const QualifiedName &name, const std::string &default_database,
                               const std::string &default_catalog) {
	if (name.is_path) {
		return name;
	}
	QualifiedName result;
	result.catalog = Lower(name.catalog);
	if (!result.catalog.empty() && EqualsIgnoreCase(result.catalog, default_catalog)) {
		result.catalog.clear();
	}
	result.database = Lower(name.database.empty() ? default_database : name.database);
	result.table = Lower(name.table);
	return result;
}

InMemoryCatalog::InMemoryCatalog(std::string default_database, std::string default_catalog)
    : default_database(std::move(default_database)), default_catalog(std::move(default_catalog)) {
}

void InMemoryCatalog::RegisterView(const QualifiedName &name, PlanNodePtr plan) {
	auto key = CanonicalName(name).ToString();
	std::lock_guard<std::mutex> lock(catalog_mutex);
	views[key] = std::move(plan);
}

void InMemoryCatalog::RegisterCache(const std::string &key, PlanNodePtr plan) {
	std::lock_guard<std::mutex> lock(catalog_mutex);
	caches[Lower(key)] = std::move(plan);
}

void InMemoryCatalog::DropView(const QualifiedName &name) {
	auto key = CanonicalName(name).ToString();
	std::lock_guard<std::mutex> lock(catalog_mutex);
	views.erase(key);
}

void InMemoryCatalog::DropCache(const std::string &key) {
	std::lock_guard<std::mutex> lock(catalog_mutex);
	caches.erase(Lower(key));
}

PlanNodePtr InMemoryCatalog::ResolveDefiningPlan(const QualifiedName &name) const {
	auto key = CanonicalName(name).ToString();
	std::lock_guard<std::mutex> lock(catalog_mutex);
	auto entry = views.find(key);
	if (entry == views.end()) {
		return nullptr;
	}
	return entry->second;
}

QualifiedName InMemoryCatalog::CanonicalName(const QualifiedName &name) const {
	return CanonicalizeName(name, default_database, default_catalog);
}

PlanNodePtr InMemoryCatalog::Lookup(const std::string &key) const {
	std::lock_guard<std::mutex> lock(catalog_mutex);
	auto entry = caches.find(Lower(key));
	if (entry == caches.end()) {
		return nullptr;
	}
	return entry->second;
}

} // namespace column_lineage
