//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_types.hpp
// Description: Value types shared by the lineage engine: qualified table names,
//              source column references, column identities and the Lineage
//              output record with its JSON serialization.
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace column_lineage {

using json = nlohmann::json;

/// @brief Opaque identity of a column produced by some operator.
typedef uint64_t ColumnId;

/// @brief Id 0 is never minted; a reference carrying it is unresolved.
static constexpr ColumnId INVALID_COLUMN_ID = 0;

/// @brief Column name used as the source of count(*) aggregates.
static constexpr const char *COUNT_STAR_COLUMN = "__count__";

/// @brief Database filled into names that do not carry one.
static constexpr const char *DEFAULT_DATABASE = "default";

//===--------------------------------------------------------------------===//
// QualifiedName
//===--------------------------------------------------------------------===//

/// @struct QualifiedName
/// @brief A catalog table identifier, or the literal path of a directory sink.
///
/// Renders as `db.table`, or `catalog.db.table` when a non-default catalog is in
/// play. A path name renders as the path in backticks. Equality and ordering are
/// case-insensitive for table names and exact for paths.
struct QualifiedName {
	std::string catalog;
	std::string database;
	std::string table;
	bool is_path = false;

	QualifiedName() {
	}
	QualifiedName(std::string database, std::string table);
	QualifiedName(std::string catalog, std::string database, std::string table);

	/// @brief Create the name of a directory sink.
	static QualifiedName Path(const std::string &path);

	/// @brief Parse `table`, `db.table` or `catalog.db.table`.
	static QualifiedName Parse(const std::string &dotted);

	bool IsEmpty() const;
	std::string ToString() const;

	/// @brief Key used for case-insensitive comparison.
	std::string ComparisonKey() const;

	bool operator==(const QualifiedName &other) const;
	bool operator!=(const QualifiedName &other) const;
	bool operator<(const QualifiedName &other) const;
};

//===--------------------------------------------------------------------===//
// SourceColumnRef
//===--------------------------------------------------------------------===//

/// @brief A base column some output column was derived from.
struct SourceColumnRef {
	QualifiedName table;
	std::string column;

	SourceColumnRef() {
	}
	SourceColumnRef(QualifiedName table, std::string column);

	std::string ToString() const;

	bool operator==(const SourceColumnRef &other) const;
	bool operator!=(const SourceColumnRef &other) const;
	bool operator<(const SourceColumnRef &other) const;
};

/// @brief Sources of a single column; empty means constant-derived.
typedef std::set<SourceColumnRef> ColumnSourceSet;

/// @brief Sources of every column in one plan instance, keyed by identity.
typedef std::unordered_map<ColumnId, ColumnSourceSet> ColumnLineage;

/// @brief Append a table name unless an equal one is already present.
void AppendUnique(std::vector<QualifiedName> &names, const QualifiedName &name);

/// @brief Append every name of `other` with AppendUnique, keeping its order.
void AppendAllUnique(std::vector<QualifiedName> &names, const std::vector<QualifiedName> &other);

/// @brief Lower-case a string (ASCII).
std::string Lower(const std::string &str);

/// @brief Case-insensitive string equality (ASCII).
bool EqualsIgnoreCase(const std::string &left, const std::string &right);

//===--------------------------------------------------------------------===//
// Lineage
//===--------------------------------------------------------------------===//

/// @class Lineage
/// @brief The lineage record of one statement.
///
/// `sources` and `targets` are de-duplicated and keep first-seen order. `columns`
/// keeps one entry per output (or destination) column in order, duplicates
/// included.
class Lineage {
public:
	typedef std::pair<std::string, ColumnSourceSet> ColumnEntry;

	std::vector<QualifiedName> sources;
	std::vector<QualifiedName> targets;
	std::vector<ColumnEntry> columns;

	void AddSource(const QualifiedName &name);
	void AddTarget(const QualifiedName &name);
	void AddColumn(std::string name, ColumnSourceSet sources);

	bool IsEmpty() const;

	/// @brief Serialize to the `inputTables`/`outputTables`/`columnLineage` record.
	json ToJson() const;
	std::string ToString() const;

	bool operator==(const Lineage &other) const;
	bool operator!=(const Lineage &other) const;
};

void to_json(json &j, const QualifiedName &name);
void to_json(json &j, const Lineage &lineage);

} // namespace column_lineage
