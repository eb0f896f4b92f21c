//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_types.cpp
// Description: Implementation of the shared lineage value types.
//===----------------------------------------------------------------------===//

#include "lineage_types.hpp"
#include <algorithm>
#include <cctype>

namespace column_lineage {

std::string Lower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

bool EqualsIgnoreCase(const std::string &left, const std::string &right) {
	if (left.size() != right.size()) {
		return false;
	}
	for (size_t i = 0; i < left.size(); i++) {
		if (std::tolower(static_cast<unsigned char>(left[i])) != std::tolower(static_cast<unsigned char>(right[i]))) {
			return false;
		}
	}
	return true;
}

//===--------------------------------------------------------------------===//
// QualifiedName
//===--------------------------------------------------------------------===//

QualifiedName::QualifiedName(std::string database, std::string table)
    : database(std::move(database)), table(std::move(table)) {
}

QualifiedName::QualifiedName(std::string catalog, std::string database, std::string table)
    : catalog(std::move(catalog)), database(std::move(database)), table(std::move(table)) {
}

QualifiedName QualifiedName::Path(const std::string &path) {
	QualifiedName result;
	result.table = path;
	result.is_path = true;
	return result;
}

QualifiedName QualifiedName::Parse(const std::string &dotted) {
	std::vector<std::string> parts;
	size_t start = 0;
	while (true) {
		auto pos = dotted.find('.', start);
		if (pos == std::string::npos) {
			parts.push_back(dotted.substr(start));
			break;
		}
		parts.push_back(dotted.substr(start, pos - start));
		start = pos + 1;
	}
	if (parts.size() == 1) {
		return QualifiedName("", parts[0]);
	}
	if (parts.size() == 2) {
		return QualifiedName(parts[0], parts[1]);
	}
	// Anything beyond three parts belongs to the table name
	std::string table = parts[2];
	for (size_t i = 3; i < parts.size(); i++) {
		table += "." + parts[i];
	}
	return QualifiedName(parts[0], parts[1], table);
}

bool QualifiedName::IsEmpty() const {
	return table.empty();
}

std::string QualifiedName::ToString() const {
	if (is_path) {
		return "`" + table + "`";
	}
	std::string result;
	if (!catalog.empty()) {
		result += catalog + ".";
	}
	result += database.empty() ? std::string(DEFAULT_DATABASE) : database;
	result += "." + table;
	return result;
}

std::string QualifiedName::ComparisonKey() const {
	if (is_path) {
		return ToString();
	}
	return Lower(ToString());
}

bool QualifiedName::operator==(const QualifiedName &other) const {
	return is_path == other.is_path && ComparisonKey() == other.ComparisonKey();
}

bool QualifiedName::operator!=(const QualifiedName &other) const {
	return !(*this == other);
}

bool QualifiedName::operator<(const QualifiedName &other) const {
	if (is_path != other.is_path) {
		return !is_path;
	}
	return ComparisonKey() < other.ComparisonKey();
}

void AppendUnique(std::vector<QualifiedName> &names, const QualifiedName &name) {
	if (std::find(names.begin(), names.end(), name) == names.end()) {
		names.push_back(name);
	}
}

void AppendAllUnique(std::vector<QualifiedName> &names, const std::vector<QualifiedName> &other) {
	for (auto &name : other) {
		AppendUnique(names, name);
	}
}

//===--------------------------------------------------------------------===//
// SourceColumnRef
//===--------------------------------------------------------------------===//

SourceColumnRef::SourceColumnRef(QualifiedName table, std::string column)
    : table(std::move(table)), column(std::move(column)) {
}

std::string SourceColumnRef::ToString() const {
	return table.ToString() + "." + column;
}

bool SourceColumnRef::operator==(const SourceColumnRef &other) const {
	return table == other.table && EqualsIgnoreCase(column, other.column);
}

bool SourceColumnRef::operator!=(const SourceColumnRef &other) const {
	return !(*this == other);
}

bool SourceColumnRef::operator<(const SourceColumnRef &other) const {
	if (table != other.table) {
		return table < other.table;
	}
	return Lower(column) < Lower(other.column);
}

//===--------------------------------------------------------------------===//
// Lineage
//===--------------------------------------------------------------------===//

void Lineage::AddSource(const QualifiedName &name) {
	AppendUnique(sources, name);
}

void Lineage::AddTarget(const QualifiedName &name) {
	AppendUnique(targets, name);
}

void Lineage::AddColumn(std::string name, ColumnSourceSet column_sources) {
	columns.emplace_back(std::move(name), std::move(column_sources));
}

bool Lineage::IsEmpty() const {
	return sources.empty() && targets.empty() && columns.empty();
}

json Lineage::ToJson() const {
	json result;
	to_json(result, *this);
	return result;
}

std::string Lineage::ToString() const {
	return ToJson().dump();
}

bool Lineage::operator==(const Lineage &other) const {
	return sources == other.sources && targets == other.targets && columns == other.columns;
}

bool Lineage::operator!=(const Lineage &other) const {
	return !(*this == other);
}

void to_json(json &j, const QualifiedName &name) {
	j = name.ToString();
}

void to_json(json &j, const Lineage &lineage) {
	json inputs = json::array();
	for (auto &source : lineage.sources) {
		inputs.push_back(source.ToString());
	}
	json outputs = json::array();
	for (auto &target : lineage.targets) {
		outputs.push_back(target.ToString());
	}
	json columns = json::array();
	for (auto &entry : lineage.columns) {
		// std::set iteration is already sorted
		json original = json::array();
		for (auto &source : entry.second) {
			original.push_back(source.ToString());
		}
		columns.push_back({{"column", entry.first}, {"originalColumns", original}});
	}
	j = json {{"inputTables", inputs}, {"outputTables", outputs}, {"columnLineage", columns}};
}

} // namespace column_lineage
