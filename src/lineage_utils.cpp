//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_utils.cpp
// Description: Implementation of hashing, id generation and job naming helpers.
//===----------------------------------------------------------------------===//

#include "lineage_utils.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <stdexcept>
#include <vector>

namespace column_lineage {

static std::string HexEncode(const unsigned char *bytes, size_t count) {
	static const char DIGITS[] = "0123456789abcdef";
	std::string result;
	result.reserve(count * 2);
	for (size_t i = 0; i < count; i++) {
		result += DIGITS[bytes[i] >> 4];
		result += DIGITS[bytes[i] & 0x0F];
	}
	return result;
}

std::string CalculateSHA256(const std::string &str) {
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int length = 0;
	if (EVP_Digest(str.data(), str.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("SHA-256 digest failed");
	}
	return HexEncode(digest, length);
}

std::string GenerateUUID() {
	static std::mutex generator_lock;
	static std::mt19937_64 generator {std::random_device {}()};

	uint64_t millis = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
	                                            std::chrono::system_clock::now().time_since_epoch())
	                                            .count());
	unsigned char bytes[16];
	{
		std::lock_guard<std::mutex> guard(generator_lock);
		uint64_t high = generator();
		uint64_t low = generator();
		for (int i = 0; i < 8; i++) {
			bytes[i] = static_cast<unsigned char>(high >> (8 * i));
			bytes[8 + i] = static_cast<unsigned char>(low >> (8 * i));
		}
	}
	// 48-bit big-endian timestamp, then version 7 and variant 0b10
	for (int i = 0; i < 6; i++) {
		bytes[i] = static_cast<unsigned char>(millis >> (8 * (5 - i)));
	}
	bytes[6] = static_cast<unsigned char>(0x70 | (bytes[6] & 0x0F));
	bytes[8] = static_cast<unsigned char>(0x80 | (bytes[8] & 0x3F));

	auto hex = HexEncode(bytes, sizeof(bytes));
	return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
	       hex.substr(20);
}

std::string GetCurrentISOTime() {
	auto result = duckdb::Timestamp::ToString(duckdb::Timestamp::GetCurrentTimestamp());
	std::replace(result.begin(), result.end(), ' ', 'T');
	return result + "Z";
}

static bool IsNameSeparator(char c) {
	return std::string("_- .,;/").find(c) != std::string::npos;
}

std::string SanitizeJobNamePart(const std::string &str) {
	std::string result;
	bool pending_separator = false;
	for (char c : str) {
		if (std::isalnum(static_cast<unsigned char>(c))) {
			if (pending_separator && !result.empty()) {
				result += '_';
			}
			pending_separator = false;
			result += c;
		} else if (IsNameSeparator(c)) {
			pending_separator = true;
		}
	}
	return result;
}

std::string InferStatementType(const duckdb::LogicalOperator &plan) {
	using duckdb::LogicalOperatorType;

	switch (plan.type) {
	case LogicalOperatorType::LOGICAL_INSERT:
		return "INSERT";
	case LogicalOperatorType::LOGICAL_DELETE:
		return "DELETE";
	case LogicalOperatorType::LOGICAL_UPDATE:
		return "UPDATE";
	case LogicalOperatorType::LOGICAL_MERGE_INTO:
		return "MERGE";
	case LogicalOperatorType::LOGICAL_CREATE_TABLE:
		return "CREATE_TABLE";
	case LogicalOperatorType::LOGICAL_CREATE_VIEW:
		return "CREATE_VIEW";
	case LogicalOperatorType::LOGICAL_COPY_TO_FILE:
		return "COPY";
	case LogicalOperatorType::LOGICAL_EXPLAIN:
		return "EXPLAIN";
	default:
		break;
	}
	// A write may sit below a projection of its returned rows
	for (const auto &child : plan.children) {
		if (child->type == LogicalOperatorType::LOGICAL_INSERT ||
		    child->type == LogicalOperatorType::LOGICAL_CREATE_TABLE) {
			return InferStatementType(*child);
		}
	}
	return "SELECT";
}

std::string GenerateJobName(const std::string &statement_type, const Lineage &lineage, const std::string &query,
                            size_t max_length) {
	static const size_t MAX_TABLES = 3;
	// Identical queries map to the same job
	auto suffix = "_" + CalculateSHA256(query).substr(0, 8);
	size_t prefix_limit = max_length > suffix.size() ? max_length - suffix.size() : 0;

	std::vector<QualifiedName> tables(lineage.targets);
	tables.insert(tables.end(), lineage.sources.begin(), lineage.sources.end());
	if (tables.size() > MAX_TABLES) {
		tables.resize(MAX_TABLES);
	}

	auto name = SanitizeJobNamePart(statement_type);
	for (auto &table : tables) {
		auto part = SanitizeJobNamePart(table.table);
		if (part.empty()) {
			continue;
		}
		if (name.size() + 1 + part.size() > prefix_limit) {
			break;
		}
		name += "_" + part;
	}
	return name + suffix;
}

} // namespace column_lineage
