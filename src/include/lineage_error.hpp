//===----------------------------------------------------------------------===//
// Column Lineage
//
// File: lineage_error.hpp
// Description: Error kinds raised while propagating lineage and the
//              LineageResult returned across the extraction entry point.
//===----------------------------------------------------------------------===//

#pragma once

#include "lineage_types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace column_lineage {

/// @brief Kinds of lineage errors.
enum class LineageErrorType : uint8_t {
	UNRESOLVED_PLAN,      ///< The plan still contains unresolved references
	CYCLIC_DEFINITION,    ///< A view, cache or CTE references itself
	UNSUPPORTED_OPERATOR, ///< Only ever reported as a warning
	INVALID_PLAN          ///< Structural violation (arity, scope, missing target)
};

/// @brief Get the display name of an error kind.
std::string LineageErrorTypeToString(LineageErrorType type);

/// @struct LineageError
/// @brief An error or warning reported by the extractor.
struct LineageError {
	LineageErrorType type;
	std::string message;

	LineageError(LineageErrorType type, std::string message) : type(type), message(std::move(message)) {
	}

	std::string ToString() const {
		return LineageErrorTypeToString(type) + ": " + message;
	}
};

//===--------------------------------------------------------------------===//
// Exceptions
//===--------------------------------------------------------------------===//

/// @class LineageException
/// @brief Base of the exceptions thrown inside the propagation engine.
/// @note These never escape ExtractLineage; they are converted into a LineageResult.
class LineageException : public std::runtime_error {
public:
	LineageException(LineageErrorType type, const std::string &message)
	    : std::runtime_error(message), error_type(type) {
	}

	LineageErrorType GetType() const {
		return error_type;
	}

	LineageError ToError() const {
		return LineageError(error_type, what());
	}

private:
	LineageErrorType error_type;
};

class UnresolvedPlanException : public LineageException {
public:
	explicit UnresolvedPlanException(const std::string &message)
	    : LineageException(LineageErrorType::UNRESOLVED_PLAN, message) {
	}
};

class CyclicDefinitionException : public LineageException {
public:
	explicit CyclicDefinitionException(const std::string &message)
	    : LineageException(LineageErrorType::CYCLIC_DEFINITION, message) {
	}
};

class InvalidPlanException : public LineageException {
public:
	explicit InvalidPlanException(const std::string &message)
	    : LineageException(LineageErrorType::INVALID_PLAN, message) {
	}
};

//===--------------------------------------------------------------------===//
// LineageResult
//===--------------------------------------------------------------------===//

/// @class LineageResult
/// @brief Either a Lineage record or the error that stopped extraction.
///
/// Warnings (fallback applications of the unsupported-operator rule) are attached
/// to successful results only.
class LineageResult {
public:
	explicit LineageResult(Lineage lineage, std::vector<LineageError> warnings = std::vector<LineageError>())
	    : lineage(std::move(lineage)), warnings(std::move(warnings)), has_error(false),
	      error(LineageErrorType::INVALID_PLAN, "") {
	}

	explicit LineageResult(LineageError error) : has_error(true), error(std::move(error)) {
	}

	bool HasError() const {
		return has_error;
	}

	/// @throws std::logic_error if the extraction succeeded.
	const LineageError &GetError() const;

	/// @throws std::logic_error if the extraction failed.
	const Lineage &GetLineage() const;

	const std::vector<LineageError> &GetWarnings() const {
		return warnings;
	}

private:
	Lineage lineage;
	std::vector<LineageError> warnings;
	bool has_error;
	LineageError error;
};

} // namespace column_lineage
