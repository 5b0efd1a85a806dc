#pragma once

#include "notetrack/core/dataset.hpp"

#include <string>
#include <variant>
#include <vector>

namespace notetrack::pipeline {

enum class AggregationErrorCode {
	NoMatchingDocuments,
	InvalidDateRange,
	InvalidQuery,
};

std::string toString(AggregationErrorCode code);

/**
 * @struct AggregationError
 * @brief A run-level failure reported to the caller instead of datasets.
 */
struct AggregationError {
	AggregationErrorCode code = AggregationErrorCode::NoMatchingDocuments;
	std::string message;
};

/**
 * @struct AggregationOutput
 * @brief The resolved window and one dataset per query, in query order.
 */
struct AggregationOutput {
	core::DateWindow window;
	std::vector<core::Dataset> datasets;

	/// Dataset of the query with @p query_id; throws std::out_of_range if none.
	const core::Dataset &datasetFor(int query_id) const;
};

/**
 * @class AggregationResult
 * @brief Either the output of a successful run or the error that stopped it.
 */
class AggregationResult {
public:
	AggregationResult(AggregationOutput output) : state_(std::move(output)) {}
	AggregationResult(AggregationError error) : state_(std::move(error)) {}

	bool ok() const {
		return std::holds_alternative<AggregationOutput>(state_);
	}

	explicit operator bool() const {
		return ok();
	}

	/**
	 * @brief The output of a successful run.
	 * @throws std::logic_error If the run failed.
	 */
	const AggregationOutput &value() const;

	/**
	 * @brief The error of a failed run.
	 * @throws std::logic_error If the run succeeded.
	 */
	const AggregationError &error() const;

private:
	std::variant<AggregationOutput, AggregationError> state_;
};

} // namespace notetrack::pipeline
