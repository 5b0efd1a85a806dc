#include "notetrack/pipeline/aggregation_result.hpp"

#include <stdexcept>

namespace notetrack::pipeline {

std::string toString(AggregationErrorCode code) {
	switch (code) {
	case AggregationErrorCode::NoMatchingDocuments:
		return "NoMatchingDocuments";
	case AggregationErrorCode::InvalidDateRange:
		return "InvalidDateRange";
	case AggregationErrorCode::InvalidQuery:
		return "InvalidQuery";
	default:
		return "Unknown";
	}
}

const core::Dataset &AggregationOutput::datasetFor(int query_id) const {
	for (const auto &dataset : datasets) {
		if (dataset.queryId() == query_id) {
			return dataset;
		}
	}
	throw std::out_of_range("No dataset for query #" + std::to_string(query_id) + ".");
}

const AggregationOutput &AggregationResult::value() const {
	if (const auto *output = std::get_if<AggregationOutput>(&state_)) {
		return *output;
	}
	throw std::logic_error("Aggregation failed: " + std::get<AggregationError>(state_).message);
}

const AggregationError &AggregationResult::error() const {
	if (const auto *error = std::get_if<AggregationError>(&state_)) {
		return *error;
	}
	throw std::logic_error("Aggregation succeeded; there is no error.");
}

} // namespace notetrack::pipeline
