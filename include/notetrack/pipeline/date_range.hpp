#pragma once

#include "notetrack/core/dataset.hpp"
#include "notetrack/core/date.hpp"
#include "notetrack/pipeline/aggregation_result.hpp"

#include <cstddef>
#include <optional>
#include <variant>

namespace notetrack::pipeline {

/**
 * @class DateRangeTracker
 * @brief Running minimum and maximum of the dates seen during a run.
 */
class DateRangeTracker {
public:
	void observe(const core::Date &date);

	/// True once at least one date was observed.
	bool valid() const {
		return min_.has_value();
	}

	/// Earliest observed date; throws std::logic_error before the first observation.
	const core::Date &min() const;

	/// Latest observed date; throws std::logic_error before the first observation.
	const core::Date &max() const;

private:
	std::optional<core::Date> min_;
	std::optional<core::Date> max_;
};

/**
 * @class DateRangeResolver
 * @brief Combines the configured bounds with the observed range into the output window.
 *
 * A lone start bound must lie strictly before the latest observed date, a lone
 * end bound strictly after the earliest. With both bounds set, the window is
 * taken as given unless it is reversed or lies entirely outside the observed
 * range.
 *
 * When no note was accepted the run fails: with InvalidDateRange if dated
 * notes existed but all fell outside the configured bounds, otherwise with
 * NoMatchingDocuments.
 */
class DateRangeResolver {
public:
	DateRangeResolver(std::optional<core::Date> start, std::optional<core::Date> end)
	    : start_(start), end_(end) {}

	std::variant<core::DateWindow, AggregationError> resolve(const DateRangeTracker &tracker,
	                                                         std::size_t accepted_sources,
	                                                         std::size_t out_of_bounds_sources = 0) const;

private:
	std::optional<core::Date> start_;
	std::optional<core::Date> end_;
};

} // namespace notetrack::pipeline
