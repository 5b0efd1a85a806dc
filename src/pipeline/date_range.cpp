#include "notetrack/pipeline/date_range.hpp"

#include <stdexcept>

namespace notetrack::pipeline {

namespace {

AggregationError invalidRange() {
	return AggregationError{AggregationErrorCode::InvalidDateRange, "Invalid date range"};
}

} // namespace

void DateRangeTracker::observe(const core::Date &date) {
	if (!min_) {
		min_ = date;
		max_ = date;
		return;
	}
	if (date < *min_) {
		min_ = date;
	}
	if (date > *max_) {
		max_ = date;
	}
}

const core::Date &DateRangeTracker::min() const {
	if (!min_) {
		throw std::logic_error("No date has been observed.");
	}
	return *min_;
}

const core::Date &DateRangeTracker::max() const {
	if (!max_) {
		throw std::logic_error("No date has been observed.");
	}
	return *max_;
}

std::variant<core::DateWindow, AggregationError> DateRangeResolver::resolve(const DateRangeTracker &tracker,
                                                                            std::size_t accepted_sources,
                                                                            std::size_t out_of_bounds_sources) const {
	if (accepted_sources == 0) {
		if (out_of_bounds_sources > 0) {
			return invalidRange();
		}
		return AggregationError{AggregationErrorCode::NoMatchingDocuments, "No notes found in the date range."};
	}
	if (!tracker.valid()) {
		return invalidRange();
	}

	const core::Date &min = tracker.min();
	const core::Date &max = tracker.max();

	if (!start_ && !end_) {
		return core::DateWindow::between(min, max);
	}
	if (start_ && !end_) {
		if (*start_ < max) {
			return core::DateWindow::between(*start_, max);
		}
		return invalidRange();
	}
	if (!start_ && end_) {
		if (*end_ > min) {
			return core::DateWindow::between(min, *end_);
		}
		return invalidRange();
	}

	if (*start_ > *end_) {
		return invalidRange();
	}
	if ((*start_ < min && *end_ < min) || (*start_ > max && *end_ > max)) {
		return invalidRange();
	}
	return core::DateWindow::between(*start_, *end_);
}

} // namespace notetrack::pipeline
