#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/pipeline/date_range.hpp"

#include <stdexcept>

using namespace notetrack::pipeline;
using notetrack::core::DateWindow;
using tests::helpers::ymd;

namespace {

DateRangeTracker trackerOver(const notetrack::core::Date &a, const notetrack::core::Date &b) {
	DateRangeTracker tracker;
	tracker.observe(a);
	tracker.observe(b);
	return tracker;
}

} // namespace

TEST_CASE("Tracker follows the earliest and latest dates", "[pipeline][range]") {
	DateRangeTracker tracker;
	REQUIRE_FALSE(tracker.valid());
	REQUIRE_THROWS_AS(tracker.min(), std::logic_error);

	tracker.observe(ymd(2021, 1, 5));
	REQUIRE(tracker.valid());
	REQUIRE(tracker.min() == ymd(2021, 1, 5));
	REQUIRE(tracker.max() == ymd(2021, 1, 5));

	tracker.observe(ymd(2021, 1, 2));
	tracker.observe(ymd(2021, 1, 9));
	tracker.observe(ymd(2021, 1, 7));
	REQUIRE(tracker.min() == ymd(2021, 1, 2));
	REQUIRE(tracker.max() == ymd(2021, 1, 9));
}

TEST_CASE("Resolver fails without accepted notes", "[pipeline][range]") {
	const auto result = DateRangeResolver(std::nullopt, std::nullopt).resolve(trackerOver(ymd(2021, 1, 1), ymd(2021, 1, 2)), 0);
	const auto *error = std::get_if<AggregationError>(&result);
	REQUIRE(error != nullptr);
	REQUIRE(error->code == AggregationErrorCode::NoMatchingDocuments);
	REQUIRE(error->message == "No notes found in the date range.");
}

TEST_CASE("Resolver fails without observed dates", "[pipeline][range]") {
	const auto result = DateRangeResolver(std::nullopt, std::nullopt).resolve(DateRangeTracker{}, 1);
	const auto *error = std::get_if<AggregationError>(&result);
	REQUIRE(error != nullptr);
	REQUIRE(error->code == AggregationErrorCode::InvalidDateRange);
	REQUIRE(error->message == "Invalid date range");
}

TEST_CASE("Resolver infers the window from observed dates", "[pipeline][range]") {
	const auto tracker = trackerOver(ymd(2021, 1, 1), ymd(2021, 1, 16));
	const auto result = DateRangeResolver(std::nullopt, std::nullopt).resolve(tracker, 2);
	const auto &window = std::get<DateWindow>(result);
	REQUIRE(window.start == ymd(2021, 1, 1));
	REQUIRE(window.end == ymd(2021, 1, 16));
	REQUIRE(window.days() == 16);
}

TEST_CASE("Resolver completes one-sided bounds", "[pipeline][range]") {
	const auto tracker = trackerOver(ymd(2021, 1, 1), ymd(2021, 1, 16));

	const auto from_start = DateRangeResolver(ymd(2021, 1, 10), std::nullopt).resolve(tracker, 2);
	REQUIRE(std::get<DateWindow>(from_start) == DateWindow::between(ymd(2021, 1, 10), ymd(2021, 1, 16)));

	const auto until_end = DateRangeResolver(std::nullopt, ymd(2021, 1, 5)).resolve(tracker, 2);
	REQUIRE(std::get<DateWindow>(until_end) == DateWindow::between(ymd(2021, 1, 1), ymd(2021, 1, 5)));

	REQUIRE(std::holds_alternative<AggregationError>(DateRangeResolver(ymd(2021, 1, 16), std::nullopt).resolve(tracker, 2)));
	REQUIRE(std::holds_alternative<AggregationError>(DateRangeResolver(std::nullopt, ymd(2021, 1, 1)).resolve(tracker, 2)));
}

TEST_CASE("Resolver checks two-sided bounds", "[pipeline][range]") {
	const auto tracker = trackerOver(ymd(2021, 1, 10), ymd(2021, 1, 20));

	const auto wider = DateRangeResolver(ymd(2021, 1, 1), ymd(2021, 1, 31)).resolve(tracker, 2);
	REQUIRE(std::get<DateWindow>(wider).days() == 31);

	const auto reversed = DateRangeResolver(ymd(2021, 1, 15), ymd(2021, 1, 12)).resolve(tracker, 2);
	REQUIRE(std::get<AggregationError>(reversed).code == AggregationErrorCode::InvalidDateRange);

	REQUIRE(std::holds_alternative<AggregationError>(
	    DateRangeResolver(ymd(2021, 1, 1), ymd(2021, 1, 5)).resolve(tracker, 2)));
	REQUIRE(std::holds_alternative<AggregationError>(
	    DateRangeResolver(ymd(2021, 2, 1), ymd(2021, 2, 5)).resolve(tracker, 2)));
	REQUIRE(std::holds_alternative<DateWindow>(
	    DateRangeResolver(ymd(2021, 1, 5), ymd(2021, 1, 10)).resolve(tracker, 2)));
}

TEST_CASE("Resolver reports bounds that miss every dated note", "[pipeline][range]") {
	const auto result =
	    DateRangeResolver(ymd(2023, 6, 1), ymd(2023, 6, 10)).resolve(DateRangeTracker{}, 0, 31);
	const auto *error = std::get_if<AggregationError>(&result);
	REQUIRE(error != nullptr);
	REQUIRE(error->code == AggregationErrorCode::InvalidDateRange);
}
