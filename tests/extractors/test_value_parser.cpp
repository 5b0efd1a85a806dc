#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/core/document.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <clocale>
#include <cmath>
#include <string>

using namespace notetrack::extractors;
using notetrack::core::QueryBuilder;
using notetrack::core::SearchType;

TEST_CASE("Leading float parsing stops at the first stray character", "[extractors][value]") {
	REQUIRE(*parseLeadingFloat("  3.5kg") == Catch::Approx(3.5));
	REQUIRE(*parseLeadingFloat("-2") == Catch::Approx(-2.0));
	REQUIRE(*parseLeadingFloat("+.5") == Catch::Approx(0.5));
	REQUIRE(*parseLeadingFloat("5.") == Catch::Approx(5.0));
	REQUIRE(*parseLeadingFloat("1e3") == Catch::Approx(1000.0));
	REQUIRE(*parseLeadingFloat("1e") == Catch::Approx(1.0));
	REQUIRE(*parseLeadingFloat("120/80") == Catch::Approx(120.0));
	REQUIRE(std::isinf(*parseLeadingFloat("Infinity")));
	REQUIRE_FALSE(parseLeadingFloat("abc").has_value());
	REQUIRE_FALSE(parseLeadingFloat("-").has_value());
	REQUIRE_FALSE(parseLeadingFloat(".").has_value());
	REQUIRE_FALSE(parseLeadingFloat("").has_value());
}

TEST_CASE("Clock times become seconds since midnight", "[extractors][value][time]") {
	const auto time = parseTimeOrNumber("01:30");
	REQUIRE(time.has_value());
	REQUIRE(time->value == Catch::Approx(5400.0));
	REQUIRE(time->time_value);

	const auto number = parseTimeOrNumber("1.5");
	REQUIRE(number.has_value());
	REQUIRE(number->value == Catch::Approx(1.5));
	REQUIRE_FALSE(number->time_value);

	const auto padded = parseTimeOrNumber("  7:45 pm ");
	REQUIRE(padded->value == Catch::Approx(19 * 3600 + 45 * 60));

	const auto not_a_time = parseTimeOrNumber("12:75");
	REQUIRE(not_a_time.has_value());
	REQUIRE(not_a_time->value == Catch::Approx(12.0));
	REQUIRE_FALSE(not_a_time->time_value);

	REQUIRE_FALSE(parseTimeOrNumber("great").has_value());
}

TEST_CASE("Accumulator sums constants and attached values", "[extractors][value][accumulator]") {
	const auto query = QueryBuilder().withSearchType(SearchType::Tag).withTarget("run").withConstValue(2.0).build();
	ValueAccumulator accumulator(query);
	REQUIRE_FALSE(accumulator.result().has_value());

	accumulator.addConstant();
	accumulator.addAttached("3.5");
	const auto result = accumulator.result();
	REQUIRE(result.has_value());
	REQUIRE(*result->value == Catch::Approx(5.5));
	REQUIRE_FALSE(result->time_value);
}

TEST_CASE("Accumulator selects the accessor among several values", "[extractors][value][accumulator]") {
	const auto diastolic = QueryBuilder().withSearchType(SearchType::Tag).withTarget("bp[1]").build();
	ValueAccumulator accumulator(diastolic);
	accumulator.addAttached("120/80");
	REQUIRE(*accumulator.result()->value == Catch::Approx(80.0));

	const auto third = QueryBuilder().withSearchType(SearchType::Tag).withTarget("bp[2]").build();
	ValueAccumulator out_of_range(third);
	out_of_range.addAttached("120/80");
	REQUIRE(out_of_range.matched());
	REQUIRE_FALSE(out_of_range.hasValue());
	REQUIRE_FALSE(out_of_range.result()->value.has_value());
}

TEST_CASE("Accumulator drops zeros when asked", "[extractors][value][accumulator]") {
	const auto query = QueryBuilder().withSearchType(SearchType::Tag).withTarget("run").ignoreZeroValue().build();
	ValueAccumulator accumulator(query);
	accumulator.addAttached("0");
	REQUIRE(accumulator.matched());
	REQUIRE_FALSE(accumulator.result()->value.has_value());

	accumulator.addAttached("4");
	REQUIRE(*accumulator.result()->value == Catch::Approx(4.0));
}

TEST_CASE("Accumulator flags clock-time contributions", "[extractors][value][time]") {
	const auto query = QueryBuilder().withSearchType(SearchType::DataviewField).withTarget("bedtime").build();
	ValueAccumulator accumulator(query);
	accumulator.addAttached("23:30");
	const auto result = accumulator.result();
	REQUIRE(result->time_value);
	REQUIRE(*result->value == Catch::Approx(23 * 3600 + 30 * 60));
}

namespace {

/// Switches LC_NUMERIC to a comma-decimal locale when one is installed.
class CommaDecimalLocale {
public:
	CommaDecimalLocale() : previous_(std::setlocale(LC_NUMERIC, nullptr)) {
		for (const char *name : {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8", "nl_NL.UTF-8"}) {
			if (std::setlocale(LC_NUMERIC, name) != nullptr) {
				break;
			}
		}
	}
	~CommaDecimalLocale() {
		std::setlocale(LC_NUMERIC, previous_.c_str());
	}

private:
	std::string previous_;
};

} // namespace

TEST_CASE("Float parsing ignores the numeric locale", "[extractors][value]") {
	const CommaDecimalLocale locale;
	REQUIRE(*parseLeadingFloat("1.5") == Catch::Approx(1.5));
	REQUIRE(*parseLeadingFloat("-72.25kg") == Catch::Approx(-72.25));
	REQUIRE(*parseLeadingFloat("2.5e2") == Catch::Approx(250.0));
	REQUIRE(parseTimeOrNumber("0.75")->value == Catch::Approx(0.75));
	REQUIRE(notetrack::core::FrontMatterValue::number(0.1).toString() == "0.1");
}

TEST_CASE("Float parsing saturates out-of-range exponents", "[extractors][value]") {
	REQUIRE(std::isinf(*parseLeadingFloat("1e999")));
	REQUIRE(*parseLeadingFloat("-1e999") < 0.0);
	REQUIRE(*parseLeadingFloat("1e-999") == Catch::Approx(0.0));
}
