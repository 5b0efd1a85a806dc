#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "notetrack/core/document.hpp"

#include <stdexcept>

using notetrack::core::DocumentHandle;
using notetrack::core::FrontMatterValue;

TEST_CASE("Front-matter values report their kind", "[core][document]") {
	const FrontMatterValue null_value;
	REQUIRE(null_value.isNull());
	REQUIRE(null_value.toString() == "null");

	const auto flag = FrontMatterValue::boolean(true);
	REQUIRE(flag.isBoolean());
	REQUIRE(flag.asBoolean());
	REQUIRE(flag.toString() == "true");

	const auto number = FrontMatterValue::number(72.5);
	REQUIRE(number.isNumber());
	REQUIRE(number.asNumber() == Catch::Approx(72.5));

	const auto text = FrontMatterValue::string("120/80");
	REQUIRE(text.isString());
	REQUIRE(text.asString() == "120/80");

	const auto list = FrontMatterValue::list({FrontMatterValue::number(1), FrontMatterValue::string("b")});
	REQUIRE(list.isList());
	REQUIRE(list.items().size() == 2);
}

TEST_CASE("Front-matter accessors reject the wrong kind", "[core][document][validation]") {
	const auto number = FrontMatterValue::number(3);
	REQUIRE_THROWS_AS(number.asString(), std::logic_error);
	REQUIRE_THROWS_AS(number.asBoolean(), std::logic_error);
	REQUIRE_THROWS_AS(number.items(), std::logic_error);
	REQUIRE_THROWS_AS(FrontMatterValue::string("x").asNumber(), std::logic_error);
}

TEST_CASE("Front-matter values stringify like their source", "[core][document]") {
	REQUIRE(FrontMatterValue::number(42).toString() == "42");
	REQUIRE(FrontMatterValue::number(-3).toString() == "-3");
	REQUIRE(FrontMatterValue::number(0.1).toString() == "0.1");
	REQUIRE(FrontMatterValue::number(72.25).toString() == "72.25");
	REQUIRE(FrontMatterValue::list({FrontMatterValue::number(120), FrontMatterValue::number(80)}).toString() ==
	        "120,80");
}

TEST_CASE("Document handles compare by path", "[core][document]") {
	const DocumentHandle a{"diary/2021-01-01.md", "2021-01-01"};
	const DocumentHandle b{"diary/2021-01-01.md", "other"};
	const DocumentHandle c{"work/2021-01-01.md", "2021-01-01"};
	REQUIRE(a == b);
	REQUIRE_FALSE(a == c);
}
