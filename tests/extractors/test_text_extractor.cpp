#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/extractors/text_extractor.hpp"
#include "notetrack/extractors/text_pattern.hpp"

#include <stdexcept>

using notetrack::core::QueryBuilder;
using notetrack::core::SearchType;
using notetrack::extractors::extractText;
using notetrack::extractors::TextPattern;
using tests::helpers::makeQuery;

TEST_CASE("Text patterns translate named groups", "[extractors][text][pattern]") {
	const TextPattern pattern("(a)(?<value>\\d+)(?:x)(?<unit>kg)?");
	REQUIRE(pattern.hasNamedGroups());
	REQUIRE(pattern.translated() == "(a)(\\d+)(?:x)(kg)?");
	REQUIRE(pattern.groupIndex("value") == std::optional<std::size_t>(2));
	REQUIRE(pattern.groupIndex("unit") == std::optional<std::size_t>(3));
	REQUIRE_FALSE(pattern.groupIndex("other").has_value());

	const TextPattern escaped("\\(?<value>[(]\\d");
	REQUIRE_FALSE(escaped.hasNamedGroups());

	const TextPattern backref("(?<word>a+)-\\k<word>");
	REQUIRE(backref.translated() == "(a+)-\\1");
	REQUIRE(backref.findAll("aa-aa a-b").size() == 1);
}

TEST_CASE("Text patterns reject invalid expressions", "[extractors][text][pattern][validation]") {
	REQUIRE_THROWS_AS(TextPattern("("), std::invalid_argument);
	REQUIRE_THROWS_AS(TextPattern(""), std::invalid_argument);
	REQUIRE_THROWS_AS(TextPattern("(?<value>a)(?<value>b)"), std::invalid_argument);
	REQUIRE_THROWS_AS(extractText("x", makeQuery(0, SearchType::Text, "[")), std::invalid_argument);
}

TEST_CASE("Text matches count without a value group", "[extractors][text]") {
	const auto result = extractText("meditated; more meditation", makeQuery(0, SearchType::Text, "meditat"));
	REQUIRE(result.has_value());
	REQUIRE(*result->value == Catch::Approx(2.0));

	REQUIRE_FALSE(extractText("nothing", makeQuery(0, SearchType::Text, "meditat")).has_value());
}

TEST_CASE("Text value groups are summed", "[extractors][text]") {
	const auto query = makeQuery(0, SearchType::Text, "(?<value>\\d+) pushups");
	const auto result = extractText("20 pushups then 15 pushups", query);
	REQUIRE(*result->value == Catch::Approx(35.0));

	const auto counted = QueryBuilder()
	                         .withSearchType(SearchType::Text)
	                         .withTarget("(?<value>\\d+) pushups")
	                         .ignoreAttachedValue()
	                         .build();
	REQUIRE(*extractText("20 pushups then 15 pushups", counted)->value == Catch::Approx(2.0));
}

TEST_CASE("Text value groups read clock times", "[extractors][text][time]") {
	const auto result = extractText("Woke up at 06:30 today", makeQuery(0, SearchType::Text, "at (?<value>\\d+:\\d+)"));
	REQUIRE(result->time_value);
	REQUIRE(*result->value == Catch::Approx(6 * 3600 + 30 * 60));
}

TEST_CASE("Text matches without a value emit nothing", "[extractors][text]") {
	REQUIRE_FALSE(extractText("x", makeQuery(0, SearchType::Text, "(?<value>\\d+)?x")).has_value());
	REQUIRE_FALSE(extractText("ran far", makeQuery(0, SearchType::Text, "ran (?<value>\\w+)")).has_value());
}

TEST_CASE("Empty text matches do not stall", "[extractors][text]") {
	const TextPattern pattern("a*");
	REQUIRE_NOTHROW(pattern.findAll("bab"));
	REQUIRE_FALSE(pattern.findAll("bab").empty());
}

TEST_CASE("Text patterns scan very long lines", "[extractors][text]") {
	const std::string note = "mood: " + std::string(200000, 'x') + "\nmood: ok\n";
	const auto result = extractText(note, makeQuery(0, SearchType::Text, "mood: .*"));
	REQUIRE(result.has_value());
	REQUIRE(*result->value == Catch::Approx(2.0));

	const TextPattern pattern("mood: (?<value>.*)");
	const auto matches = pattern.findAll(note);
	REQUIRE(matches.size() == 2);
	REQUIRE(matches[0].values->size() == 200000);
	REQUIRE(*matches[1].values == "ok");
}

TEST_CASE("Text patterns match per line", "[extractors][text][pattern]") {
	const TextPattern anchored("^steps (?<value>\\d+)$");
	const auto matches = anchored.findAll("steps 10\nwalked\nsteps 20");
	REQUIRE(matches.size() == 2);
	REQUIRE(*matches[1].values == "20");

	REQUIRE(TextPattern("a.b").findAll("a\nb").empty());
}
