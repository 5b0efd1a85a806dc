#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/extractors/frontmatter_extractor.hpp"

using namespace notetrack::extractors;
using notetrack::core::FrontMatter;
using notetrack::core::FrontMatterValue;
using notetrack::core::QueryBuilder;
using notetrack::core::SearchType;
using tests::helpers::makeQuery;

namespace {

FrontMatter sampleFrontMatter() {
	FrontMatter fm;
	fm["weight"] = FrontMatterValue::number(72.5);
	fm["bedtime"] = FrontMatterValue::string("23:15");
	fm["mood"] = FrontMatterValue::string("great");
	fm["done"] = FrontMatterValue::boolean(true);
	fm["rest"] = FrontMatterValue::number(0);
	fm["empty"] = FrontMatterValue();
	fm["bp"] = FrontMatterValue::string("120/80");
	fm["laps"] = FrontMatterValue::list({FrontMatterValue::number(3), FrontMatterValue::number(5)});
	fm["tags"] = FrontMatterValue::list({FrontMatterValue::string("exercise/run"), FrontMatterValue::string("diary")});
	return fm;
}

} // namespace

TEST_CASE("Front-matter keys yield numbers and times", "[extractors][frontmatter]") {
	const auto fm = sampleFrontMatter();

	const auto weight = extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "weight"));
	REQUIRE(weight.has_value());
	REQUIRE(*weight->value == Catch::Approx(72.5));
	REQUIRE_FALSE(weight->time_value);

	const auto bedtime = extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "bedtime"));
	REQUIRE(*bedtime->value == Catch::Approx(23 * 3600 + 15 * 60));
	REQUIRE(bedtime->time_value);

	const auto rest = extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "rest"));
	REQUIRE(rest.has_value());
	REQUIRE(*rest->value == Catch::Approx(0.0));
}

TEST_CASE("Front-matter keys without a usable number yield nothing", "[extractors][frontmatter]") {
	const auto fm = sampleFrontMatter();
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "mood")).has_value());
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "done")).has_value());
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "empty")).has_value());
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "missing")).has_value());
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "laps")).has_value());
}

TEST_CASE("Front-matter accessors pick one element", "[extractors][frontmatter]") {
	const auto fm = sampleFrontMatter();
	REQUIRE(*extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "bp[0]"))->value == Catch::Approx(120));
	REQUIRE(*extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "bp[1]"))->value == Catch::Approx(80));
	REQUIRE(*extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "laps[1]"))->value == Catch::Approx(5));
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "bp[2]")).has_value());
	REQUIRE_FALSE(extractFrontMatterKey(fm, makeQuery(0, SearchType::Frontmatter, "weight[0]")).has_value());

	const auto custom =
	    QueryBuilder().withSearchType(SearchType::Frontmatter).withTarget("bp[1]").withSeparator("-").build();
	REQUIRE_FALSE(extractFrontMatterKey(fm, custom).has_value());
}

TEST_CASE("Front-matter values split into tokens", "[extractors][frontmatter]") {
	REQUIRE(*splitFrontMatterValue(FrontMatterValue::string("1,2/3"), "/") == std::vector<std::string>{"1", "2/3"});
	REQUIRE(*splitFrontMatterValue(FrontMatterValue::string("1/2"), "/") == std::vector<std::string>{"1", "2"});
	REQUIRE(*splitFrontMatterValue(FrontMatterValue::list({FrontMatterValue::number(4)}), "/") ==
	        std::vector<std::string>{"4"});
	REQUIRE_FALSE(splitFrontMatterValue(FrontMatterValue::number(4), "/").has_value());
}

TEST_CASE("Front-matter tags count matches and nested tags", "[extractors][frontmatter][tag]") {
	const auto fm = sampleFrontMatter();

	const auto exercise = extractFrontMatterTags(fm, makeQuery(0, SearchType::Tag, "exercise"));
	REQUIRE(exercise.has_value());
	REQUIRE(*exercise->value == Catch::Approx(1.0));

	const auto weighted =
	    QueryBuilder().withSearchType(SearchType::Tag).withTarget("diary").withConstValue(3.0).build();
	REQUIRE(*extractFrontMatterTags(fm, weighted)->value == Catch::Approx(3.0));

	REQUIRE_FALSE(extractFrontMatterTags(fm, makeQuery(0, SearchType::Tag, "exer")).has_value());

	FrontMatter scalar;
	scalar["tags"] = FrontMatterValue::string("exercise");
	REQUIRE(extractFrontMatterTags(scalar, makeQuery(0, SearchType::Tag, "exercise")).has_value());
	REQUIRE_FALSE(extractFrontMatterTags(FrontMatter{}, makeQuery(0, SearchType::Tag, "exercise")).has_value());
}
