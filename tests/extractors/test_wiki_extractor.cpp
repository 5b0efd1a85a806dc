#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/extractors/wiki_extractor.hpp"

using notetrack::core::QueryBuilder;
using notetrack::core::SearchType;
using notetrack::extractors::extractWikiLinks;

TEST_CASE("Wiki links are counted per exact target", "[extractors][wiki]") {
	const std::vector<std::string> links{"Gym", "Reading", "Gym", "Gym Log"};

	const auto gym = extractWikiLinks(links, tests::helpers::makeQuery(0, SearchType::Wiki, "Gym"));
	REQUIRE(gym.has_value());
	REQUIRE(*gym->value == Catch::Approx(2.0));

	const auto weighted = QueryBuilder().withSearchType(SearchType::Wiki).withTarget("Reading").withConstValue(0.5).build();
	REQUIRE(*extractWikiLinks(links, weighted)->value == Catch::Approx(0.5));

	REQUIRE_FALSE(extractWikiLinks(links, tests::helpers::makeQuery(0, SearchType::Wiki, "gym")).has_value());
	REQUIRE_FALSE(extractWikiLinks({}, tests::helpers::makeQuery(0, SearchType::Wiki, "Gym")).has_value());
}
