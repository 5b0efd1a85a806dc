#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/document_fixtures.hpp"
#include "notetrack/sources/frontmatter_reader.hpp"

using namespace notetrack::sources;
using tests::helpers::frontMatterNote;

TEST_CASE("Front matter requires an opening fence on the first line", "[sources][frontmatter]") {
	REQUIRE_FALSE(readFrontMatter("").has_value());
	REQUIRE_FALSE(readFrontMatter("# Title\n---\nweight: 70\n---\n").has_value());
	REQUIRE_FALSE(readFrontMatter("---\nweight: 70\n").has_value());
	REQUIRE(readFrontMatter("---\n---\nbody")->empty());
}

TEST_CASE("Front matter scalars keep their types", "[sources][frontmatter]") {
	const auto fm = readFrontMatter(frontMatterNote("weight: 72.5\n"
	                                                "steps: 8000 # walked\n"
	                                                "bedtime: 23:15\n"
	                                                "mood: \"great # really\"\n"
	                                                "note: 'single'\n"
	                                                "done: true\n"
	                                                "skipped: False\n"
	                                                "empty:\n"
	                                                "tilde: ~\n"
	                                                "bp: 120/80",
	                                                "Body text"));
	REQUIRE(fm.has_value());
	REQUIRE(fm->at("weight").asNumber() == Catch::Approx(72.5));
	REQUIRE(fm->at("steps").asNumber() == Catch::Approx(8000.0));
	REQUIRE(fm->at("bedtime").asString() == "23:15");
	REQUIRE(fm->at("mood").asString() == "great # really");
	REQUIRE(fm->at("note").asString() == "single");
	REQUIRE(fm->at("done").asBoolean());
	REQUIRE_FALSE(fm->at("skipped").asBoolean());
	REQUIRE(fm->at("empty").isNull());
	REQUIRE(fm->at("tilde").isNull());
	REQUIRE(fm->at("bp").asString() == "120/80");
}

TEST_CASE("Front matter reads flow and block lists", "[sources][frontmatter]") {
	const auto fm = readFrontMatter(frontMatterNote("tags: [exercise, diary]\n"
	                                                "laps:\n"
	                                                "  - 3\n"
	                                                "  - 5\n"
	                                                "after: 1"));
	REQUIRE(fm.has_value());

	const auto &tags = fm->at("tags").items();
	REQUIRE(tags.size() == 2);
	REQUIRE(tags[0].asString() == "exercise");
	REQUIRE(tags[1].asString() == "diary");

	const auto &laps = fm->at("laps").items();
	REQUIRE(laps.size() == 2);
	REQUIRE(laps[1].asNumber() == Catch::Approx(5.0));
	REQUIRE(fm->at("after").asNumber() == Catch::Approx(1.0));

	REQUIRE(readFrontMatter(frontMatterNote("tags: []"))->at("tags").items().empty());
}

TEST_CASE("Wiki links keep targets and skip embeds", "[sources][links]") {
	const auto links = scanWikiLinks("Went to [[Gym]] and read [[Books/Dune|Dune]].\n![[photo.png]] [[Gym]]");
	REQUIRE(links == std::vector<std::string>{"Gym", "Books/Dune", "Gym"});
	REQUIRE(scanWikiLinks("no links [[unterminated").empty());
}

TEST_CASE("Metadata combines front matter and links", "[sources][frontmatter]") {
	const auto metadata = deriveMetadata(frontMatterNote("weight: 70", "[[Gym]]"));
	REQUIRE(metadata.frontmatter.has_value());
	REQUIRE(metadata.links == std::vector<std::string>{"Gym"});

	const auto plain = deriveMetadata("just text");
	REQUIRE_FALSE(plain.frontmatter.has_value());
	REQUIRE(plain.links.empty());
}

TEST_CASE("Malformed or non-mapping front matter is ignored", "[sources][frontmatter]") {
	REQUIRE_FALSE(readFrontMatter(frontMatterNote("weight: [70, 71")).has_value());
	REQUIRE_FALSE(readFrontMatter(frontMatterNote("- just\n- a list")).has_value());

	const auto nested = readFrontMatter(frontMatterNote("health:\n  weight: 70\nsteps: 100"));
	REQUIRE(nested.has_value());
	REQUIRE(nested->at("health").isNull());
	REQUIRE(nested->at("steps").asNumber() == Catch::Approx(100.0));
}

TEST_CASE("Quoted numbers stay strings", "[sources][frontmatter]") {
	const auto fm = readFrontMatter(frontMatterNote("sleep: \"1.5\"\nzip: '01234'"));
	REQUIRE(fm->at("sleep").asString() == "1.5");
	REQUIRE(fm->at("zip").asString() == "01234");
}
