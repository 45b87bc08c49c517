/// @file test_similarity_matcher.cpp
/// @brief Unit tests for almanac::imagery::SimilarityMatcher and the text helpers it relies on.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "imagery/image_record.hpp"
#include "imagery/similarity_matcher.hpp"
#include "imagery/text.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace almanac;
using namespace almanac::imagery;

namespace
{
    ImageRecord record_with(std::optional<std::string> title_query,
                            std::vector<std::string> tags = {},
                            std::optional<std::string> location_query = std::nullopt)
    {
        ImageRecord r;
        r.id = "rec";
        r.title_query = std::move(title_query);
        r.tags = std::move(tags);
        r.location_query = std::move(location_query);
        return r;
    }
}

// =================================================================
// Text helpers
// =================================================================

TEST_CASE("splitWords lower-cases and drops empty tokens")
{
    const auto words = splitWords("  Team   MEETING\tNow ");
    REQUIRE(words.size() == 3);
    CHECK(words[0] == "team");
    CHECK(words[1] == "meeting");
    CHECK(words[2] == "now");
}

TEST_CASE("splitOn treats every delimiter character separately")
{
    const auto parts = splitOn("San Francisco, CA", ", ");
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "San");
    CHECK(parts[2] == "CA");
}

TEST_CASE("overlapsIgnoreCase is symmetric containment")
{
    CHECK(overlapsIgnoreCase("New York", "new york, ny"));
    CHECK(overlapsIgnoreCase("new york, ny", "NEW YORK"));
    CHECK_FALSE(overlapsIgnoreCase("Boston", "New York"));
}

TEST_CASE("Blank strings overlap nothing")
{
    CHECK(isBlank(""));
    CHECK(isBlank(" \t "));
    CHECK_FALSE(isBlank(" a "));

    CHECK_FALSE(overlapsIgnoreCase("", "Paris"));
    CHECK_FALSE(overlapsIgnoreCase("Paris", ""));
    CHECK_FALSE(overlapsIgnoreCase("  ", "Paris"));
    CHECK_FALSE(overlapsIgnoreCase("", ""));
}

// =================================================================
// Resolution profile
// =================================================================

TEST_CASE("Exact title match scores 3.0")
{
    CHECK(SimilarityMatcher::score(record_with("Team Meeting"), "team meeting", std::nullopt)
          == doctest::Approx(3.0));
}

TEST_CASE("Title containment in either direction scores 2.0")
{
    CHECK(SimilarityMatcher::score(record_with("weekly team meeting"), "Team Meeting", std::nullopt)
          == doctest::Approx(2.0));
    CHECK(SimilarityMatcher::score(record_with("meeting"), "Team Meeting", std::nullopt)
          == doctest::Approx(2.0));
}

TEST_CASE("Matching title and location clear the auto-accept threshold")
{
    const auto r = record_with("birthday party", {}, "New York");
    const f64 s = SimilarityMatcher::score(r, std::vector<std::string>{"birthday", "party"}, std::string("New York"));
    CHECK(s == doctest::Approx(4.0));
    CHECK(s >= SimilarityMatcher::kAutoAcceptScore);
}

TEST_CASE("Otherwise each shared word scores 0.5")
{
    CHECK(SimilarityMatcher::score(record_with("team lunch"), "team meeting", std::nullopt)
          == doctest::Approx(0.5));
    CHECK(SimilarityMatcher::score(record_with("garden party"), "team meeting", std::nullopt)
          == doctest::Approx(0.0));
}

TEST_CASE("Tags and location add independent contributions")
{
    const auto r = record_with(std::nullopt, {"Meeting", "office"}, "New York, NY");

    CHECK(SimilarityMatcher::score(r, "team meeting", std::nullopt) == doctest::Approx(0.3));
    CHECK(SimilarityMatcher::score(r, "team meeting", std::string("new york")) == doctest::Approx(1.3));
    CHECK(SimilarityMatcher::score(r, "lunch", std::string("Boston")) == doctest::Approx(0.0));
}

TEST_CASE("Score does not depend on tag order")
{
    const auto a = record_with("offsite", {"team", "meeting", "office"});
    const auto b = record_with("offsite", {"office", "meeting", "team"});

    CHECK(SimilarityMatcher::score(a, "team meeting", std::nullopt)
          == doctest::Approx(SimilarityMatcher::score(b, "team meeting", std::nullopt)));
}

TEST_CASE("An empty title contributes nothing")
{
    const auto r = record_with("anything", {}, "Paris");
    CHECK(SimilarityMatcher::score(r, "", std::nullopt) == doctest::Approx(0.0));
    CHECK(SimilarityMatcher::score(r, "   ", std::string("Paris")) == doctest::Approx(1.0));
}

TEST_CASE("A blank event location earns no location bonus")
{
    const auto r = record_with("team lunch", {}, "Paris");

    // One shared word only: stays below auto-accept
    const f64 s = SimilarityMatcher::score(r, "team meeting", std::string(""));
    CHECK(s == doctest::Approx(0.5));
    CHECK(s < SimilarityMatcher::kAutoAcceptScore);
    CHECK(SimilarityMatcher::score(r, "team meeting", std::string("   ")) == doctest::Approx(0.5));
}

TEST_CASE("Blank tags and a blank stored title score nothing")
{
    CHECK(SimilarityMatcher::score(record_with("physio", {""}), "dentist appointment today", std::nullopt)
          == doctest::Approx(0.0));
    CHECK(SimilarityMatcher::score(record_with("physio", {" ", "dentist"}), "dentist appointment", std::nullopt)
          == doctest::Approx(0.3));
    CHECK(SimilarityMatcher::score(record_with(""), "team meeting", std::nullopt) == doctest::Approx(0.0));
    CHECK(SimilarityMatcher::score(record_with("", {""}), "team meeting", std::nullopt, kBrowsingProfile)
          == doctest::Approx(0.0));
}

// =================================================================
// Browsing profile
// =================================================================

TEST_CASE("Browsing profile counts words, tags and location differently")
{
    const auto r = record_with("team meeting room", {"meeting"}, "Berlin");

    // 2 words found (+2.0), one tag overlap (+0.5), location (+2.0)
    CHECK(SimilarityMatcher::score(r, "team meeting", std::string("berlin"), kBrowsingProfile)
          == doctest::Approx(4.5));
}

TEST_CASE("rank sorts by descending score and truncates")
{
    std::vector<ImageRecord> records;
    records.push_back(record_with("garden"));
    records.back().id = "none";
    records.push_back(record_with("team lunch"));
    records.back().id = "partial";
    records.push_back(record_with("team meeting"));
    records.back().id = "best";
    records.push_back(record_with("yoga"));
    records.back().id = "none2";

    const auto ranked = SimilarityMatcher::rank(records, "team meeting", std::nullopt, kBrowsingProfile, 3);
    REQUIRE(ranked.size() == 3);
    CHECK(ranked[0].id == "best");
    CHECK(ranked[1].id == "partial");
    // Ties keep input order
    CHECK(ranked[2].id == "none");
}
