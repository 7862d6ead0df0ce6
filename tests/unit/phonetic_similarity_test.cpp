#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "vigil/text/phonetic.hpp"
#include "vigil/text/similarity.hpp"

using Catch::Matchers::WithinAbs;
using namespace vigil::text;

TEST_CASE("soundex reference codes", "[text][phonetic]") {
    REQUIRE(soundex("robert") == "R163");
    REQUIRE(soundex("rupert") == "R163");
    REQUIRE(soundex("ashcraft") == "A261");
    REQUIRE(soundex("tymczak") == "T522");
    REQUIRE(soundex("pfister") == "P236");
    REQUIRE(soundex("petrov") == "P361");
    REQUIRE(soundex("petrof") == "P361");
    REQUIRE(soundex("lee") == "L000");
    REQUIRE(soundex("12345").empty());
}

TEST_CASE("levenshtein distance", "[text][similarity]") {
    REQUIRE(levenshtein("kitten", "sitting") == 3);
    REQUIRE(levenshtein("", "abc") == 3);
    REQUIRE(levenshtein("petrov", "petrov") == 0);
}

TEST_CASE("edit similarity is normalized by the longer string", "[text][similarity]") {
    REQUIRE_THAT(edit_similarity("petrov", "petrof"), WithinAbs(1.0 - 1.0 / 6.0, 1e-6));
    REQUIRE_THAT(edit_similarity("", ""), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(edit_similarity("abc", ""), WithinAbs(0.0, 1e-6));
}

TEST_CASE("jaro-winkler reference values", "[text][similarity]") {
    REQUIRE_THAT(jaro_winkler("martha", "marhta"), WithinAbs(0.9611, 1e-3));
    REQUIRE_THAT(jaro_winkler("dixon", "dicksonx"), WithinAbs(0.8133, 1e-3));
    REQUIRE_THAT(jaro_winkler("same", "same"), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(jaro_winkler("abc", "xyz"), WithinAbs(0.0, 1e-6));
}
