#include <catch2/catch_test_macros.hpp>

#include "vigil/text/fold.hpp"
#include "vigil/text/phonetic.hpp"

using namespace vigil::text;

TEST_CASE("fold lowercases and strips punctuation", "[text][fold]") {
    REQUIRE(fold("PETROV") == "petrov");
    REQUIRE(fold("O'Brien-Smith") == "obriensmith");
    REQUIRE(fold("...").empty());
}

TEST_CASE("fold transliterates Russian and Ukrainian Cyrillic", "[text][fold]") {
    REQUIRE(fold("Петров") == "petrov");
    REQUIRE(fold("Иван") == "ivan");
    REQUIRE(fold("Щукин") == "shchukin");
    REQUIRE(fold("Олена") == "olena");
    REQUIRE(fold("Їжак") == "yizhak");
}

TEST_CASE("fold strips Latin-1 diacritics", "[text][fold]") {
    REQUIRE(fold("Petróv") == "petrov");
    REQUIRE(fold("Müller") == "muller");
    REQUIRE(fold("Straße") == "strasse");
}

TEST_CASE("fold strips Latin Extended-A diacritics", "[text][fold]") {
    REQUIRE(fold("Łukasz") == "lukasz");
    REQUIRE(fold("Ştefan") == "stefan");
    REQUIRE(fold("Ștefan") == "stefan");
    REQUIRE(fold("Žižek") == "zizek");
    REQUIRE(fold("Čapek") == "capek");
    REQUIRE(fold("Erdős") == "erdos");
    REQUIRE(fold("Œuvre") == "oeuvre");

    // Blocking keys survive the diacritic.
    REQUIRE(soundex(fold("Ştefan")) == "S315");
    REQUIRE(soundex(fold("Łukasz")) == soundex("lukasz"));
}

TEST_CASE("fold transliterates Greek", "[text][fold]") {
    REQUIRE(fold("Αλέξης") == "alexis");
    REQUIRE(fold("ΠΑΠΑΔΟΠΟΥΛΟΣ") == "papadopoylos");
}

TEST_CASE("scripts without a table fold to nothing", "[text][fold]") {
    REQUIRE(fold("محمد").empty());
}

TEST_CASE("ascii fastpath agrees with the full path on ASCII", "[text][fold]") {
    for (const char* s : {"Ivan", "PETROV-2", "o'neil"}) {
        REQUIRE(fold(s, true) == fold(s, false));
    }
    // Non-ASCII input still takes the full path.
    REQUIRE(fold("Петров", true) == "petrov");
}

TEST_CASE("fold_text splits on whitespace and drops empty tokens", "[text][fold]") {
    auto t = fold_text("  Ivan   -  Petrov ");
    REQUIRE(t == std::vector<std::string>{"ivan", "petrov"});
    REQUIRE(sorted_join({"petrov", "ivan"}) == "ivan petrov");
}

TEST_CASE("stopwords are dropped unless nothing would remain", "[text][fold]") {
    REQUIRE(is_stopword("ooo"));
    REQUIRE(is_stopword("llc"));
    REQUIRE_FALSE(is_stopword("romashka"));
    REQUIRE(drop_stopwords({"ooo", "romashka"}) == std::vector<std::string>{"romashka"});
    REQUIRE(drop_stopwords({"ooo", "llc"}) == std::vector<std::string>{"ooo", "llc"});
}

TEST_CASE("identifiers normalize to the bare uppercase value", "[text][fold]") {
    REQUIRE(normalize_identifier("INN:1234567890") == "1234567890");
    REQUIRE(normalize_identifier("passport: ab 123-456") == "AB123456");
    REQUIRE(normalize_identifier("1234567890") == "1234567890");
    REQUIRE(normalize_identifier("INN:").empty());
}
