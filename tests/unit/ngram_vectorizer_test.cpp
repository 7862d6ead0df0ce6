#include <algorithm>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "vigil/text/ngram_vectorizer.hpp"

using Catch::Matchers::WithinAbs;
using vigil::text::NgramParams;
using vigil::text::NgramVectorizer;
using vigil::text::SparseVector;

namespace {

auto fitted() -> NgramVectorizer {
    NgramVectorizer v;
    auto ok = v.fit({"ivan petrov", "olena kovalenko", "sergei ivanov", "petr ivanenko",
                     "ooo romashka", "global trade holdings ltd"});
    REQUIRE(ok.has_value());
    return v;
}

} // namespace

TEST_CASE("sparse dot product merges sorted indices", "[text][ngram]") {
    SparseVector a{{1, 3, 7}, {1.0f, 2.0f, 3.0f}};
    SparseVector b{{3, 4, 7}, {0.5f, 9.0f, 1.0f}};
    REQUIRE_THAT(a.dot(b), WithinAbs(2.0 * 0.5 + 3.0 * 1.0, 1e-6));

    a.normalize();
    REQUIRE_THAT(a.dot(a), WithinAbs(1.0, 1e-5));
}

TEST_CASE("terms are word-bounded character n-grams plus word n-grams", "[text][ngram]") {
    NgramVectorizer v;
    auto terms = v.extract_terms("ivan petrov");
    auto has = [&](const char* t) { return std::find(terms.begin(), terms.end(), t) != terms.end(); };
    REQUIRE(has("c: iv"));
    REQUIRE(has("c:ivan "));
    REQUIRE(has("w:ivan"));
    REQUIRE(has("w:ivan petrov"));
    REQUIRE_FALSE(has("c:n p"));  // never crosses a word boundary
}

TEST_CASE("fit rejects invalid parameters and empty corpora", "[text][ngram]") {
    NgramVectorizer empty;
    REQUIRE_FALSE(empty.fit({}).has_value());

    NgramParams bad;
    bad.char_min = 6;
    bad.char_max = 3;
    NgramVectorizer inverted(bad);
    auto r = inverted.fit({"ivan"});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == vigil::core::error_code::config_invalid);
}

TEST_CASE("cosine similarity orders spellings sensibly", "[text][ngram]") {
    auto v = fitted();
    REQUIRE(v.is_fitted());
    REQUIRE(v.vocabulary_size() > 0);

    const auto q = v.transform("ivan petrov");
    REQUIRE_THAT(NgramVectorizer::cosine(q, v.transform("ivan petrov")), WithinAbs(1.0, 1e-5));

    const float close = NgramVectorizer::cosine(q, v.transform("ivan petrof"));
    const float far = NgramVectorizer::cosine(q, v.transform("olena kovalenko"));
    REQUIRE(close > 0.3f);
    REQUIRE(close < 1.0f);
    REQUIRE(far < close);
}

TEST_CASE("unseen text yields an empty vector", "[text][ngram]") {
    auto v = fitted();
    REQUIRE(v.transform("qqq").empty());
    REQUIRE_THAT(NgramVectorizer::cosine(v.transform("qqq"), v.transform("ivan")), WithinAbs(0.0, 1e-6));
    NgramVectorizer unfitted;
    REQUIRE(unfitted.transform("ivan").empty());
}
