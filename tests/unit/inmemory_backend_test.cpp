#include <chrono>

#include <catch2/catch_test_macros.hpp>

#include "vigil/backend/inmemory_backend.hpp"
#include "vigil/text/fold.hpp"

#include "../support/watchlist_fixture.hpp"

using namespace vigil;
using namespace std::chrono_literals;
using vigil::backend::InMemoryBackend;

TEST_CASE("create rejects empty lists and duplicate ids", "[backend]") {
    auto empty = InMemoryBackend::create({});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == core::error_code::config_invalid);

    auto records = test::sample_records();
    records.push_back(records.front());
    auto dup = InMemoryBackend::create(records);
    REQUIRE_FALSE(dup.has_value());
    REQUIRE(dup.error().message.find("UA-001") != std::string::npos);

    auto unfitted = InMemoryBackend::create(test::sample_records(),
                                            std::make_shared<text::NgramVectorizer>());
    REQUIRE_FALSE(unfitted.has_value());
}

TEST_CASE("exported patterns cover names, aliases and identifiers", "[backend]") {
    auto b = test::sample_backend();
    REQUIRE(b->size() == 6);

    auto set = b->export_patterns();
    REQUIRE(set.has_value());
    REQUIRE(set->records.size() == 6);

    std::size_t ids = 0, aliases = 0;
    for (const auto& p : set->patterns) {
        REQUIRE(p.record < set->records.size());
        if (p.kind == backend::PatternKind::identifier) ++ids;
        if (p.kind == backend::PatternKind::alias) ++aliases;
    }
    REQUIRE(ids == 3);
    REQUIRE(aliases == 5);
}

TEST_CASE("exact lookup by folded name and identifier", "[backend]") {
    auto b = test::sample_backend();
    const backend::CallOptions call;

    auto by_name = b->exact_lookup({{"petrov", "ivan"}, {}}, call);
    REQUIRE(by_name.has_value());
    REQUIRE(by_name->size() == 1);
    REQUIRE(by_name->front().record.id == "UA-001");

    auto by_id = b->exact_lookup({{}, {"12345678"}}, call);
    REQUIRE(by_id.has_value());
    REQUIRE(by_id->size() == 1);
    REQUIRE(by_id->front().record.id == "UA-003");
    REQUIRE(by_id->front().kind == backend::PatternKind::identifier);
}

TEST_CASE("blocking requires a surname key and ranks by matched kinds", "[backend]") {
    auto b = test::sample_backend();
    const backend::CallOptions call;

    backend::BlockingKeys keys;
    keys.surname = {"I151", "I155"};   // ivanov/ivanovich, ivanenko
    keys.initial = {"s"};
    auto hits = b->blocking_search(keys, 10, call);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 3);
    REQUIRE(hits->front().record.id == "UA-004");
    REQUIRE(hits->front().matched(backend::KeyKind::initial));

    auto capped = b->blocking_search(keys, 1, call);
    REQUIRE(capped->size() == 1);

    backend::BlockingKeys no_surname;
    no_surname.initial = {"i"};
    REQUIRE(b->blocking_search(no_surname, 10, call)->empty());
}

TEST_CASE("expired or cancelled calls are reported", "[backend]") {
    auto b = test::sample_backend();
    backend::BlockingKeys keys;
    keys.surname = {"P361"};

    backend::CallOptions late{Clock::now() - 1ms, {}};
    auto r = b->blocking_search(keys, 10, late);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::deadline_exceeded);

    std::stop_source stop;
    stop.request_stop();
    backend::CallOptions cancelled{Clock::now() + 1s, stop.get_token()};
    auto c = b->blocking_search(keys, 10, cancelled);
    REQUIRE_FALSE(c.has_value());
    REQUIRE(c.error().code == core::error_code::cancelled);

    auto v = b->vector_search(b->vectorizer()->transform("ivan petrov"), 5, late);
    REQUIRE(v.has_value());
    REQUIRE(v->truncated);
}

TEST_CASE("vector search returns best records first", "[backend]") {
    auto b = test::sample_backend();
    auto v = b->vector_search(b->vectorizer()->transform("romashka"), 3, backend::CallOptions{});
    REQUIRE(v.has_value());
    REQUIRE_FALSE(v->truncated);
    REQUIRE_FALSE(v->hits.empty());
    REQUIRE(v->hits.front().record.id == "UA-003");
    for (std::size_t i = 1; i < v->hits.size(); ++i) {
        REQUIRE(v->hits[i - 1].cosine >= v->hits[i].cosine);
    }
}
