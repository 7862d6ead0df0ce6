#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "vigil/screening/orchestrator.hpp"

#include "../support/fakes.hpp"
#include "../support/watchlist_fixture.hpp"

using namespace vigil;
using namespace std::chrono_literals;
using vigil::screening::ScreeningOrchestrator;

namespace {

auto has_reason(const ScreeningResult& r, const std::string& code) -> bool {
    const auto& v = r.decision.decision_reasons;
    return std::find(v.begin(), v.end(), code) != v.end();
}

struct Pipeline {
    std::shared_ptr<const backend::WatchlistBackend> backend;
    std::shared_ptr<core::TaskPool> pool;
    std::unique_ptr<ScreeningOrchestrator> orchestrator;
};

auto make_pipeline(std::shared_ptr<const backend::WatchlistBackend> backend,
                   std::shared_ptr<const text::NgramVectorizer> vectorizer,
                   ScreeningConfig cfg = {}) -> Pipeline {
    Pipeline p;
    p.backend = std::move(backend);
    p.pool = std::make_shared<core::TaskPool>(2);
    auto tiers = screening::make_tier_set(p.backend, std::move(vectorizer), p.pool);
    REQUIRE(tiers.has_value());
    auto cache = std::make_shared<cache::ShardedResultCache>(cfg.cache.max_entries, cfg.cache.num_shards);
    p.orchestrator = std::make_unique<ScreeningOrchestrator>(cfg, *tiers, cache, p.pool);
    return p;
}

auto standard_pipeline(ScreeningConfig cfg = {}) -> Pipeline {
    auto backend = test::sample_backend();
    auto vectorizer = backend->vectorizer();
    return make_pipeline(std::move(backend), std::move(vectorizer), cfg);
}

} // namespace

TEST_CASE("listed person with matching tax id is high risk without review", "[integration]") {
    auto p = standard_pipeline();
    auto r = p.orchestrator->screen(test::person({"Ivan", "Petrov"}, {"INN:1234567890"}));

    REQUIRE(r.has_value());
    REQUIRE(r->early_stopped);
    REQUIRE(r->decision.risk_level == RiskLevel::high);
    REQUIRE_FALSE(r->decision.review_required);
    REQUIRE(r->decision.required_additional_fields.empty());
    REQUIRE(has_reason(*r, "id_exact_match"));
    REQUIRE(r->candidates.front().id == "UA-001");
    REQUIRE(r->candidates.front().metadata.program == "UA-NSDC");
    REQUIRE_FALSE(r->tiers[static_cast<std::size_t>(TierKind::vector)].invoked);
}

TEST_CASE("name-only exact match of a listed person asks for evidence", "[integration]") {
    auto p = standard_pipeline();
    auto e = test::person({"Ivan", "Petrov"});
    e.signals.smartfilter_confidence = 1.0f;
    e.signals.person_confidence = 1.0f;
    e.signals.org_confidence = 0.8f;

    auto r = p.orchestrator->screen(e);
    REQUIRE(r.has_value());
    REQUIRE(r->decision.risk_level == RiskLevel::high);
    REQUIRE(r->decision.review_required);
    REQUIRE(r->decision.required_additional_fields ==
            std::vector<EvidenceField>{EvidenceField::tin, EvidenceField::dob});
    REQUIRE(has_reason(*r, "missing_evidence:TIN"));
}

TEST_CASE("fuzzy spelling with moderate signals is not escalated to review", "[integration]") {
    auto p = standard_pipeline();
    auto e = test::person({"Ivan", "Petrof"});
    e.signals.person_confidence = 0.65f;

    auto r = p.orchestrator->screen(e);
    REQUIRE(r.has_value());
    REQUIRE_FALSE(r->early_stopped);
    REQUIRE((r->decision.risk_level == RiskLevel::medium || r->decision.risk_level == RiskLevel::low));
    REQUIRE_FALSE(r->decision.review_required);
    REQUIRE_FALSE(r->candidates.empty());
    REQUIRE(r->candidates.front().id == "UA-001");
    REQUIRE(r->candidates.front().features.has_value());
}

TEST_CASE("Cyrillic organization with registry code is matched", "[integration]") {
    auto p = standard_pipeline();
    auto r = p.orchestrator->screen(test::organization({"ООО", "Ромашка"}, {"EDRPOU: 12345678"}));
    REQUIRE(r.has_value());
    REQUIRE(r->candidates.front().id == "UA-003");
    REQUIRE(r->decision.risk_level == RiskLevel::high);
    REQUIRE(has_reason(*r, "org_evidence_strong"));
}

TEST_CASE("vector timeout degrades gracefully", "[integration][timeout]") {
    auto inner = test::sample_backend();
    auto slow = std::make_shared<test::DegradedBackend>(inner, 2s);
    ScreeningConfig cfg;
    cfg.vector.timeout = 20ms;
    auto p = make_pipeline(slow, inner->vectorizer(), cfg);

    const auto start = Clock::now();
    auto r = p.orchestrator->screen(test::person({"Viktor", "Romashkin"}));
    REQUIRE(Clock::now() - start < 1s);

    REQUIRE(r.has_value());
    const auto& vec = r->tiers[static_cast<std::size_t>(TierKind::vector)];
    REQUIRE(vec.invoked);
    REQUIRE(vec.partial);
    REQUIRE(vec.error_code == core::error_code::deadline_exceeded);
    REQUIRE(has_reason(*r, "backend_unavailable:vector"));
    REQUIRE(has_reason(*r, "deadline_exceeded:vector"));
    REQUIRE(r->decision.decision_reasons.back().rfind("risk_level:", 0) == 0);
    REQUIRE(p.orchestrator->get_stats().degraded_requests == 1);

    // The timed-out result was not cached; the retry reaches the vector tier again.
    auto again = p.orchestrator->screen(test::person({"Viktor", "Romashkin"}));
    REQUIRE(again.has_value());
    REQUIRE_FALSE(again->cache_hit);
    REQUIRE(slow->vector_calls() == 2);
}

TEST_CASE("second identical request is a cache hit with the same decision", "[integration][cache]") {
    auto p = standard_pipeline();
    const auto e = test::person({"Olena", "Kovalenko"}, {}, test::make_date(1982, 7, 1));
    auto first = p.orchestrator->screen(e);
    auto second = p.orchestrator->screen(e);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(second->cache_hit);
    REQUIRE(second->decision == first->decision);
    REQUIRE(second->candidates.front().id == first->candidates.front().id);
}

TEST_CASE("concurrent screening is consistent", "[integration][concurrency]") {
    auto p = standard_pipeline();
    const std::vector<NormalizedEntity> inputs = {
        test::person({"Ivan", "Petrov"}, {"INN:1234567890"}),
        test::person({"Petr", "Ivanenko"}),
        test::organization({"Global", "Trade", "Holdings"}),
        test::person({"Olena", "Kovalenko"}),
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                auto r = p.orchestrator->screen(inputs[static_cast<std::size_t>(i + t) % inputs.size()]);
                if (!r) failures.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(failures.load() == 0);
    const auto stats = p.orchestrator->get_stats();
    REQUIRE(stats.total_requests == 100);
    REQUIRE(stats.cache_hits >= 80);
}
