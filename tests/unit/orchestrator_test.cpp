#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "vigil/screening/orchestrator.hpp"

#include "../support/fakes.hpp"
#include "../support/watchlist_fixture.hpp"

using namespace vigil;
using vigil::screening::ScreeningOrchestrator;
using vigil::test::CallbackTier;
using vigil::test::CountingTier;
using vigil::test::candidate;
using vigil::test::result_of;

namespace {

struct FakePipeline {
    std::shared_ptr<CountingTier> exact;
    std::shared_ptr<CountingTier> blocking;
    std::shared_ptr<CountingTier> vector;
    std::shared_ptr<CountingTier> rerank;

    FakePipeline(TierResult exact_result, TierResult blocking_result, TierResult vector_result = {})
        : exact(std::make_shared<CountingTier>(TierKind::exact, std::move(exact_result)))
        , blocking(std::make_shared<CountingTier>(TierKind::blocking, std::move(blocking_result)))
        , vector(std::make_shared<CountingTier>(TierKind::vector, std::move(vector_result)))
        , rerank(std::make_shared<CountingTier>(TierKind::rerank)) {}

    auto tiers() const -> tier::TierSet { return {exact, blocking, vector, rerank}; }
};

auto has_reason(const ScreeningResult& r, const std::string& code) -> bool {
    const auto& v = r.decision.decision_reasons;
    return std::find(v.begin(), v.end(), code) != v.end();
}

auto no_cache_config() -> ScreeningConfig {
    ScreeningConfig cfg;
    cfg.cache.enabled = false;
    return cfg;
}

} // namespace

TEST_CASE("exact hit stops before blocking and vector", "[screening]") {
    FakePipeline p(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Ivan", "Petrov"}));
    REQUIRE(r.has_value());
    REQUIRE(r->early_stopped);
    REQUIRE(p.exact->calls() == 1);
    REQUIRE(p.blocking->calls() == 0);
    REQUIRE(p.vector->calls() == 0);
    REQUIRE(p.rerank->calls() == 1);
    REQUIRE(r->candidates.front().id == "UA-001");
    REQUIRE(r->tiers[0].invoked);
    REQUIRE_FALSE(r->tiers[1].invoked);
    REQUIRE(has_reason(*r, "decisive_tier:exact"));
    REQUIRE(o.get_stats().early_stops == 1);
}

TEST_CASE("good enough blocking result is not escalated", "[screening]") {
    FakePipeline p(result_of({}), result_of({candidate("UA-002", TierKind::blocking, 0.95f)}, true));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Olena", "Kovalenko"}));
    REQUIRE(r.has_value());
    REQUIRE_FALSE(r->early_stopped);
    REQUIRE(p.blocking->calls() == 1);
    REQUIRE(p.vector->calls() == 0);
    REQUIRE(o.get_stats().escalations == 0);
}

TEST_CASE("weak blocking result escalates and candidates are merged", "[screening]") {
    FakePipeline p(result_of({}),
                   result_of({candidate("UA-004", TierKind::blocking, 0.5f),
                              candidate("UA-005", TierKind::blocking, 0.4f)}, true),
                   result_of({candidate("UA-005", TierKind::vector, 0.8f),
                              candidate("UA-001", TierKind::vector, 0.3f)}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Petr", "Ivanenko"}));
    REQUIRE(r.has_value());
    REQUIRE(p.vector->calls() == 1);
    REQUIRE(r->candidates.size() == 3);
    REQUIRE(r->candidates[0].id == "UA-005");
    REQUIRE(r->candidates[0].source_tier == TierKind::vector);
    REQUIRE(has_reason(*r, "decisive_tier:vector"));
    REQUIRE(o.get_stats().escalations == 1);
}

TEST_CASE("empty blocking result escalates to vector exactly once", "[screening]") {
    FakePipeline p(result_of({}), result_of({}, true),
                   result_of({candidate("UA-002", TierKind::vector, 0.7f)}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Olena", "Kovalenkova"}));
    REQUIRE(r.has_value());
    REQUIRE(p.vector->calls() == 1);
    REQUIRE(r->tiers[static_cast<std::size_t>(TierKind::vector)].invoked);
    REQUIRE(r->candidates.front().id == "UA-002");
}

TEST_CASE("disable flags skip tiers", "[screening]") {
    FakePipeline p(result_of({candidate("UA-001", TierKind::exact, 1.0f)}),
                   result_of({candidate("UA-004", TierKind::blocking, 0.3f)}, true));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto e = test::person({"Ivan", "Petrov"});
    e.policy_flags.disable_exact = true;
    e.policy_flags.disable_vector = true;
    auto r = o.screen(e);
    REQUIRE(r.has_value());
    REQUIRE(p.exact->calls() == 0);
    REQUIRE(p.blocking->calls() == 1);
    REQUIRE(p.vector->calls() == 0);
    REQUIRE(r->candidates.front().id == "UA-004");
}

TEST_CASE("candidate list is capped after merge", "[screening]") {
    FakePipeline p(result_of({}),
                   result_of({candidate("A", TierKind::blocking, 0.5f),
                              candidate("B", TierKind::blocking, 0.6f),
                              candidate("C", TierKind::blocking, 0.7f)}, true));
    auto cfg = no_cache_config();
    cfg.orchestrator.max_candidates = 2;
    ScreeningOrchestrator o(cfg, p.tiers());

    auto r = o.screen(test::person({"Someone"}));
    REQUIRE(r.has_value());
    REQUIRE(r->candidates.size() == 2);
    REQUIRE(r->candidates[0].id == "C");
    REQUIRE(r->candidates[1].id == "B");
}

TEST_CASE("merge keeps the best confidence and the union of fields", "[screening]") {
    auto a = candidate("X", TierKind::blocking, 0.4f);
    auto b = candidate("X", TierKind::vector, 0.9f);
    b.matched_fields = {};
    b.matched_fields.set(MatchedField::dob);
    auto merged = screening::merge_candidates({a, b, candidate("Y", TierKind::blocking, 0.9f)}, 10);

    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].id == "X");
    REQUIRE(merged[0].source_tier == TierKind::vector);
    REQUIRE(merged[0].matched_fields.has(MatchedField::name));
    REQUIRE(merged[0].matched_fields.has(MatchedField::dob));
    REQUIRE(merged[1].id == "Y");
}

TEST_CASE("repeat requests are served from the cache", "[screening][cache]") {
    FakePipeline p(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    auto cache = std::make_shared<cache::ShardedResultCache>(100);
    ScreeningOrchestrator o(ScreeningConfig{}, p.tiers(), cache);

    const auto e = test::person({"Ivan", "Petrov"});
    auto first = o.screen(e);
    auto second = o.screen(e);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE_FALSE(first->cache_hit);
    REQUIRE(second->cache_hit);
    REQUIRE(p.exact->calls() == 1);
    REQUIRE(second->decision == first->decision);
    REQUIRE(o.get_stats().cache_hits == 1);

    auto traced = e;
    traced.policy_flags.no_cache = true;
    auto third = o.screen(traced);
    REQUIRE(third.has_value());
    REQUIRE_FALSE(third->cache_hit);
    REQUIRE(p.exact->calls() == 2);
}

TEST_CASE("cache failure degrades to a miss", "[screening][cache]") {
    FakePipeline p(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    auto cache = std::make_shared<test::FailingCache>();
    ScreeningOrchestrator o(ScreeningConfig{}, p.tiers(), cache);

    auto r = o.screen(test::person({"Ivan", "Petrov"}));
    REQUIRE(r.has_value());
    REQUIRE(has_reason(*r, "cache_error"));
    REQUIRE(cache->gets.load() == 1);
    REQUIRE(cache->puts.load() == 0);
    REQUIRE(o.get_stats().degraded_requests == 1);
}

TEST_CASE("tier failure is reported without failing the request", "[screening]") {
    TierResult failed;
    failed.escalate = true;
    failed.error = core::error{core::error_code::backend_unavailable, "connection refused", "tier.blocking"};
    FakePipeline p(result_of({}), failed, result_of({candidate("UA-004", TierKind::vector, 0.6f)}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Sergei", "Ivanov"}));
    REQUIRE(r.has_value());
    REQUIRE(has_reason(*r, "backend_unavailable:blocking"));
    REQUIRE(r->tiers[1].error_code == core::error_code::backend_unavailable);
    REQUIRE(p.vector->calls() == 1);
    REQUIRE(r->candidates.front().id == "UA-004");
}

TEST_CASE("degraded results are not cached", "[screening][cache]") {
    // Blocking backend is down for the first request only.
    auto blocking = std::make_shared<CallbackTier>(TierKind::blocking, [n = 0](const tier::TierInput&) mutable {
        if (n++ == 0) {
            TierResult failed;
            failed.escalate = true;
            failed.error = core::error{core::error_code::backend_unavailable, "connection refused", "tier.blocking"};
            return failed;
        }
        return result_of({candidate("UA-004", TierKind::blocking, 0.95f)});
    });
    FakePipeline p(result_of({}), result_of({}));
    auto tiers = p.tiers();
    tiers.blocking = blocking;
    auto cache = std::make_shared<cache::ShardedResultCache>(100);
    ScreeningOrchestrator o(ScreeningConfig{}, tiers, cache);

    const auto e = test::person({"Sergei", "Ivanov"});
    auto first = o.screen(e);
    REQUIRE(first.has_value());
    REQUIRE(has_reason(*first, "backend_unavailable:blocking"));
    REQUIRE(cache->metrics().size == 0);

    auto second = o.screen(e);
    REQUIRE(second.has_value());
    REQUIRE_FALSE(second->cache_hit);
    REQUIRE(blocking->calls() == 2);
    REQUIRE_FALSE(has_reason(*second, "backend_unavailable:blocking"));
    REQUIRE(second->candidates.front().id == "UA-004");

    // A clean result is cached as usual.
    auto third = o.screen(e);
    REQUIRE(third.has_value());
    REQUIRE(third->cache_hit);
    REQUIRE(blocking->calls() == 2);
}

TEST_CASE("cancellation during a tier discards partial results", "[screening][cancel]") {
    std::stop_source stop;
    auto blocking = std::make_shared<CallbackTier>(TierKind::blocking, [&stop](const tier::TierInput&) {
        stop.request_stop();
        return result_of({candidate("UA-004", TierKind::blocking, 0.95f)});
    });
    FakePipeline p(result_of({}), result_of({}));
    auto tiers = p.tiers();
    tiers.blocking = blocking;
    auto cache = std::make_shared<cache::ShardedResultCache>(100);
    ScreeningOrchestrator o(ScreeningConfig{}, tiers, cache);

    auto r = o.screen(test::person({"Sergei", "Ivanov"}), stop.get_token());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::cancelled);
    REQUIRE(blocking->calls() == 1);
    REQUIRE(p.vector->calls() == 0);
    REQUIRE(p.rerank->calls() == 0);
    REQUIRE(cache->metrics().size == 0);
    REQUIRE(o.get_stats().cancelled == 1);
}

TEST_CASE("fatal tier errors fail the request", "[screening]") {
    TierResult broken;
    broken.error = core::error{core::error_code::internal, "index corrupted", "tier.exact"};
    FakePipeline p(broken, result_of({}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto r = o.screen(test::person({"Ivan", "Petrov"}));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::internal);
    REQUIRE(p.blocking->calls() == 0);
}

TEST_CASE("malformed input and pre-cancelled requests fail fast", "[screening]") {
    FakePipeline p(result_of({}), result_of({}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto bad = test::person({"Ivan"});
    bad.signals.org_confidence = -1.0f;
    auto r = o.screen(bad);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::malformed_input);

    std::stop_source stop;
    stop.request_stop();
    auto c = o.screen(test::person({"Ivan"}), stop.get_token());
    REQUIRE_FALSE(c.has_value());
    REQUIRE(c.error().code == core::error_code::cancelled);

    REQUIRE(p.exact->calls() == 0);
    const auto stats = o.get_stats();
    REQUIRE(stats.rejected == 1);
    REQUIRE(stats.cancelled == 1);
    REQUIRE(stats.total_requests == 2);
}

TEST_CASE("entities flagged not to process are skipped without tier calls", "[screening]") {
    FakePipeline p(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    NormalizedEntity e;
    e.signals.should_process = false;
    auto r = o.screen(e);
    REQUIRE(r.has_value());
    REQUIRE(r->decision.risk_level == RiskLevel::skip);
    REQUIRE(r->candidates.empty());
    REQUIRE(p.exact->calls() == 0);
    REQUIRE(p.rerank->calls() == 0);
}

TEST_CASE("identical input gives identical decisions", "[screening]") {
    FakePipeline p(result_of({}), result_of({candidate("UA-004", TierKind::blocking, 0.8f)}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());
    const auto e = test::person({"Sergei", "Ivanov"});
    REQUIRE(o.screen(e)->decision == o.screen(e)->decision);
}

TEST_CASE("configuration updates are validated before install", "[screening][config]") {
    FakePipeline p(result_of({}), result_of({}));
    ScreeningOrchestrator o(no_cache_config(), p.tiers());

    auto bad = o.config();
    bad.decision.thr_high = 2.0f;
    REQUIRE_FALSE(o.update_config(bad).has_value());
    REQUIRE(o.config().decision.thr_high == 0.85f);

    auto good = o.config();
    good.decision.thr_high = 0.8f;
    REQUIRE(o.update_config(good).has_value());
    REQUIRE(o.config().decision.thr_high == 0.8f);
}

TEST_CASE("shadow tiers run in the background and divergences are counted", "[screening][shadow]") {
    FakePipeline primary(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    FakePipeline shadow(result_of({}), result_of({candidate("UA-004", TierKind::blocking, 0.95f)}));
    auto pool = std::make_shared<core::TaskPool>(1);
    ScreeningOrchestrator o(no_cache_config(), primary.tiers(), nullptr, pool);
    o.set_shadow_tiers(shadow.tiers());

    auto e = test::person({"Ivan", "Petrov"});
    REQUIRE(o.screen(e).has_value());
    pool->wait_all();
    REQUIRE(o.get_stats().shadow_runs == 0);

    e.policy_flags.shadow = true;
    auto r = o.screen(e);
    REQUIRE(r.has_value());
    REQUIRE(r->candidates.front().id == "UA-001");
    pool->wait_all();

    const auto stats = o.get_stats();
    REQUIRE(stats.shadow_runs == 1);
    REQUIRE(stats.shadow_divergences == 1);
    REQUIRE(shadow.blocking->calls() == 1);
}

TEST_CASE("destroying the orchestrator waits for running shadow work", "[screening][shadow]") {
    using namespace std::chrono_literals;
    FakePipeline primary(result_of({candidate("UA-001", TierKind::exact, 1.0f)}), result_of({}));
    auto pool = std::make_shared<core::TaskPool>(1);
    auto finished = std::make_shared<std::atomic<bool>>(false);

    auto o = std::make_unique<ScreeningOrchestrator>(no_cache_config(), primary.tiers(), nullptr, pool);
    {
        // The slow tier keeps a pool reference, as a vector tier does.
        tier::TierSet shadow;
        shadow.blocking = std::make_shared<CallbackTier>(TierKind::blocking,
            [held = pool, finished](const tier::TierInput&) {
                std::this_thread::sleep_for(200ms);
                finished->store(true);
                return TierResult{};
            });
        o->set_shadow_tiers(std::move(shadow));
    }

    auto e = test::person({"Ivan", "Petrov"});
    e.policy_flags.shadow = true;
    REQUIRE(o->screen(e).has_value());

    o.reset();
    REQUIRE(finished->load());
    REQUIRE(pool.use_count() == 1);
    pool.reset();
}
