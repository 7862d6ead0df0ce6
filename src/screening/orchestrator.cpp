#include "vigil/screening/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "vigil/decision/decision_engine.hpp"
#include "vigil/tier/blocker.hpp"
#include "vigil/tier/exact_matcher.hpp"
#include "vigil/tier/reranker.hpp"
#include "vigil/tier/vector_searcher.hpp"

namespace vigil::screening {

namespace {

auto micros_since(Clock::time_point start) -> std::chrono::microseconds {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

auto cancelled_error() -> core::error {
    return core::error{core::error_code::cancelled, "request cancelled by caller", "screening"};
}

/** \brief Per-request working state shared by the primary and shadow runs. */
struct PipelineRun {
    ScreeningResult result;
    std::vector<std::string> degradations;
};

/** \brief Counters and shadow bookkeeping. Shadow tasks hold this, never the
 *  orchestrator, so the worker pool is always released by its owner. */
struct SharedState {
    std::atomic<std::uint64_t> total_requests{0};
    std::atomic<std::uint64_t> cache_hits{0};
    std::atomic<std::uint64_t> early_stops{0};
    std::atomic<std::uint64_t> escalations{0};
    std::atomic<std::uint64_t> degraded{0};
    std::atomic<std::uint64_t> cancelled{0};
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> shadow_runs{0};
    std::atomic<std::uint64_t> shadow_divergences{0};

    std::mutex shadow_mutex;
    std::condition_variable shadow_done;
    std::size_t shadow_in_flight{0};

    auto begin_shadow() -> void {
        std::lock_guard lock(shadow_mutex);
        ++shadow_in_flight;
    }

    auto end_shadow() -> void {
        {
            std::lock_guard lock(shadow_mutex);
            --shadow_in_flight;
        }
        shadow_done.notify_all();
    }

    auto wait_shadow() -> void {
        std::unique_lock lock(shadow_mutex);
        shadow_done.wait(lock, [this] { return shadow_in_flight == 0; });
    }
};

/** \brief Marks a shadow task finished when it leaves scope. */
class ShadowTicket {
public:
    explicit ShadowTicket(std::shared_ptr<SharedState> state) : state_(std::move(state)) {}
    ~ShadowTicket() { state_->end_shadow(); }

    ShadowTicket(const ShadowTicket&) = delete;
    ShadowTicket& operator=(const ShadowTicket&) = delete;

private:
    std::shared_ptr<SharedState> state_;
};

auto record(PipelineRun& run, TierKind kind, const TierResult& tr) -> void {
    auto& diag = run.result.tiers[static_cast<std::size_t>(kind)];
    diag.invoked = true;
    diag.elapsed = tr.elapsed;
    diag.candidate_count = tr.candidates.size();
    diag.escalate = tr.escalate;
    diag.partial = tr.partial;
    if (!tr.error) return;

    diag.error_code = tr.error->code;
    diag.error_message = tr.error->message;
    if (core::is_fatal(tr.error->code)) return;

    const std::string tier_name(to_string(kind));
    run.degradations.push_back("backend_unavailable:" + tier_name);
    if (tr.error->code == core::error_code::deadline_exceeded) {
        run.degradations.push_back("deadline_exceeded:" + tier_name);
    }
    spdlog::warn("tier {} degraded ({}): {}", tier_name,
                 core::to_string(tr.error->code), tr.error->message);
}

/** \brief Tiers 0-3 plus the decision; no cache. Counters are updated only
 *  when \p stats is non-null. */
auto run_pipeline(const tier::TierSet& tiers, const NormalizedEntity& entity,
                  const ScreeningConfig& cfg, const tier::RequestContext& ctx,
                  PipelineRun& run, SharedState* stats) -> std::expected<void, core::error> {
    const auto& flags = entity.policy_flags;
    const auto query = tier::prepare(entity);
    std::vector<Candidate> candidates;

    // A fatal tier error or a stop request ends the run; candidates gathered
    // so far are dropped with it.
    auto invoke = [&](tier::Tier& t, std::span<const Candidate> prior)
        -> std::expected<TierResult, core::error> {
        auto tr = t.run(tier::TierInput{entity, query, prior, cfg, ctx});
        record(run, t.kind(), tr);
        if (tr.error && core::is_fatal(tr.error->code)) return std::unexpected(*tr.error);
        if (ctx.cancelled()) return std::unexpected(cancelled_error());
        return tr;
    };

    if (entity.signals.should_process) {
        // Tier0
        if (tiers.exact && !flags.disable_exact) {
            auto tr = invoke(*tiers.exact, {});
            if (!tr) return std::unexpected(tr.error());
            run.result.early_stopped = std::any_of(tr->candidates.begin(), tr->candidates.end(),
                [&](const Candidate& c) { return c.raw_score >= cfg.exact.exact_match_threshold; });
            candidates = std::move(tr->candidates);
        }

        if (run.result.early_stopped) {
            if (stats) stats->early_stops.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("exact match, skipping blocking and vector tiers");
        } else {
            // Tier1
            bool escalate = true;
            if (tiers.blocking && !flags.disable_blocking) {
                auto tr = invoke(*tiers.blocking, {});
                if (!tr) return std::unexpected(tr.error());
                escalate = (tr->candidates.empty() || tr->escalate ||
                            tr->best_confidence < cfg.blocking.escalation_threshold) &&
                           tr->best_confidence < cfg.blocking.good_enough_threshold;
                candidates.insert(candidates.end(),
                                  std::make_move_iterator(tr->candidates.begin()),
                                  std::make_move_iterator(tr->candidates.end()));
            }

            // Tier2
            if (escalate && tiers.vector && !flags.disable_vector) {
                if (ctx.expired()) {
                    run.degradations.push_back("deadline_exceeded:" + std::string(to_string(TierKind::vector)));
                    spdlog::warn("request budget spent before vector escalation");
                } else {
                    if (stats) stats->escalations.fetch_add(1, std::memory_order_relaxed);
                    spdlog::debug("escalating to vector search");
                    auto tr = invoke(*tiers.vector, {});
                    if (!tr) return std::unexpected(tr.error());
                    candidates.insert(candidates.end(),
                                      std::make_move_iterator(tr->candidates.begin()),
                                      std::make_move_iterator(tr->candidates.end()));
                }
            }
        }
        if (ctx.cancelled()) return std::unexpected(cancelled_error());

        candidates = merge_candidates(std::move(candidates), cfg.orchestrator.max_candidates);

        // Tier3
        if (tiers.rerank && !candidates.empty()) {
            auto tr = invoke(*tiers.rerank, candidates);
            if (!tr) return std::unexpected(tr.error());
            candidates = std::move(tr->candidates);
        }
    }

    decision::DecisionEvidence evidence;
    evidence.signals = entity.signals;
    evidence.identifiers_supplied = !query.identifiers.empty();
    evidence.dob_supplied = entity.dob.has_value();
    evidence.degradations = run.degradations;
    if (!candidates.empty()) {
        const auto& best = candidates.front();
        evidence.similarity_top = best.confidence;
        evidence.id_match = best.matched_fields.has(MatchedField::identifier);
        evidence.dob_match = best.matched_fields.has(MatchedField::dob);
        evidence.decisive_tier = best.source_tier;
    }

    auto decided = decision::DecisionEngine(cfg.decision).decide(evidence);
    if (!decided) return std::unexpected(decided.error());

    run.result.decision = std::move(*decided);
    run.result.candidates = std::move(candidates);
    return {};
}

/** \brief True when every invoked tier and the cache lookup succeeded. */
auto fully_served(const PipelineRun& run) -> bool {
    return run.degradations.empty() &&
           std::none_of(run.result.tiers.begin(), run.result.tiers.end(),
                        [](const TierDiagnostics& d) { return d.error_code.has_value(); });
}

} // anonymous namespace

class ScreeningOrchestrator::Impl {
public:
    Impl(ScreeningConfig config, tier::TierSet tiers,
         std::shared_ptr<cache::ScreeningCache> cache,
         std::shared_ptr<core::TaskPool> pool)
        : config_(std::make_shared<const ScreeningConfig>(std::move(config)))
        , tiers_(std::move(tiers))
        , cache_(std::move(cache))
        , pool_(std::move(pool))
        , state_(std::make_shared<SharedState>()) {}

    ~Impl() { state_->wait_shadow(); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    auto screen(const NormalizedEntity& entity, std::stop_token stop)
        -> std::expected<ScreeningResult, core::error>;

    auto update_config(const ScreeningConfig& config) -> std::expected<void, core::error> {
        if (auto ok = config.validate(); !ok) {
            spdlog::warn("rejected configuration update: {}", ok.error().message);
            return ok;
        }
        auto next = std::make_shared<const ScreeningConfig>(config);
        std::lock_guard lock(config_mutex_);
        config_ = std::move(next);
        return {};
    }

    auto snapshot() const -> std::shared_ptr<const ScreeningConfig> {
        std::lock_guard lock(config_mutex_);
        return config_;
    }

    auto set_shadow_tiers(tier::TierSet tiers) -> void {
        std::lock_guard lock(config_mutex_);
        shadow_ = std::make_shared<const tier::TierSet>(std::move(tiers));
    }

    auto get_stats() const noexcept -> OrchestratorStats {
        const auto& st = *state_;
        OrchestratorStats s;
        s.total_requests = st.total_requests.load(std::memory_order_relaxed);
        s.cache_hits = st.cache_hits.load(std::memory_order_relaxed);
        s.early_stops = st.early_stops.load(std::memory_order_relaxed);
        s.escalations = st.escalations.load(std::memory_order_relaxed);
        s.degraded_requests = st.degraded.load(std::memory_order_relaxed);
        s.cancelled = st.cancelled.load(std::memory_order_relaxed);
        s.rejected = st.rejected.load(std::memory_order_relaxed);
        s.shadow_runs = st.shadow_runs.load(std::memory_order_relaxed);
        s.shadow_divergences = st.shadow_divergences.load(std::memory_order_relaxed);
        return s;
    }

private:
    auto submit_shadow(const NormalizedEntity& entity,
                       std::shared_ptr<const ScreeningConfig> cfg,
                       const ScreeningResult& primary) -> void;

    mutable std::mutex config_mutex_;
    std::shared_ptr<const ScreeningConfig> config_;
    std::shared_ptr<const tier::TierSet> shadow_;

    tier::TierSet tiers_;
    std::shared_ptr<cache::ScreeningCache> cache_;
    std::shared_ptr<core::TaskPool> pool_;
    std::shared_ptr<SharedState> state_;
};

auto ScreeningOrchestrator::Impl::screen(const NormalizedEntity& entity, std::stop_token stop)
    -> std::expected<ScreeningResult, core::error> {
    const auto start = Clock::now();
    auto& st = *state_;
    st.total_requests.fetch_add(1, std::memory_order_relaxed);

    if (auto ok = validate(entity); !ok) {
        st.rejected.fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(ok.error());
    }
    if (stop.stop_requested()) {
        st.cancelled.fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(cancelled_error());
    }

    const auto cfg = snapshot();
    const auto& flags = entity.policy_flags;
    PipelineRun run;

    const bool use_cache = cache_ && cfg->cache.enabled && !flags.no_cache;
    bool cache_ok = use_cache;
    std::string key;
    if (use_cache) {
        key = canonical_form(entity);
        auto cached = cache_->get(key);
        if (!cached) {
            cache_ok = false;
            run.degradations.push_back("cache_error");
            spdlog::warn("cache lookup failed, treating as miss: {}", cached.error().message);
        } else if (*cached) {
            st.cache_hits.fetch_add(1, std::memory_order_relaxed);
            auto hit = std::move(**cached);
            hit.cache_hit = true;
            hit.elapsed = micros_since(start);
            return hit;
        }
    }

    for (std::size_t i = 0; i < kTierCount; ++i) {
        run.result.tiers[i].tier = static_cast<TierKind>(i);
    }

    const tier::RequestContext ctx{start + cfg->orchestrator.request_budget, stop};
    if (auto ok = run_pipeline(tiers_, entity, *cfg, ctx, run, &st); !ok) {
        if (ok.error().code == core::error_code::cancelled) {
            st.cancelled.fetch_add(1, std::memory_order_relaxed);
        } else {
            spdlog::error("screening failed ({}): {}",
                          core::to_string(ok.error().code), ok.error().message);
        }
        return std::unexpected(ok.error());
    }

    const bool served = fully_served(run);
    if (!run.degradations.empty()) {
        st.degraded.fetch_add(1, std::memory_order_relaxed);
    }
    run.result.elapsed = micros_since(start);

    // Degraded results are not stored; the next request retries the tiers.
    if (use_cache && cache_ok && served) {
        if (auto put = cache_->put(key, run.result, cfg->cache.ttl); !put) {
            spdlog::warn("cache store failed: {}", put.error().message);
        }
    }

    if (flags.shadow) {
        submit_shadow(entity, cfg, run.result);
    }
    return std::move(run.result);
}

auto ScreeningOrchestrator::Impl::submit_shadow(const NormalizedEntity& entity,
                                                std::shared_ptr<const ScreeningConfig> cfg,
                                                const ScreeningResult& primary) -> void {
    std::shared_ptr<const tier::TierSet> shadow;
    {
        std::lock_guard lock(config_mutex_);
        shadow = shadow_;
    }
    if (!shadow || !pool_) return;

    std::string primary_top = primary.candidates.empty() ? std::string{} : primary.candidates.front().id;
    const auto primary_level = primary.decision.risk_level;

    state_->begin_shadow();
    try {
        // Fire and forget: the future is dropped and never awaited.
        (void)pool_->submit([state = state_, shadow = std::move(shadow), cfg = std::move(cfg), entity,
                             primary_top = std::move(primary_top), primary_level]() mutable {
            ShadowTicket ticket(state);
            // Tiers may own the pool; they are released before the ticket.
            const auto tiers = std::move(shadow);
            const auto config = std::move(cfg);

            state->shadow_runs.fetch_add(1, std::memory_order_relaxed);
            PipelineRun run;
            const tier::RequestContext ctx{Clock::now() + config->orchestrator.request_budget, {}};
            auto ok = run_pipeline(*tiers, entity, *config, ctx, run, nullptr);
            if (!ok) {
                spdlog::info("shadow run failed: {}", ok.error().message);
                return;
            }
            const std::string shadow_top = run.result.candidates.empty()
                ? std::string{} : run.result.candidates.front().id;
            if (run.result.decision.risk_level != primary_level || shadow_top != primary_top) {
                state->shadow_divergences.fetch_add(1, std::memory_order_relaxed);
                spdlog::info("shadow divergence: primary {} '{}' vs shadow {} '{}'",
                             to_string(primary_level), primary_top,
                             to_string(run.result.decision.risk_level), shadow_top);
            }
        });
    } catch (const std::runtime_error& e) {
        state_->end_shadow();
        spdlog::warn("shadow run not scheduled: {}", e.what());
    }
}

ScreeningOrchestrator::ScreeningOrchestrator(ScreeningConfig config,
                                             tier::TierSet tiers,
                                             std::shared_ptr<cache::ScreeningCache> cache,
                                             std::shared_ptr<core::TaskPool> pool)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(tiers),
                                   std::move(cache), std::move(pool))) {
}

ScreeningOrchestrator::~ScreeningOrchestrator() = default;

auto ScreeningOrchestrator::screen(const NormalizedEntity& entity, std::stop_token stop)
    -> std::expected<ScreeningResult, core::error> {
    return impl_->screen(entity, std::move(stop));
}

auto ScreeningOrchestrator::update_config(const ScreeningConfig& config)
    -> std::expected<void, core::error> {
    return impl_->update_config(config);
}

auto ScreeningOrchestrator::config() const -> ScreeningConfig {
    return *impl_->snapshot();
}

auto ScreeningOrchestrator::set_shadow_tiers(tier::TierSet tiers) -> void {
    impl_->set_shadow_tiers(std::move(tiers));
}

auto ScreeningOrchestrator::get_stats() const noexcept -> OrchestratorStats {
    return impl_->get_stats();
}

auto merge_candidates(std::vector<Candidate> candidates, std::size_t cap) -> std::vector<Candidate> {
    std::vector<Candidate> merged;
    merged.reserve(candidates.size());
    std::unordered_map<std::string, std::size_t> by_id;

    for (auto& c : candidates) {
        auto [it, inserted] = by_id.try_emplace(c.id, merged.size());
        if (inserted) {
            merged.push_back(std::move(c));
            continue;
        }
        auto& kept = merged[it->second];
        auto fields = kept.matched_fields;
        fields.merge(c.matched_fields);
        if (c.confidence > kept.confidence) {
            kept = std::move(c);
        }
        kept.matched_fields = fields;
    }

    std::sort(merged.begin(), merged.end(), [](const Candidate& a, const Candidate& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.id < b.id;
    });
    if (merged.size() > cap) merged.resize(cap);
    return merged;
}

auto make_tier_set(std::shared_ptr<const backend::WatchlistBackend> backend,
                   std::shared_ptr<const text::NgramVectorizer> vectorizer,
                   std::shared_ptr<core::TaskPool> pool)
    -> std::expected<tier::TierSet, core::error> {
    auto exact = tier::ExactMatcher::create(backend);
    if (!exact) return std::unexpected(exact.error());

    tier::TierSet tiers;
    tiers.exact = std::move(*exact);
    tiers.blocking = std::make_shared<tier::Blocker>(backend);
    if (vectorizer && pool) {
        tiers.vector = std::make_shared<tier::VectorSearcher>(backend, vectorizer, std::move(pool));
    }
    tiers.rerank = std::make_shared<tier::Reranker>(std::move(vectorizer));
    return tiers;
}

} // namespace vigil::screening
