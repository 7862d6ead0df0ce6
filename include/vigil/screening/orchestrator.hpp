#pragma once

/** \file orchestrator.hpp
 *  \brief Tier orchestration: cache, early stopping, escalation, decision.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <vector>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/cache/result_cache.hpp"
#include "vigil/config.hpp"
#include "vigil/core/task_pool.hpp"
#include "vigil/error.hpp"
#include "vigil/text/ngram_vectorizer.hpp"
#include "vigil/tier/tier.hpp"
#include "vigil/types.hpp"

namespace vigil::screening {

/** \brief Point-in-time orchestrator counters. */
struct OrchestratorStats {
    std::uint64_t total_requests{0};
    std::uint64_t cache_hits{0};
    std::uint64_t early_stops{0};       /**< Tier0 hit above the exact threshold */
    std::uint64_t escalations{0};       /**< Tier2 invocations */
    std::uint64_t degraded_requests{0}; /**< at least one tier or the cache failed */
    std::uint64_t cancelled{0};
    std::uint64_t rejected{0};          /**< malformed input */
    std::uint64_t shadow_runs{0};
    std::uint64_t shadow_divergences{0};
};

/** \brief Screening pipeline entry point.
 *
 * Example usage:
 * ```cpp
 * auto tiers = make_tier_set(backend, vectorizer, pool);
 * ScreeningOrchestrator screener(config, *tiers, cache, pool);
 *
 * auto result = screener.screen(entity);
 * if (result && result->decision.risk_level == RiskLevel::high) { ... }
 * ```
 *
 * Thread-safety: screen() may be called concurrently. update_config() swaps the
 * snapshot used by requests that start after it returns. The destructor blocks
 * until background shadow runs have finished.
 */
class ScreeningOrchestrator {
public:
    /** \brief Assemble the pipeline.
     *
     * \param config Validated configuration (see ScreeningConfig::validate)
     * \param tiers Tier implementations; null slots are skipped
     * \param cache Result cache; may be null
     * \param pool Worker pool for shadow runs; may be null
     */
    ScreeningOrchestrator(ScreeningConfig config,
                          tier::TierSet tiers,
                          std::shared_ptr<cache::ScreeningCache> cache = nullptr,
                          std::shared_ptr<core::TaskPool> pool = nullptr);
    ~ScreeningOrchestrator();

    ScreeningOrchestrator(const ScreeningOrchestrator&) = delete;
    ScreeningOrchestrator& operator=(const ScreeningOrchestrator&) = delete;

    /** \brief Screen one entity.
     *
     * \param entity Normalized input
     * \param stop Caller cancellation; propagated to every backend call
     * \return Result, or malformed_input / cancelled / internal
     *
     * Backend and cache failures never fail the request; they are recorded in
     * the per-tier diagnostics and in the decision reasons.
     */
    auto screen(const NormalizedEntity& entity, std::stop_token stop = {})
        -> std::expected<ScreeningResult, core::error>;

    /** \brief Validate and install a new configuration. */
    auto update_config(const ScreeningConfig& config) -> std::expected<void, core::error>;

    /** \brief Current configuration snapshot. */
    [[nodiscard]] auto config() const -> ScreeningConfig;

    /** \brief Alternate tiers run in the background for requests flagged shadow. */
    auto set_shadow_tiers(tier::TierSet tiers) -> void;

    [[nodiscard]] auto get_stats() const noexcept -> OrchestratorStats;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Merge by id keeping the highest confidence and the union of matched
 *  fields, order by confidence, and keep at most \p cap. */
auto merge_candidates(std::vector<Candidate> candidates, std::size_t cap) -> std::vector<Candidate>;

/** \brief Standard four-tier pipeline over one backend.
 *
 * Tier0 is compiled from backend->export_patterns(). Tier2 and the Tier3
 * cosine feature use \p vectorizer; pass null to run without them.
 */
auto make_tier_set(std::shared_ptr<const backend::WatchlistBackend> backend,
                   std::shared_ptr<const text::NgramVectorizer> vectorizer,
                   std::shared_ptr<core::TaskPool> pool)
    -> std::expected<tier::TierSet, core::error>;

} // namespace vigil::screening
