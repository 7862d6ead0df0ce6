#pragma once

/** \file tier.hpp
 *  \brief Common interface of the four screening tiers.
 *
 * The pipeline is a closed set of tier kinds (exact, blocking, vector, rerank),
 * each behind the same Tier interface and assembled once into a TierSet. A tier
 * never fails the request: backend trouble is reported through
 * TierResult::error and the tier contributes what it has.
 */

#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/config.hpp"
#include "vigil/types.hpp"

namespace vigil::tier {

/** \brief Entity text prepared once per request according to its policy flags. */
struct PreparedQuery {
    std::vector<std::string> folded;       /**< folded name tokens, input order */
    std::vector<std::string> keyed;        /**< folded minus stopwords under strict_stopwords */
    std::vector<std::string> identifiers;  /**< normalized identifier values */
};

auto prepare(const NormalizedEntity& entity) -> PreparedQuery;

/** \brief Request-wide deadline and cancellation. */
struct RequestContext {
    Clock::time_point deadline{Clock::time_point::max()};
    std::stop_token stop;

    /** \brief Options for one backend call: deadline = min(now + timeout, request deadline). */
    [[nodiscard]] auto call_options(milliseconds timeout) const -> backend::CallOptions;

    [[nodiscard]] auto expired() const -> bool { return Clock::now() >= deadline; }
    [[nodiscard]] auto cancelled() const -> bool { return stop.stop_requested(); }
};

/** \brief Everything a tier may look at. Borrowed for the duration of run(). */
struct TierInput {
    const NormalizedEntity& entity;
    const PreparedQuery& query;
    std::span<const Candidate> candidates;  /**< prior candidates; used by rerank */
    const ScreeningConfig& config;
    const RequestContext& context;
};

class Tier {
public:
    virtual ~Tier() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> TierKind = 0;

    virtual auto run(const TierInput& input) -> TierResult = 0;
};

/** \brief The assembled pipeline. Any slot may be null; a null tier is skipped. */
struct TierSet {
    std::shared_ptr<Tier> exact;
    std::shared_ptr<Tier> blocking;
    std::shared_ptr<Tier> vector;
    std::shared_ptr<Tier> rerank;
};

/** \brief Candidate for \p record, with metadata copied for audit and rerank. */
auto make_candidate(const backend::WatchlistRecord& record, TierKind source,
                    float raw_score, float confidence) -> Candidate;

/** \brief Map a backend failure onto a tier error; cancellation and deadline keep their codes. */
auto tier_error(const core::error& backend_error, std::string component) -> core::error;

} // namespace vigil::tier
