#pragma once

/** \file blocker.hpp
 *  \brief Tier1: phonetic and structural blocking keys queried as index filters.
 */

#include <memory>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/tier/tier.hpp"

namespace vigil::tier {

/**
 * \brief Recall-oriented candidate generation.
 *
 * Keys: Soundex of the surname anchor (the last token and, to tolerate
 * reversed order, the first token; for organizations the longest non-stopword
 * token), the first initial, and the birth years within the configured window
 * of a known DOB. A record must share a surname key. Candidate confidence is
 * the share of generated key kinds the record matched.
 */
class Blocker final : public Tier {
public:
    explicit Blocker(std::shared_ptr<const backend::WatchlistBackend> backend);

    [[nodiscard]] auto kind() const noexcept -> TierKind override { return TierKind::blocking; }

    auto run(const TierInput& input) -> TierResult override;

    /** \brief Keys for an entity; exposed for diagnostics and tests. */
    static auto make_keys(const NormalizedEntity& entity, const PreparedQuery& query,
                          const BlockingTierConfig& config) -> backend::BlockingKeys;

private:
    std::shared_ptr<const backend::WatchlistBackend> backend_;
};

} // namespace vigil::tier
