#pragma once

/** \file reranker.hpp
 *  \brief Tier3: multi-feature re-scoring of the merged candidate list.
 */

#include <memory>

#include "vigil/text/ngram_vectorizer.hpp"
#include "vigil/tier/tier.hpp"

namespace vigil::tier {

/**
 * \brief Fuses name similarity, phonetic agreement, exact rules and vector
 * cosine into one calibrated confidence per candidate.
 *
 * Features (all in [0,1]):
 * - edit: best over the record's name and aliases of the mean of Levenshtein
 *   similarity and Jaro-Winkler, each taken token-order insensitively;
 * - phonetic: share of query tokens whose Soundex appears in that form;
 * - exact rule: 1.0 on an identifier match, the configured DOB value on a DOB
 *   match, else 0;
 * - cosine: n-gram TF-IDF cosine, only when a vectorizer is configured.
 * The weighted sum is divided by the weights of the features present.
 * Output is sorted by confidence, then identifier/DOB evidence, then id.
 */
class Reranker final : public Tier {
public:
    explicit Reranker(std::shared_ptr<const text::NgramVectorizer> vectorizer = nullptr);

    [[nodiscard]] auto kind() const noexcept -> TierKind override { return TierKind::rerank; }

    auto run(const TierInput& input) -> TierResult override;

    /** \brief Score one candidate in place. */
    auto score(const NormalizedEntity& entity, const PreparedQuery& query,
               const RerankConfig& config, Candidate& candidate) const -> void;

private:
    std::shared_ptr<const text::NgramVectorizer> vectorizer_;
};

/** \brief Strict ordering used for the final candidate list. */
auto rank_before(const Candidate& a, const Candidate& b) noexcept -> bool;

} // namespace vigil::tier
