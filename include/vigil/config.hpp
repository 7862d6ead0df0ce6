#pragma once

/** \file config.hpp
 *  \brief Screening configuration: tier thresholds, weights, timeouts, cache sizing.
 *
 * All structs are plain aggregates with production defaults. A configuration is
 * validated once (validate()) before it is installed; the orchestrator then
 * reads it through an immutable snapshot for the duration of a request.
 *
 * Environment overrides use keys of the form VIGIL_<SECTION>__<FIELD>, e.g.
 * VIGIL_DECISION__THR_HIGH=0.9 or VIGIL_VECTOR__TIMEOUT_MS=30.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>

#include "vigil/error.hpp"

namespace vigil {

using std::chrono::milliseconds;

/** \brief Tier0 exact matcher. */
struct ExactTierConfig {
    float exact_match_threshold{0.95f};   /**< raw score that stops the pipeline early */
    milliseconds timeout{100};            /**< backend fallback lookup only */
};

/** \brief Tier1 phonetic/structural blocking. */
struct BlockingTierConfig {
    static constexpr std::uint32_t MAX_BIRTH_YEAR_WINDOW = 10;

    std::uint32_t limit{300};             /**< hard cap on records returned per request */
    std::uint32_t birth_year_window{1};   /**< +- years around a known DOB */
    float escalation_threshold{0.75f};    /**< best confidence below this escalates to Tier2 */
    float good_enough_threshold{0.90f};   /**< best confidence at or above this never escalates */
    milliseconds timeout{200};
};

/** \brief Tier2 vector kNN. */
struct VectorTierConfig {
    std::uint32_t k{20};                  /**< neighbours requested */
    milliseconds timeout{50};             /**< strictest time box in the pipeline */
};

/** \brief Tier3 feature weights; normalized over the features available per candidate. */
struct RerankConfig {
    float w_edit{0.35f};
    float w_phonetic{0.15f};
    float w_exact_rule{0.20f};
    float w_cosine{0.30f};
    float dob_rule_score{0.7f};           /**< exact rule value for a DOB-only match */
};

/** \brief Decision engine weights and thresholds. */
struct DecisionConfig {
    float w_smartfilter{0.25f};
    float w_person{0.30f};
    float w_org{0.15f};
    float w_similarity{0.25f};
    float bonus_dob{0.07f};
    float bonus_id{0.15f};
    float thr_high{0.85f};
    float thr_medium{0.65f};
    float strong_signal_threshold{0.7f};      /**< upstream signal above which the strong reason is used */
    float strong_similarity_threshold{0.9f};  /**< similarity above which high_vector_similarity is used */
    bool id_match_forces_high{true};

    /** \brief Weights in [0,1], thresholds ordered 0 <= thr_medium <= thr_high <= 1. */
    auto validate() const -> std::expected<void, core::error>;
};

/** \brief Result cache sizing. */
struct CacheConfig {
    bool enabled{true};
    std::size_t max_entries{10000};       /**< total across shards */
    std::size_t num_shards{16};
    std::chrono::seconds ttl{300};
};

/** \brief Request-level limits. */
struct OrchestratorConfig {
    milliseconds request_budget{500};     /**< end-to-end latency budget per request */
    std::size_t max_candidates{50};       /**< cap after merge-by-id */
};

struct ScreeningConfig {
    ExactTierConfig exact;
    BlockingTierConfig blocking;
    VectorTierConfig vector;
    RerankConfig rerank;
    DecisionConfig decision;
    CacheConfig cache;
    OrchestratorConfig orchestrator;

    /** \brief Check every section; the first violation is reported as config_invalid. */
    auto validate() const -> std::expected<void, core::error>;
};

/** \brief Apply VIGIL_* environment overrides on top of \p base and validate the result.
 *
 * \return Overridden config, or config_invalid when a variable is set but unparsable
 *         or the resulting config fails validation
 */
auto config_from_env(ScreeningConfig base = {}) -> std::expected<ScreeningConfig, core::error>;

} // namespace vigil
