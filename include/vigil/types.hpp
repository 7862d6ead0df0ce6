#pragma once

/**
 * \file types.hpp
 * \brief Screening data model: input entity, candidates, tier outcomes, decisions.
 *
 * Ownership & lifetime:
 * - NormalizedEntity and everything derived from it live for one request and are
 *   owned by the orchestrator call frame.
 * - ScreeningResult is a value type; the cache stores copies and hands out copies.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vigil/error.hpp"

namespace vigil {

using Clock = std::chrono::steady_clock;
using Date = std::chrono::year_month_day;

enum class EntityType : std::uint8_t {
  unknown = 0,
  person = 1,
  organization = 2,
};

auto to_string(EntityType t) noexcept -> std::string_view;

/** \brief Per-request feature toggles, passed by value through the pipeline. */
struct PolicyFlags {
  bool strict_stopwords{false};  /**< drop legal-form/stop tokens before keying and vectorizing */
  bool ascii_fastpath{false};    /**< skip UTF-8 decoding for pure-ASCII tokens */
  bool disable_exact{false};     /**< skip Tier0 */
  bool disable_blocking{false};  /**< skip Tier1 */
  bool disable_vector{false};    /**< never escalate to Tier2 */
  bool no_cache{false};          /**< bypass cache read and write (debug tracing) */
  bool shadow{false};            /**< request a shadow comparison run */

  /** \brief Sorted, comma-separated names of the set flags (stable across builds). */
  [[nodiscard]] auto canonical() const -> std::string;

  auto operator==(const PolicyFlags&) const -> bool = default;
};

/** \brief Signals produced upstream by the pre-filter and signal extraction. */
struct UpstreamSignals {
  bool should_process{true};           /**< false: no identifiable entity, decision is skip */
  float smartfilter_confidence{0.0f};  /**< pre-filter confidence [0,1] */
  float person_confidence{0.0f};       /**< person evidence [0,1] */
  float org_confidence{0.0f};          /**< organization evidence [0,1] */
  EntityType entity_type{EntityType::unknown};
};

/** \brief Canonical entity produced by the normalization collaborator. */
struct NormalizedEntity {
  std::vector<std::string> tokens;       /**< canonical name tokens, in order */
  std::string language;                  /**< detected language, e.g. "ru", "uk", "en" */
  std::optional<Date> dob;               /**< date of birth when known */
  std::vector<std::string> identifiers;  /**< "TYPE:VALUE" or bare value */
  PolicyFlags policy_flags;
  UpstreamSignals signals;
};

/** \brief Reject entities the decision engine cannot produce a safe result for. */
auto validate(const NormalizedEntity& entity) -> std::expected<void, core::error>;

/** \brief Canonical form used as the cache key: folded tokens, language, DOB,
 *  sorted identifiers, signals and sorted policy flags. */
auto canonical_form(const NormalizedEntity& entity) -> std::string;

/** \brief "YYYY-MM-DD". */
auto format_date(const Date& d) -> std::string;

enum class TierKind : std::uint8_t {
  exact = 0,
  blocking = 1,
  vector = 2,
  rerank = 3,
};

inline constexpr std::size_t kTierCount = 4;

auto to_string(TierKind t) noexcept -> std::string_view;

/** \brief Which parts of the input contributed to a candidate. */
enum class MatchedField : std::uint8_t {
  name = 1u << 0,
  alias = 1u << 1,
  dob = 1u << 2,
  identifier = 1u << 3,
};

struct MatchedFields {
  std::uint8_t bits{0};

  constexpr auto set(MatchedField f) noexcept -> void { bits |= static_cast<std::uint8_t>(f); }
  [[nodiscard]] constexpr auto has(MatchedField f) const noexcept -> bool {
    return (bits & static_cast<std::uint8_t>(f)) != 0;
  }
  constexpr auto merge(MatchedFields other) noexcept -> void { bits |= other.bits; }
  /** \brief Identifier or DOB evidence, preferred over name-only matches on ties. */
  [[nodiscard]] constexpr auto has_hard_evidence() const noexcept -> bool {
    return has(MatchedField::identifier) || has(MatchedField::dob);
  }

  auto operator==(const MatchedFields&) const -> bool = default;
};

/** \brief Watchlist-side attributes carried along for audit and exact rules. */
struct CandidateMetadata {
  std::vector<std::string> aliases;
  std::string program;                   /**< sanction program, e.g. "UA-NSDC" */
  std::string country;
  std::optional<Date> dob;
  std::vector<std::string> identifiers;  /**< normalized identifier values */
};

/** \brief Tier3 sub-scores kept for the audit trail. */
struct RerankFeatures {
  float edit_similarity{0.0f};
  float phonetic{0.0f};
  float exact_rule{0.0f};
  std::optional<float> cosine;
};

/** \brief A watchlist record proposed by one of the tiers. */
struct Candidate {
  std::string id;                        /**< stable watchlist entry key */
  std::string matched_text;              /**< primary name of the record */
  EntityType entity_type{EntityType::person};
  TierKind source_tier{TierKind::exact};
  float raw_score{0.0f};                 /**< tier-local, not comparable across tiers */
  float confidence{0.0f};                /**< tier-normalized; calibrated after Tier3 */
  MatchedFields matched_fields;
  CandidateMetadata metadata;
  std::optional<RerankFeatures> features;
};

/** \brief Outcome of one tier invocation, consumed immediately by the orchestrator. */
struct TierResult {
  std::vector<Candidate> candidates;
  std::chrono::microseconds elapsed{0};
  bool escalate{false};
  float best_confidence{0.0f};
  bool partial{false};                   /**< time-boxed call returned before completion */
  std::optional<core::error> error;
};

/** \brief Per-tier audit row carried in the result. */
struct TierDiagnostics {
  TierKind tier{TierKind::exact};
  bool invoked{false};
  std::chrono::microseconds elapsed{0};
  std::size_t candidate_count{0};
  bool escalate{false};
  bool partial{false};
  std::optional<core::error_code> error_code;
  std::string error_message;
};

enum class RiskLevel : std::uint8_t {
  skip = 0,
  low = 1,
  medium = 2,
  high = 3,
};

auto to_string(RiskLevel r) noexcept -> std::string_view;

/** \brief Evidence types the caller may be asked to supply. */
enum class EvidenceField : std::uint8_t {
  tin = 0,
  dob = 1,
};

auto to_string(EvidenceField f) noexcept -> std::string_view;

/** \brief Weighted contributions of each score component. */
struct ScoreBreakdown {
  float smartfilter_signal{0.0f};
  float person_evidence{0.0f};
  float org_evidence{0.0f};
  float similarity_top{0.0f};
  float id_exact_match{0.0f};
  float dob_match{0.0f};

  [[nodiscard]] auto sum() const noexcept -> float {
    return smartfilter_signal + person_evidence + org_evidence +
           similarity_top + id_exact_match + dob_match;
  }

  auto operator==(const ScoreBreakdown&) const -> bool = default;
};

struct Decision {
  RiskLevel risk_level{RiskLevel::low};
  float risk_score{0.0f};
  bool review_required{false};
  std::vector<EvidenceField> required_additional_fields;
  std::vector<std::string> decision_reasons;
  ScoreBreakdown breakdown;

  auto operator==(const Decision&) const -> bool = default;
};

/** \brief Final response handed to the API layer. */
struct ScreeningResult {
  std::vector<Candidate> candidates;     /**< reranked, best first */
  Decision decision;
  std::array<TierDiagnostics, kTierCount> tiers{};
  bool cache_hit{false};
  bool early_stopped{false};
  std::chrono::microseconds elapsed{0};
};

} // namespace vigil
