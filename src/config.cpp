#include "vigil/config.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "vigil/core/platform_utils.hpp"

namespace vigil {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{
        core::error_code::config_invalid, std::move(message), "config"});
}

auto unit_range(float v) -> bool {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

auto check_unit(float v, const char* name) -> std::expected<void, core::error> {
    if (!unit_range(v)) return invalid(std::string(name) + " must be in [0,1]");
    return {};
}

// Each reader leaves the field untouched when the variable is unset and
// reports the variable name when it is set but unparsable.
auto read_float(const char* name, float& field) -> std::expected<void, core::error> {
    if (!core::safe_getenv(name)) return {};
    auto v = core::env_double(name);
    if (!v) return invalid(std::string("unparsable number in ") + name);
    field = static_cast<float>(*v);
    return {};
}

template <typename T>
auto read_uint(const char* name, T& field) -> std::expected<void, core::error> {
    if (!core::safe_getenv(name)) return {};
    auto v = core::env_uint(name);
    if (!v) return invalid(std::string("unparsable integer in ") + name);
    if (*v > std::numeric_limits<T>::max()) return invalid(std::string("integer out of range in ") + name);
    field = static_cast<T>(*v);
    return {};
}

template <typename Duration>
auto read_duration(const char* name, Duration& field) -> std::expected<void, core::error> {
    if (!core::safe_getenv(name)) return {};
    auto v = core::env_uint(name);
    if (!v) return invalid(std::string("unparsable duration in ") + name);
    using rep = typename Duration::rep;
    if (*v > static_cast<std::uint64_t>(std::numeric_limits<rep>::max())) {
        return invalid(std::string("duration out of range in ") + name);
    }
    field = Duration{static_cast<typename Duration::rep>(*v)};
    return {};
}

auto read_bool(const char* name, bool& field) -> std::expected<void, core::error> {
    if (!core::safe_getenv(name)) return {};
    auto v = core::env_bool(name);
    if (!v) return invalid(std::string("unparsable boolean in ") + name);
    field = *v;
    return {};
}

} // anonymous namespace

auto DecisionConfig::validate() const -> std::expected<void, core::error> {
    const std::pair<float, const char*> fields[] = {
        {w_smartfilter, "decision.w_smartfilter"},
        {w_person, "decision.w_person"},
        {w_org, "decision.w_org"},
        {w_similarity, "decision.w_similarity"},
        {bonus_dob, "decision.bonus_dob"},
        {bonus_id, "decision.bonus_id"},
        {thr_high, "decision.thr_high"},
        {thr_medium, "decision.thr_medium"},
        {strong_signal_threshold, "decision.strong_signal_threshold"},
        {strong_similarity_threshold, "decision.strong_similarity_threshold"},
    };
    for (const auto& [v, name] : fields) {
        if (auto r = check_unit(v, name); !r) return r;
    }
    if (thr_medium > thr_high) {
        return invalid("decision.thr_medium must not exceed decision.thr_high");
    }
    return {};
}

auto ScreeningConfig::validate() const -> std::expected<void, core::error> {
    if (auto r = check_unit(exact.exact_match_threshold, "exact.exact_match_threshold"); !r) return r;

    if (blocking.limit == 0) return invalid("blocking.limit must be positive");
    if (blocking.birth_year_window > BlockingTierConfig::MAX_BIRTH_YEAR_WINDOW) {
        return invalid("blocking.birth_year_window must not exceed "
                       + std::to_string(BlockingTierConfig::MAX_BIRTH_YEAR_WINDOW));
    }
    if (auto r = check_unit(blocking.escalation_threshold, "blocking.escalation_threshold"); !r) return r;
    if (auto r = check_unit(blocking.good_enough_threshold, "blocking.good_enough_threshold"); !r) return r;
    if (blocking.escalation_threshold > blocking.good_enough_threshold) {
        return invalid("blocking.escalation_threshold must not exceed blocking.good_enough_threshold");
    }

    if (vector.k == 0) return invalid("vector.k must be positive");
    if (vector.timeout.count() <= 0) return invalid("vector.timeout must be positive");
    if (blocking.timeout.count() <= 0 || exact.timeout.count() <= 0) {
        return invalid("tier timeouts must be positive");
    }

    const std::pair<float, const char*> rerank_fields[] = {
        {rerank.w_edit, "rerank.w_edit"},
        {rerank.w_phonetic, "rerank.w_phonetic"},
        {rerank.w_exact_rule, "rerank.w_exact_rule"},
        {rerank.w_cosine, "rerank.w_cosine"},
        {rerank.dob_rule_score, "rerank.dob_rule_score"},
    };
    for (const auto& [v, name] : rerank_fields) {
        if (auto r = check_unit(v, name); !r) return r;
    }
    if (rerank.w_edit + rerank.w_phonetic + rerank.w_exact_rule <= 0.0f) {
        return invalid("rerank weights must not all be zero");
    }

    if (auto r = decision.validate(); !r) return r;

    if (cache.enabled) {
        if (cache.max_entries == 0) return invalid("cache.max_entries must be positive");
        if (cache.num_shards == 0) return invalid("cache.num_shards must be positive");
        if (cache.ttl.count() <= 0) return invalid("cache.ttl must be positive");
    }

    if (orchestrator.request_budget.count() <= 0) return invalid("orchestrator.request_budget must be positive");
    if (orchestrator.max_candidates == 0) return invalid("orchestrator.max_candidates must be positive");
    return {};
}

auto config_from_env(ScreeningConfig base) -> std::expected<ScreeningConfig, core::error> {
    auto& c = base;
    const std::expected<void, core::error> steps[] = {
        read_float("VIGIL_EXACT__THRESHOLD", c.exact.exact_match_threshold),
        read_duration("VIGIL_EXACT__TIMEOUT_MS", c.exact.timeout),

        read_uint("VIGIL_BLOCKING__LIMIT", c.blocking.limit),
        read_uint("VIGIL_BLOCKING__BIRTH_YEAR_WINDOW", c.blocking.birth_year_window),
        read_float("VIGIL_BLOCKING__ESCALATION_THRESHOLD", c.blocking.escalation_threshold),
        read_float("VIGIL_BLOCKING__GOOD_ENOUGH", c.blocking.good_enough_threshold),
        read_duration("VIGIL_BLOCKING__TIMEOUT_MS", c.blocking.timeout),

        read_uint("VIGIL_VECTOR__K", c.vector.k),
        read_duration("VIGIL_VECTOR__TIMEOUT_MS", c.vector.timeout),

        read_float("VIGIL_RERANK__W_EDIT", c.rerank.w_edit),
        read_float("VIGIL_RERANK__W_PHONETIC", c.rerank.w_phonetic),
        read_float("VIGIL_RERANK__W_EXACT_RULE", c.rerank.w_exact_rule),
        read_float("VIGIL_RERANK__W_COSINE", c.rerank.w_cosine),

        read_float("VIGIL_DECISION__W_SMARTFILTER", c.decision.w_smartfilter),
        read_float("VIGIL_DECISION__W_PERSON", c.decision.w_person),
        read_float("VIGIL_DECISION__W_ORG", c.decision.w_org),
        read_float("VIGIL_DECISION__W_SIMILARITY", c.decision.w_similarity),
        read_float("VIGIL_DECISION__BONUS_DOB", c.decision.bonus_dob),
        read_float("VIGIL_DECISION__BONUS_ID", c.decision.bonus_id),
        read_float("VIGIL_DECISION__THR_HIGH", c.decision.thr_high),
        read_float("VIGIL_DECISION__THR_MEDIUM", c.decision.thr_medium),
        read_bool("VIGIL_DECISION__ID_MATCH_FORCES_HIGH", c.decision.id_match_forces_high),

        read_bool("VIGIL_CACHE__ENABLED", c.cache.enabled),
        read_uint("VIGIL_CACHE__MAX_ENTRIES", c.cache.max_entries),
        read_uint("VIGIL_CACHE__SHARDS", c.cache.num_shards),
        read_duration("VIGIL_CACHE__TTL_S", c.cache.ttl),

        read_duration("VIGIL_ORCHESTRATOR__BUDGET_MS", c.orchestrator.request_budget),
        read_uint("VIGIL_ORCHESTRATOR__MAX_CANDIDATES", c.orchestrator.max_candidates),
    };
    for (const auto& s : steps) {
        if (!s) return std::unexpected(s.error());
    }
    if (auto r = base.validate(); !r) return std::unexpected(r.error());
    return base;
}

} // namespace vigil
