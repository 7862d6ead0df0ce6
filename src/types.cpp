#include "vigil/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include "vigil/text/fold.hpp"

namespace vigil {

auto to_string(EntityType t) noexcept -> std::string_view {
    switch (t) {
        case EntityType::person: return "person";
        case EntityType::organization: return "organization";
        case EntityType::unknown: return "unknown";
    }
    return "unknown";
}

auto to_string(TierKind t) noexcept -> std::string_view {
    switch (t) {
        case TierKind::exact: return "exact";
        case TierKind::blocking: return "blocking";
        case TierKind::vector: return "vector";
        case TierKind::rerank: return "rerank";
    }
    return "unknown";
}

auto to_string(RiskLevel r) noexcept -> std::string_view {
    switch (r) {
        case RiskLevel::skip: return "skip";
        case RiskLevel::low: return "low";
        case RiskLevel::medium: return "medium";
        case RiskLevel::high: return "high";
    }
    return "low";
}

auto to_string(EvidenceField f) noexcept -> std::string_view {
    switch (f) {
        case EvidenceField::tin: return "TIN";
        case EvidenceField::dob: return "DOB";
    }
    return "TIN";
}

auto PolicyFlags::canonical() const -> std::string {
    // Names are listed in lexicographic order.
    const std::pair<bool, std::string_view> flags[] = {
        {ascii_fastpath, "ascii_fastpath"},
        {disable_blocking, "disable_blocking"},
        {disable_exact, "disable_exact"},
        {disable_vector, "disable_vector"},
        {no_cache, "no_cache"},
        {shadow, "shadow"},
        {strict_stopwords, "strict_stopwords"},
    };
    std::string out;
    for (const auto& [on, name] : flags) {
        if (!on) continue;
        if (!out.empty()) out.push_back(',');
        out.append(name);
    }
    return out;
}

auto format_date(const Date& d) -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(d.year()),
                  static_cast<unsigned>(d.month()),
                  static_cast<unsigned>(d.day()));
    return buf;
}

namespace {

auto signal_in_range(float v) -> bool {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

auto malformed(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{
        core::error_code::malformed_input, std::move(message), "screening.input"});
}

} // anonymous namespace

auto validate(const NormalizedEntity& entity) -> std::expected<void, core::error> {
    const auto& s = entity.signals;
    if (!signal_in_range(s.smartfilter_confidence) ||
        !signal_in_range(s.person_confidence) ||
        !signal_in_range(s.org_confidence)) {
        return malformed("upstream confidences must be finite and within [0,1]");
    }
    if (entity.dob && !entity.dob->ok()) {
        return malformed("date of birth is not a valid calendar date");
    }
    if (!s.should_process) {
        return {};
    }
    // Tokens in scripts that fold to nothing still count as a name.
    const bool has_name = std::any_of(entity.tokens.begin(), entity.tokens.end(),
        [](const std::string& t) { return !text::fold(t).empty() || !text::is_ascii(t); });
    if (!has_name) {
        return malformed("entity has no name tokens");
    }
    for (const auto& id : entity.identifiers) {
        if (text::normalize_identifier(id).empty()) {
            return malformed("identifier '" + id + "' has no value");
        }
    }
    return {};
}

auto canonical_form(const NormalizedEntity& entity) -> std::string {
    // Unfoldable tokens keep their raw bytes so distinct names never share a key.
    std::vector<std::string> name;
    name.reserve(entity.tokens.size());
    for (const auto& t : entity.tokens) {
        if (auto f = text::fold(t); !f.empty()) {
            name.push_back(std::move(f));
        } else if (!text::is_ascii(t)) {
            name.push_back(t);
        }
    }
    std::string out = "n=";
    out.append(text::join(name));

    out.append("|l=").append(entity.language);
    out.append("|d=");
    if (entity.dob) out.append(format_date(*entity.dob));

    std::vector<std::string> ids;
    ids.reserve(entity.identifiers.size());
    for (const auto& id : entity.identifiers) {
        ids.push_back(text::normalize_identifier(id));
    }
    out.append("|i=").append(text::sorted_join(std::move(ids), ","));

    const auto& s = entity.signals;
    char buf[96];
    std::snprintf(buf, sizeof(buf), "|s=%d,%.4f,%.4f,%.4f,",
                  s.should_process ? 1 : 0,
                  static_cast<double>(s.smartfilter_confidence),
                  static_cast<double>(s.person_confidence),
                  static_cast<double>(s.org_confidence));
    out.append(buf).append(to_string(s.entity_type));

    out.append("|f=").append(entity.policy_flags.canonical());
    return out;
}

} // namespace vigil
