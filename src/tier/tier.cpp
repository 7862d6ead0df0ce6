#include "vigil/tier/tier.hpp"

#include <algorithm>

#include "vigil/text/fold.hpp"

namespace vigil::tier {

auto prepare(const NormalizedEntity& entity) -> PreparedQuery {
    const auto& flags = entity.policy_flags;

    PreparedQuery q;
    q.folded = text::fold_tokens(entity.tokens, flags.ascii_fastpath);
    q.keyed = flags.strict_stopwords ? text::drop_stopwords(q.folded) : q.folded;
    q.identifiers.reserve(entity.identifiers.size());
    for (const auto& id : entity.identifiers) {
        if (auto v = text::normalize_identifier(id); !v.empty()) {
            q.identifiers.push_back(std::move(v));
        }
    }
    return q;
}

auto RequestContext::call_options(milliseconds timeout) const -> backend::CallOptions {
    const auto now = Clock::now();
    auto d = deadline;
    if (now < deadline && deadline - now > timeout) {
        d = now + timeout;
    }
    return backend::CallOptions{d, stop};
}

auto make_candidate(const backend::WatchlistRecord& record, TierKind source,
                    float raw_score, float confidence) -> Candidate {
    Candidate c;
    c.id = record.id;
    c.matched_text = record.name;
    c.entity_type = record.entity_type;
    c.source_tier = source;
    c.raw_score = raw_score;
    c.confidence = std::clamp(confidence, 0.0f, 1.0f);
    c.metadata.aliases = record.aliases;
    c.metadata.program = record.program;
    c.metadata.country = record.country;
    c.metadata.dob = record.dob;
    c.metadata.identifiers.reserve(record.identifiers.size());
    for (const auto& id : record.identifiers) {
        if (auto v = text::normalize_identifier(id); !v.empty()) {
            c.metadata.identifiers.push_back(std::move(v));
        }
    }
    return c;
}

auto tier_error(const core::error& backend_error, std::string component) -> core::error {
    core::error e;
    switch (backend_error.code) {
        case core::error_code::cancelled:
        case core::error_code::deadline_exceeded:
            e.code = backend_error.code;
            break;
        default:
            e.code = core::error_code::backend_unavailable;
            break;
    }
    e.message = backend_error.message;
    e.component = std::move(component);
    return e;
}

} // namespace vigil::tier
