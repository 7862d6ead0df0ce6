#include "vigil/decision/decision_engine.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::decision {

namespace {

auto internal(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{
        core::error_code::internal, std::move(message), "decision"});
}

auto in_unit(float v) -> bool {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

auto push_unique(std::vector<std::string>& reasons, std::string code) -> void {
    if (std::find(reasons.begin(), reasons.end(), code) == reasons.end()) {
        reasons.push_back(std::move(code));
    }
}

} // anonymous namespace

DecisionEngine::DecisionEngine(DecisionConfig config)
    : config_(config) {}

auto DecisionEngine::decide(const DecisionEvidence& evidence) const -> std::expected<Decision, core::error> {
    if (auto ok = config_.validate(); !ok) {
        return internal("decision config rejected: " + ok.error().message);
    }

    const auto& s = evidence.signals;
    if (!in_unit(s.smartfilter_confidence) || !in_unit(s.person_confidence) ||
        !in_unit(s.org_confidence) || !in_unit(evidence.similarity_top)) {
        return internal("decision evidence outside [0,1]");
    }

    Decision d;
    if (!s.should_process) {
        d.risk_level = RiskLevel::skip;
        d.risk_score = 0.0f;
        d.decision_reasons = {"smartfilter_skip", "risk_level:skip"};
        return d;
    }

    const auto& c = config_;
    auto& b = d.breakdown;
    b.smartfilter_signal = c.w_smartfilter * s.smartfilter_confidence;
    b.person_evidence = c.w_person * s.person_confidence;
    b.org_evidence = c.w_org * s.org_confidence;
    b.similarity_top = c.w_similarity * evidence.similarity_top;
    b.id_exact_match = evidence.id_match ? c.bonus_id : 0.0f;
    b.dob_match = evidence.dob_match ? c.bonus_dob : 0.0f;

    d.risk_score = std::clamp(b.sum(), 0.0f, 1.0f);

    if (d.risk_score >= c.thr_high) {
        d.risk_level = RiskLevel::high;
    } else if (d.risk_score >= c.thr_medium) {
        d.risk_level = RiskLevel::medium;
    } else {
        d.risk_level = RiskLevel::low;
    }

    if (evidence.id_match && c.id_match_forces_high) {
        d.risk_level = RiskLevel::high;
        d.risk_score = std::max(d.risk_score, c.thr_high);
    }

    bool mismatch = false;
    if (d.risk_level == RiskLevel::high && !evidence.id_match && !evidence.dob_match) {
        d.review_required = true;
        if (!evidence.identifiers_supplied) d.required_additional_fields.push_back(EvidenceField::tin);
        if (!evidence.dob_supplied) d.required_additional_fields.push_back(EvidenceField::dob);
        if (d.required_additional_fields.empty()) {
            // Both evidence types were supplied and neither matched the best candidate.
            mismatch = true;
            d.risk_level = RiskLevel::medium;
        }
    }

    auto& r = d.decision_reasons;
    if (b.smartfilter_signal > 0.0f) {
        push_unique(r, s.smartfilter_confidence >= c.strong_signal_threshold
                           ? "strong_smartfilter_signal" : "smartfilter_signal");
    }
    if (b.person_evidence > 0.0f) {
        push_unique(r, s.person_confidence >= c.strong_signal_threshold
                           ? "person_evidence_strong" : "person_evidence");
    }
    if (b.org_evidence > 0.0f) {
        push_unique(r, s.org_confidence >= c.strong_signal_threshold
                           ? "org_evidence_strong" : "org_evidence");
    }
    if (b.similarity_top > 0.0f) {
        push_unique(r, evidence.similarity_top >= c.strong_similarity_threshold
                           ? "high_vector_similarity" : "similarity_top");
    }
    if (evidence.id_match) push_unique(r, "id_exact_match");
    if (evidence.dob_match) push_unique(r, "dob_match");
    if (evidence.decisive_tier && evidence.similarity_top > 0.0f) {
        push_unique(r, "decisive_tier:" + std::string(to_string(*evidence.decisive_tier)));
    }
    for (const auto& code : evidence.degradations) {
        push_unique(r, code);
    }
    if (mismatch) push_unique(r, "evidence_mismatch");
    for (auto f : d.required_additional_fields) {
        push_unique(r, "missing_evidence:" + std::string(to_string(f)));
    }
    push_unique(r, "risk_level:" + std::string(to_string(d.risk_level)));

    return d;
}

} // namespace vigil::decision
