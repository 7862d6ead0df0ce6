#include "vigil/tier/reranker.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_set>

#include "vigil/text/fold.hpp"
#include "vigil/text/phonetic.hpp"
#include "vigil/text/similarity.hpp"

namespace vigil::tier {

namespace {

auto name_similarity(const std::vector<std::string>& q, const std::vector<std::string>& f) -> float {
    const auto qj = text::join(q);
    const auto fj = text::join(f);
    const auto qs = text::sorted_join(q);
    const auto fs = text::sorted_join(f);
    const float lev = std::max(text::edit_similarity(qj, fj), text::edit_similarity(qs, fs));
    const float jw = std::max(text::jaro_winkler(qj, fj), text::jaro_winkler(qs, fs));
    return 0.5f * (lev + jw);
}

auto phonetic_share(const std::vector<std::string>& q, const std::vector<std::string>& f) -> float {
    if (q.empty()) return 0.0f;
    std::unordered_set<std::string> codes;
    for (const auto& t : f) {
        if (auto c = text::soundex(t); !c.empty()) codes.insert(std::move(c));
    }
    std::size_t hit = 0;
    for (const auto& t : q) {
        if (auto c = text::soundex(t); !c.empty() && codes.count(c) > 0) ++hit;
    }
    return static_cast<float>(hit) / static_cast<float>(q.size());
}

} // anonymous namespace

Reranker::Reranker(std::shared_ptr<const text::NgramVectorizer> vectorizer)
    : vectorizer_(std::move(vectorizer)) {}

auto Reranker::score(const NormalizedEntity& entity, const PreparedQuery& query,
                     const RerankConfig& config, Candidate& candidate) const -> void {
    const bool strict = entity.policy_flags.strict_stopwords;
    const bool fast = entity.policy_flags.ascii_fastpath;

    std::vector<std::vector<std::string>> forms;
    forms.reserve(1 + candidate.metadata.aliases.size());
    auto add_form = [&](const std::string& s) {
        auto toks = text::fold_text(s, fast);
        if (strict) toks = text::drop_stopwords(toks);
        if (!toks.empty()) forms.push_back(std::move(toks));
    };
    add_form(candidate.matched_text);
    for (const auto& a : candidate.metadata.aliases) add_form(a);

    RerankFeatures f;
    for (const auto& form : forms) {
        f.edit_similarity = std::max(f.edit_similarity, name_similarity(query.keyed, form));
        f.phonetic = std::max(f.phonetic, phonetic_share(query.keyed, form));
    }

    const bool id_match = std::any_of(query.identifiers.begin(), query.identifiers.end(),
        [&](const std::string& id) {
            const auto& ids = candidate.metadata.identifiers;
            return std::find(ids.begin(), ids.end(), id) != ids.end();
        });
    const bool dob_match = entity.dob && candidate.metadata.dob && *entity.dob == *candidate.metadata.dob;

    if (id_match) {
        candidate.matched_fields.set(MatchedField::identifier);
    }
    if (dob_match) {
        candidate.matched_fields.set(MatchedField::dob);
    }
    if (candidate.matched_fields.has(MatchedField::identifier)) {
        f.exact_rule = 1.0f;
    } else if (candidate.matched_fields.has(MatchedField::dob)) {
        f.exact_rule = config.dob_rule_score;
    }

    float weighted = config.w_edit * f.edit_similarity +
                     config.w_phonetic * f.phonetic +
                     config.w_exact_rule * f.exact_rule;
    float total = config.w_edit + config.w_phonetic + config.w_exact_rule;

    if (vectorizer_ && vectorizer_->is_fitted()) {
        const auto qv = vectorizer_->transform(text::join(query.keyed));
        float best = 0.0f;
        for (const auto& form : forms) {
            best = std::max(best, text::NgramVectorizer::cosine(qv, vectorizer_->transform(text::join(form))));
        }
        f.cosine = best;
        weighted += config.w_cosine * best;
        total += config.w_cosine;
    }

    candidate.confidence = total > 0.0f ? std::clamp(weighted / total, 0.0f, 1.0f) : 0.0f;
    candidate.features = f;
}

auto Reranker::run(const TierInput& input) -> TierResult {
    const auto start = Clock::now();
    TierResult result;
    result.candidates.assign(input.candidates.begin(), input.candidates.end());

    for (auto& c : result.candidates) {
        score(input.entity, input.query, input.config.rerank, c);
    }
    std::sort(result.candidates.begin(), result.candidates.end(), rank_before);

    if (!result.candidates.empty()) {
        result.best_confidence = result.candidates.front().confidence;
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    return result;
}

auto rank_before(const Candidate& a, const Candidate& b) noexcept -> bool {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    const bool ha = a.matched_fields.has_hard_evidence();
    const bool hb = b.matched_fields.has_hard_evidence();
    if (ha != hb) return ha;
    return a.id < b.id;
}

} // namespace vigil::tier
