#include "vigil/tier/blocker.hpp"

#include <algorithm>
#include <bit>
#include <chrono>
#include <string>

#include "vigil/text/fold.hpp"
#include "vigil/text/phonetic.hpp"

namespace vigil::tier {

namespace {

auto push_unique(std::vector<std::string>& keys, std::string key) -> void {
    if (key.empty()) return;
    if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(std::move(key));
    }
}

auto generated_kinds(const backend::BlockingKeys& keys) -> int {
    return static_cast<int>(!keys.surname.empty()) +
           static_cast<int>(!keys.initial.empty()) +
           static_cast<int>(!keys.birth_year.empty());
}

} // anonymous namespace

Blocker::Blocker(std::shared_ptr<const backend::WatchlistBackend> backend)
    : backend_(std::move(backend)) {}

auto Blocker::make_keys(const NormalizedEntity& entity, const PreparedQuery& query,
                        const BlockingTierConfig& config) -> backend::BlockingKeys {
    backend::BlockingKeys keys;
    const auto& tokens = query.keyed;
    if (tokens.empty()) return keys;

    if (entity.signals.entity_type == EntityType::organization) {
        const auto core = text::drop_stopwords(tokens);
        const auto longest = std::max_element(core.begin(), core.end(),
            [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
        push_unique(keys.surname, text::soundex(*longest));
    } else {
        push_unique(keys.surname, text::soundex(tokens.back()));
        push_unique(keys.surname, text::soundex(tokens.front()));
    }

    push_unique(keys.initial, tokens.front().substr(0, 1));

    if (entity.dob) {
        const int year = static_cast<int>(entity.dob->year());
        const int window = static_cast<int>(config.birth_year_window);
        for (int y = year - window; y <= year + window; ++y) {
            push_unique(keys.birth_year, std::to_string(y));
        }
    }
    return keys;
}

auto Blocker::run(const TierInput& input) -> TierResult {
    const auto start = Clock::now();
    TierResult result;
    result.escalate = true;

    const auto& cfg = input.config.blocking;
    const auto keys = make_keys(input.entity, input.query, cfg);
    const int kinds = generated_kinds(keys);

    if (backend_ && !keys.surname.empty()) {
        auto hits = backend_->blocking_search(keys, cfg.limit, input.context.call_options(cfg.timeout));
        if (!hits) {
            result.error = tier_error(hits.error(), "tier.blocking");
        } else {
            const auto n = std::min<std::size_t>(hits->size(), cfg.limit);
            result.candidates.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                const auto& h = (*hits)[i];
                const int matched = std::popcount(static_cast<unsigned>(h.matched_kinds));
                const float conf = kinds > 0 ? static_cast<float>(matched) / static_cast<float>(kinds) : 0.0f;
                auto c = make_candidate(h.record, TierKind::blocking, static_cast<float>(matched), conf);
                c.matched_fields.set(MatchedField::name);
                result.best_confidence = std::max(result.best_confidence, c.confidence);
                result.candidates.push_back(std::move(c));
            }
        }
    }

    result.escalate = result.candidates.empty() ||
                      result.best_confidence < cfg.escalation_threshold;
    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    return result;
}

} // namespace vigil::tier
