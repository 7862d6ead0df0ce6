#include "vigil/tier/vector_searcher.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <stop_token>

#include <spdlog/spdlog.h>

#include "vigil/text/fold.hpp"

namespace vigil::tier {

VectorSearcher::VectorSearcher(std::shared_ptr<const backend::WatchlistBackend> backend,
                               std::shared_ptr<const text::NgramVectorizer> vectorizer,
                               std::shared_ptr<core::TaskPool> pool)
    : backend_(std::move(backend))
    , vectorizer_(std::move(vectorizer))
    , pool_(std::move(pool)) {}

auto VectorSearcher::run(const TierInput& input) -> TierResult {
    const auto start = Clock::now();
    TierResult result;
    auto finish = [&]() -> TierResult {
        for (const auto& c : result.candidates) {
            result.best_confidence = std::max(result.best_confidence, c.confidence);
        }
        result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
        return std::move(result);
    };

    if (!backend_ || !vectorizer_ || !pool_) {
        result.error = core::error{core::error_code::backend_unavailable,
                                   "vector search is not configured", "tier.vector"};
        return finish();
    }

    auto query = vectorizer_->transform(text::join(input.query.keyed));
    if (query.empty()) {
        return finish();
    }

    // One stop source per call, linked to the request's token.
    std::stop_source call_stop;
    std::stop_callback link(input.context.stop, [&call_stop] { call_stop.request_stop(); });

    auto call = input.context.call_options(input.config.vector.timeout);
    call.stop = call_stop.get_token();
    const auto deadline = call.deadline;
    const std::size_t k = input.config.vector.k;

    std::future<std::expected<backend::VectorSearchResult, core::error>> pending;
    try {
        pending = pool_->submit([backend = backend_, query = std::move(query), k, call] {
            return backend->vector_search(query, k, call);
        });
    } catch (const std::runtime_error& e) {
        result.error = core::error{core::error_code::backend_unavailable, e.what(), "tier.vector"};
        return finish();
    }

    if (pending.wait_until(deadline) != std::future_status::ready) {
        call_stop.request_stop();
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        result.partial = true;
        result.error = core::error{core::error_code::deadline_exceeded,
                                   "vector search exceeded its time box", "tier.vector"};
        spdlog::debug("vector search abandoned after {} us",
                      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
        // Take what is already there; never wait for it.
        if (pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return finish();
        }
    }

    auto found = pending.get();
    if (!found) {
        result.error = tier_error(found.error(), "tier.vector");
        return finish();
    }
    if (found->truncated) {
        result.partial = true;
        if (!result.error) {
            result.error = core::error{core::error_code::deadline_exceeded,
                                       "vector scan truncated at deadline", "tier.vector"};
        }
    }

    result.candidates.reserve(found->hits.size());
    for (const auto& h : found->hits) {
        auto c = make_candidate(h.record, TierKind::vector, h.cosine, h.cosine);
        c.matched_fields.set(MatchedField::name);
        result.candidates.push_back(std::move(c));
    }
    return finish();
}

} // namespace vigil::tier
