#pragma once

/** \file vector_searcher.hpp
 *  \brief Tier2: n-gram TF-IDF kNN, escalation only, hard time box.
 */

#include <atomic>
#include <cstdint>
#include <memory>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/core/task_pool.hpp"
#include "vigil/text/ngram_vectorizer.hpp"
#include "vigil/tier/tier.hpp"

namespace vigil::tier {

/**
 * \brief Cosine kNN through the backend, run on the worker pool.
 *
 * The caller waits at most until min(now + vector timeout, request deadline).
 * On timeout the call's stop source is triggered and whatever the backend has
 * already delivered is used (usually nothing); the result carries
 * deadline_exceeded and partial = true. The backend task may finish later on
 * its worker; its result is dropped.
 */
class VectorSearcher final : public Tier {
public:
    VectorSearcher(std::shared_ptr<const backend::WatchlistBackend> backend,
                   std::shared_ptr<const text::NgramVectorizer> vectorizer,
                   std::shared_ptr<core::TaskPool> pool);

    [[nodiscard]] auto kind() const noexcept -> TierKind override { return TierKind::vector; }

    auto run(const TierInput& input) -> TierResult override;

    /** \brief Calls abandoned because they outlived their deadline. */
    [[nodiscard]] auto timeouts() const noexcept -> std::uint64_t {
        return timeouts_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<const backend::WatchlistBackend> backend_;
    std::shared_ptr<const text::NgramVectorizer> vectorizer_;
    std::shared_ptr<core::TaskPool> pool_;
    std::atomic<std::uint64_t> timeouts_{0};
};

} // namespace vigil::tier
