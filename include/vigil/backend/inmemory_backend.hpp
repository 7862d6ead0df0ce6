#pragma once

/** \file inmemory_backend.hpp
 *  \brief Reference WatchlistBackend held entirely in memory.
 *
 * Blocking keys are kept as Roaring posting lists over dense record ordinals;
 * vectors are brute-force scanned. Suitable for tests, benchmarks and small
 * lists; the production index sits behind the same interface.
 *
 * Thread-safety: immutable after create(); all queries are safe to run
 * concurrently.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <roaring/roaring.hh>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/text/ngram_vectorizer.hpp"

namespace vigil::backend {

class InMemoryBackend final : public WatchlistBackend {
public:
    /** \brief Index \p records.
     *
     * \param records Watchlist entries; ids must be unique and non-empty
     * \param vectorizer Fitted vectorizer to use; when null one is fitted on the
     *        records' names and aliases
     * \return Backend, or config_invalid on duplicate ids / empty corpus
     */
    static auto create(std::vector<WatchlistRecord> records,
                       std::shared_ptr<const text::NgramVectorizer> vectorizer = nullptr)
        -> std::expected<std::unique_ptr<InMemoryBackend>, core::error>;

    auto export_patterns() const -> std::expected<PatternSet, core::error> override;

    auto exact_lookup(const ExactQuery& query, const CallOptions& call) const
        -> std::expected<std::vector<ExactHit>, core::error> override;

    auto blocking_search(const BlockingKeys& keys, std::size_t limit,
                         const CallOptions& call) const
        -> std::expected<std::vector<BlockingHit>, core::error> override;

    auto vector_search(const text::SparseVector& query, std::size_t k,
                       const CallOptions& call) const
        -> std::expected<VectorSearchResult, core::error> override;

    /** \brief The vectorizer queries must be encoded with. */
    [[nodiscard]] auto vectorizer() const noexcept -> std::shared_ptr<const text::NgramVectorizer> {
        return vectorizer_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return records_.size(); }

private:
    InMemoryBackend() = default;

    auto index_record(std::uint32_t ordinal) -> void;

    std::vector<WatchlistRecord> records_;
    std::shared_ptr<const text::NgramVectorizer> vectorizer_;

    // Blocking posting lists, keyed by raw key value.
    std::unordered_map<std::string, roaring::Roaring> surname_postings_;
    std::unordered_map<std::string, roaring::Roaring> initial_postings_;
    std::unordered_map<std::string, roaring::Roaring> year_postings_;

    // Exact lookup: folded name forms and normalized identifiers.
    std::unordered_map<std::string, std::vector<std::pair<std::uint32_t, PatternKind>>> name_index_;
    std::unordered_map<std::string, std::vector<std::uint32_t>> identifier_index_;

    // One vector per surface form; form_owner_[i] is the record ordinal.
    std::vector<text::SparseVector> form_vectors_;
    std::vector<std::uint32_t> form_owner_;
};

} // namespace vigil::backend
