#pragma once

/** \file exact_matcher.hpp
 *  \brief Tier0: whole-name and whole-identifier matching over a compiled automaton.
 */

#include <expected>
#include <memory>
#include <vector>

#include "vigil/backend/watchlist_backend.hpp"
#include "vigil/tier/aho_corasick.hpp"
#include "vigil/tier/tier.hpp"

namespace vigil::tier {

/**
 * \brief Exact matcher compiled once at startup.
 *
 * Patterns are folded names and aliases (as given and token-sorted, with and
 * without stopwords) plus normalized identifier values. The query is scanned as
 * one segmented text: the name, its token-sorted form, then one segment per
 * identifier. A hit counts only when it covers a whole segment of the matching
 * kind, so "ivan" never matches inside "ivanov".
 *
 * With no patterns compiled the matcher falls back to the backend's
 * exact_lookup().
 */
class ExactMatcher final : public Tier {
public:
    /** \brief Matcher with an empty automaton; every query goes to the backend. */
    explicit ExactMatcher(std::shared_ptr<const backend::WatchlistBackend> backend);

    /** \brief Export the backend's patterns and compile them. */
    static auto create(std::shared_ptr<const backend::WatchlistBackend> backend)
        -> std::expected<std::shared_ptr<ExactMatcher>, core::error>;

    /** \brief Replace the automaton with one built from \p patterns. Not thread-safe. */
    auto compile(backend::PatternSet patterns) -> void;

    [[nodiscard]] auto kind() const noexcept -> TierKind override { return TierKind::exact; }

    auto run(const TierInput& input) -> TierResult override;

    [[nodiscard]] auto pattern_count() const noexcept -> std::size_t { return automaton_.pattern_count(); }

private:
    struct Entry {
        std::uint32_t record{0};
        backend::PatternKind kind{backend::PatternKind::name};
    };

    auto scan(const PreparedQuery& query) const -> std::vector<Candidate>;
    auto fallback(const TierInput& input, TierResult& result) const -> void;

    std::shared_ptr<const backend::WatchlistBackend> backend_;
    std::vector<backend::WatchlistRecord> records_;
    std::vector<Entry> entries_;
    AhoCorasick automaton_;
};

} // namespace vigil::tier
