#pragma once

/** \file watchlist_backend.hpp
 *  \brief Narrow interface to the watchlist index.
 *
 * The screening core never talks to an index engine directly; it goes through
 * WatchlistBackend. Implementations must be thread-safe for concurrent reads.
 * Every query carries a CallOptions with an absolute deadline and a stop token;
 * implementations should poll both and return early (partial results or
 * deadline_exceeded / cancelled) instead of overrunning.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "vigil/error.hpp"
#include "vigil/text/ngram_vectorizer.hpp"
#include "vigil/types.hpp"

namespace vigil::backend {

/** \brief One watchlist entry as stored by the index. */
struct WatchlistRecord {
    std::string id;                        /**< stable entry key */
    std::string name;                      /**< primary name, UTF-8 */
    EntityType entity_type{EntityType::person};
    std::vector<std::string> aliases;      /**< alternative spellings, transliterations */
    std::vector<std::string> identifiers;  /**< "TYPE:VALUE" or bare value */
    std::optional<Date> dob;
    std::string program;
    std::string country;
};

/** \brief Deadline and cancellation for one backend call. */
struct CallOptions {
    Clock::time_point deadline{Clock::time_point::max()};
    std::stop_token stop;

    [[nodiscard]] auto expired() const -> bool {
        return stop.stop_requested() || Clock::now() >= deadline;
    }
};

/** \brief Pattern kinds exported for the Tier0 automaton. */
enum class PatternKind : std::uint8_t {
    name = 0,
    alias = 1,
    identifier = 2,
};

/** \brief A surface form of one record. */
struct ExactPattern {
    std::string text;                      /**< raw surface form; folded by the matcher */
    std::uint32_t record{0};               /**< index into PatternSet::records */
    PatternKind kind{PatternKind::name};
};

/** \brief Everything the Tier0 automaton is compiled from. */
struct PatternSet {
    std::vector<WatchlistRecord> records;
    std::vector<ExactPattern> patterns;
};

/** \brief Fallback exact lookup when no automaton is compiled. */
struct ExactQuery {
    std::vector<std::string> folded_tokens;
    std::vector<std::string> identifiers;  /**< normalized identifier values */
};

struct ExactHit {
    WatchlistRecord record;
    PatternKind kind{PatternKind::name};
};

/** \brief Blocking keys grouped by kind. Keys are compared verbatim. */
struct BlockingKeys {
    std::vector<std::string> surname;      /**< Soundex codes; a record must share one */
    std::vector<std::string> initial;      /**< first-letter keys */
    std::vector<std::string> birth_year;   /**< "1985" style years */
};

/** \brief Bit set over the key kinds a record matched. */
enum class KeyKind : std::uint8_t {
    surname = 1u << 0,
    initial = 1u << 1,
    birth_year = 1u << 2,
};

struct BlockingHit {
    WatchlistRecord record;
    std::uint8_t matched_kinds{0};         /**< KeyKind bits */

    [[nodiscard]] auto matched(KeyKind k) const noexcept -> bool {
        return (matched_kinds & static_cast<std::uint8_t>(k)) != 0;
    }
};

struct VectorHit {
    WatchlistRecord record;
    float cosine{0.0f};
};

struct VectorSearchResult {
    std::vector<VectorHit> hits;           /**< best first */
    bool truncated{false};                 /**< deadline hit before the scan completed */
};

class WatchlistBackend {
public:
    virtual ~WatchlistBackend() = default;

    /** \brief All name/alias/identifier surface forms for automaton compilation. */
    virtual auto export_patterns() const -> std::expected<PatternSet, core::error> = 0;

    virtual auto exact_lookup(const ExactQuery& query, const CallOptions& call) const
        -> std::expected<std::vector<ExactHit>, core::error> = 0;

    /** \brief Records sharing at least one surname key, at most \p limit of them. */
    virtual auto blocking_search(const BlockingKeys& keys, std::size_t limit,
                                 const CallOptions& call) const
        -> std::expected<std::vector<BlockingHit>, core::error> = 0;

    /** \brief Top-k by cosine similarity to \p query. */
    virtual auto vector_search(const text::SparseVector& query, std::size_t k,
                               const CallOptions& call) const
        -> std::expected<VectorSearchResult, core::error> = 0;
};

} // namespace vigil::backend
