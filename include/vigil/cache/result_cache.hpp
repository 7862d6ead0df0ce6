#pragma once

/** \file result_cache.hpp
 *  \brief Memoization of screening results keyed by canonical entity form.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vigil/error.hpp"
#include "vigil/types.hpp"

namespace vigil::cache {

/** \brief Point-in-time cache counters. */
struct CacheMetrics {
    double hit_rate{0.0};
    std::size_t size{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};    /**< capacity-driven removals */
    std::uint64_t expirations{0};  /**< TTL-driven removals */
};

/** \brief Result cache seen by the orchestrator.
 *
 * Errors from get/put are never fatal to a request; the orchestrator treats
 * them as a miss.
 */
class ScreeningCache {
public:
    virtual ~ScreeningCache() = default;

    /** \brief Copy of the stored result, or nullopt on miss/expiry. */
    virtual auto get(std::string_view key) -> std::expected<std::optional<ScreeningResult>, core::error> = 0;

    /** \brief Insert or replace; the entry expires \p ttl after this call. */
    virtual auto put(std::string_view key, const ScreeningResult& value, std::chrono::milliseconds ttl)
        -> std::expected<void, core::error> = 0;

    virtual auto remove(std::string_view key) -> bool = 0;
    virtual auto clear() -> void = 0;
    [[nodiscard]] virtual auto metrics() const -> CacheMetrics = 0;
};

/** \brief 64-bit FNV-1a over bytes. */
constexpr auto fnv1a_hash(std::string_view s) noexcept -> std::uint64_t {
    std::uint64_t hash = 14695981039346656037ULL;
    for (char c : s) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

class ResultCacheShard;

/** \brief Sharded LRU with per-entry TTL.
 *
 * Each shard holds at most ceil(max_entries / num_shards) entries behind its
 * own reader/writer lock; the shard is chosen by FNV-1a of the key and the full
 * key is compared inside the shard. An entry leaves the cache on LRU eviction
 * or on expiry, whichever comes first.
 */
class ShardedResultCache final : public ScreeningCache {
public:
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 16;

    explicit ShardedResultCache(std::size_t max_entries,
                                std::size_t num_shards = DEFAULT_NUM_SHARDS);
    ~ShardedResultCache() override;

    ShardedResultCache(const ShardedResultCache&) = delete;
    ShardedResultCache& operator=(const ShardedResultCache&) = delete;

    auto get(std::string_view key) -> std::expected<std::optional<ScreeningResult>, core::error> override;
    auto put(std::string_view key, const ScreeningResult& value, std::chrono::milliseconds ttl)
        -> std::expected<void, core::error> override;
    auto remove(std::string_view key) -> bool override;
    auto clear() -> void override;
    [[nodiscard]] auto metrics() const -> CacheMetrics override;

private:
    auto shard_for(std::string_view key) const -> ResultCacheShard&;

    std::vector<std::unique_ptr<ResultCacheShard>> shards_;
};

} // namespace vigil::cache
