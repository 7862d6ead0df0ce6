#include "vigil/cache/result_cache.hpp"

#include <algorithm>
#include <iterator>
#include <list>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace vigil::cache {

/** \brief One LRU list with its own lock and counters. */
class ResultCacheShard {
public:
    struct Entry {
        std::string key;
        ScreeningResult value;
        Clock::time_point expires_at;
        Clock::time_point last_accessed;
    };

    using ListIterator = std::list<Entry>::iterator;

    explicit ResultCacheShard(std::size_t capacity)
        : capacity_(capacity) {}

    auto get(std::string_view key) -> std::optional<ScreeningResult> {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        auto list_it = it->second;
        const auto now = Clock::now();
        if (now >= list_it->expires_at) {
            erase(it);
            expirations_.fetch_add(1, std::memory_order_relaxed);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }
        list_it->last_accessed = now;

        hits_.fetch_add(1, std::memory_order_relaxed);
        return list_it->value;
    }

    auto put(std::string_view key, const ScreeningResult& value, std::chrono::milliseconds ttl) -> void {
        std::unique_lock lock(mutex_);
        const auto now = Clock::now();

        // Entries are immutable; a repeated key replaces the whole node.
        if (auto it = index_.find(key); it != index_.end()) {
            erase(it);
        } else {
            make_space(now);
        }
        lru_list_.push_front(Entry{std::string(key), value, now + ttl, now});
        // The index key views the string owned by the list node.
        index_.emplace(std::string_view(lru_list_.front().key), lru_list_.begin());
    }

    auto remove(std::string_view key) -> bool {
        std::unique_lock lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        erase(it);
        return true;
    }

    auto clear() -> void {
        std::unique_lock lock(mutex_);
        index_.clear();
        lru_list_.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    auto add_to(CacheMetrics& m) const -> void {
        m.hits += hits_.load(std::memory_order_relaxed);
        m.misses += misses_.load(std::memory_order_relaxed);
        m.evictions += evictions_.load(std::memory_order_relaxed);
        m.expirations += expirations_.load(std::memory_order_relaxed);
        m.size += size();
    }

private:
    using Index = std::unordered_map<std::string_view, ListIterator>;

    auto make_space(Clock::time_point now) -> void {
        // Expired entries go first, then least recently used.
        for (auto it = lru_list_.begin(); it != lru_list_.end();) {
            auto next = std::next(it);
            if (now >= it->expires_at) {
                index_.erase(std::string_view(it->key));
                lru_list_.erase(it);
                expirations_.fetch_add(1, std::memory_order_relaxed);
            }
            it = next;
        }
        while (!lru_list_.empty() && lru_list_.size() >= capacity_) {
            erase(index_.find(std::string_view(lru_list_.back().key)));
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    auto erase(Index::iterator it) -> void {
        auto list_it = it->second;
        index_.erase(it);
        lru_list_.erase(list_it);
    }

    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    Index index_;
    std::size_t capacity_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expirations_{0};
};

ShardedResultCache::ShardedResultCache(std::size_t max_entries, std::size_t num_shards) {
    num_shards = std::max<std::size_t>(1, num_shards);
    max_entries = std::max<std::size_t>(1, max_entries);
    const auto per_shard = (max_entries + num_shards - 1) / num_shards;
    shards_.reserve(num_shards);
    for (std::size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<ResultCacheShard>(per_shard));
    }
}

ShardedResultCache::~ShardedResultCache() = default;

auto ShardedResultCache::shard_for(std::string_view key) const -> ResultCacheShard& {
    return *shards_[fnv1a_hash(key) % shards_.size()];
}

auto ShardedResultCache::get(std::string_view key)
    -> std::expected<std::optional<ScreeningResult>, core::error> {
    return shard_for(key).get(key);
}

auto ShardedResultCache::put(std::string_view key, const ScreeningResult& value,
                             std::chrono::milliseconds ttl) -> std::expected<void, core::error> {
    if (ttl.count() <= 0) {
        return std::unexpected(core::error{
            core::error_code::cache_error, "ttl must be positive", "cache.sharded"});
    }
    shard_for(key).put(key, value, ttl);
    return {};
}

auto ShardedResultCache::remove(std::string_view key) -> bool {
    return shard_for(key).remove(key);
}

auto ShardedResultCache::clear() -> void {
    for (auto& shard : shards_) {
        shard->clear();
    }
}

auto ShardedResultCache::metrics() const -> CacheMetrics {
    CacheMetrics m;
    for (const auto& shard : shards_) {
        shard->add_to(m);
    }
    const auto total = m.hits + m.misses;
    m.hit_rate = total > 0 ? static_cast<double>(m.hits) / static_cast<double>(total) : 0.0;
    return m;
}

} // namespace vigil::cache
