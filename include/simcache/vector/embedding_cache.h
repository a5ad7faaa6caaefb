#pragma once

#include <simcache/core/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace simcache::vector {

/**
 * A stored vector with its L2 norm computed once at population time.
 */
struct CachedVector {
    std::string record_id;
    Vector vector;
    float magnitude = 0.0f;
};

using CachedVectorSet = std::vector<CachedVector>;
using CachedVectorSetPtr = std::shared_ptr<const CachedVectorSet>;

/**
 * Embedding cache configuration
 *
 * The four sizing numbers drive every eviction decision; memory is estimated as
 * count * bytes_per_record, never measured.
 */
struct EmbeddingCacheConfig {
    double max_memory_mb = 500.0;                 // Global budget across all entries
    size_t max_per_entry = 50000;                 // Larger sets are never cached
    std::chrono::milliseconds ttl = std::chrono::minutes(10); // Sliding inactivity window
    size_t bytes_per_record = 6200; // 1536 floats + id + magnitude + overhead

    // Time source for TTL bookkeeping; defaults to std::chrono::steady_clock::now
    std::function<TimePoint()> clock;
};

/**
 * Summary of cache occupancy, embedded in search diagnostics
 */
struct CacheInfo {
    size_t entries_count = 0;
    double memory_used_mb = 0.0;
    double memory_budget_mb = 0.0;
    double memory_usage_percent = 0.0;
};

/**
 * Detailed snapshot for observability
 */
struct CacheStats {
    struct Entry {
        std::string key;
        size_t count = 0;
        double memory_mb = 0.0;
        Duration age{0};
        Duration last_access{0};
    };

    size_t entries_count = 0;
    size_t total_vectors = 0;
    double memory_used_mb = 0.0;
    double memory_budget_mb = 0.0;
    double memory_usage_percent = 0.0;
    size_t max_per_entry = 0;
    Duration ttl{0};

    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
    size_t expirations = 0;
    size_t skipped = 0;

    std::vector<Entry> entries; // Most recently used first
};

/**
 * Memory-bounded LRU + TTL cache of per (dataset, field) vector sets.
 *
 * Entries are immutable once inserted: set() replaces a whole entry and readers keep the
 * snapshot they were handed by get(). All mutating calls, get() included, take the
 * exclusive lock; getStats()/getInfo() take the shared lock.
 */
class EmbeddingCache {
public:
    explicit EmbeddingCache(const EmbeddingCacheConfig& config = {});
    ~EmbeddingCache();

    EmbeddingCache(const EmbeddingCache&) = delete;
    EmbeddingCache& operator=(const EmbeddingCache&) = delete;

    // Key format: "<datasetId>:<fieldName>"
    static std::string makeKey(std::string_view datasetId, std::string_view fieldName);

    // Returns nullptr on miss. An entry idle for longer than the TTL is evicted and
    // reported as a miss; a hit refreshes its access time and LRU position.
    CachedVectorSetPtr get(const std::string& datasetId, const std::string& fieldName);

    // Returns false (nothing stored) when the set exceeds max_per_entry or its estimate
    // alone exceeds the budget. Otherwise replaces any same-key entry, evicts least recently
    // used entries until the new one fits, and inserts it as most recently used.
    bool set(const std::string& datasetId, const std::string& fieldName, CachedVectorSet vectors);
    bool set(const std::string& datasetId, const std::string& fieldName,
             CachedVectorSetPtr vectors);

    void invalidate(const std::string& datasetId, const std::string& fieldName);
    size_t invalidateDataset(const std::string& datasetId);
    void clear();

    bool contains(const std::string& datasetId, const std::string& fieldName) const;
    size_t size() const;
    double getMemoryUsageMB() const;
    double estimateMemoryMB(size_t count) const;

    CacheStats getStats() const;
    CacheInfo getInfo() const;

    const EmbeddingCacheConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace simcache::vector
