#include <simcache/vector/embedding_cache.h>

#include <spdlog/spdlog.h>

#include <iterator>
#include <list>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace simcache::vector {

namespace {

constexpr double kBytesPerMB = 1024.0 * 1024.0;

} // namespace

class EmbeddingCache::Impl {
public:
    explicit Impl(const EmbeddingCacheConfig& config) : config_(config) {
        if (!config_.clock) {
            config_.clock = [] { return std::chrono::steady_clock::now(); };
        }
    }

    CachedVectorSetPtr get(const std::string& key) {
        std::unique_lock lock(mutex_);

        auto it = cache_.find(key);
        if (it == cache_.end()) {
            stats_.misses++;
            return nullptr;
        }

        const auto now = config_.clock();
        if (now - it->second.accessed_at > config_.ttl) {
            spdlog::debug("[EmbeddingCache] Entry {} expired after {}ms idle", key,
                          std::chrono::duration_cast<std::chrono::milliseconds>(
                              now - it->second.accessed_at)
                              .count());
            removeEntry(it);
            stats_.expirations++;
            stats_.misses++;
            return nullptr;
        }

        // Cache hit: refresh sliding TTL and move to the most recently used end
        it->second.accessed_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_pos);
        stats_.hits++;
        return it->second.vectors;
    }

    bool set(const std::string& key, CachedVectorSetPtr snapshot) {
        const size_t count = snapshot ? snapshot->size() : 0;
        if (count > config_.max_per_entry) {
            spdlog::debug("[EmbeddingCache] Not caching {}: {} vectors exceeds per-entry limit {}",
                          key, count, config_.max_per_entry);
            noteSkipped();
            return false;
        }
        if (!snapshot) {
            snapshot = std::make_shared<const CachedVectorSet>();
        }

        const double entryMB = estimateMemoryMB(count);
        if (entryMB > config_.max_memory_mb) {
            spdlog::debug("[EmbeddingCache] Not caching {}: {:.2f}MB exceeds budget {:.2f}MB",
                          key, entryMB, config_.max_memory_mb);
            noteSkipped();
            return false;
        }

        std::unique_lock lock(mutex_);

        // Replace semantics: drop the old contribution before sizing the eviction
        if (auto existing = cache_.find(key); existing != cache_.end()) {
            removeEntry(existing);
        }

        while (total_memory_mb_ + entryMB > config_.max_memory_mb && !lru_list_.empty()) {
            evictLRU();
        }

        const auto now = config_.clock();
        lru_list_.push_front(key);
        Entry entry;
        entry.vectors = std::move(snapshot);
        entry.memory_mb = entryMB;
        entry.created_at = now;
        entry.accessed_at = now;
        entry.lru_pos = lru_list_.begin();
        cache_.emplace(key, std::move(entry));
        total_memory_mb_ += entryMB;

        spdlog::debug("[EmbeddingCache] Cached {} ({:.2f}MB, total {:.2f}/{:.2f}MB)", key, entryMB,
                      total_memory_mb_, config_.max_memory_mb);
        return true;
    }

    void invalidate(const std::string& key) {
        std::unique_lock lock(mutex_);
        if (auto it = cache_.find(key); it != cache_.end()) {
            removeEntry(it);
            spdlog::debug("[EmbeddingCache] Invalidated {}", key);
        }
    }

    size_t invalidatePrefix(const std::string& prefix) {
        std::unique_lock lock(mutex_);
        size_t removed = 0;
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                auto next = std::next(it);
                removeEntry(it);
                it = next;
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            spdlog::debug("[EmbeddingCache] Invalidated {} entries with prefix {}", removed,
                          prefix);
        }
        return removed;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        cache_.clear();
        lru_list_.clear();
        total_memory_mb_ = 0.0;
        spdlog::info("[EmbeddingCache] Cleared");
    }

    bool contains(const std::string& key) const {
        std::shared_lock lock(mutex_);
        return cache_.find(key) != cache_.end();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return cache_.size();
    }

    double getMemoryUsageMB() const {
        std::shared_lock lock(mutex_);
        return total_memory_mb_;
    }

    double estimateMemoryMB(size_t count) const {
        return static_cast<double>(count) * static_cast<double>(config_.bytes_per_record) /
               kBytesPerMB;
    }

    CacheStats getStats() const {
        std::shared_lock lock(mutex_);

        CacheStats stats = stats_;
        const auto now = config_.clock();
        stats.entries_count = cache_.size();
        stats.memory_used_mb = total_memory_mb_;
        stats.memory_budget_mb = config_.max_memory_mb;
        stats.memory_usage_percent = usagePercent();
        stats.max_per_entry = config_.max_per_entry;
        stats.ttl = config_.ttl;

        stats.entries.reserve(cache_.size());
        for (const auto& key : lru_list_) {
            const auto& entry = cache_.at(key);
            CacheStats::Entry e;
            e.key = key;
            e.count = entry.vectors->size();
            e.memory_mb = entry.memory_mb;
            e.age = std::chrono::duration_cast<Duration>(now - entry.created_at);
            e.last_access = std::chrono::duration_cast<Duration>(now - entry.accessed_at);
            stats.total_vectors += e.count;
            stats.entries.push_back(std::move(e));
        }
        return stats;
    }

    CacheInfo getInfo() const {
        std::shared_lock lock(mutex_);
        CacheInfo info;
        info.entries_count = cache_.size();
        info.memory_used_mb = total_memory_mb_;
        info.memory_budget_mb = config_.max_memory_mb;
        info.memory_usage_percent = usagePercent();
        return info;
    }

    const EmbeddingCacheConfig& getConfig() const { return config_; }

private:
    struct Entry {
        CachedVectorSetPtr vectors;
        double memory_mb = 0.0;
        TimePoint created_at;
        TimePoint accessed_at;
        std::list<std::string>::iterator lru_pos;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    // Caller holds the exclusive lock
    void removeEntry(EntryMap::iterator it) {
        total_memory_mb_ -= it->second.memory_mb;
        lru_list_.erase(it->second.lru_pos);
        cache_.erase(it);
        if (cache_.empty()) {
            // Avoid accumulating floating point drift across many add/remove cycles
            total_memory_mb_ = 0.0;
        }
    }

    // Caller holds the exclusive lock
    void evictLRU() {
        const std::string key = lru_list_.back();
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            lru_list_.pop_back();
            return;
        }
        spdlog::debug("[EmbeddingCache] Evicting {} ({:.2f}MB)", key, it->second.memory_mb);
        removeEntry(it);
        stats_.evictions++;
    }

    void noteSkipped() {
        std::unique_lock lock(mutex_);
        stats_.skipped++;
    }

    double usagePercent() const {
        if (config_.max_memory_mb <= 0.0) {
            return 0.0;
        }
        return total_memory_mb_ / config_.max_memory_mb * 100.0;
    }

    EmbeddingCacheConfig config_;

    mutable std::shared_mutex mutex_;
    EntryMap cache_;
    std::list<std::string> lru_list_; // Front: most recently used
    double total_memory_mb_ = 0.0;

    CacheStats stats_;
};

EmbeddingCache::EmbeddingCache(const EmbeddingCacheConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}
EmbeddingCache::~EmbeddingCache() = default;

std::string EmbeddingCache::makeKey(std::string_view datasetId, std::string_view fieldName) {
    std::string key;
    key.reserve(datasetId.size() + fieldName.size() + 1);
    key.append(datasetId);
    key.push_back(':');
    key.append(fieldName);
    return key;
}

CachedVectorSetPtr EmbeddingCache::get(const std::string& datasetId,
                                       const std::string& fieldName) {
    return pImpl->get(makeKey(datasetId, fieldName));
}

bool EmbeddingCache::set(const std::string& datasetId, const std::string& fieldName,
                         CachedVectorSet vectors) {
    return pImpl->set(makeKey(datasetId, fieldName),
                      std::make_shared<const CachedVectorSet>(std::move(vectors)));
}

bool EmbeddingCache::set(const std::string& datasetId, const std::string& fieldName,
                         CachedVectorSetPtr vectors) {
    return pImpl->set(makeKey(datasetId, fieldName), std::move(vectors));
}

void EmbeddingCache::invalidate(const std::string& datasetId, const std::string& fieldName) {
    pImpl->invalidate(makeKey(datasetId, fieldName));
}

size_t EmbeddingCache::invalidateDataset(const std::string& datasetId) {
    return pImpl->invalidatePrefix(datasetId + ":");
}

void EmbeddingCache::clear() {
    pImpl->clear();
}

bool EmbeddingCache::contains(const std::string& datasetId, const std::string& fieldName) const {
    return pImpl->contains(makeKey(datasetId, fieldName));
}

size_t EmbeddingCache::size() const {
    return pImpl->size();
}

double EmbeddingCache::getMemoryUsageMB() const {
    return pImpl->getMemoryUsageMB();
}

double EmbeddingCache::estimateMemoryMB(size_t count) const {
    return pImpl->estimateMemoryMB(count);
}

CacheStats EmbeddingCache::getStats() const {
    return pImpl->getStats();
}

CacheInfo EmbeddingCache::getInfo() const {
    return pImpl->getInfo();
}

const EmbeddingCacheConfig& EmbeddingCache::getConfig() const {
    return pImpl->getConfig();
}

} // namespace simcache::vector
