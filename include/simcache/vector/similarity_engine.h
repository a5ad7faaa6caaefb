#pragma once

#include <simcache/core/types.h>
#include <simcache/vector/embedding_cache.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simcache::vector {

struct SimilarityHit {
    std::string record_id;
    float similarity = 0.0f;
};

struct SimilarityEngineConfig {
    size_t worker_threads = 0; // 0 = std::thread::hardware_concurrency()
};

/**
 * @brief Parallel cosine ranking of a query vector against a candidate set.
 *
 * Candidates are split into contiguous chunks, one per worker, and each chunk is scored on a
 * shared Boost.Asio thread pool. Workers only read their own chunk; results are merged after
 * every chunk completes. Ranking never fails: malformed candidates score 0.
 */
class SimilarityEngine {
public:
    explicit SimilarityEngine(const SimilarityEngineConfig& config = {});
    ~SimilarityEngine();

    SimilarityEngine(const SimilarityEngine&) = delete;
    SimilarityEngine& operator=(const SimilarityEngine&) = delete;

    /**
     * Scores every candidate except the one whose id equals excludeId.
     * Output order is unspecified; use sortAndTruncate() to rank.
     */
    std::vector<SimilarityHit> rank(const Vector& query, float queryMagnitude,
                                    const CachedVectorSet& candidates,
                                    const std::optional<std::string>& excludeId = std::nullopt,
                                    size_t maxWorkers = 0) const;

    // Worker count used for a candidate set of the given size: min(threads, n), at least 1
    size_t workersFor(size_t candidateCount, size_t maxWorkers = 0) const;

    size_t threadCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Descending similarity, ties broken by record id ascending
void sortHits(std::vector<SimilarityHit>& hits);

// Sorts and keeps the first `limit` hits (all of them if fewer)
std::vector<SimilarityHit> sortAndTruncate(std::vector<SimilarityHit> hits, size_t limit);

} // namespace simcache::vector
