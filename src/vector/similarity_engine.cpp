#include <simcache/vector/similarity_engine.h>
#include <simcache/vector/vector_math.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace simcache::vector {

class SimilarityEngine::Impl {
public:
    explicit Impl(const SimilarityEngineConfig& config) {
        threads_ = config.worker_threads;
        if (threads_ == 0) {
            threads_ = std::thread::hardware_concurrency();
        }
        if (threads_ == 0) {
            threads_ = 4;
        }
        pool_ = std::make_unique<boost::asio::thread_pool>(threads_);
        spdlog::debug("[SimilarityEngine] Initialized with {} threads", threads_);
    }

    ~Impl() {
        if (pool_) {
            pool_->join();
        }
    }

    size_t workersFor(size_t candidateCount, size_t maxWorkers) const {
        size_t workers = threads_;
        if (maxWorkers > 0) {
            workers = std::min(workers, maxWorkers);
        }
        workers = std::min(workers, candidateCount);
        return std::max<size_t>(workers, 1);
    }

    std::vector<SimilarityHit> rank(const Vector& query, float queryMagnitude,
                                    const CachedVectorSet& candidates,
                                    const std::optional<std::string>& excludeId,
                                    size_t maxWorkers) const {
        std::vector<SimilarityHit> results;
        if (candidates.empty()) {
            return results;
        }

        const size_t workers = workersFor(candidates.size(), maxWorkers);
        const size_t chunkSize = (candidates.size() + workers - 1) / workers;

        if (workers == 1) {
            return scoreChunk(query, queryMagnitude, candidates, 0, candidates.size(), excludeId);
        }

        std::vector<std::future<std::vector<SimilarityHit>>> futures;
        futures.reserve(workers);

        for (size_t start = 0; start < candidates.size(); start += chunkSize) {
            const size_t end = std::min(start + chunkSize, candidates.size());
            auto task = std::make_shared<std::packaged_task<std::vector<SimilarityHit>()>>(
                [&query, queryMagnitude, &candidates, start, end, &excludeId]() {
                    return scoreChunk(query, queryMagnitude, candidates, start, end, excludeId);
                });
            futures.push_back(task->get_future());
            boost::asio::post(*pool_, [task]() { (*task)(); });
        }

        // Wait for every chunk before merging
        std::vector<std::vector<SimilarityHit>> partials;
        partials.reserve(futures.size());
        size_t total = 0;
        for (auto& fut : futures) {
            partials.push_back(fut.get());
            total += partials.back().size();
        }

        results.reserve(total);
        for (auto& part : partials) {
            results.insert(results.end(), std::make_move_iterator(part.begin()),
                           std::make_move_iterator(part.end()));
        }

        spdlog::debug("[SimilarityEngine] Ranked {} candidates with {} workers", candidates.size(),
                      futures.size());
        return results;
    }

    size_t threadCount() const { return threads_; }

private:
    static std::vector<SimilarityHit> scoreChunk(const Vector& query, float queryMagnitude,
                                                 const CachedVectorSet& candidates, size_t start,
                                                 size_t end,
                                                 const std::optional<std::string>& excludeId) {
        std::vector<SimilarityHit> out;
        out.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            const auto& cached = candidates[i];
            if (excludeId && cached.record_id == *excludeId) {
                continue;
            }
            float score = cosineSimilarity(query, queryMagnitude, cached.vector, cached.magnitude);
            if (!std::isfinite(score)) {
                score = 0.0f;
            }
            out.push_back({cached.record_id, score});
        }
        return out;
    }

    size_t threads_ = 0;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

SimilarityEngine::SimilarityEngine(const SimilarityEngineConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

SimilarityEngine::~SimilarityEngine() = default;

std::vector<SimilarityHit> SimilarityEngine::rank(const Vector& query, float queryMagnitude,
                                                  const CachedVectorSet& candidates,
                                                  const std::optional<std::string>& excludeId,
                                                  size_t maxWorkers) const {
    return pImpl->rank(query, queryMagnitude, candidates, excludeId, maxWorkers);
}

size_t SimilarityEngine::workersFor(size_t candidateCount, size_t maxWorkers) const {
    return pImpl->workersFor(candidateCount, maxWorkers);
}

size_t SimilarityEngine::threadCount() const {
    return pImpl->threadCount();
}

void sortHits(std::vector<SimilarityHit>& hits) {
    std::sort(hits.begin(), hits.end(), [](const SimilarityHit& a, const SimilarityHit& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.record_id < b.record_id;
    });
}

std::vector<SimilarityHit> sortAndTruncate(std::vector<SimilarityHit> hits, size_t limit) {
    sortHits(hits);
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

} // namespace simcache::vector
