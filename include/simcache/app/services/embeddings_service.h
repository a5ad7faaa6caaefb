#pragma once

#include <simcache/config/embeddings_config.h>
#include <simcache/core/types.h>
#include <simcache/genai/embedding_client.h>
#include <simcache/metadata/dataset_catalog.h>
#include <simcache/storage/vector_store.h>
#include <simcache/vector/embedding_cache.h>
#include <simcache/vector/similarity_engine.h>

#include <memory>
#include <string>
#include <vector>

namespace simcache::app::services {

// Field name under which record-mode embeddings are stored
inline constexpr const char* kRecordLevelFieldName = "_record";

enum class EmbeddingMode { Field, Record };

// "" and "field" map to Field, "record" to Record; anything else is InvalidArgument
Result<EmbeddingMode> parseEmbeddingMode(const std::string& mode);

struct EmbeddingRequest {
    std::string dataset; // Name or id
    std::string field_name;
    std::string mode;                    // "field" (default) or "record"
    std::vector<std::string> record_ids; // Empty = every record in the dataset
    std::string record_template;         // Record mode only, `{fieldName}` placeholders
};

struct EmbeddingResponse {
    size_t generated = 0;
    size_t skipped = 0;
    std::vector<std::string> errors;
};

struct FindSimilarRequest {
    std::string dataset;
    std::string field_name;
    std::string mode;
    std::string text;      // Embedded through the provider
    std::string record_id; // Or reuse this record's stored vector
    int limit = 0;         // <= 0 selects the configured default
};

using SimilarRecord = vector::SimilarityHit;

struct SimilarityDebug {
    std::string dataset_id;
    std::string field_name;
    size_t query_embedding_len = 0;
    size_t stored_embeddings = 0;
    size_t processed_count = 0;
    size_t error_count = 0;
    std::vector<std::string> errors; // First few decode failures
    bool cache_hit = false;
    bool cache_skipped = false;
    vector::CacheInfo cache_stats;
};

struct FindSimilarResponse {
    std::vector<SimilarRecord> results;
    SimilarityDebug debug;
};

struct EmbeddingStats {
    size_t total_records = 0;
    size_t embedded_records = 0;
    size_t not_embedded_records = 0;
};

struct EmbeddableField {
    std::string name;
    std::string type;
};

/**
 * @brief Collaborators of the embeddings service
 *
 * The cache and engine are shared so several services (or a CLI session) can reuse one
 * instance; each is individually thread-safe.
 */
struct EmbeddingsServiceDeps {
    std::shared_ptr<metadata::IDatasetCatalog> catalog;
    std::shared_ptr<storage::IVectorStore> store;
    std::shared_ptr<genai::IEmbeddingClient> client;
    std::shared_ptr<vector::EmbeddingCache> cache;
    std::shared_ptr<vector::SimilarityEngine> engine;
};

/**
 * @brief Generates, stores and searches record embeddings
 *
 * Configuration and lookup failures are returned before any cache or network work. Batch
 * failures during generation are collected into the response instead of failing the call.
 */
class EmbeddingsService {
public:
    EmbeddingsService(config::EmbeddingsSettings settings, EmbeddingsServiceDeps deps);
    ~EmbeddingsService();

    EmbeddingsService(const EmbeddingsService&) = delete;
    EmbeddingsService& operator=(const EmbeddingsService&) = delete;

    Result<EmbeddingResponse> generateEmbeddings(const EmbeddingRequest& req);
    Result<FindSimilarResponse> findSimilar(const FindSimilarRequest& req);

    Result<size_t> deleteEmbeddingsForRecord(const std::string& recordId);
    Result<size_t> deleteEmbeddingsForDataset(const std::string& dataset);
    Result<size_t> deleteEmbeddingsForField(const std::string& dataset,
                                            const std::string& fieldName);

    Result<EmbeddingStats> getEmbeddingStats(const std::string& dataset,
                                             const std::string& fieldName);
    Result<std::vector<std::string>> getPendingRecordIds(const std::string& dataset,
                                                         const std::string& fieldName);
    Result<std::vector<EmbeddableField>> getEmbeddableFields(const std::string& dataset);

    vector::CacheStats getCacheStats() const;
    vector::CacheInfo getCacheInfo() const;
    void clearCache();

    const config::EmbeddingsSettings& settings() const { return settings_; }

private:
    // Resolved field name for a mode/field pair; validates embeddability when requested
    Result<std::string> resolveFieldName(const metadata::DatasetInfo& dataset,
                                         const std::string& mode, const std::string& fieldName,
                                         bool requireEmbeddable) const;

    Result<Vector> resolveQueryVector(const FindSimilarRequest& req, const std::string& fieldName);

    // Cache lookup, falling back to loading and decoding the stored vectors
    Result<vector::CachedVectorSetPtr> loadCandidates(const std::string& datasetId,
                                                      const std::string& fieldName,
                                                      SimilarityDebug& debug);

    config::EmbeddingsSettings settings_;
    EmbeddingsServiceDeps deps_;
};

} // namespace simcache::app::services
