#pragma once

#include <simcache/core/types.h>
#include <simcache/vector/vector_codec.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simcache::storage {

/**
 * @brief A persisted embedding for one (record, field) pair
 *
 * The payload is kept in whatever shape the backing store produced; callers decode it with
 * vector::decodeVector() and must tolerate per-record failures.
 */
struct StoredVectorRecord {
    std::string record_id;
    std::string dataset_id;
    std::string field_name;
    vector::StoredVectorPayload embedding;
    std::string model;
    size_t dimensions = 0;
};

using StoredVectorPredicate = std::function<bool(const StoredVectorRecord&)>;

/**
 * @brief Abstract interface for the embedding persistence collaborator
 *
 * Records are unique on (record_id, field_name). Implementations must be safe for concurrent
 * use; the embeddings service adds no locking of its own.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    /**
     * @brief All stored vectors for a dataset/field (the candidate set)
     */
    virtual Result<std::vector<StoredVectorRecord>>
    findVectorsByDatasetField(const std::string& datasetId, const std::string& fieldName) = 0;

    /**
     * @brief Stored vector for one record/field, std::nullopt when absent
     */
    virtual Result<std::optional<StoredVectorRecord>>
    findVectorByRecordField(const std::string& recordId, const std::string& fieldName) = 0;

    /**
     * @brief Insert, or update in place when (recordId, fieldName) already exists
     */
    virtual Result<void> upsertVector(const std::string& recordId, const std::string& datasetId,
                                      const std::string& fieldName, const Vector& vector,
                                      const std::string& modelName, size_t dimensions) = 0;

    /**
     * @brief Delete every record matching the predicate
     * @return Number of deleted records
     */
    virtual Result<size_t> deleteVectorsIf(const StoredVectorPredicate& predicate) = 0;
};

/**
 * @brief Thread-safe in-process store used by the CLI and tests
 */
class InMemoryVectorStore final : public IVectorStore {
public:
    InMemoryVectorStore();
    ~InMemoryVectorStore() override;

    Result<std::vector<StoredVectorRecord>>
    findVectorsByDatasetField(const std::string& datasetId, const std::string& fieldName) override;

    Result<std::optional<StoredVectorRecord>>
    findVectorByRecordField(const std::string& recordId, const std::string& fieldName) override;

    Result<void> upsertVector(const std::string& recordId, const std::string& datasetId,
                              const std::string& fieldName, const Vector& vector,
                              const std::string& modelName, size_t dimensions) override;

    Result<size_t> deleteVectorsIf(const StoredVectorPredicate& predicate) override;

    // Seeds a record verbatim, keeping its payload encoding
    void put(StoredVectorRecord record);

    std::vector<StoredVectorRecord> all() const;
    size_t size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace simcache::storage
