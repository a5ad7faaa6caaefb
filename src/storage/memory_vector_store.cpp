#include <simcache/storage/vector_store.h>

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace simcache::storage {

class InMemoryVectorStore::Impl {
public:
    using Key = std::pair<std::string, std::string>; // (record_id, field_name)

    mutable std::shared_mutex mutex_;
    std::map<Key, StoredVectorRecord> records_;
};

InMemoryVectorStore::InMemoryVectorStore() : pImpl(std::make_unique<Impl>()) {}

InMemoryVectorStore::~InMemoryVectorStore() = default;

Result<std::vector<StoredVectorRecord>>
InMemoryVectorStore::findVectorsByDatasetField(const std::string& datasetId,
                                               const std::string& fieldName) {
    std::shared_lock lock(pImpl->mutex_);
    std::vector<StoredVectorRecord> out;
    for (const auto& [key, record] : pImpl->records_) {
        if (record.dataset_id == datasetId && record.field_name == fieldName) {
            out.push_back(record);
        }
    }
    return out;
}

Result<std::optional<StoredVectorRecord>>
InMemoryVectorStore::findVectorByRecordField(const std::string& recordId,
                                             const std::string& fieldName) {
    std::shared_lock lock(pImpl->mutex_);
    auto it = pImpl->records_.find({recordId, fieldName});
    if (it == pImpl->records_.end()) {
        return std::optional<StoredVectorRecord>{};
    }
    return std::optional<StoredVectorRecord>{it->second};
}

Result<void> InMemoryVectorStore::upsertVector(const std::string& recordId,
                                               const std::string& datasetId,
                                               const std::string& fieldName, const Vector& vector,
                                               const std::string& modelName, size_t dimensions) {
    if (recordId.empty() || fieldName.empty()) {
        return Error{ErrorCode::InvalidArgument, "record_id and field_name are required"};
    }

    std::unique_lock lock(pImpl->mutex_);
    auto& record = pImpl->records_[{recordId, fieldName}];
    record.record_id = recordId;
    record.dataset_id = datasetId;
    record.field_name = fieldName;
    record.embedding.emplace<nlohmann::json>(vector::encodeVector(vector));
    record.model = modelName;
    record.dimensions = dimensions;
    return Result<void>();
}

Result<size_t> InMemoryVectorStore::deleteVectorsIf(const StoredVectorPredicate& predicate) {
    if (!predicate) {
        return Error{ErrorCode::InvalidArgument, "predicate is required"};
    }

    std::unique_lock lock(pImpl->mutex_);
    size_t removed = 0;
    for (auto it = pImpl->records_.begin(); it != pImpl->records_.end();) {
        if (predicate(it->second)) {
            it = pImpl->records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    spdlog::debug("[InMemoryVectorStore] Deleted {} stored vectors", removed);
    return removed;
}

void InMemoryVectorStore::put(StoredVectorRecord record) {
    std::unique_lock lock(pImpl->mutex_);
    Impl::Key key{record.record_id, record.field_name};
    pImpl->records_[std::move(key)] = std::move(record);
}

std::vector<StoredVectorRecord> InMemoryVectorStore::all() const {
    std::shared_lock lock(pImpl->mutex_);
    std::vector<StoredVectorRecord> out;
    out.reserve(pImpl->records_.size());
    for (const auto& [key, record] : pImpl->records_) {
        out.push_back(record);
    }
    return out;
}

size_t InMemoryVectorStore::size() const {
    std::shared_lock lock(pImpl->mutex_);
    return pImpl->records_.size();
}

} // namespace simcache::storage
