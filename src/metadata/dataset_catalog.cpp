#include <simcache/metadata/dataset_catalog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace simcache::metadata {

const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::Text: return "text";
        case FieldType::Editor: return "editor";
        case FieldType::Email: return "email";
        case FieldType::Url: return "url";
        case FieldType::Number: return "number";
        case FieldType::Other: return "other";
    }
    return "other";
}

FieldType fieldTypeFromString(const std::string& s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text")
        return FieldType::Text;
    if (lower == "editor")
        return FieldType::Editor;
    if (lower == "email")
        return FieldType::Email;
    if (lower == "url")
        return FieldType::Url;
    if (lower == "number")
        return FieldType::Number;
    return FieldType::Other;
}

const FieldInfo* DatasetInfo::findField(const std::string& fieldName) const {
    for (const auto& f : fields) {
        if (f.name == fieldName)
            return &f;
    }
    return nullptr;
}

std::string RecordData::getString(const std::string& fieldName) const {
    auto it = values.find(fieldName);
    return it == values.end() ? std::string{} : it->second;
}

class InMemoryDatasetCatalog::Impl {
public:
    struct Dataset {
        DatasetInfo info;
        std::map<std::string, RecordData> records; // Ordered by record id
    };

    // Caller holds the lock
    const Dataset* resolve(const std::string& nameOrId) const {
        if (auto it = datasets_.find(nameOrId); it != datasets_.end()) {
            return &it->second;
        }
        for (const auto& [id, ds] : datasets_) {
            if (ds.info.name == nameOrId)
                return &ds;
        }
        return nullptr;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, Dataset> datasets_;
};

InMemoryDatasetCatalog::InMemoryDatasetCatalog() : pImpl(std::make_unique<Impl>()) {}

InMemoryDatasetCatalog::~InMemoryDatasetCatalog() = default;

Result<DatasetInfo> InMemoryDatasetCatalog::findDataset(const std::string& nameOrId) {
    std::shared_lock lock(pImpl->mutex_);
    const auto* ds = pImpl->resolve(nameOrId);
    if (!ds) {
        return Error{ErrorCode::NotFound, "dataset not found: " + nameOrId};
    }
    return ds->info;
}

Result<std::vector<RecordData>> InMemoryDatasetCatalog::listRecords(const std::string& datasetId) {
    std::shared_lock lock(pImpl->mutex_);
    auto it = pImpl->datasets_.find(datasetId);
    if (it == pImpl->datasets_.end()) {
        return Error{ErrorCode::NotFound, "dataset not found: " + datasetId};
    }
    std::vector<RecordData> out;
    out.reserve(it->second.records.size());
    for (const auto& [id, record] : it->second.records) {
        out.push_back(record);
    }
    return out;
}

Result<RecordData> InMemoryDatasetCatalog::findRecord(const std::string& datasetId,
                                                      const std::string& recordId) {
    std::shared_lock lock(pImpl->mutex_);
    auto it = pImpl->datasets_.find(datasetId);
    if (it == pImpl->datasets_.end()) {
        return Error{ErrorCode::NotFound, "dataset not found: " + datasetId};
    }
    auto rit = it->second.records.find(recordId);
    if (rit == it->second.records.end()) {
        return Error{ErrorCode::NotFound, "record not found: " + recordId};
    }
    return rit->second;
}

void InMemoryDatasetCatalog::addDataset(DatasetInfo dataset) {
    std::unique_lock lock(pImpl->mutex_);
    auto& slot = pImpl->datasets_[dataset.id];
    slot.info = std::move(dataset);
}

Result<void> InMemoryDatasetCatalog::addRecord(const std::string& datasetId, RecordData record) {
    std::unique_lock lock(pImpl->mutex_);
    auto it = pImpl->datasets_.find(datasetId);
    if (it == pImpl->datasets_.end()) {
        return Error{ErrorCode::NotFound, "dataset not found: " + datasetId};
    }
    std::string id = record.id;
    it->second.records[id] = std::move(record);
    return Result<void>();
}

} // namespace simcache::metadata
