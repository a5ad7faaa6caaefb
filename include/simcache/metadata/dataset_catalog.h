#pragma once

#include <simcache/core/types.h>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace simcache::metadata {

enum class FieldType { Text, Editor, Email, Url, Number, Other };

const char* fieldTypeToString(FieldType type);
FieldType fieldTypeFromString(const std::string& s);

struct FieldInfo {
    std::string name;
    FieldType type = FieldType::Text;
    bool embeddable = false;

    // Only text and editor fields flagged for embedding qualify
    bool isEmbeddable() const {
        return embeddable && (type == FieldType::Text || type == FieldType::Editor);
    }
};

struct DatasetInfo {
    std::string id;
    std::string name;
    std::vector<FieldInfo> fields;

    const FieldInfo* findField(const std::string& fieldName) const;
};

struct RecordData {
    std::string id;
    std::unordered_map<std::string, std::string> values;

    // Empty string when the field is unset
    std::string getString(const std::string& fieldName) const;
};

/**
 * @brief Read-only dataset/record metadata used to decide what to embed
 */
class IDatasetCatalog {
public:
    virtual ~IDatasetCatalog() = default;

    // Resolves either the canonical id or the display name
    virtual Result<DatasetInfo> findDataset(const std::string& nameOrId) = 0;

    virtual Result<std::vector<RecordData>> listRecords(const std::string& datasetId) = 0;

    virtual Result<RecordData> findRecord(const std::string& datasetId,
                                          const std::string& recordId) = 0;
};

/**
 * @brief Thread-safe in-process catalog used by the CLI and tests
 */
class InMemoryDatasetCatalog final : public IDatasetCatalog {
public:
    InMemoryDatasetCatalog();
    ~InMemoryDatasetCatalog() override;

    Result<DatasetInfo> findDataset(const std::string& nameOrId) override;
    Result<std::vector<RecordData>> listRecords(const std::string& datasetId) override;
    Result<RecordData> findRecord(const std::string& datasetId,
                                  const std::string& recordId) override;

    void addDataset(DatasetInfo dataset);
    Result<void> addRecord(const std::string& datasetId, RecordData record);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace simcache::metadata
