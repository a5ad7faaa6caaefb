#pragma once

#include <simcache/core/types.h>
#include <simcache/metadata/dataset_catalog.h>
#include <simcache/storage/vector_store.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>

namespace simcache::app {

/**
 * In-memory collaborators populated from a JSON fixture:
 *
 *   {
 *     "datasets": [{"id": "ds1", "name": "articles",
 *                   "fields": [{"name": "title", "type": "text", "embeddable": true}],
 *                   "records": [{"id": "r1", "values": {"title": "..."}}]}],
 *     "vectors": [{"recordId": "r1", "datasetId": "ds1", "fieldName": "title",
 *                  "embedding": [0.1, 0.2], "model": "m"}]
 *   }
 *
 * "embedding" is kept in the shape it was written in (array or JSON string).
 */
struct Fixture {
    std::shared_ptr<metadata::InMemoryDatasetCatalog> catalog;
    std::shared_ptr<storage::InMemoryVectorStore> store;
};

Result<nlohmann::json> readFixtureDocument(const std::filesystem::path& path);
Result<Fixture> loadFixture(const nlohmann::json& doc);
Result<Fixture> loadFixtureFile(const std::filesystem::path& path);

// Writes `original` back with its "vectors" array replaced by the store contents
Result<void> saveFixtureFile(const std::filesystem::path& path, const nlohmann::json& original,
                             const storage::InMemoryVectorStore& store);

} // namespace simcache::app
