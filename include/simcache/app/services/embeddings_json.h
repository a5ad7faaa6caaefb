#pragma once

#include <simcache/app/services/embeddings_service.h>

#include <nlohmann/json.hpp>

namespace simcache::app::services {

// camelCase JSON views of the service results, as printed by the CLI
nlohmann::json toJson(const EmbeddingResponse& r);
nlohmann::json toJson(const FindSimilarResponse& r);
nlohmann::json toJson(const SimilarityDebug& d);
nlohmann::json toJson(const EmbeddingStats& s);
nlohmann::json toJson(const std::vector<EmbeddableField>& fields);
nlohmann::json toJson(const vector::CacheInfo& info);
nlohmann::json toJson(const vector::CacheStats& stats);

} // namespace simcache::app::services
