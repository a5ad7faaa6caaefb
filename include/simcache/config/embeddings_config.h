#pragma once

#include <simcache/core/types.h>
#include <simcache/vector/embedding_cache.h>
#include <simcache/vector/similarity_engine.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace simcache::config {

struct EmbeddingsSettings {
    bool enabled = false;
    std::string provider = "openai";
    std::string api_key;
    std::string api_base_url = "https://api.openai.com/v1";
    std::string embedding_model;
    int embedding_dimensions = 0; // 0 = provider default

    std::chrono::milliseconds generation_timeout = std::chrono::seconds(120);
    std::chrono::milliseconds query_timeout = std::chrono::seconds(30);

    size_t max_texts_per_batch = 2048;
    size_t record_field_truncate_chars = 2000;
    size_t default_limit = 10;
    size_t max_limit = 100;
    size_t max_error_messages = 10;
    size_t max_debug_errors = 3;
};

struct SimcacheConfig {
    EmbeddingsSettings embeddings;
    vector::EmbeddingCacheConfig cache;
    vector::SimilarityEngineConfig search;
    std::filesystem::path source; // Config file consulted, empty if none existed
};

/**
 * @brief Resolve settings: environment, then the TOML file, then defaults
 *
 * A missing file is not an error. Unparsable values keep the default and log a warning.
 */
SimcacheConfig loadConfig(const std::string& override_path = "");

} // namespace simcache::config
