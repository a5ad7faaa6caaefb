#include <simcache/config/config_helpers.h>
#include <simcache/config/embeddings_config.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace simcache::config {

namespace {

class SettingSource {
public:
    explicit SettingSource(std::filesystem::path file) : file_(std::move(file)) {}

    // env → config file → empty
    std::string raw(const char* envName, const std::string& section, const std::string& key,
                    const char* fallbackEnv = nullptr) const {
        if (envName) {
            if (auto v = env_value(envName))
                return *v;
        }
        if (fallbackEnv) {
            if (auto v = env_value(fallbackEnv))
                return *v;
        }
        if (file_.empty())
            return {};
        return parse_config_value(file_, section, key);
    }

    void setString(std::string& out, const char* envName, const std::string& section,
                   const std::string& key, const char* fallbackEnv = nullptr) const {
        if (auto v = raw(envName, section, key, fallbackEnv); !v.empty())
            out = v;
    }

    void setBool(bool& out, const char* envName, const std::string& section,
                 const std::string& key) const {
        auto v = raw(envName, section, key);
        if (v.empty())
            return;
        if (auto b = parse_bool(v)) {
            out = *b;
        } else {
            spdlog::warn("[Config] Ignoring invalid boolean for {}.{}: '{}'", section, key, v);
        }
    }

    template <typename T>
    void setCount(T& out, const char* envName, const std::string& section,
                  const std::string& key) const {
        auto v = raw(envName, section, key);
        if (v.empty())
            return;
        auto n = parse_int(v);
        if (n && *n >= 0) {
            out = static_cast<T>(*n);
        } else {
            spdlog::warn("[Config] Ignoring invalid count for {}.{}: '{}'", section, key, v);
        }
    }

    void setSeconds(std::chrono::milliseconds& out, const char* envName,
                    const std::string& section, const std::string& key) const {
        auto v = raw(envName, section, key);
        if (v.empty())
            return;
        auto n = parse_int(v);
        if (n && *n > 0) {
            out = std::chrono::seconds(*n);
        } else {
            spdlog::warn("[Config] Ignoring invalid duration for {}.{}: '{}'", section, key, v);
        }
    }

    void setMegabytes(double& out, const char* envName, const std::string& section,
                      const std::string& key) const {
        auto v = raw(envName, section, key);
        if (v.empty())
            return;
        auto d = parse_double(v);
        if (d && *d > 0.0) {
            out = *d;
        } else {
            spdlog::warn("[Config] Ignoring invalid size for {}.{}: '{}'", section, key, v);
        }
    }

private:
    std::filesystem::path file_;
};

} // namespace

SimcacheConfig loadConfig(const std::string& override_path) {
    SimcacheConfig cfg;

    auto path = get_config_path(override_path);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        cfg.source = path;
        spdlog::debug("[Config] Using config file {}", path.string());
    } else if (!override_path.empty()) {
        spdlog::warn("[Config] Config file not found: {}", path.string());
    }

    SettingSource src(cfg.source);
    auto& ai = cfg.embeddings;

    src.setBool(ai.enabled, "SIMCACHE_AI_ENABLED", "ai", "enabled");
    src.setString(ai.provider, nullptr, "ai", "provider");
    src.setString(ai.api_key, "SIMCACHE_API_KEY", "ai", "api_key", "OPENAI_API_KEY");
    src.setString(ai.api_base_url, "SIMCACHE_API_BASE_URL", "ai", "api_base_url");
    src.setString(ai.embedding_model, "SIMCACHE_EMBEDDING_MODEL", "ai", "embedding_model");
    src.setCount(ai.embedding_dimensions, "SIMCACHE_EMBEDDING_DIMENSIONS", "ai",
                 "embedding_dimensions");
    src.setSeconds(ai.generation_timeout, nullptr, "ai", "generation_timeout_seconds");
    src.setSeconds(ai.query_timeout, nullptr, "ai", "query_timeout_seconds");
    src.setCount(ai.max_texts_per_batch, nullptr, "ai", "max_texts_per_batch");
    src.setCount(ai.record_field_truncate_chars, nullptr, "ai", "record_field_truncate_chars");

    src.setMegabytes(cfg.cache.max_memory_mb, "SIMCACHE_CACHE_MAX_MEMORY_MB", "cache",
                     "max_memory_mb");
    src.setCount(cfg.cache.max_per_entry, nullptr, "cache", "max_per_entry");
    src.setSeconds(cfg.cache.ttl, "SIMCACHE_CACHE_TTL_SECONDS", "cache", "ttl_seconds");
    src.setCount(cfg.cache.bytes_per_record, nullptr, "cache", "bytes_per_record");

    src.setCount(cfg.search.worker_threads, nullptr, "search", "worker_threads");
    src.setCount(ai.default_limit, nullptr, "search", "default_limit");
    src.setCount(ai.max_limit, nullptr, "search", "max_limit");

    if (ai.max_texts_per_batch == 0)
        ai.max_texts_per_batch = 1;
    if (ai.default_limit == 0)
        ai.default_limit = 10;
    if (ai.max_limit < ai.default_limit)
        ai.max_limit = ai.default_limit;

    return cfg;
}

} // namespace simcache::config
