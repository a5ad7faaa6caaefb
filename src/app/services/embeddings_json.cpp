#include <simcache/app/services/embeddings_json.h>

namespace simcache::app::services {

using nlohmann::json;

json toJson(const EmbeddingResponse& r) {
    json j;
    j["generated"] = r.generated;
    j["skipped"] = r.skipped;
    if (!r.errors.empty()) {
        j["errors"] = r.errors;
    }
    return j;
}

json toJson(const vector::CacheInfo& info) {
    return json{{"entriesCount", info.entries_count},
                {"memoryUsedMB", info.memory_used_mb},
                {"memoryBudgetMB", info.memory_budget_mb},
                {"memoryUsagePercent", info.memory_usage_percent}};
}

json toJson(const SimilarityDebug& d) {
    json j;
    j["datasetId"] = d.dataset_id;
    j["fieldName"] = d.field_name;
    j["queryEmbeddingLen"] = d.query_embedding_len;
    j["storedEmbeddings"] = d.stored_embeddings;
    j["processedCount"] = d.processed_count;
    j["errorCount"] = d.error_count;
    if (!d.errors.empty()) {
        j["errors"] = d.errors;
    }
    j["cacheHit"] = d.cache_hit;
    j["cacheSkipped"] = d.cache_skipped;
    j["cacheStats"] = toJson(d.cache_stats);
    return j;
}

json toJson(const FindSimilarResponse& r) {
    json results = json::array();
    for (const auto& hit : r.results) {
        results.push_back({{"recordId", hit.record_id}, {"similarity", hit.similarity}});
    }
    return json{{"results", std::move(results)}, {"debug", toJson(r.debug)}};
}

json toJson(const EmbeddingStats& s) {
    return json{{"totalRecords", s.total_records},
                {"embeddedRecords", s.embedded_records},
                {"notEmbeddedRecords", s.not_embedded_records}};
}

json toJson(const std::vector<EmbeddableField>& fields) {
    json out = json::array();
    for (const auto& f : fields) {
        out.push_back({{"name", f.name}, {"type", f.type}});
    }
    return out;
}

json toJson(const vector::CacheStats& stats) {
    json j;
    j["entriesCount"] = stats.entries_count;
    j["totalEmbeddings"] = stats.total_vectors;
    j["memoryUsedMB"] = stats.memory_used_mb;
    j["memoryBudgetMB"] = stats.memory_budget_mb;
    j["memoryUsagePercent"] = stats.memory_usage_percent;
    j["maxPerEntry"] = stats.max_per_entry;
    j["ttlSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(stats.ttl).count();
    j["hits"] = stats.hits;
    j["misses"] = stats.misses;
    j["evictions"] = stats.evictions;
    j["expirations"] = stats.expirations;
    j["skipped"] = stats.skipped;

    json entries = json::array();
    for (const auto& e : stats.entries) {
        entries.push_back({{"key", e.key},
                           {"count", e.count},
                           {"memoryMB", e.memory_mb},
                           {"ageSeconds", e.age.count() / 1000.0},
                           {"lastAccessSeconds", e.last_access.count() / 1000.0}});
    }
    j["entries"] = std::move(entries);
    return j;
}

} // namespace simcache::app::services
