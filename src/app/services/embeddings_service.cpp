#include <simcache/app/services/embeddings_service.h>
#include <simcache/app/services/record_text.h>
#include <simcache/vector/vector_codec.h>
#include <simcache/vector/vector_math.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

namespace simcache::app::services {

namespace {

struct PendingText {
    std::string record_id;
    std::string text;
};

void capErrors(std::vector<std::string>& errors, size_t maxMessages) {
    if (errors.size() <= maxMessages)
        return;
    const size_t more = errors.size() - maxMessages;
    errors.resize(maxMessages);
    errors.push_back("... and " + std::to_string(more) + " more errors");
}

} // namespace

Result<EmbeddingMode> parseEmbeddingMode(const std::string& mode) {
    if (mode.empty() || mode == "field")
        return EmbeddingMode::Field;
    if (mode == "record")
        return EmbeddingMode::Record;
    return Error{ErrorCode::InvalidArgument,
                 "invalid embedding mode: " + mode + " (must be 'field' or 'record')"};
}

EmbeddingsService::EmbeddingsService(config::EmbeddingsSettings settings,
                                     EmbeddingsServiceDeps deps)
    : settings_(std::move(settings)), deps_(std::move(deps)) {
    if (!deps_.cache)
        deps_.cache = std::make_shared<vector::EmbeddingCache>();
    if (!deps_.engine)
        deps_.engine = std::make_shared<vector::SimilarityEngine>();
}

EmbeddingsService::~EmbeddingsService() = default;

Result<std::string> EmbeddingsService::resolveFieldName(const metadata::DatasetInfo& dataset,
                                                        const std::string& mode,
                                                        const std::string& fieldName,
                                                        bool requireEmbeddable) const {
    auto parsed = parseEmbeddingMode(mode);
    if (!parsed)
        return parsed.error();
    if (parsed.value() == EmbeddingMode::Record)
        return std::string(kRecordLevelFieldName);

    if (fieldName.empty()) {
        return Error{ErrorCode::InvalidArgument, "fieldName is required for field mode"};
    }
    const auto* field = dataset.findField(fieldName);
    if (!field) {
        return Error{ErrorCode::NotFound,
                     "field '" + fieldName + "' not found in dataset " + dataset.name};
    }
    if (requireEmbeddable && !field->isEmbeddable()) {
        return Error{ErrorCode::InvalidArgument,
                     "field '" + fieldName +
                         "' is not a text/editor field or is not marked as embeddable"};
    }
    return fieldName;
}

Result<EmbeddingResponse> EmbeddingsService::generateEmbeddings(const EmbeddingRequest& req) {
    if (!settings_.enabled) {
        return Error{ErrorCode::NotInitialized, "AI features are not enabled"};
    }
    if (settings_.api_key.empty()) {
        return Error{ErrorCode::NotInitialized, "AI API key is not configured"};
    }
    if (settings_.embedding_model.empty()) {
        return Error{ErrorCode::NotInitialized, "embedding model is not configured"};
    }
    if (!deps_.catalog || !deps_.store || !deps_.client) {
        return Error{ErrorCode::NotInitialized, "embeddings service is missing a collaborator"};
    }

    auto dsRes = deps_.catalog->findDataset(req.dataset);
    if (!dsRes) {
        return dsRes.error();
    }
    const auto& dataset = dsRes.value();

    auto fieldRes = resolveFieldName(dataset, req.mode, req.field_name, true);
    if (!fieldRes) {
        return fieldRes.error();
    }
    const std::string fieldName = fieldRes.value();
    const bool recordMode = fieldName == kRecordLevelFieldName;

    std::vector<metadata::RecordData> records;
    if (!req.record_ids.empty()) {
        for (const auto& id : req.record_ids) {
            auto r = deps_.catalog->findRecord(dataset.id, id);
            if (r) {
                records.push_back(std::move(r).value());
            } else {
                spdlog::debug("[EmbeddingsService] Skipping record {}: {}", id, r.error().message);
            }
        }
    } else {
        auto all = deps_.catalog->listRecords(dataset.id);
        if (!all) {
            return Error{all.error().code, "failed to fetch records: " + all.error().message};
        }
        records = std::move(all).value();
    }

    EmbeddingResponse response;
    if (records.empty()) {
        return response;
    }

    const auto* field = recordMode ? nullptr : dataset.findField(fieldName);
    std::vector<PendingText> pending;
    pending.reserve(records.size());
    for (const auto& record : records) {
        std::string text =
            recordMode ? generateRecordText(record, dataset, req.record_template,
                                            settings_.record_field_truncate_chars)
                       : fieldText(record, *field);
        if (!text.empty()) {
            pending.push_back({record.id, std::move(text)});
        }
    }
    response.skipped = records.size() - pending.size();
    if (pending.empty()) {
        return response;
    }

    std::optional<int> dims;
    if (settings_.embedding_dimensions > 0)
        dims = settings_.embedding_dimensions;

    auto batches = batchItems(pending, settings_.max_texts_per_batch);
    spdlog::debug("[EmbeddingsService] Embedding {} texts for {}:{} in {} batches",
                  pending.size(), dataset.id, fieldName, batches.size());

    for (const auto& batch : batches) {
        std::vector<std::string> texts;
        texts.reserve(batch.size());
        for (const auto& p : batch) {
            texts.push_back(p.text);
        }

        auto embedded = deps_.client->embed(texts, settings_.embedding_model, dims,
                                            settings_.generation_timeout);
        if (!embedded) {
            spdlog::warn("[EmbeddingsService] Batch of {} failed: {}", batch.size(),
                         embedded.error().message);
            response.errors.push_back("batch error: " + embedded.error().message);
            response.skipped += batch.size();
            continue;
        }

        const auto& vectors = embedded.value();
        const size_t usable = std::min(vectors.size(), batch.size());
        size_t stored = 0;
        for (size_t i = 0; i < usable; ++i) {
            const auto& p = batch[i];
            auto up = deps_.store->upsertVector(p.record_id, dataset.id, fieldName, vectors[i],
                                                settings_.embedding_model, vectors[i].size());
            if (!up) {
                response.errors.push_back("record " + p.record_id + ": " + up.error().message);
                ++response.skipped;
            } else {
                ++response.generated;
                ++stored;
            }
        }
        if (usable < batch.size()) {
            response.errors.push_back("batch error: provider returned " +
                                      std::to_string(vectors.size()) + " embeddings for " +
                                      std::to_string(batch.size()) + " texts");
            response.skipped += batch.size() - usable;
        }
        if (stored > 0) {
            deps_.cache->invalidate(dataset.id, fieldName);
        }
    }

    capErrors(response.errors, settings_.max_error_messages);
    spdlog::info("[EmbeddingsService] {}:{} generated={} skipped={} errors={}", dataset.id,
                 fieldName, response.generated, response.skipped, response.errors.size());
    return response;
}

Result<Vector> EmbeddingsService::resolveQueryVector(const FindSimilarRequest& req,
                                                     const std::string& fieldName) {
    if (!req.text.empty()) {
        if (settings_.api_key.empty()) {
            return Error{ErrorCode::NotInitialized, "AI API key is not configured"};
        }
        if (settings_.embedding_model.empty()) {
            return Error{ErrorCode::NotInitialized, "embedding model is not configured"};
        }
        if (!deps_.client) {
            return Error{ErrorCode::NotInitialized, "no embedding client configured"};
        }
        std::optional<int> dims;
        if (settings_.embedding_dimensions > 0)
            dims = settings_.embedding_dimensions;
        auto r = deps_.client->embed({req.text}, settings_.embedding_model, dims,
                                     settings_.query_timeout);
        if (!r) {
            return Error{r.error().code,
                         "failed to generate query embedding: " + r.error().message};
        }
        if (r.value().empty()) {
            return Error{ErrorCode::InvalidData, "no embedding returned for query text"};
        }
        return std::move(r).value().front();
    }

    auto found = deps_.store->findVectorByRecordField(req.record_id, fieldName);
    if (!found) {
        return found.error();
    }
    if (!found.value()) {
        return Error{ErrorCode::NotFound, "no embedding found for record " + req.record_id};
    }
    auto decoded = vector::decodeVector(found.value()->embedding);
    if (!decoded) {
        return Error{ErrorCode::InvalidData,
                     "failed to parse existing embedding: " + decoded.error().message};
    }
    return decoded;
}

Result<vector::CachedVectorSetPtr>
EmbeddingsService::loadCandidates(const std::string& datasetId, const std::string& fieldName,
                                  SimilarityDebug& debug) {
    if (auto cached = deps_.cache->get(datasetId, fieldName)) {
        debug.cache_hit = true;
        debug.stored_embeddings = cached->size();
        return cached;
    }

    auto rows = deps_.store->findVectorsByDatasetField(datasetId, fieldName);
    if (!rows) {
        return Error{rows.error().code, "failed to fetch embeddings: " + rows.error().message};
    }
    debug.stored_embeddings = rows.value().size();

    vector::CachedVectorSet parsed;
    parsed.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto v = vector::decodeVector(row.embedding);
        if (!v) {
            ++debug.error_count;
            if (debug.errors.size() < settings_.max_debug_errors) {
                debug.errors.push_back("record " + row.record_id + ": " + v.error().message);
            }
            spdlog::warn("[EmbeddingsService] Skipping stored vector for {} ({}): {}",
                         row.record_id, vector::describePayload(row.embedding),
                         v.error().message);
            continue;
        }
        vector::CachedVector cv;
        cv.record_id = row.record_id;
        cv.magnitude = vector::computeMagnitude(v.value());
        cv.vector = std::move(v).value();
        parsed.push_back(std::move(cv));
    }

    vector::CachedVectorSetPtr snapshot =
        std::make_shared<const vector::CachedVectorSet>(std::move(parsed));
    if (!deps_.cache->set(datasetId, fieldName, snapshot)) {
        debug.cache_skipped = true;
    }
    return snapshot;
}

Result<FindSimilarResponse> EmbeddingsService::findSimilar(const FindSimilarRequest& req) {
    if (!settings_.enabled) {
        return Error{ErrorCode::NotInitialized, "AI features are not enabled"};
    }
    if (!deps_.catalog || !deps_.store) {
        return Error{ErrorCode::NotInitialized, "embeddings service is missing a collaborator"};
    }

    auto dsRes = deps_.catalog->findDataset(req.dataset);
    if (!dsRes) {
        return dsRes.error();
    }
    const std::string datasetId = dsRes.value().id;

    auto fieldRes = resolveFieldName(dsRes.value(), req.mode, req.field_name, false);
    if (!fieldRes) {
        return fieldRes.error();
    }
    const std::string fieldName = fieldRes.value();

    if (req.text.empty() && req.record_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "either text or recordId must be provided"};
    }
    if (!req.text.empty() && !req.record_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "provide only one of text or recordId"};
    }

    auto query = resolveQueryVector(req, fieldName);
    if (!query) {
        return query.error();
    }

    FindSimilarResponse response;
    auto& debug = response.debug;
    debug.dataset_id = datasetId;
    debug.field_name = fieldName;
    debug.query_embedding_len = query.value().size();

    auto candidates = loadCandidates(datasetId, fieldName, debug);
    if (!candidates) {
        return candidates.error();
    }

    std::optional<std::string> exclude;
    if (!req.record_id.empty())
        exclude = req.record_id;

    const float queryMagnitude = vector::computeMagnitude(query.value());
    auto hits =
        deps_.engine->rank(query.value(), queryMagnitude, *candidates.value(), exclude);
    debug.processed_count = hits.size();

    size_t limit = req.limit > 0 ? static_cast<size_t>(req.limit) : settings_.default_limit;
    limit = std::min(limit, settings_.max_limit);
    response.results = vector::sortAndTruncate(std::move(hits), limit);

    debug.cache_stats = deps_.cache->getInfo();
    spdlog::debug("[EmbeddingsService] {}:{} ranked {} candidates (cache {}), returning {}",
                  datasetId, fieldName, debug.processed_count, debug.cache_hit ? "hit" : "miss",
                  response.results.size());
    return response;
}

Result<size_t> EmbeddingsService::deleteEmbeddingsForRecord(const std::string& recordId) {
    if (!deps_.store) {
        return Error{ErrorCode::NotInitialized, "no vector store configured"};
    }
    std::set<std::pair<std::string, std::string>> touched;
    auto removed = deps_.store->deleteVectorsIf([&](const storage::StoredVectorRecord& r) {
        if (r.record_id != recordId)
            return false;
        touched.emplace(r.dataset_id, r.field_name);
        return true;
    });
    if (!removed) {
        return Error{removed.error().code, "failed to delete embedding: " + removed.error().message};
    }
    for (const auto& [datasetId, fieldName] : touched) {
        deps_.cache->invalidate(datasetId, fieldName);
    }
    return removed;
}

Result<size_t> EmbeddingsService::deleteEmbeddingsForDataset(const std::string& dataset) {
    if (!deps_.store) {
        return Error{ErrorCode::NotInitialized, "no vector store configured"};
    }
    // The dataset may already be gone from the catalog; fall back to the id as given
    std::string datasetId = dataset;
    if (deps_.catalog) {
        if (auto ds = deps_.catalog->findDataset(dataset))
            datasetId = ds.value().id;
    }

    auto removed = deps_.store->deleteVectorsIf(
        [&](const storage::StoredVectorRecord& r) { return r.dataset_id == datasetId; });
    if (!removed) {
        return Error{removed.error().code, "failed to delete embedding: " + removed.error().message};
    }
    deps_.cache->invalidateDataset(datasetId);
    return removed;
}

Result<size_t> EmbeddingsService::deleteEmbeddingsForField(const std::string& dataset,
                                                           const std::string& fieldName) {
    if (!deps_.store) {
        return Error{ErrorCode::NotInitialized, "no vector store configured"};
    }
    std::string datasetId = dataset;
    if (deps_.catalog) {
        if (auto ds = deps_.catalog->findDataset(dataset))
            datasetId = ds.value().id;
    }

    auto removed = deps_.store->deleteVectorsIf([&](const storage::StoredVectorRecord& r) {
        return r.dataset_id == datasetId && r.field_name == fieldName;
    });
    if (!removed) {
        return Error{removed.error().code, "failed to delete embedding: " + removed.error().message};
    }
    deps_.cache->invalidate(datasetId, fieldName);
    return removed;
}

Result<EmbeddingStats> EmbeddingsService::getEmbeddingStats(const std::string& dataset,
                                                            const std::string& fieldName) {
    auto pending = getPendingRecordIds(dataset, fieldName);
    if (!pending) {
        return pending.error();
    }
    auto ds = deps_.catalog->findDataset(dataset);
    if (!ds) {
        return ds.error();
    }
    auto records = deps_.catalog->listRecords(ds.value().id);
    if (!records) {
        return Error{records.error().code, "failed to count records: " + records.error().message};
    }

    EmbeddingStats stats;
    stats.total_records = records.value().size();
    stats.not_embedded_records = pending.value().size();
    stats.embedded_records = stats.total_records - stats.not_embedded_records;
    return stats;
}

Result<std::vector<std::string>>
EmbeddingsService::getPendingRecordIds(const std::string& dataset, const std::string& fieldName) {
    if (!deps_.catalog || !deps_.store) {
        return Error{ErrorCode::NotInitialized, "embeddings service is missing a collaborator"};
    }
    auto ds = deps_.catalog->findDataset(dataset);
    if (!ds) {
        return ds.error();
    }
    auto records = deps_.catalog->listRecords(ds.value().id);
    if (!records) {
        return Error{records.error().code, "failed to fetch records: " + records.error().message};
    }
    auto stored = deps_.store->findVectorsByDatasetField(ds.value().id, fieldName);
    if (!stored) {
        return Error{stored.error().code, "failed to fetch embeddings: " + stored.error().message};
    }

    std::unordered_set<std::string> embedded;
    for (const auto& s : stored.value()) {
        embedded.insert(s.record_id);
    }

    std::vector<std::string> out;
    for (const auto& r : records.value()) {
        if (!embedded.count(r.id))
            out.push_back(r.id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

Result<std::vector<EmbeddableField>>
EmbeddingsService::getEmbeddableFields(const std::string& dataset) {
    if (!deps_.catalog) {
        return Error{ErrorCode::NotInitialized, "no dataset catalog configured"};
    }
    auto ds = deps_.catalog->findDataset(dataset);
    if (!ds) {
        return ds.error();
    }
    std::vector<EmbeddableField> out;
    for (const auto& f : ds.value().fields) {
        if (f.isEmbeddable())
            out.push_back({f.name, metadata::fieldTypeToString(f.type)});
    }
    return out;
}

vector::CacheStats EmbeddingsService::getCacheStats() const {
    return deps_.cache->getStats();
}

vector::CacheInfo EmbeddingsService::getCacheInfo() const {
    return deps_.cache->getInfo();
}

void EmbeddingsService::clearCache() {
    deps_.cache->clear();
}

} // namespace simcache::app::services
