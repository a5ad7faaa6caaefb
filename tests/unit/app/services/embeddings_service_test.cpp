#include <simcache/app/services/embeddings_json.h>
#include <simcache/app/services/embeddings_service.h>

#include "common/fake_embedding_client.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>

using namespace simcache;
using namespace simcache::app::services;
using simcache::test::FakeEmbeddingClient;

class EmbeddingsServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = std::make_shared<metadata::InMemoryDatasetCatalog>();
        store_ = std::make_shared<storage::InMemoryVectorStore>();
        client_ = std::make_shared<FakeEmbeddingClient>();
        cache_ = std::make_shared<vector::EmbeddingCache>();

        metadata::DatasetInfo ds;
        ds.id = "ds_articles";
        ds.name = "articles";
        ds.fields = {{"title", metadata::FieldType::Text, true},
                     {"body", metadata::FieldType::Editor, true},
                     {"notes", metadata::FieldType::Text, false},
                     {"rating", metadata::FieldType::Number, false}};
        catalog_->addDataset(ds);
        addRecord("a1", "Cats", "<p>All about cats</p>");
        addRecord("a2", "Dogs", "<p>All about dogs</p>");
        addRecord("a3", "", "<p>Untitled</p>");

        settings_.enabled = true;
        settings_.api_key = "sk-test";
        settings_.embedding_model = "text-embedding-3-small";
    }

    void addRecord(const std::string& id, const std::string& title, const std::string& body) {
        metadata::RecordData r;
        r.id = id;
        if (!title.empty())
            r.values["title"] = title;
        r.values["body"] = body;
        ASSERT_TRUE(catalog_->addRecord("ds_articles", std::move(r)));
    }

    std::unique_ptr<EmbeddingsService> makeService() {
        EmbeddingsServiceDeps deps;
        deps.catalog = catalog_;
        deps.store = store_;
        deps.client = client_;
        deps.cache = cache_;
        vector::SimilarityEngineConfig ecfg;
        ecfg.worker_threads = 2;
        deps.engine = std::make_shared<vector::SimilarityEngine>(ecfg);
        return std::make_unique<EmbeddingsService>(settings_, std::move(deps));
    }

    void seedVector(const std::string& recordId, const std::string& field, Vector v) {
        ASSERT_TRUE(store_->upsertVector(recordId, "ds_articles", field, v, "m", v.size()));
    }

    std::shared_ptr<metadata::InMemoryDatasetCatalog> catalog_;
    std::shared_ptr<storage::InMemoryVectorStore> store_;
    std::shared_ptr<FakeEmbeddingClient> client_;
    std::shared_ptr<vector::EmbeddingCache> cache_;
    config::EmbeddingsSettings settings_;
};

TEST_F(EmbeddingsServiceTest, ParseModeAcceptsFieldAndRecord) {
    EXPECT_EQ(parseEmbeddingMode("").value(), EmbeddingMode::Field);
    EXPECT_EQ(parseEmbeddingMode("field").value(), EmbeddingMode::Field);
    EXPECT_EQ(parseEmbeddingMode("record").value(), EmbeddingMode::Record);
    EXPECT_EQ(parseEmbeddingMode("row").error().code, ErrorCode::InvalidArgument);
}

TEST_F(EmbeddingsServiceTest, GenerateFieldModeStoresNonEmptyValues) {
    auto service = makeService();
    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";

    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().generated, 2u);
    EXPECT_EQ(r.value().skipped, 1u); // a3 has no title
    EXPECT_TRUE(r.value().errors.empty());

    auto stored = store_->findVectorsByDatasetField("ds_articles", "title");
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.value().size(), 2u);
    EXPECT_EQ(client_->lastModel(), "text-embedding-3-small");
    EXPECT_EQ(client_->lastTimeout(), std::chrono::seconds(120));
    EXPECT_FALSE(client_->lastDimensions().has_value());

    auto one = store_->findVectorByRecordField("a1", "title");
    ASSERT_TRUE(one && one.value().has_value());
    EXPECT_EQ(one.value()->dimensions, 4u);
    EXPECT_EQ(one.value()->model, "text-embedding-3-small");
}

TEST_F(EmbeddingsServiceTest, GenerateStripsEditorMarkup) {
    std::vector<std::string> seen;
    client_ = std::make_shared<FakeEmbeddingClient>([&seen](const std::string& t) {
        seen.push_back(t);
        return Vector{1.0f, 0.0f};
    });
    auto service = makeService();
    EmbeddingRequest req;
    req.dataset = "ds_articles";
    req.field_name = "body";
    req.record_ids = {"a1"};

    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "All about cats");
}

TEST_F(EmbeddingsServiceTest, GenerateRecordModeUsesSentinelField) {
    settings_.embedding_dimensions = 256;
    auto service = makeService();
    EmbeddingRequest req;
    req.dataset = "articles";
    req.mode = "record";

    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().generated, 3u);
    EXPECT_EQ(client_->lastDimensions(), 256);

    auto rows = store_->findVectorsByDatasetField("ds_articles", kRecordLevelFieldName);
    ASSERT_TRUE(rows);
    EXPECT_EQ(rows.value().size(), 3u);
}

TEST_F(EmbeddingsServiceTest, GenerateFailsFastOnConfiguration) {
    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";

    settings_.enabled = false;
    EXPECT_EQ(makeService()->generateEmbeddings(req).error().code, ErrorCode::NotInitialized);

    settings_.enabled = true;
    settings_.api_key.clear();
    EXPECT_EQ(makeService()->generateEmbeddings(req).error().code, ErrorCode::NotInitialized);

    settings_.api_key = "sk";
    settings_.embedding_model.clear();
    EXPECT_EQ(makeService()->generateEmbeddings(req).error().code, ErrorCode::NotInitialized);
    EXPECT_EQ(client_->calls(), 0u);
}

TEST_F(EmbeddingsServiceTest, GenerateValidatesDatasetAndField) {
    auto service = makeService();
    EmbeddingRequest req;
    req.dataset = "missing";
    req.field_name = "title";
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::NotFound);

    req.dataset = "articles";
    req.field_name = "";
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::InvalidArgument);

    req.field_name = "nope";
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::NotFound);

    req.field_name = "notes"; // text, but not flagged
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::InvalidArgument);

    req.field_name = "rating";
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::InvalidArgument);

    req.field_name = "title";
    req.mode = "sideways";
    EXPECT_EQ(service->generateEmbeddings(req).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(client_->calls(), 0u);
}

TEST_F(EmbeddingsServiceTest, GenerateWithUnknownIdsSkipsThemSilently) {
    auto service = makeService();
    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";
    req.record_ids = {"ghost1", "ghost2"};

    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().generated, 0u);
    EXPECT_EQ(r.value().skipped, 0u);
    EXPECT_EQ(client_->calls(), 0u);
}

TEST_F(EmbeddingsServiceTest, FailedBatchDoesNotAbortOthers) {
    for (int i = 0; i < 5; ++i) {
        addRecord("b" + std::to_string(i), "Title " + std::to_string(i), "");
    }
    settings_.max_texts_per_batch = 3;
    client_->failCall(2);
    auto service = makeService();

    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";
    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r);

    // 7 titled records in batches of 3, 3, 1; the second batch fails
    EXPECT_EQ(client_->batchSizes(), (std::vector<size_t>{3, 3, 1}));
    EXPECT_EQ(r.value().generated, 4u);
    EXPECT_EQ(r.value().skipped, 1u + 3u);
    ASSERT_EQ(r.value().errors.size(), 1u);
    EXPECT_NE(r.value().errors[0].find("batch error"), std::string::npos);
}

TEST_F(EmbeddingsServiceTest, InvalidUtf8TextDoesNotAbortLaterBatches) {
    // Serialize every text the way the HTTP client does before embedding it
    client_ = std::make_shared<FakeEmbeddingClient>([](const std::string& text) {
        auto body = genai::buildEmbeddingRequestBody({text}, "m", std::nullopt);
        return Vector{static_cast<float>(body.size()), 1.0f};
    });
    catalog_ = std::make_shared<metadata::InMemoryDatasetCatalog>();
    metadata::DatasetInfo ds;
    ds.id = "ds_articles";
    ds.name = "articles";
    ds.fields = {{"title", metadata::FieldType::Text, true}};
    catalog_->addDataset(ds);
    addRecord("latin1", "caf\xE9 cr\xE8me", "");
    addRecord("clean", "Coffee", "");
    settings_.max_texts_per_batch = 1;
    auto service = makeService();

    EmbeddingRequest req;
    req.dataset = "articles";
    req.mode = "record";
    EmbeddingResponse r;
    ASSERT_NO_THROW({
        auto res = service->generateEmbeddings(req);
        ASSERT_TRUE(res) << res.error().message;
        r = res.value();
    });
    EXPECT_EQ(client_->calls(), 2u);
    EXPECT_EQ(r.generated, 2u);
    EXPECT_TRUE(r.errors.empty());
    auto clean = store_->findVectorByRecordField("clean", kRecordLevelFieldName);
    ASSERT_TRUE(clean && clean.value().has_value());
}

TEST_F(EmbeddingsServiceTest, AllBatchesFailingIsStillASuccessEnvelope) {
    settings_.max_texts_per_batch = 1;
    for (size_t i = 1; i <= 20; ++i) {
        client_->failCall(i);
    }
    for (int i = 0; i < 12; ++i) {
        addRecord("c" + std::to_string(i), "T" + std::to_string(i), "");
    }
    auto service = makeService();

    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";
    auto r = service->generateEmbeddings(req);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().generated, 0u);
    EXPECT_EQ(r.value().skipped, 15u);
    ASSERT_EQ(r.value().errors.size(), 11u);
    EXPECT_EQ(r.value().errors.back(), "... and 4 more errors");
}

TEST_F(EmbeddingsServiceTest, StoringInvalidatesCachedCandidates) {
    seedVector("a1", "title", {1.0f, 0.0f, 0.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f, 0.0f, 0.0f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.record_id = "a1";
    ASSERT_TRUE(service->findSimilar(q));
    EXPECT_TRUE(cache_->contains("ds_articles", "title"));

    EmbeddingRequest req;
    req.dataset = "articles";
    req.field_name = "title";
    req.record_ids = {"a2"};
    ASSERT_TRUE(service->generateEmbeddings(req));
    EXPECT_FALSE(cache_->contains("ds_articles", "title"));
}

TEST_F(EmbeddingsServiceTest, FindSimilarByRecordIdMissThenHit) {
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f});
    seedVector("a3", "title", {0.7f, 0.7f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.record_id = "a1";

    auto first = service->findSimilar(q);
    ASSERT_TRUE(first) << first.error().message;
    const auto& r1 = first.value();
    ASSERT_EQ(r1.results.size(), 2u);
    EXPECT_EQ(r1.results[0].record_id, "a3");
    EXPECT_NEAR(r1.results[0].similarity, 0.7071f, 1e-3f);
    EXPECT_EQ(r1.results[1].record_id, "a2");
    EXPECT_FALSE(r1.debug.cache_hit);
    EXPECT_FALSE(r1.debug.cache_skipped);
    EXPECT_EQ(r1.debug.stored_embeddings, 3u);
    EXPECT_EQ(r1.debug.processed_count, 2u);
    EXPECT_EQ(r1.debug.query_embedding_len, 2u);
    EXPECT_EQ(r1.debug.dataset_id, "ds_articles");
    EXPECT_EQ(r1.debug.cache_stats.entries_count, 1u);
    EXPECT_EQ(client_->calls(), 0u);

    auto second = service->findSimilar(q);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second.value().debug.cache_hit);
    EXPECT_EQ(second.value().results.size(), 2u);
}

TEST_F(EmbeddingsServiceTest, FindSimilarByTextEmbedsWithQueryTimeout) {
    client_ = std::make_shared<FakeEmbeddingClient>(
        [](const std::string&) { return Vector{1.0f, 0.0f}; });
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.text = "feline";
    auto r = service->findSimilar(q);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().results.size(), 2u);
    EXPECT_EQ(r.value().results[0].record_id, "a1"); // nothing excluded for text queries
    EXPECT_EQ(client_->lastTimeout(), std::chrono::seconds(30));
}

TEST_F(EmbeddingsServiceTest, FindSimilarCountsUndecodableRows) {
    seedVector("a1", "title", {1.0f, 0.0f});
    for (int i = 0; i < 5; ++i) {
        storage::StoredVectorRecord bad;
        bad.record_id = "bad" + std::to_string(i);
        bad.dataset_id = "ds_articles";
        bad.field_name = "title";
        bad.embedding.emplace<std::string>("not json");
        store_->put(bad);
    }
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.text = "x";
    auto r = service->findSimilar(q);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().debug.stored_embeddings, 6u);
    EXPECT_EQ(r.value().debug.error_count, 5u);
    EXPECT_EQ(r.value().debug.errors.size(), 3u);
    EXPECT_EQ(r.value().results.size(), 1u);
}

TEST_F(EmbeddingsServiceTest, FindSimilarValidatesInOrder) {
    auto service = makeService();
    FindSimilarRequest q;
    q.dataset = "missing";
    q.field_name = "title";
    q.text = "x";
    EXPECT_EQ(service->findSimilar(q).error().code, ErrorCode::NotFound);

    q.dataset = "articles";
    q.field_name = "";
    EXPECT_EQ(service->findSimilar(q).error().code, ErrorCode::InvalidArgument);

    q.field_name = "title";
    q.text = "";
    EXPECT_EQ(service->findSimilar(q).error().code, ErrorCode::InvalidArgument);

    q.text = "x";
    q.record_id = "a1";
    EXPECT_EQ(service->findSimilar(q).error().code, ErrorCode::InvalidArgument);

    q.text = "";
    auto noVector = service->findSimilar(q);
    ASSERT_FALSE(noVector);
    EXPECT_EQ(noVector.error().code, ErrorCode::NotFound);
    EXPECT_NE(noVector.error().message.find("no embedding found for record a1"),
              std::string::npos);
    EXPECT_EQ(cache_->size(), 0u);

    settings_.enabled = false;
    EXPECT_EQ(makeService()->findSimilar(q).error().code, ErrorCode::NotInitialized);
}

TEST_F(EmbeddingsServiceTest, FindSimilarSurfacesProviderErrors) {
    client_->failCall(1);
    auto service = makeService();
    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.text = "x";
    auto r = service->findSimilar(q);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::UpstreamError);
    EXPECT_NE(r.error().message.find("failed to generate query embedding"), std::string::npos);
}

TEST_F(EmbeddingsServiceTest, LimitIsDefaultedAndClamped) {
    client_ = std::make_shared<FakeEmbeddingClient>(
        [](const std::string&) { return Vector{1.0f, 0.0f}; });
    for (int i = 0; i < 30; ++i) {
        seedVector("r" + std::to_string(i), "title", {1.0f, static_cast<float>(i)});
    }
    settings_.max_limit = 20;
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.text = "x";

    q.limit = 0;
    EXPECT_EQ(service->findSimilar(q).value().results.size(), 10u);
    q.limit = 3;
    EXPECT_EQ(service->findSimilar(q).value().results.size(), 3u);
    q.limit = 500;
    EXPECT_EQ(service->findSimilar(q).value().results.size(), 20u);
}

TEST_F(EmbeddingsServiceTest, OversizedCandidateSetIsReportedNotCached) {
    vector::EmbeddingCacheConfig cfg;
    cfg.max_per_entry = 2;
    cache_ = std::make_shared<vector::EmbeddingCache>(cfg);
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f});
    seedVector("a3", "title", {1.0f, 1.0f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.record_id = "a1";
    auto r = service->findSimilar(q);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().debug.cache_skipped);
    EXPECT_EQ(r.value().results.size(), 2u);
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(EmbeddingsServiceTest, DeleteOperationsInvalidateCache) {
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f});
    seedVector("a1", "body", {1.0f, 1.0f});
    auto service = makeService();
    ASSERT_TRUE(cache_->set("ds_articles", "title", vector::CachedVectorSet{}));
    ASSERT_TRUE(cache_->set("ds_articles", "body", vector::CachedVectorSet{}));
    ASSERT_TRUE(cache_->set("ds_other", "title", vector::CachedVectorSet{}));

    auto byRecord = service->deleteEmbeddingsForRecord("a1");
    ASSERT_TRUE(byRecord);
    EXPECT_EQ(byRecord.value(), 2u);
    EXPECT_FALSE(cache_->contains("ds_articles", "title"));
    EXPECT_FALSE(cache_->contains("ds_articles", "body"));
    EXPECT_TRUE(cache_->contains("ds_other", "title"));

    ASSERT_TRUE(cache_->set("ds_articles", "title", vector::CachedVectorSet{}));
    auto byField = service->deleteEmbeddingsForField("articles", "title");
    ASSERT_TRUE(byField);
    EXPECT_EQ(byField.value(), 1u);
    EXPECT_FALSE(cache_->contains("ds_articles", "title"));

    seedVector("a3", "body", {1.0f});
    ASSERT_TRUE(cache_->set("ds_articles", "body", vector::CachedVectorSet{}));
    auto byDataset = service->deleteEmbeddingsForDataset("ds_articles");
    ASSERT_TRUE(byDataset);
    EXPECT_EQ(byDataset.value(), 1u);
    EXPECT_FALSE(cache_->contains("ds_articles", "body"));
    EXPECT_TRUE(cache_->contains("ds_other", "title"));
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(EmbeddingsServiceTest, StatsPendingAndEmbeddableFields) {
    seedVector("a2", "title", {1.0f});
    auto service = makeService();

    auto stats = service->getEmbeddingStats("articles", "title");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().total_records, 3u);
    EXPECT_EQ(stats.value().embedded_records, 1u);
    EXPECT_EQ(stats.value().not_embedded_records, 2u);

    auto pending = service->getPendingRecordIds("articles", "title");
    ASSERT_TRUE(pending);
    EXPECT_EQ(pending.value(), (std::vector<std::string>{"a1", "a3"}));

    auto fields = service->getEmbeddableFields("articles");
    ASSERT_TRUE(fields);
    ASSERT_EQ(fields.value().size(), 2u);
    EXPECT_EQ(fields.value()[0].name, "title");
    EXPECT_EQ(fields.value()[1].type, "editor");

    EXPECT_EQ(service->getEmbeddingStats("missing", "title").error().code, ErrorCode::NotFound);
}

TEST_F(EmbeddingsServiceTest, CacheStatsAndClear) {
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {0.0f, 1.0f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.record_id = "a1";
    ASSERT_TRUE(service->findSimilar(q));
    ASSERT_TRUE(service->findSimilar(q));

    auto stats = service->getCacheStats();
    EXPECT_EQ(stats.entries_count, 1u);
    EXPECT_EQ(stats.total_vectors, 2u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(service->getCacheInfo().entries_count, 1u);

    auto j = toJson(stats);
    EXPECT_EQ(j["entriesCount"], 1);
    EXPECT_EQ(j["entries"][0]["key"], "ds_articles:title");

    service->clearCache();
    EXPECT_EQ(service->getCacheInfo().entries_count, 0u);
}

TEST_F(EmbeddingsServiceTest, SearchResponseJsonShape) {
    seedVector("a1", "title", {1.0f, 0.0f});
    seedVector("a2", "title", {1.0f, 0.0f});
    auto service = makeService();

    FindSimilarRequest q;
    q.dataset = "articles";
    q.field_name = "title";
    q.record_id = "a1";
    auto r = service->findSimilar(q);
    ASSERT_TRUE(r);

    auto j = toJson(r.value());
    ASSERT_EQ(j["results"].size(), 1u);
    EXPECT_EQ(j["results"][0]["recordId"], "a2");
    EXPECT_EQ(j["debug"]["fieldName"], "title");
    EXPECT_EQ(j["debug"]["cacheHit"], false);
    EXPECT_TRUE(j["debug"].contains("cacheStats"));
}
