#include <simcache/storage/vector_store.h>

#include <gtest/gtest.h>

using namespace simcache;
using namespace simcache::storage;

class MemoryVectorStoreTest : public ::testing::Test {
protected:
    InMemoryVectorStore store_;
};

TEST_F(MemoryVectorStoreTest, UpsertInsertsThenUpdatesInPlace) {
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "title", {1.0f, 2.0f}, "m1", 2));
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "title", {3.0f, 4.0f, 5.0f}, "m2", 3));
    EXPECT_EQ(store_.size(), 1u);

    auto found = store_.findVectorByRecordField("r1", "title");
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->model, "m2");
    EXPECT_EQ(found.value()->dimensions, 3u);
    auto decoded = vector::decodeVector(found.value()->embedding);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), (Vector{3.0f, 4.0f, 5.0f}));
}

TEST_F(MemoryVectorStoreTest, UpsertRequiresIds) {
    auto r = store_.upsertVector("", "ds", "title", {1.0f}, "m", 1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MemoryVectorStoreTest, FindByDatasetFieldFilters) {
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "title", {1.0f}, "m", 1));
    ASSERT_TRUE(store_.upsertVector("r2", "ds", "title", {1.0f}, "m", 1));
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "body", {1.0f}, "m", 1));
    ASSERT_TRUE(store_.upsertVector("r9", "other", "title", {1.0f}, "m", 1));

    auto rows = store_.findVectorsByDatasetField("ds", "title");
    ASSERT_TRUE(rows);
    EXPECT_EQ(rows.value().size(), 2u);

    auto none = store_.findVectorByRecordField("r2", "body");
    ASSERT_TRUE(none);
    EXPECT_FALSE(none.value().has_value());
}

TEST_F(MemoryVectorStoreTest, DeleteIfReturnsCount) {
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "title", {1.0f}, "m", 1));
    ASSERT_TRUE(store_.upsertVector("r1", "ds", "body", {1.0f}, "m", 1));
    ASSERT_TRUE(store_.upsertVector("r2", "ds", "title", {1.0f}, "m", 1));

    auto removed =
        store_.deleteVectorsIf([](const StoredVectorRecord& r) { return r.record_id == "r1"; });
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(store_.size(), 1u);

    EXPECT_FALSE(store_.deleteVectorsIf(nullptr));
}

TEST_F(MemoryVectorStoreTest, PutKeepsPayloadEncoding) {
    StoredVectorRecord rec;
    rec.record_id = "r1";
    rec.dataset_id = "ds";
    rec.field_name = "title";
    rec.embedding.emplace<std::string>("[0.5, 0.5]");
    store_.put(rec);

    auto all = store_.all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<std::string>(all[0].embedding));
}
