#include <simcache/vector/vector_codec.h>

#include <string>
#include <vector>
#include <gtest/gtest.h>

using namespace simcache;
using namespace simcache::vector;
using nlohmann::json;

TEST(VectorCodecTest, DecodesTypedFloatArray) {
    StoredVectorPayload p{std::vector<float>{0.5f, -1.0f}};
    auto r = decodeVector(p);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Vector{0.5f, -1.0f}));
}

TEST(VectorCodecTest, DecodesDoubleArray) {
    StoredVectorPayload p{std::vector<double>{0.25, 2.0, -3.5}};
    auto r = decodeVector(p);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Vector{0.25f, 2.0f, -3.5f}));
}

TEST(VectorCodecTest, DecodesJsonEncodedString) {
    StoredVectorPayload p{std::in_place_index<2>, std::string("[1, 0.5, -2]")};
    auto r = decodeVector(p);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Vector{1.0f, 0.5f, -2.0f}));
}

TEST(VectorCodecTest, DecodesHeterogeneousNumericList) {
    StoredVectorPayload p{std::in_place_index<3>, json::parse(R"([1, 2.5, -3, 4e-1])")};
    auto r = decodeVector(p);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 4u);
    EXPECT_FLOAT_EQ(r.value()[0], 1.0f);
    EXPECT_FLOAT_EQ(r.value()[3], 0.4f);
}

TEST(VectorCodecTest, DecodesDoubleEncodedJsonString) {
    StoredVectorPayload p{std::in_place_index<3>, json("[0.1, 0.2]")};
    auto r = decodeVector(p);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().size(), 2u);
}

TEST(VectorCodecTest, RejectsNonNumericElementWithIndex) {
    StoredVectorPayload p{std::in_place_index<3>, json::parse(R"([1, "x", 3])")};
    auto r = decodeVector(p);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_NE(r.error().message.find("index 1"), std::string::npos);
    EXPECT_NE(r.error().message.find("string"), std::string::npos);
}

TEST(VectorCodecTest, RejectsNullAndWrongShapes) {
    auto null = decodeVector(StoredVectorPayload{std::in_place_index<3>, json()});
    ASSERT_FALSE(null);
    EXPECT_NE(null.error().message.find("null"), std::string::npos);

    auto obj = decodeVector(StoredVectorPayload{std::in_place_index<3>, json::object()});
    ASSERT_FALSE(obj);
    EXPECT_NE(obj.error().message.find("unexpected embedding type"), std::string::npos);

    auto garbage = decodeVector(StoredVectorPayload{std::in_place_index<2>, std::string("[1,")});
    ASSERT_FALSE(garbage);
    EXPECT_EQ(garbage.error().code, ErrorCode::InvalidData);
}

TEST(VectorCodecTest, EncodeProducesDecodableArray) {
    Vector v{0.5f, 0.25f, -0.125f};
    auto encoded = encodeVector(v);
    ASSERT_TRUE(encoded.is_array());
    EXPECT_EQ(encoded.size(), 3u);
    auto back = decodeVector(StoredVectorPayload{std::in_place_index<3>, encoded});
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), v);
}

TEST(VectorCodecTest, DescribePayloadNamesShape) {
    EXPECT_EQ(describePayload(StoredVectorPayload{std::vector<float>(3)}), "float[3]");
    EXPECT_EQ(describePayload(StoredVectorPayload{std::in_place_index<3>, json::object()}),
              "json object");
}
