#include <gtest/gtest.h>
#include "storage/Codec.hpp"
#include "storage/errors.hpp"

using namespace compass::storage;

TEST(CodecTest, DecodesEmptyArray) {
    EXPECT_TRUE(decodeContainer("[]").empty());
    EXPECT_TRUE(decodeContainer("  [ ]\n").empty());
}

TEST(CodecTest, DecodesRecordsInOrder) {
    const auto records = decodeContainer(R"([{"id":"b"},{"id":"a"},3])");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0]["id"], "b");
    EXPECT_EQ(records[1]["id"], "a");
    EXPECT_EQ(records[2], 3);
}

TEST(CodecTest, RejectsMalformedJson) {
    EXPECT_THROW(decodeContainer("{not json"), CorruptContainer);
    EXPECT_THROW(decodeContainer(""), CorruptContainer);
    EXPECT_THROW(decodeContainer("[{\"id\": 1},"), CorruptContainer);
}

TEST(CodecTest, RejectsNonArrayRoot) {
    EXPECT_THROW(decodeContainer(R"({"id":"x"})"), CorruptContainer);
    EXPECT_THROW(decodeContainer("42"), CorruptContainer);
}

TEST(CodecTest, EncodesEmptyContainer) {
    EXPECT_EQ(encodeContainer({}), "[]\n");
}

TEST(CodecTest, EncodesSortedKeysWithTwoSpaceIndent) {
    const std::vector<nlohmann::json> records{nlohmann::json{{"title", "x"}, {"id", "1"}}};
    EXPECT_EQ(encodeContainer(records), "[\n  {\n    \"id\": \"1\",\n    \"title\": \"x\"\n  }\n]\n");
}

TEST(CodecTest, LeavesUtf8Unescaped) {
    const std::vector<nlohmann::json> records{nlohmann::json{{"unsolved_stage", "未看题"}}};
    const auto bytes = encodeContainer(records);
    EXPECT_NE(bytes.find("未看题"), std::string::npos);
    EXPECT_EQ(bytes.find("\\u"), std::string::npos);
}

TEST(CodecTest, DecodeOfEncodeKeepsEveryKey) {
    const std::vector<nlohmann::json> records{
        nlohmann::json{{"id", "1"}, {"custom", {{"nested", true}}}, {"tags", {"dp", "greedy"}}},
        nlohmann::json{{"id", "2"}, {"pass_count", nullptr}}
    };
    EXPECT_EQ(decodeContainer(encodeContainer(records)), records);
}
