#include <gtest/gtest.h>
#include <ragcore/core/document.h>

using namespace ragcore;

TEST(ChunkIdTest, FormatsAndParses) {
    EXPECT_EQ(makeChunkId(42, 3), "42:3");

    Chunk chunk;
    chunk.document_id = 7;
    chunk.chunk_index = 0;
    EXPECT_EQ(chunk.id(), "7:0");

    auto parsed = parseChunkId("42:3");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, 42);
    EXPECT_EQ(parsed->second, 3u);
}

TEST(ChunkIdTest, RejectsMalformedIds) {
    EXPECT_FALSE(parseChunkId("").has_value());
    EXPECT_FALSE(parseChunkId("42").has_value());
    EXPECT_FALSE(parseChunkId(":3").has_value());
    EXPECT_FALSE(parseChunkId("42:").has_value());
    EXPECT_FALSE(parseChunkId("a:b").has_value());
    EXPECT_FALSE(parseChunkId("1:2:3").has_value());
}

TEST(Utf8LengthTest, CountsCodePoints) {
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("beveiliging"), 11u);
    EXPECT_EQ(utf8Length("caf\xC3\xA9"), 4u);       // é is two bytes
    EXPECT_EQ(utf8Length("\xE2\x82\xAC" "5"), 2u);  // euro sign is three bytes
}
