#include <gtest/gtest.h>
#include <ragcore/config/config_helpers.h>

using namespace ragcore;
using namespace ragcore::config;
using namespace std::chrono_literals;

TEST(ConfigHelpersTest, ParsesSectionsDottedKeysAndComments) {
    auto map = parse_config_text(R"(
# engine settings
top_level.flag = true

[chunking]
chunk_size = 512   # bytes
separators = ["\n\n", ". ", ""]

[retrieval]
semantic_weight = 0.8
)");
    EXPECT_EQ(map["top_level"]["flag"], "true");
    EXPECT_EQ(map["chunking"]["chunk_size"], "512");
    EXPECT_EQ(map["retrieval"]["semantic_weight"], "0.8");

    auto separators = parse_string_list(map["chunking"]["separators"]);
    ASSERT_EQ(separators.size(), 3u);
    EXPECT_EQ(separators[0], "\n\n");
    EXPECT_EQ(separators[1], ". ");
    EXPECT_EQ(separators[2], "");
}

TEST(ConfigHelpersTest, HashInsideQuotesIsNotAComment) {
    auto map = parse_config_text("[logging]\nfile = \"/tmp/run#1.log\" # trailing\n");
    EXPECT_EQ(unquote(map["logging"]["file"]), "/tmp/run#1.log");
}

TEST(ConfigHelpersTest, TypedParsersRejectGarbage) {
    EXPECT_EQ(parse_int("42").value(), 42);
    EXPECT_EQ(parse_int("\"7\"").value(), 7);
    EXPECT_FALSE(parse_int("4x"));
    EXPECT_FALSE(parse_int(""));

    EXPECT_DOUBLE_EQ(parse_double("0.25").value(), 0.25);
    EXPECT_FALSE(parse_double("abc"));

    EXPECT_TRUE(parse_bool("Yes").value());
    EXPECT_FALSE(parse_bool("off").value());
    auto bad = parse_bool("maybe");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigHelpersTest, DurationsUseSuffixOrDefaultUnit) {
    EXPECT_EQ(parse_duration("30", 1s).value(), 30s);
    EXPECT_EQ(parse_duration("250ms", 1s).value(), 250ms);
    EXPECT_EQ(parse_duration("5m", 1ms).value(), 5min);
    EXPECT_EQ(parse_duration("2h", 1ms).value(), 2h);
    EXPECT_EQ(parse_duration("7d", 1ms).value(), 168h);
    EXPECT_FALSE(parse_duration("soon", 1s));
    EXPECT_FALSE(parse_duration("5 weeks", 1s));
}

TEST(ConfigHelpersTest, UnquoteResolvesEscapesOnlyInDoubleQuotes) {
    EXPECT_EQ(unquote("\"a\\tb\""), "a\tb");
    EXPECT_EQ(unquote("'a\\tb'"), "a\\tb");
    EXPECT_EQ(unquote("plain"), "plain");
}

TEST(ConfigHelpersTest, ConfigPathHonoursOverride) {
    EXPECT_EQ(get_config_path("/etc/ragcore.toml"), std::filesystem::path("/etc/ragcore.toml"));
    EXPECT_EQ(get_config_path().filename(), "config.toml");
}
