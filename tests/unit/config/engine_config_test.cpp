#include <gtest/gtest.h>
#include <ragcore/config/engine_config.h>

#include "../../common/temp_dir_scope.h"

#include <fstream>
#include <map>

using namespace ragcore;
using namespace ragcore::config;
using ragcore::test::TempDirScope;
using namespace std::chrono_literals;

namespace {

EnvLookup fakeEnvironment(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

EnvLookup emptyEnvironment() {
    return fakeEnvironment({});
}

} // namespace

class EngineConfigTest : public ::testing::Test {
protected:
    std::filesystem::path writeConfig(const std::string& body) {
        auto path = dir_.path() / "config.toml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    TempDirScope dir_ = TempDirScope::unique_under("ragcore-config");
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.chunking.chunk_size, 768u);
    EXPECT_EQ(config.diversity.final_top_k, 6u);
    EXPECT_EQ(config.cache.l1.query_ttl, 5min);
}

TEST_F(EngineConfigTest, FileValuesOverrideDefaults) {
    auto path = writeConfig(R"(
[chunking]
chunk_size = 512
chunk_overlap = 64
separators = ["\n\n", "\n", " ", ""]

[retrieval]
candidate_pool_size = 80
request_timeout = 2s
semantic_weight = 0.6
bm25_weight = 0.4
bm25_k1 = 1.2

[rerank]
top_n = 30
final_top_k = 5
adjacency_window = 1

[cache]
tier_cooldown = 10
l1_capacity = 500
l2_enabled = false
l3_query_ttl = 12h
l3_path = "/var/lib/ragcore/cache.db"

[logging]
level = "debug"
)");

    auto loaded = loadEngineConfig(path, emptyEnvironment());
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& c = loaded.value();
    EXPECT_EQ(c.chunking.chunk_size, 512u);
    EXPECT_EQ(c.chunking.chunk_overlap, 64u);
    ASSERT_EQ(c.chunking.separators.size(), 4u);
    EXPECT_EQ(c.chunking.separators[0], "\n\n");
    EXPECT_EQ(c.retrieval.candidate_pool_size, 80u);
    EXPECT_EQ(c.retrieval.request_timeout, 2s);
    EXPECT_DOUBLE_EQ(c.hybrid.semantic_weight, 0.6);
    EXPECT_DOUBLE_EQ(c.bm25.k1, 1.2);
    EXPECT_EQ(c.rerank.top_n, 30u);
    EXPECT_EQ(c.diversity.final_top_k, 5u);
    EXPECT_EQ(c.diversity.adjacency_window, 1u);
    EXPECT_EQ(c.cache.tier_cooldown, 10s);
    EXPECT_EQ(c.cache.l1.capacity, 500u);
    EXPECT_FALSE(c.cache.l2.enabled);
    EXPECT_EQ(c.cache.l3.query_ttl, 12h);
    EXPECT_EQ(c.cache.l3_path, std::filesystem::path("/var/lib/ragcore/cache.db"));
    EXPECT_EQ(c.logging.level, "debug");
}

TEST_F(EngineConfigTest, EnvironmentWinsOverFile) {
    auto path = writeConfig("[retrieval]\ncandidate_pool_size = 80\n");
    auto env = fakeEnvironment({{"RAGCORE_RETRIEVAL_CANDIDATE_POOL_SIZE", "120"},
                                {"RAGCORE_CACHE_L1_ENABLED", "false"},
                                {"RAGCORE_LOG_LEVEL", "warn"}});

    auto loaded = loadEngineConfig(path, env);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded.value().retrieval.candidate_pool_size, 120u);
    EXPECT_FALSE(loaded.value().cache.l1.enabled);
    EXPECT_EQ(loaded.value().logging.level, "warn");
}

TEST_F(EngineConfigTest, OverridesAreCountedPerKey) {
    ConfigMap map;
    auto env = fakeEnvironment({{"RAGCORE_CHUNKING_CHUNK_SIZE", "1024"},
                                {"RAGCORE_UNKNOWN_THING", "1"}});
    EXPECT_EQ(applyEnvironmentOverrides(map, env), 1u);
    EXPECT_EQ(map["chunking"]["chunk_size"], "1024");
}

TEST_F(EngineConfigTest, MalformedValueNamesTheKey) {
    ConfigMap map;
    map["rerank"]["top_n"] = "many";
    auto config = engineConfigFromMap(map);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(config.error().message.find("rerank.top_n"), std::string::npos);

    map.clear();
    map["ingest"]["embed_workers"] = "-2";
    EXPECT_FALSE(engineConfigFromMap(map));
}

TEST_F(EngineConfigTest, UnknownKeysAreIgnored) {
    ConfigMap map;
    map["retrieval"]["no_such_key"] = "1";
    map["daemon"]["socket"] = "/tmp/x";
    EXPECT_TRUE(engineConfigFromMap(map));
}

TEST_F(EngineConfigTest, ValidationReportsTheSection) {
    auto path = writeConfig("[chunking]\nchunk_size = 100\nchunk_overlap = 60\n");
    auto loaded = loadEngineConfig(path, emptyEnvironment());
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::ValidationError);
    EXPECT_NE(loaded.error().message.find("[chunking]"), std::string::npos);

    EngineConfig config;
    config.diversity.final_top_k = config.rerank.top_n + 1;
    auto invalid = config.validate();
    ASSERT_FALSE(invalid);
    EXPECT_NE(invalid.error().message.find("final_top_k"), std::string::npos);

    config = EngineConfig{};
    config.logging.level = "chatty";
    EXPECT_FALSE(config.validate());
}

TEST_F(EngineConfigTest, MissingExplicitFileIsNotFound) {
    auto loaded = loadEngineConfig(dir_.path() / "absent.toml", emptyEnvironment());
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}
