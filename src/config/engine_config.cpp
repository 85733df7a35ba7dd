#include <ragcore/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <vector>

namespace ragcore::config {

namespace {

using Setter = std::function<Result<void>(EngineConfig&, const std::string&)>;

struct KeySpec {
    std::string section;
    std::string key;
    Setter set;
};

template <typename Access> Setter sizeSetter(Access access) {
    return [access](EngineConfig& c, const std::string& raw) -> Result<void> {
        auto v = parse_int(unquote(raw));
        if (!v) {
            return v.error();
        }
        if (v.value() < 0) {
            return Error{ErrorCode::InvalidArgument, "value must not be negative"};
        }
        access(c) = static_cast<size_t>(v.value());
        return {};
    };
}

template <typename Access> Setter doubleSetter(Access access) {
    return [access](EngineConfig& c, const std::string& raw) -> Result<void> {
        auto v = parse_double(unquote(raw));
        if (!v) {
            return v.error();
        }
        access(c) = v.value();
        return {};
    };
}

template <typename Access> Setter boolSetter(Access access) {
    return [access](EngineConfig& c, const std::string& raw) -> Result<void> {
        auto v = parse_bool(unquote(raw));
        if (!v) {
            return v.error();
        }
        access(c) = v.value();
        return {};
    };
}

template <typename Access> Setter durationSetter(Access access, std::chrono::milliseconds unit) {
    return [access, unit](EngineConfig& c, const std::string& raw) -> Result<void> {
        auto v = parse_duration(unquote(raw), unit);
        if (!v) {
            return v.error();
        }
        access(c) = v.value();
        return {};
    };
}

template <typename Access> Setter stringSetter(Access access) {
    return [access](EngineConfig& c, const std::string& raw) -> Result<void> {
        access(c) = unquote(raw);
        return {};
    };
}

template <typename Access> Setter pathSetter(Access access) {
    return [access](EngineConfig& c, const std::string& raw) -> Result<void> {
        access(c) = expand_tilde(unquote(raw));
        return {};
    };
}

void addTierKeys(std::vector<KeySpec>& specs, const char* prefix,
                 cache::CacheTierConfig cache::CacheManagerConfig::*tier) {
    using std::chrono::seconds;
    auto name = [prefix](const char* suffix) { return std::string(prefix) + "_" + suffix; };
    specs.push_back({"cache", name("enabled"),
                     boolSetter([tier](EngineConfig& c) -> bool& { return (c.cache.*tier).enabled; })});
    specs.push_back({"cache", name("capacity"), sizeSetter([tier](EngineConfig& c) -> size_t& {
                         return (c.cache.*tier).capacity;
                     })});
    specs.push_back({"cache", name("embedding_ttl"),
                     durationSetter(
                         [tier](EngineConfig& c) -> std::chrono::milliseconds& {
                             return (c.cache.*tier).embedding_ttl;
                         },
                         seconds(1))});
    specs.push_back({"cache", name("query_ttl"),
                     durationSetter(
                         [tier](EngineConfig& c) -> std::chrono::milliseconds& {
                             return (c.cache.*tier).query_ttl;
                         },
                         seconds(1))});
}

std::vector<KeySpec> buildKeySpecs() {
    using std::chrono::milliseconds;
    using std::chrono::seconds;
    std::vector<KeySpec> specs = {
        // [chunking]
        {"chunking", "chunk_size",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.chunking.chunk_size; })},
        {"chunking", "chunk_overlap",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.chunking.chunk_overlap; })},
        {"chunking", "min_chunk_chars",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.chunking.min_chunk_chars; })},
        {"chunking", "preserve_tables",
         boolSetter([](EngineConfig& c) -> bool& { return c.chunking.preserve_tables; })},
        {"chunking", "separators",
         [](EngineConfig& c, const std::string& raw) -> Result<void> {
             auto list = parse_string_list(raw);
             if (list.empty()) {
                 return Error{ErrorCode::InvalidArgument, "separator list is empty"};
             }
             for (auto& s : list) {
                 s = unescape(s);
             }
             c.chunking.separators = std::move(list);
             return {};
         }},

        // [retrieval]
        {"retrieval", "candidate_pool_size",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.retrieval.candidate_pool_size; })},
        {"retrieval", "request_timeout",
         durationSetter([](EngineConfig& c) -> milliseconds& { return c.retrieval.request_timeout; },
                        milliseconds(1))},
        {"retrieval", "worker_threads",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.retrieval.worker_threads; })},
        {"retrieval", "cache_results",
         boolSetter([](EngineConfig& c) -> bool& { return c.retrieval.cache_results; })},
        {"retrieval", "min_similarity",
         doubleSetter([](EngineConfig& c) -> double& { return c.hybrid.min_similarity; })},
        {"retrieval", "semantic_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.hybrid.semantic_weight; })},
        {"retrieval", "bm25_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.hybrid.bm25_weight; })},
        {"retrieval", "bm25_k1", doubleSetter([](EngineConfig& c) -> double& { return c.bm25.k1; })},
        {"retrieval", "bm25_b", doubleSetter([](EngineConfig& c) -> double& { return c.bm25.b; })},

        // [rerank]
        {"rerank", "top_n", sizeSetter([](EngineConfig& c) -> size_t& { return c.rerank.top_n; })},
        {"rerank", "combined_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.rerank.combined_weight; })},
        {"rerank", "keyword_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.rerank.keyword_weight; })},
        {"rerank", "position_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.rerank.position_weight; })},
        {"rerank", "length_weight",
         doubleSetter([](EngineConfig& c) -> double& { return c.rerank.length_weight; })},
        {"rerank", "position_decay",
         doubleSetter([](EngineConfig& c) -> double& { return c.rerank.position_decay; })},
        {"rerank", "ideal_min_chars",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.rerank.ideal_min_chars; })},
        {"rerank", "ideal_max_chars",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.rerank.ideal_max_chars; })},
        {"rerank", "final_top_k",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.diversity.final_top_k; })},
        {"rerank", "adjacency_window",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.diversity.adjacency_window; })},
        {"rerank", "diversity_threshold",
         doubleSetter([](EngineConfig& c) -> double& { return c.diversity.diversity_threshold; })},

        // [cache]
        {"cache", "tier_cooldown",
         durationSetter([](EngineConfig& c) -> milliseconds& { return c.cache.tier_cooldown; },
                        seconds(1))},
        {"cache", "l3_path",
         pathSetter([](EngineConfig& c) -> std::filesystem::path& { return c.cache.l3_path; })},
        {"cache", "warm_on_open",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.cache.warm_on_open; })},

        // [ingest]
        {"ingest", "embed_batch_size",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.ingest.embed_batch_size; })},
        {"ingest", "embed_workers",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.ingest.embed_workers; })},

        // [logging]
        {"logging", "level",
         stringSetter([](EngineConfig& c) -> std::string& { return c.logging.level; })},
        {"logging", "file",
         pathSetter([](EngineConfig& c) -> std::filesystem::path& { return c.logging.file; })},
        {"logging", "max_file_bytes",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.logging.max_file_bytes; })},
        {"logging", "max_files",
         sizeSetter([](EngineConfig& c) -> size_t& { return c.logging.max_files; })},
    };
    addTierKeys(specs, "l1", &cache::CacheManagerConfig::l1);
    addTierKeys(specs, "l2", &cache::CacheManagerConfig::l2);
    addTierKeys(specs, "l3", &cache::CacheManagerConfig::l3);
    return specs;
}

const std::vector<KeySpec>& keySpecs() {
    static const std::vector<KeySpec> specs = buildKeySpecs();
    return specs;
}

const KeySpec* findSpec(const std::string& section, const std::string& key) {
    for (const auto& spec : keySpecs()) {
        if (section == spec.section && key == spec.key) {
            return &spec;
        }
    }
    return nullptr;
}

std::string envName(std::string_view section, std::string_view key) {
    std::string name = "RAGCORE_";
    for (char c : section) {
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    name.push_back('_');
    for (char c : key) {
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

Result<void> withSection(const char* section, Result<void> result) {
    if (result) {
        return result;
    }
    return Error{result.error().code, fmt::format("[{}] {}", section, result.error().message)};
}

} // namespace

Result<void> EngineConfig::validate() const {
    if (auto r = withSection("chunking", chunking.validate()); !r) {
        return r;
    }
    if (auto r = withSection("retrieval", retrieval.validate()); !r) {
        return r;
    }
    if (auto r = withSection("retrieval", hybrid.validate()); !r) {
        return r;
    }
    if (auto r = withSection("retrieval", bm25.validate()); !r) {
        return r;
    }
    if (auto r = withSection("rerank", rerank.validate()); !r) {
        return r;
    }
    if (auto r = withSection("rerank", diversity.validate()); !r) {
        return r;
    }
    if (diversity.final_top_k > rerank.top_n) {
        return Error{ErrorCode::ValidationError, "[rerank] final_top_k must not exceed top_n"};
    }
    if (auto r = withSection("cache", cache.validate()); !r) {
        return r;
    }
    if (auto r = withSection("ingest", ingest.validate()); !r) {
        return r;
    }
    if (auto r = logging::parseLevel(logging.level); !r) {
        return Error{ErrorCode::ValidationError, "[logging] " + r.error().message};
    }
    return {};
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str()); value && *value) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

size_t applyEnvironmentOverrides(ConfigMap& map, const EnvLookup& env) {
    size_t applied = 0;
    for (const auto& spec : keySpecs()) {
        if (auto value = env(envName(spec.section, spec.key))) {
            map[spec.section][spec.key] = *value;
            ++applied;
        }
    }
    if (auto level = env("RAGCORE_LOG_LEVEL")) {
        map["logging"]["level"] = *level;
        ++applied;
    }
    return applied;
}

Result<EngineConfig> engineConfigFromMap(const ConfigMap& map) {
    EngineConfig config;
    for (const auto& [section, values] : map) {
        for (const auto& [key, raw] : values) {
            const auto* spec = findSpec(section, key);
            if (!spec) {
                spdlog::warn("Ignoring unknown config key {}.{}", section, key);
                continue;
            }
            if (auto r = spec->set(config, raw); !r) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("{}.{} = '{}': {}", section, key, raw, r.error().message)};
            }
        }
    }
    return config;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path, const EnvLookup& env) {
    const auto resolved = path.empty() ? get_config_path() : path;

    ConfigMap map;
    std::error_code ec;
    if (std::filesystem::exists(resolved, ec)) {
        auto parsed = parse_config_file(resolved);
        if (!parsed) {
            return parsed.error();
        }
        map = std::move(parsed).value();
        spdlog::debug("Loaded configuration from {}", resolved.string());
    } else if (!path.empty()) {
        return Error{ErrorCode::NotFound, "config file not found: " + resolved.string()};
    } else {
        spdlog::debug("No configuration at {}, using defaults", resolved.string());
    }

    if (auto overridden = applyEnvironmentOverrides(map, env); overridden > 0) {
        spdlog::debug("{} settings overridden from the environment", overridden);
    }

    auto config = engineConfigFromMap(map);
    if (!config) {
        return config;
    }
    if (auto r = config.value().validate(); !r) {
        return r.error();
    }
    return config;
}

} // namespace ragcore::config
