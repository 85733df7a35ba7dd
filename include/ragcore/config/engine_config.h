#pragma once

#include <ragcore/cache/cache_manager.h>
#include <ragcore/chunking/text_chunker.h>
#include <ragcore/config/config_helpers.h>
#include <ragcore/core/logging.h>
#include <ragcore/core/types.h>
#include <ragcore/ingest/ingestion_pipeline.h>
#include <ragcore/search/bm25_scorer.h>
#include <ragcore/search/diversity_filter.h>
#include <ragcore/search/hybrid_ranker.h>
#include <ragcore/search/reranker.h>
#include <ragcore/search/retrieval_orchestrator.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ragcore::config {

/**
 * @brief Every tunable of the engine, grouped by config file section.
 *
 * [chunking] chunker; [retrieval] candidate pool, hybrid weights, BM25 and deadlines;
 * [rerank] reranker and diversity filter; [cache] tiers; [ingest] embedding pool;
 * [logging] spdlog.
 */
struct EngineConfig {
    ragcore::chunking::ChunkingConfig chunking;
    search::OrchestratorConfig retrieval;
    search::HybridRankerConfig hybrid;
    search::Bm25Config bm25;
    search::RerankerConfig rerank;
    search::DiversityConfig diversity;
    cache::CacheManagerConfig cache;
    ingest::IngestConfig ingest;
    logging::LoggingConfig logging;

    Result<void> validate() const;
};

// Reads an environment variable; injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup processEnvironment();

/**
 * @brief Overlay RAGCORE_<SECTION>_<KEY> variables onto a parsed config.
 *
 * Only known keys are consulted, e.g. RAGCORE_RETRIEVAL_CANDIDATE_POOL_SIZE.
 * @return number of values overridden
 */
size_t applyEnvironmentOverrides(ConfigMap& map, const EnvLookup& env = processEnvironment());

/**
 * @brief Build a config from defaults plus the given sections. Unknown keys are logged and
 * ignored; malformed values are errors. The result is not validated.
 */
Result<EngineConfig> engineConfigFromMap(const ConfigMap& map);

/**
 * @brief Load, override from the environment and validate.
 *
 * An empty path resolves to get_config_path(); a missing file at the default location
 * yields the defaults, a missing explicit file is NotFound.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {},
                                      const EnvLookup& env = processEnvironment());

} // namespace ragcore::config
