#pragma once

#include <ragcore/core/types.h>

#include <spdlog/common.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace ragcore::logging {

struct LoggingConfig {
    std::string level = "info"; ///< trace, debug, info, warn, error, off
    std::filesystem::path file; ///< Empty keeps the default console logger
    size_t max_file_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;
};

Result<spdlog::level::level_enum> parseLevel(std::string_view level);

/**
 * @brief Apply a logging configuration to spdlog's default logger.
 *
 * With a file set, the default logger is replaced by a rotating file logger named "ragcore".
 */
Result<void> configure(const LoggingConfig& config);

} // namespace ragcore::logging
