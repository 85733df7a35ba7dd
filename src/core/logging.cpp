#include <ragcore/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

namespace ragcore::logging {

Result<spdlog::level::level_enum> parseLevel(std::string_view level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error" || level == "err") {
        return spdlog::level::err;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return Error{ErrorCode::InvalidArgument, fmt::format("unknown log level '{}'", level)};
}

Result<void> configure(const LoggingConfig& config) {
    auto level = parseLevel(config.level);
    if (!level) {
        return level.error();
    }

    if (!config.file.empty()) {
        try {
            if (config.file.has_parent_path()) {
                std::filesystem::create_directories(config.file.parent_path());
            }
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.max_file_bytes, config.max_files);
            auto logger = std::make_shared<spdlog::logger>("ragcore", sink);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("cannot open log file {}: {}", config.file.string(), e.what())};
        }
    }

    spdlog::set_level(level.value());
    return {};
}

} // namespace ragcore::logging
