#include "kiln/log.hpp"

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace kiln {

namespace {

std::string resolve_level(const LogConfig &config) {
    if (const char *level = std::getenv("KILN_LOG_LEVEL"))
        return level;
    if (!config.level.empty())
        return config.level;
    return "info";
}

std::string resolve_pattern(const LogConfig &config) {
    if (const char *pattern = std::getenv("KILN_LOG_PATTERN"))
        return pattern;
    if (!config.pattern.empty())
        return config.pattern;
    return "[%H:%M:%S.%e] [%^%l%$] %v";
}

} // namespace

void init_logging(const LogConfig &config) {
    auto logger = spdlog::get("kiln");
    if (!logger)
        logger = spdlog::stdout_color_mt("kiln");
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

std::string_view verbosity_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return "error";
    case 1:
        return "info";
    case 2:
        return "debug";
    default:
        return verbosity < 0 ? "error" : "trace";
    }
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace kiln
