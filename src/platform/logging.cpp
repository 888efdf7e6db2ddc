#include "octpkg/logging.hpp"
#include "octpkg/platform.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace octpkg {

void init_logging(bool verbose, bool quiet) {
    auto logger = spdlog::stderr_color_mt("octpkg");
    logger->set_pattern("octpkg: %^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    // OCTPKG_LOG_LEVEL wins over flags, for debugging scripted runs
    if (auto level = get_env("OCTPKG_LOG_LEVEL")) {
        set_log_level(*level);
    }
}

void set_log_level(const std::string& level) {
    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("unknown log level '{}', keeping current level", level);
    }
}

} // namespace octpkg
