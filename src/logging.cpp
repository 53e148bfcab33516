#include "solrfetch/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace solrfetch {

std::shared_ptr<spdlog::logger> initLogging(bool verbose) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
        spdlog::register_logger(logger);
    }

    logger->set_pattern("%Y/%m/%d %H:%M:%S [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace solrfetch
