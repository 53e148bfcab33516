#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace solrfetch {

constexpr const char* kLoggerName = "solrfetch";

// Installs a stderr logger named "solrfetch" as spdlog's default logger.
std::shared_ptr<spdlog::logger> initLogging(bool verbose);

} // namespace solrfetch
