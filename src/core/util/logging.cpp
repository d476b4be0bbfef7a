// File: src/core/util/logging.cpp
#include "readlog/core/util/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace readlog {
namespace {

std::string resolve_level(const LoggingConfig& cfg) {
  if (const char* level = std::getenv("READLOG_LOG_LEVEL")) return level;
  if (!cfg.level.empty()) return cfg.level;
  return "info";
}

std::string resolve_pattern(const LoggingConfig& cfg) {
  if (const char* pattern = std::getenv("READLOG_LOG_PATTERN")) return pattern;
  if (!cfg.pattern.empty()) return cfg.pattern;
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

}  // namespace

Status init_logging(const LoggingConfig& cfg) {
  const std::string level_name = resolve_level(cfg);
  const auto level = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off; only "off" itself may mean that.
  if (level == spdlog::level::off && level_name != "off") {
    return Status::invalid_argument("unknown log level: " + level_name);
  }

  auto logger = spdlog::get("readlog");
  if (!logger) logger = spdlog::stdout_color_mt("readlog");
  logger->set_pattern(resolve_pattern(cfg));
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  return Status::ok_status();
}

void shutdown_logging() { spdlog::shutdown(); }

}  // namespace readlog
