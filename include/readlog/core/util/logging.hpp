// File: include/readlog/core/util/logging.hpp
#pragma once

#include "readlog/core/config.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// Installs the process-wide "readlog" logger (colored stdout). READLOG_LOG_LEVEL and
// READLOG_LOG_PATTERN override the config values. invalid_argument for an unknown level name.
Status init_logging(const LoggingConfig& cfg);

void shutdown_logging();

}  // namespace readlog
