// include/readlog/core/config.hpp
#pragma once

#include <string>
#include <vector>

#include "readlog/core/analysis/selection.hpp"
#include "readlog/core/status.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

// -----------------------------
// Input source
// -----------------------------
struct InputConfig {
  std::string type = "kobo_sqlite";  // kobo_sqlite | jsonl
  std::string path = "KoboReader.sqlite";
};

// -----------------------------
// Statistics
// -----------------------------
struct StatsConfig {
  // Reported for duration and pages turned.
  std::vector<double> quantiles = {0.25, 0.5, 0.75, 0.9};

  // Sessions shorter than this are left out of the statistics (0 keeps all).
  DurationNs min_session_ns = 0;
};

// -----------------------------
// Output (results + logs)
// -----------------------------
struct OutputConfig {
  // Where to write result JSONL.
  std::string out_dir = "out";
  bool write_jsonl = true;
};

struct LoggingConfig {
  std::string level = "info";
  std::string pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] %v";
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  Selection selection = Selection::kAll;

  InputConfig input;
  StatsConfig stats;
  OutputConfig output;
  LoggingConfig logging;
};

// Fail early on anything a run could not use.
inline Status validate_config(const Config& cfg) {
  if (cfg.input.type != "kobo_sqlite" && cfg.input.type != "jsonl") {
    return Status::invalid_argument("input.type must be 'kobo_sqlite' or 'jsonl'");
  }
  if (cfg.input.path.empty()) {
    return Status::invalid_argument("input.path must not be empty");
  }
  for (const double q : cfg.stats.quantiles) {
    if (!(q >= 0.0 && q <= 1.0)) {
      return Status::invalid_argument("stats.quantiles entries must be within [0,1]");
    }
  }
  if (cfg.stats.min_session_ns < 0) {
    return Status::invalid_argument("stats.min_session_s must be >= 0");
  }
  if (cfg.output.write_jsonl && cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.logging.level.empty()) {
    return Status::invalid_argument("logging.level must not be empty");
  }
  return Status::ok_status();
}

}  // namespace readlog
