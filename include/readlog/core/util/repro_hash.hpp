// File: include/readlog/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "readlog/core/analysis/analysis_result.hpp"
#include "readlog/core/config.hpp"

namespace readlog {

// Hash of everything in Config that changes what a run reads or reports.
// Logging settings are excluded: they never change results.
std::string compute_config_hash(const Config& cfg);

// Fingerprint of an AnalysisResult, section by section, absent sections included.
// Two parses of the same input must produce the same value.
std::string compute_result_fingerprint(const AnalysisResult& result);

}  // namespace readlog
