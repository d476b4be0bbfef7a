// File: include/readlog/core/export/result_sink.hpp
#pragma once

#include <string>

#include "readlog/core/analysis/analysis_result.hpp"
#include "readlog/core/analysis/run_summary.hpp"
#include "readlog/core/status.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

// Keep output stable; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;
  std::string input_type;
  std::string input_path;
  std::string out_dir;
  std::string config_hash;

  Selection selection = Selection::kAll;
  TimestampNs wall_start_time;
};

class IResultSink {
 public:
  virtual ~IResultSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status write_result(const AnalysisResult& result) = 0;
  virtual Status write_summary(const RunSummary& summary) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace readlog
