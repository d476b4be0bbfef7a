// File: include/readlog/core/export/jsonl_result_sink.hpp
#pragma once

#include <fstream>
#include <memory>
#include <string>

#include <json/json.h>

#include "readlog/core/export/result_sink.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// JSONL sink for analysis results.
// Writes every line to:
//   1) a unique per-run file: results_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: results_latest.jsonl (truncated each run)
// Line "type" is one of run_started, session, orphan, lookup, term, brightness, bookmark, book,
// summary. Sections absent from the result produce no lines.
class JsonlResultSink final : public IResultSink {
 public:
  JsonlResultSink();
  ~JsonlResultSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status write_result(const AnalysisResult& result) override;
  Status write_summary(const RunSummary& summary) override;
  Status flush() override;
  void close() override;

 private:
  Status write_json_(const Json::Value& v);
  Status write_line_(const std::string& line);

  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;

  std::unique_ptr<Json::StreamWriter> writer_;
};

}  // namespace readlog
