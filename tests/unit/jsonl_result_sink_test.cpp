#include "readlog/core/export/jsonl_result_sink.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "readlog/core/analysis/analyzer.hpp"
#include "readlog/core/util/json_fields.hpp"

namespace {

namespace fs = std::filesystem;
using readlog::RawEvent;
using readlog::Selection;

RawEvent MakeRaw(const std::string& tag, double t_s, const std::string& book, readlog::FieldMap fields = {}) {
  RawEvent r;
  r.type_tag = tag;
  r.timestamp = readlog::at_seconds(t_s);
  if (!book.empty()) r.book_id = book;
  r.fields = fields;
  return r;
}

std::vector<Json::Value> ReadLines(const std::string& path) {
  std::ifstream in(path);
  assert(in.is_open());
  std::vector<Json::Value> out;
  std::string line;
  while (std::getline(in, line)) {
    auto v = readlog::parse_json(line);
    assert(v.ok());
    out.push_back(v.take_value());
  }
  return out;
}

std::map<std::string, int> CountTypes(const std::vector<Json::Value>& lines) {
  std::map<std::string, int> n;
  for (const auto& v : lines) ++n[v["type"].asString()];
  return n;
}

readlog::AnalysisResult SampleResult(Selection sel) {
  const std::vector<RawEvent> raws = {
      MakeRaw("SessionStart", 1700000000, "vol-1", {{"title", "Dune"}}),
      MakeRaw("DictionaryLookup", 1700000010, "vol-1", {{"Word", "spice"}}),
      MakeRaw("DictionaryLookup", 1700000020, "vol-1", {{"Word", "spice"}}),
      MakeRaw("PageTurn", 1700000030, "vol-1"),
      MakeRaw("SessionEnd", 1700000600, "vol-1"),
      MakeRaw("SessionEnd", 1700000700, "vol-2"),
      MakeRaw("BrightnessChange", 1700000000, "", {{"value", "35"}, {"mode", "manual"}}),
      MakeRaw("BookmarkAdded", 1700000100, "vol-1", {{"location", "0.1"}, {"note", "start"}}),
  };
  const std::vector<readlog::Book> books = {{"vol-1", "Dune", "Frank Herbert"}};
  return readlog::Analyzer().analyze(raws, books, sel);
}

readlog::RunInfo MakeRun(const fs::path& dir, std::int64_t wall_s) {
  readlog::RunInfo run;
  run.out_dir = dir.string();
  run.input_type = "jsonl";
  run.input_path = "events.jsonl";
  run.config_hash = "cafe";
  run.wall_start_time = readlog::at_seconds(static_cast<double>(wall_s));
  return run;
}

void TestWritesEveryLineType() {
  const fs::path dir = fs::temp_directory_path() / "readlog_jsonl_result_sink_test";
  fs::remove_all(dir);

  const auto result = SampleResult(Selection::kAll);
  auto summary = readlog::summarize(result, readlog::StatsConfig{});
  assert(summary.ok());

  readlog::JsonlResultSink sink;
  assert(sink.open(MakeRun(dir, 1700001000)).ok());
  assert(sink.write_result(result).ok());
  assert(sink.write_summary(*summary).ok());
  sink.close();

  assert(fs::exists(sink.path()));
  assert(fs::path(sink.path()).filename() == "results_1700001000000000000.jsonl");

  const auto lines = ReadLines(sink.path());
  const auto n = CountTypes(lines);
  assert(n.at("run_started") == 1);
  assert(n.at("session") == 1);
  assert(n.at("orphan") == 1);
  assert(n.at("lookup") == 2);
  assert(n.at("term") == 1);
  assert(n.at("brightness") == 1);
  assert(n.at("bookmark") == 1);
  assert(n.at("book") == 1);
  assert(n.at("summary") == 1);

  assert(lines.front()["type"].asString() == "run_started");
  assert(lines.front()["config_hash"].asString() == "cafe");
  assert(lines.back()["type"].asString() == "summary");
  assert(lines.back()["result_fingerprint"].asString() == summary->result_fingerprint);

  for (const auto& v : lines) {
    const std::string type = v["type"].asString();
    if (type == "session") {
      assert(v["title"].asString() == "Dune");
      assert(v["duration_s"].asDouble() == 600.0);
      assert(v["pages_turned"].asInt64() == 1);
      assert(v["start"].asString() == "2023-11-14T22:13:20Z");
      assert(v["start_ns"].asInt64() == 1700000000LL * 1'000'000'000LL);
    } else if (type == "orphan") {
      assert(v["kind"].asString() == "dangling_end");
      assert(v["book_id"].asString() == "vol-2");
    } else if (type == "term") {
      assert(v["term"].asString() == "spice" && v["count"].asUInt64() == 2);
    } else if (type == "bookmark") {
      assert(v["note"].asString() == "start");
    }
  }

  // The latest file mirrors the per-run file.
  assert(ReadLines(sink.latest_path()).size() == lines.size());
  fs::remove_all(dir);
}

void TestAbsentSectionsWriteNothing() {
  const fs::path dir = fs::temp_directory_path() / "readlog_jsonl_result_sink_test_gate";
  fs::remove_all(dir);

  readlog::JsonlResultSink sink;
  assert(sink.open(MakeRun(dir, 1)).ok());
  assert(sink.write_result(SampleResult(Selection::kBrightness)).ok());
  sink.close();

  const auto n = CountTypes(ReadLines(sink.path()));
  assert(n.size() == 2);
  assert(n.count("run_started") == 1 && n.count("brightness") == 1);
  fs::remove_all(dir);
}

void TestWriteWhileClosedFails() {
  readlog::JsonlResultSink sink;
  const auto st = sink.write_result(readlog::AnalysisResult{});
  assert(!st.ok() && st.code() == readlog::Status::Code::kInvalidArgument);
  assert(sink.flush().ok());
}

}  // namespace

int main() {
  TestWritesEveryLineType();
  TestAbsentSectionsWriteNothing();
  TestWriteWhileClosedFails();

  std::cout << "readlog_unit_jsonl_result_sink: pass\n";
  return 0;
}
