// File: src/core/export/jsonl_result_sink.cpp
#include "readlog/core/export/jsonl_result_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include "readlog/core/util/time_format.hpp"

namespace readlog {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

Json::Value line(const char* type) {
  Json::Value v(Json::objectValue);
  v["type"] = type;
  return v;
}

void put_time(Json::Value& v, const char* key, TimestampNs t) {
  v[std::string(key) + "_ns"] = Json::Int64(t.ns);
  v[key] = format_timestamp(t);
}

template <typename T>
void put_opt(Json::Value& v, const char* key, const std::optional<T>& x) {
  if (x) v[key] = *x;
}

void put_opt_i64(Json::Value& v, const char* key, const std::optional<std::int64_t>& x) {
  if (x) v[key] = Json::Int64(*x);
}

Json::Value session_json(const ReadingSession& s) {
  Json::Value v = line("session");
  v["book_id"] = s.book_id;
  put_time(v, "start", s.start_time);
  put_time(v, "end", s.end_time);
  v["duration_s"] = s.duration_s();
  v["pages_turned"] = Json::Int64(s.pages_turned);
  v["implicitly_closed"] = s.implicitly_closed;
  put_opt(v, "title", s.book_title);
  put_opt(v, "start_progress", s.start_progress);
  put_opt(v, "end_progress", s.end_progress);
  put_opt_i64(v, "seconds_read", s.seconds_read);
  put_opt_i64(v, "button_presses", s.button_presses);
  return v;
}

Json::Value orphan_json(const OrphanSpan& o) {
  Json::Value v = line("orphan");
  v["kind"] = orphan_kind_name(o.kind);
  v["book_id"] = o.book_id;
  put_time(v, "t", o.timestamp);
  v["pages_turned"] = Json::Int64(o.pages_turned);
  return v;
}

Json::Value metric_json(const MetricSummary& m) {
  Json::Value v(Json::objectValue);
  v["metric"] = session_metric_name(m.metric);
  if (m.average) v["average"] = *m.average;
  Json::Value ps(Json::arrayValue);
  for (std::size_t i = 0; i < m.values.size() && i < m.quantiles.size(); ++i) {
    Json::Value p(Json::objectValue);
    p["p"] = m.quantiles[i];
    p["value"] = m.values[i];
    ps.append(p);
  }
  v["percentiles"] = ps;
  return v;
}

}  // namespace

JsonlResultSink::JsonlResultSink() {
  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  b["emitUTF8"] = true;
  writer_.reset(b.newStreamWriter());
}

JsonlResultSink::~JsonlResultSink() { close(); }

Status JsonlResultSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time.ns;

  path_ = join_path(run.out_dir, "results_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "results_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  Json::Value v = line("run_started");
  v["t_wall_ns"] = Json::Int64(wall0);
  v["t_wall"] = format_timestamp(run.wall_start_time);
  v["selection"] = selection_name(run.selection);
  v["input_type"] = run.input_type;
  v["input_path"] = run.input_path;
  v["config_path"] = run.config_path;
  v["config_hash"] = run.config_hash;

  READLOG_RETURN_IF_ERROR(write_json_(v));
  return flush();
}

Status JsonlResultSink::write_result(const AnalysisResult& r) {
  if (!open_) return Status::invalid_argument("JsonlResultSink::write_result called while not open");

  if (r.sessions) {
    for (const auto& s : r.sessions->sessions) READLOG_RETURN_IF_ERROR(write_json_(session_json(s)));
    for (const auto& o : r.sessions->orphans) READLOG_RETURN_IF_ERROR(write_json_(orphan_json(o)));
  }

  if (r.terms) {
    for (const auto& t : *r.terms) {
      Json::Value v = line("lookup");
      v["term"] = t.term;
      put_opt(v, "book_id", t.book_id);
      put_time(v, "t", t.timestamp);
      if (!t.dictionary.empty()) v["dictionary"] = t.dictionary;
      READLOG_RETURN_IF_ERROR(write_json_(v));
    }
    for (const auto& tf : term_frequencies(*r.terms)) {
      Json::Value v = line("term");
      v["term"] = tf.term;
      if (!tf.dictionary.empty()) v["dictionary"] = tf.dictionary;
      v["count"] = Json::UInt64(tf.count);
      READLOG_RETURN_IF_ERROR(write_json_(v));
    }
  }

  if (r.brightness) {
    for (const auto& b : *r.brightness) {
      Json::Value v = line("brightness");
      put_time(v, "t", b.timestamp);
      v["value"] = Json::Int64(b.value);
      v["mode"] = brightness_mode_name(b.mode);
      if (!b.method.empty()) v["method"] = b.method;
      READLOG_RETURN_IF_ERROR(write_json_(v));
    }
  }

  if (r.bookmarks) {
    for (const auto& b : *r.bookmarks) {
      Json::Value v = line("bookmark");
      v["book_id"] = b.book_id;
      v["location"] = b.location;
      put_time(v, "t", b.timestamp);
      put_opt(v, "note", b.note);
      READLOG_RETURN_IF_ERROR(write_json_(v));
    }
  }

  if (r.books) {
    for (const auto& b : *r.books) {
      Json::Value v = line("book");
      v["book_id"] = b.id;
      v["title"] = b.title;
      v["authors"] = b.authors;
      READLOG_RETURN_IF_ERROR(write_json_(v));
    }
  }

  return Status::ok_status();
}

Status JsonlResultSink::write_summary(const RunSummary& s) {
  if (!open_) return Status::invalid_argument("JsonlResultSink::write_summary called while not open");

  Json::Value v = line("summary");
  v["selection"] = selection_name(s.selection);
  v["sessions"] = Json::UInt64(s.session_count);
  v["sessions_excluded"] = Json::UInt64(s.sessions_excluded);
  v["orphans"] = Json::UInt64(s.orphan_count);

  Json::Value metrics(Json::arrayValue);
  for (const auto& m : s.metrics) metrics.append(metric_json(m));
  v["metrics"] = metrics;

  put_opt(v, "manual_brightness_avg", s.manual_brightness_avg);
  put_opt(v, "natural_light_avg", s.natural_light_avg);
  v["distinct_terms"] = Json::UInt64(s.terms.size());

  Json::Value diag(Json::objectValue);
  diag["rows_read"] = Json::UInt64(s.diagnostics.rows_read);
  diag["classified"] = Json::UInt64(s.diagnostics.classified);
  diag["unknown_tags"] = Json::UInt64(s.diagnostics.unknown_tags);
  diag["malformed_rows"] = Json::UInt64(s.diagnostics.malformed_rows);
  v["diagnostics"] = diag;
  v["result_fingerprint"] = s.result_fingerprint;

  READLOG_RETURN_IF_ERROR(write_json_(v));
  return flush();
}

Status JsonlResultSink::write_json_(const Json::Value& v) {
  std::ostringstream ss;
  if (writer_->write(v, &ss) != 0) return Status::io_error("failed encoding result line");
  return write_line_(ss.str());
}

Status JsonlResultSink::write_line_(const std::string& text) {
  f_ << text << "\n";
  latest_ << text << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlResultSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlResultSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace readlog
