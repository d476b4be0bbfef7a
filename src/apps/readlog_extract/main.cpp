// File: src/apps/readlog_extract/main.cpp
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "readlog/adapters/jsonl/jsonl_row_source.hpp"
#include "readlog/adapters/kobo_sqlite/kobo_sqlite_source.hpp"
#include "readlog/core/analysis/analyzer.hpp"
#include "readlog/core/analysis/run_summary.hpp"
#include "readlog/core/export/jsonl_result_sink.hpp"
#include "readlog/core/util/config_loader.hpp"
#include "readlog/core/util/logging.hpp"
#include "readlog/core/util/repro_hash.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string db_path;    // overrides input.path, forces kobo_sqlite
  std::string selection;  // overrides selection
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--db" && i + 1 < argc) {
      a.db_path = argv[++i];
      continue;
    }
    if (s == "--select" && i + 1 < argc) {
      a.selection = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "readlog_extract\n"
            << "  --config <path>\n"
            << "  [--db <KoboReader.sqlite>]   (either may be given alone)\n"
            << "  [--select all|reading_sessions|dictionary_lookups|bookmarks|brightness]\n";
}

// Source already opened, or the open error.
readlog::Result<std::unique_ptr<readlog::IRowSource>> make_source_from_config(
    const readlog::Config& cfg) {
  using R = readlog::Result<std::unique_ptr<readlog::IRowSource>>;

  if (cfg.input.type == "kobo_sqlite") {
    auto src = std::make_unique<readlog::KoboSqliteSource>(cfg.input.path);
    const readlog::Status st = src->open();
    if (!st.ok()) return R::err(st);
    return R::ok(std::move(src));
  }

  if (cfg.input.type == "jsonl") {
    auto src = std::make_unique<readlog::JsonlRowSource>(cfg.input.path);
    const readlog::Status st = src->open();
    if (!st.ok()) return R::err(st);
    return R::ok(std::move(src));
  }

  return R::err(readlog::Status::invalid_argument("unknown input.type: " + cfg.input.type));
}

void print_summary(const readlog::RunSummary& s) {
  std::cout << std::fixed << std::setprecision(2);
  std::cout << "Selection: " << readlog::selection_name(s.selection) << "\n";
  std::cout << "Rows: " << s.diagnostics.rows_read << "  classified=" << s.diagnostics.classified
            << "  unknown=" << s.diagnostics.unknown_tags
            << "  malformed=" << s.diagnostics.malformed_rows << "\n";

  if (!s.metrics.empty()) {
    std::cout << "Sessions: " << s.session_count << "  (excluded " << s.sessions_excluded
              << ", orphans " << s.orphan_count << ")\n";
    for (const auto& m : s.metrics) {
      std::cout << "  " << readlog::session_metric_name(m.metric) << ": ";
      if (!m.average) {
        std::cout << "n/a\n";
        continue;
      }
      std::cout << "avg=" << *m.average;
      for (std::size_t i = 0; i < m.values.size(); ++i) {
        std::cout << "  p" << static_cast<int>(m.quantiles[i] * 100.0 + 0.5) << "=" << m.values[i];
      }
      std::cout << "\n";
    }
  }

  if (s.manual_brightness_avg) std::cout << "Brightness avg: " << *s.manual_brightness_avg << "\n";
  if (s.natural_light_avg) std::cout << "Natural light avg: " << *s.natural_light_avg << "\n";

  if (!s.terms.empty()) {
    std::cout << "Terms: " << s.terms.size() << " distinct\n";
    const std::size_t n = s.terms.size() < 10 ? s.terms.size() : 10;
    for (std::size_t i = 0; i < n; ++i) {
      std::cout << "  " << s.terms[i].term << " x" << s.terms[i].count << "\n";
    }
  }

  std::cout << "Fingerprint: " << s.result_fingerprint << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || (args.config_path.empty() && args.db_path.empty())) {
    print_usage();
    return args.help ? 0 : 2;
  }

  // Defaults apply when only --db is given.
  readlog::Config cfg;
  if (!args.config_path.empty()) {
    auto cfg_r = readlog::load_config(args.config_path);
    if (!cfg_r.ok()) {
      std::cerr << cfg_r.status().message() << "\n";
      return 1;
    }
    cfg = cfg_r.take_value();
  }

  if (!args.db_path.empty()) {
    cfg.input.type = "kobo_sqlite";
    cfg.input.path = args.db_path;
  }
  if (!args.selection.empty()) {
    auto sel = readlog::parse_selection(args.selection);
    if (!sel.ok()) {
      std::cerr << sel.status().message() << "\n";
      return 2;
    }
    cfg.selection = sel.value();
  }
  const readlog::Status st_cfg = readlog::validate_config(cfg);
  if (!st_cfg.ok()) {
    std::cerr << st_cfg.message() << "\n";
    return 1;
  }

  const readlog::Status st_log = readlog::init_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  auto src_r = make_source_from_config(cfg);
  if (!src_r.ok()) {
    spdlog::error("{} ({})", src_r.status().message(),
                  readlog::status_code_name(src_r.status().code()));
    readlog::shutdown_logging();
    return 2;
  }
  std::unique_ptr<readlog::IRowSource> source = src_r.take_value();

  readlog::Analyzer analyzer;
  auto result_r = analyzer.parse(*source, cfg.selection);
  if (!result_r.ok()) {
    spdlog::error("parse failed: {}", result_r.status().message());
    readlog::shutdown_logging();
    return 2;
  }
  const readlog::AnalysisResult result = result_r.take_value();

  auto summary_r = readlog::summarize(result, cfg.stats);
  if (!summary_r.ok()) {
    spdlog::error("statistics failed: {}", summary_r.status().message());
    readlog::shutdown_logging();
    return 2;
  }
  const readlog::RunSummary summary = summary_r.take_value();

  if (cfg.output.write_jsonl) {
    readlog::RunInfo run;
    run.config_path = args.config_path;
    run.input_type = cfg.input.type;
    run.input_path = cfg.input.path;
    run.out_dir = cfg.output.out_dir;
    run.config_hash = readlog::compute_config_hash(cfg);
    run.selection = cfg.selection;
    run.wall_start_time = readlog::TimestampNs{
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count()};

    readlog::JsonlResultSink sink;
    readlog::Status st = sink.open(run);
    if (st.ok()) st = sink.write_result(result);
    if (st.ok()) st = sink.write_summary(summary);
    sink.close();
    if (!st.ok()) {
      spdlog::error("{}", st.message());
      readlog::shutdown_logging();
      return 2;
    }
    std::cout << "Results: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  }

  print_summary(summary);
  readlog::shutdown_logging();
  return 0;
}
