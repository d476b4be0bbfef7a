#include "readlog/core/analysis/analyzer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "readlog/core/analysis/run_summary.hpp"
#include "readlog/core/io/memory_row_source.hpp"
#include "readlog/core/util/repro_hash.hpp"

namespace {

using readlog::AnalysisResult;
using readlog::Analyzer;
using readlog::MemoryRowSource;
using readlog::RawEvent;
using readlog::Selection;
using readlog::Status;

RawEvent MakeRaw(const std::string& tag, double t_s, const std::string& book,
                 readlog::FieldMap fields = {}) {
  RawEvent r;
  r.id = tag + "@" + std::to_string(t_s);
  r.type_tag = tag;
  r.timestamp = readlog::at_seconds(t_s);
  if (!book.empty()) r.book_id = book;
  r.fields = std::move(fields);
  return r;
}

// Two books, a lookup, a bookmark, brightness changes and one row the reader never defined.
MemoryRowSource MixedLog() {
  MemoryRowSource src;
  src.add(MakeRaw("OpenContent", 0, "vol-b", {{"progress", "10"}}));
  src.add(MakeRaw("PageTurn", 30, "vol-b"));
  src.add(MakeRaw("DictionaryLookup", 40, "vol-b", {{"Word", "liminal"}, {"Dictionary", "en"}}));
  src.add(MakeRaw("BrightnessAdjusted", 45, "", {{"NewBrightness", "40"}}));
  src.add(MakeRaw("LeaveContent", 300, "vol-b", {{"progress", "14"}, {"PagesTurned", "6"}}));
  src.add(MakeRaw("AppStart", 301, ""));
  src.add(MakeRaw("SessionStart", 400, "vol-a"));
  src.add(MakeRaw("BookmarkAdded", 420, "vol-a", {{"location", "0.5"}}));
  src.add(MakeRaw("NaturalLightAdjusted", 445, "", {{"NewNaturalLight", "20"}}));
  src.add(MakeRaw("BrightnessAdjusted", 545, "", {{"NewBrightness", "90"}}));
  src.add(MakeRaw("SessionEnd", 460, "vol-a"));

  src.add_book(readlog::Book{"vol-b", "Bravo", "B. Author"});
  src.add_book(readlog::Book{"vol-a", "Alpha", "A. Author"});
  src.add_book(readlog::Book{"vol-z", "Unread", ""});
  return src;
}

AnalysisResult Parse(MemoryRowSource& src, Selection sel) {
  auto r = Analyzer().parse(src, sel);
  assert(r.ok());
  return r.take_value();
}

void TestSelectAllFillsEverySection() {
  MemoryRowSource src = MixedLog();
  const AnalysisResult r = Parse(src, Selection::kAll);

  assert(r.sessions && r.terms && r.brightness && r.bookmarks && r.books);
  assert(r.sessions->sessions.size() == 2);
  assert(r.sessions->sessions[0].book_id == "vol-b");
  assert(r.sessions->sessions[0].pages_turned == 6);
  assert(r.terms->size() == 1);
  assert(r.brightness->size() == 3);
  assert(r.bookmarks->size() == 1);

  // Only referenced books, ordered by id.
  assert(r.books->size() == 2);
  assert((*r.books)[0].id == "vol-a" && (*r.books)[1].id == "vol-b");

  // Titles come from the book table when the markers carry none.
  assert(r.sessions->sessions[0].book_title == std::string("Bravo"));
  assert(r.sessions->sessions[1].book_title == std::string("Alpha"));
}

void TestSelectionGatesSections() {
  MemoryRowSource src = MixedLog();

  const AnalysisResult sessions = Parse(src, Selection::kReadingSessions);
  assert(sessions.sessions && sessions.books);
  assert(!sessions.terms && !sessions.brightness && !sessions.bookmarks);

  const AnalysisResult light = Parse(src, Selection::kBrightness);
  assert(light.brightness && light.brightness->size() == 3);
  assert(!light.sessions && !light.terms && !light.bookmarks && !light.books);

  const AnalysisResult lookups = Parse(src, Selection::kDictionaryLookups);
  assert(lookups.terms && !lookups.sessions);
  assert(lookups.books && lookups.books->size() == 1 && (*lookups.books)[0].id == "vol-b");

  const AnalysisResult marks = Parse(src, Selection::kBookmarks);
  assert(marks.bookmarks && marks.bookmarks->size() == 1 && !marks.brightness);
}

void TestDiagnosticsCountUnknownRows() {
  MemoryRowSource src = MixedLog();
  src.add(MakeRaw("SessionStart", 900, ""));  // no book: malformed

  const AnalysisResult r = Parse(src, Selection::kReadingSessions);
  // Unknown tags are kept for diagnostics; unrelated known tags are skipped.
  assert(r.diagnostics.unknown_tags == 1);
  assert(r.diagnostics.malformed_rows == 1);
  assert(r.diagnostics.rows_read == 7);
  assert(r.diagnostics.classified == 5);
  assert(r.sessions->sessions.size() == 2);
}

void TestMissingSource() {
  MemoryRowSource src = MixedLog();
  src.set_unavailable("KoboReader.sqlite not found");
  const auto r = Analyzer().parse(src, Selection::kAll);
  assert(!r.ok());
  assert(r.status().code() == Status::Code::kMissingSource);
}

void TestEmptyLog() {
  MemoryRowSource src;
  const AnalysisResult r = Parse(src, Selection::kAll);
  assert(r.sessions && r.sessions->sessions.empty());
  assert(r.books && r.books->empty());
  assert(r.session_stats().count() == 0);
}

void TestParseIsIdempotent() {
  MemoryRowSource src = MixedLog();
  const AnalysisResult a = Parse(src, Selection::kAll);
  const AnalysisResult b = Parse(src, Selection::kAll);
  assert(readlog::compute_result_fingerprint(a) == readlog::compute_result_fingerprint(b));

  const AnalysisResult c = Parse(src, Selection::kBrightness);
  assert(readlog::compute_result_fingerprint(a) != readlog::compute_result_fingerprint(c));
}

void TestSummarize() {
  MemoryRowSource src = MixedLog();
  const AnalysisResult r = Parse(src, Selection::kAll);

  readlog::StatsConfig stats;
  stats.quantiles = {0.5};
  auto s = readlog::summarize(r, stats);
  assert(s.ok());
  assert(s->session_count == 2 && s->sessions_excluded == 0);
  assert(s->metrics.size() == 4);
  assert(s->metrics[0].metric == readlog::SessionMetric::kDuration);
  assert(s->metrics[0].average && std::fabs(*s->metrics[0].average - 180.0) < 1e-9);
  assert(s->metrics[0].values.size() == 1);
  // No session carries SecondsRead.
  assert(!s->metrics[2].average && s->metrics[2].values.empty());
  assert(s->manual_brightness_avg && s->natural_light_avg);
  assert(std::fabs(*s->natural_light_avg - 20.0) < 1e-9);
  assert(s->terms.size() == 1 && s->terms[0].term == "liminal");

  stats.min_session_ns = readlog::seconds_to_ns(120);
  auto filtered = readlog::summarize(r, stats);
  assert(filtered.ok() && filtered->session_count == 1 && filtered->sessions_excluded == 1);

  stats.quantiles = {1.5};
  const auto bad = readlog::summarize(r, stats);
  assert(!bad.ok() && bad.status().code() == Status::Code::kInvalidArgument);
}

void TestSelectionNames() {
  const auto s = readlog::parse_selection("Reading_Sessions");
  assert(s.ok() && *s == Selection::kReadingSessions);
  assert(readlog::parse_selection("everything").status().code() == Status::Code::kInvalidArgument);
  assert(std::string(readlog::selection_name(Selection::kDictionaryLookups)) == "dictionary_lookups");

  const readlog::ExtractionPlan plan = readlog::plan_for(Selection::kBrightness);
  assert(plan.brightness && !plan.sessions && !plan.books);
  assert(plan.tags.count("NaturalLightAdjusted") == 1);
}

}  // namespace

int main() {
  TestSelectAllFillsEverySection();
  TestSelectionGatesSections();
  TestDiagnosticsCountUnknownRows();
  TestMissingSource();
  TestEmptyLog();
  TestParseIsIdempotent();
  TestSummarize();
  TestSelectionNames();

  std::cout << "readlog_unit_analyzer: pass\n";
  return 0;
}
