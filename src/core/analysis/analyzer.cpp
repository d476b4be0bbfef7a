// File: src/core/analysis/analyzer.cpp
#include "readlog/core/analysis/analyzer.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "readlog/core/events/classifier.hpp"

namespace readlog {
namespace {

// Every tag the classifier has a rule for.
const TagSet& known_tags() {
  static const TagSet tags = [] {
    TagSet out;
    for (const EventKind k : {EventKind::kSessionStart, EventKind::kSessionEnd, EventKind::kPageTurn,
                              EventKind::kDictionaryLookup, EventKind::kBrightnessChange,
                              EventKind::kBookmarkAdded}) {
      const TagSet t = tags_for(k);
      out.insert(t.begin(), t.end());
    }
    return out;
  }();
  return tags;
}

// Rows with a known tag the plan did not ask for are dropped. Rows with an unknown tag are kept
// so they are classified and show up in the diagnostics.
bool wanted(const RawEvent& raw, const ExtractionPlan& plan) {
  if (plan.tags.count(raw.type_tag) != 0) return true;
  return known_tags().count(raw.type_tag) == 0;
}

void count_diagnostics(const std::vector<ClassifiedEvent>& events, ParseDiagnostics& diag) {
  for (const auto& e : events) {
    const auto* u = e.as<UnrecognizedEvent>();
    if (!u) {
      ++diag.classified;
      continue;
    }
    if (u->reason == UnrecognizedReason::kUnknownTag) {
      ++diag.unknown_tags;
    } else {
      ++diag.malformed_rows;
      spdlog::debug("malformed row id={} tag={}: {}", u->raw.id, u->raw.type_tag, u->detail);
    }
  }
}

std::set<BookId> referenced_books(const AnalysisResult& r) {
  std::set<BookId> ids;
  if (r.sessions) {
    for (const auto& s : r.sessions->sessions) ids.insert(s.book_id);
    for (const auto& o : r.sessions->orphans) ids.insert(o.book_id);
  }
  if (r.terms) {
    for (const auto& t : *r.terms) {
      if (t.book_id) ids.insert(*t.book_id);
    }
  }
  if (r.bookmarks) {
    for (const auto& b : *r.bookmarks) ids.insert(b.book_id);
  }
  return ids;
}

// Books referenced by the result, ordered by id, first record per id kept.
std::vector<Book> join_books(const std::vector<Book>& books, const std::set<BookId>& ids) {
  std::vector<Book> out;
  std::set<BookId> seen;
  for (const auto& b : books) {
    if (ids.count(b.id) == 0 || !seen.insert(b.id).second) continue;
    out.push_back(b);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Book& a, const Book& b) { return a.id < b.id; });
  return out;
}

void fill_titles(std::vector<ReadingSession>& sessions, const std::vector<Book>& books) {
  std::unordered_map<BookId, const Book*> by_id;
  for (const auto& b : books) by_id.emplace(b.id, &b);

  for (auto& s : sessions) {
    if (s.book_title) continue;
    const auto it = by_id.find(s.book_id);
    if (it != by_id.end() && !it->second->title.empty()) s.book_title = it->second->title;
  }
}

}  // namespace

Result<AnalysisResult> Analyzer::parse(IRowSource& source, Selection selection) const {
  const ExtractionPlan plan = plan_for(selection);

  auto events = source.read_events(plan.tags);
  if (!events.ok()) {
    spdlog::error("{}: cannot read events: {}", source.name(), events.status().message());
    return Result<AnalysisResult>::err(events.status());
  }

  std::vector<Book> books;
  if (plan.books) {
    auto loaded = source.read_books();
    if (!loaded.ok()) {
      spdlog::error("{}: cannot read books: {}", source.name(), loaded.status().message());
      return Result<AnalysisResult>::err(loaded.status());
    }
    books = loaded.take_value();
  }

  spdlog::debug("{}: {} rows, {} books", source.name(), events->size(), books.size());
  return Result<AnalysisResult>::ok(analyze(*events, books, selection));
}

AnalysisResult Analyzer::analyze(const std::vector<RawEvent>& raws, const std::vector<Book>& books,
                                 Selection selection) const {
  const ExtractionPlan plan = plan_for(selection);

  AnalysisResult result;
  result.selection = selection;

  std::vector<RawEvent> rows;
  rows.reserve(raws.size());
  for (const auto& raw : raws) {
    if (wanted(raw, plan)) rows.push_back(raw);
  }
  result.diagnostics.rows_read = rows.size();

  const std::vector<ClassifiedEvent> events = classify_all(rows);
  count_diagnostics(events, result.diagnostics);

  if (plan.sessions) result.sessions = reconstructor_.reconstruct(events);
  if (plan.lookups) result.terms = extract_dictionary_lookups(events);
  if (plan.brightness) result.brightness = extract_brightness(events);
  if (plan.bookmarks) result.bookmarks = extract_bookmarks(events);

  if (plan.books) {
    result.books = join_books(books, referenced_books(result));
    if (result.sessions) fill_titles(result.sessions->sessions, *result.books);
  }

  const ParseDiagnostics& d = result.diagnostics;
  spdlog::debug("parse selection={} rows={} classified={} unknown={} malformed={}",
                selection_name(selection), d.rows_read, d.classified, d.unknown_tags,
                d.malformed_rows);
  if (d.unknown_tags + d.malformed_rows > 0) {
    spdlog::warn("{} of {} rows unrecognized ({} unknown tag, {} malformed)",
                 d.unknown_tags + d.malformed_rows, d.rows_read, d.unknown_tags, d.malformed_rows);
  }
  return result;
}

}  // namespace readlog
