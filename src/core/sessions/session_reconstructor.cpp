// File: src/core/sessions/session_reconstructor.cpp
#include "readlog/core/sessions/session_reconstructor.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace readlog {
namespace {

bool is_session_marker(EventKind k) {
  return k == EventKind::kSessionStart || k == EventKind::kSessionEnd ||
         k == EventKind::kPageTurn;
}

// Timestamp order; arrival order breaks ties.
bool arrives_before(const ClassifiedEvent* a, const ClassifiedEvent* b) {
  if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
  return a->row_index < b->row_index;
}

}  // namespace

const char* orphan_kind_name(OrphanKind kind) noexcept {
  switch (kind) {
    case OrphanKind::kOpenSession: return "open_session";
    case OrphanKind::kDanglingEnd: return "dangling_end";
  }
  return "unknown";
}

SessionReport SessionReconstructor::reconstruct(const std::vector<ClassifiedEvent>& events) const {
  // std::map keeps book iteration order independent of input hashing.
  std::map<BookId, std::vector<const ClassifiedEvent*>> by_book;
  for (const auto& e : events) {
    if (!is_session_marker(e.kind())) continue;
    if (!e.book_id || e.book_id->empty()) continue;
    by_book[*e.book_id].push_back(&e);
  }

  SessionReport report;
  for (auto& [book, book_events] : by_book) {
    std::stable_sort(book_events.begin(), book_events.end(), &arrives_before);
    walk_book(book, book_events, report);
  }

  std::stable_sort(report.sessions.begin(), report.sessions.end(),
                   [](const ReadingSession& a, const ReadingSession& b) {
                     if (a.start_time != b.start_time) return a.start_time < b.start_time;
                     return a.book_id < b.book_id;
                   });
  std::stable_sort(report.orphans.begin(), report.orphans.end(),
                   [](const OrphanSpan& a, const OrphanSpan& b) {
                     if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
                     return a.book_id < b.book_id;
                   });
  return report;
}

void SessionReconstructor::walk_book(const BookId& book,
                                     const std::vector<const ClassifiedEvent*>& events,
                                     SessionReport& report) {
  std::optional<OpenSession> open;

  for (const ClassifiedEvent* e : events) {
    if (const auto* start = e->as<SessionStartEvent>()) {
      if (open) {
        // Missing end marker: close at the boundary the new start establishes.
        ReadingSession s = close(book, *open, e->timestamp);
        s.implicitly_closed = true;
        report.sessions.push_back(std::move(s));
      }
      open = OpenSession{e->timestamp, 0, start->title, start->progress};
      continue;
    }

    if (e->as<PageTurnEvent>()) {
      if (open) {
        ++open->pages;
      } else {
        ++report.stray_page_turns;
      }
      continue;
    }

    if (const auto* end = e->as<SessionEndEvent>()) {
      if (!open) {
        report.orphans.push_back(OrphanSpan{OrphanKind::kDanglingEnd, book, e->timestamp, 0});
        continue;
      }
      ReadingSession s = close(book, *open, e->timestamp);
      if (end->pages_turned) s.pages_turned = std::max(s.pages_turned, *end->pages_turned);
      s.end_progress = end->progress;
      s.seconds_read = end->seconds_read;
      s.button_presses = end->button_presses;
      report.sessions.push_back(std::move(s));
      open.reset();
    }
  }

  if (open) {
    report.orphans.push_back(
        OrphanSpan{OrphanKind::kOpenSession, book, open->start_time, open->pages});
  }
}

ReadingSession SessionReconstructor::close(const BookId& book, const OpenSession& open,
                                           TimestampNs end_time) {
  ReadingSession s;
  s.book_id = book;
  s.start_time = open.start_time;
  s.end_time = end_time;
  s.pages_turned = open.pages;
  s.book_title = open.title;
  s.start_progress = open.start_progress;
  return s;
}

}  // namespace readlog
