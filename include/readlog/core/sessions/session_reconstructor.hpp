// File: include/readlog/core/sessions/session_reconstructor.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "readlog/core/events/classified_event.hpp"
#include "readlog/core/sessions/reading_session.hpp"

namespace readlog {

// Pairs session start/end markers per book.
//
// Events are grouped by book, ordered by (timestamp, row_index), then walked through a two-state
// machine (Idle / InSession). Events of other kinds, and events without a book, are ignored.
// Output sessions are ordered by (start_time, book_id); orphans by (timestamp, book_id).
class SessionReconstructor {
 public:
  SessionReport reconstruct(const std::vector<ClassifiedEvent>& events) const;

 private:
  struct OpenSession {
    TimestampNs start_time;
    std::int64_t pages = 0;
    std::optional<std::string> title;
    std::optional<int> start_progress;
  };

  static void walk_book(const BookId& book, const std::vector<const ClassifiedEvent*>& events,
                        SessionReport& report);

  static ReadingSession close(const BookId& book, const OpenSession& open, TimestampNs end_time);
};

}  // namespace readlog
