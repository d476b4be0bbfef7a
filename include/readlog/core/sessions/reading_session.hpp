// File: include/readlog/core/sessions/reading_session.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "readlog/core/types.hpp"

namespace readlog {

// A start marker paired with a later end marker for the same book.
// Invariant: end_time >= start_time, pages_turned >= 0.
struct ReadingSession {
  BookId book_id;
  TimestampNs start_time;
  TimestampNs end_time;
  std::int64_t pages_turned = 0;

  // True when the session was closed because a new start arrived without an end marker.
  bool implicitly_closed = false;

  // Vendor details carried over from the markers when the log has them.
  std::optional<std::string> book_title;
  std::optional<int> start_progress;
  std::optional<int> end_progress;
  std::optional<std::int64_t> seconds_read;
  std::optional<std::int64_t> button_presses;

  // Saturates at the int64 limit for spans longer than about 292 years.
  [[nodiscard]] DurationNs duration_ns() const noexcept {
    if (end_time.ns <= start_time.ns) return 0;
    const std::uint64_t span =
        static_cast<std::uint64_t>(end_time.ns) - static_cast<std::uint64_t>(start_time.ns);
    constexpr auto kMax = std::numeric_limits<DurationNs>::max();
    return span > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<DurationNs>(span);
  }
  [[nodiscard]] double duration_s() const noexcept { return seconds_between(start_time, end_time); }
};

enum class OrphanKind {
  kOpenSession,  // start with no end before the stream ran out
  kDanglingEnd,  // end with no preceding start
};

struct OrphanSpan {
  OrphanKind kind = OrphanKind::kOpenSession;
  BookId book_id;
  TimestampNs timestamp;         // start time (open) or end time (dangling)
  std::int64_t pages_turned = 0;  // pages counted while open; 0 for dangling ends
};

const char* orphan_kind_name(OrphanKind kind) noexcept;

struct SessionReport {
  std::vector<ReadingSession> sessions;
  std::vector<OrphanSpan> orphans;

  // Page turns seen while no session was open for their book.
  std::size_t stray_page_turns = 0;
};

}  // namespace readlog
