// include/readlog/core/types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace readlog {

// -----------------------------
// Basic identifiers
// -----------------------------

using BookId = std::string;  // vendor volume id, e.g. "file:///mnt/onboard/x.epub"

// Named payload fields of a stored row. Values stay as the text the source exposed;
// decoding happens in the classifier so a bad value can downgrade a single event.
using FieldMap = std::map<std::string, std::string>;

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds since the Unix epoch (UTC) for determinism.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

using DurationNs = std::int64_t;

// Largest magnitude in seconds that converts to int64 nanoseconds.
constexpr double kMaxRepresentableSeconds = 9'223'372'036.0;

// False for NaN and for values whose nanosecond count would overflow.
constexpr bool seconds_in_range(double seconds) {
  return seconds >= -kMaxRepresentableSeconds && seconds <= kMaxRepresentableSeconds;
}

// Requires seconds_in_range(seconds).
constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

constexpr double ns_to_seconds(DurationNs ns) { return static_cast<double>(ns) * 1e-9; }

constexpr TimestampNs at_seconds(double seconds) { return TimestampNs{seconds_to_ns(seconds)}; }

// Elapsed seconds from `from` to `to`, computed in double so spans wider than int64 ns stay exact
// to the precision of a double.
constexpr double seconds_between(TimestampNs from, TimestampNs to) {
  return (static_cast<double>(to.ns) - static_cast<double>(from.ns)) * 1e-9;
}

// -----------------------------
// Reference data
// -----------------------------

struct Book {
  BookId id;
  std::string title;
  std::string authors;

  bool operator==(const Book& other) const {
    return id == other.id && title == other.title && authors == other.authors;
  }
};

}  // namespace readlog
