// File: include/readlog/core/events/classified_event.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "readlog/core/io/raw_event.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

enum class BrightnessMode {
  kManual,
  kNaturalLight,
};

// -----------------------------
// Typed payloads
// -----------------------------

struct SessionStartEvent {
  std::optional<std::string> title;
  std::optional<int> progress;  // percent, 0..100
};

struct SessionEndEvent {
  std::optional<int> progress;  // percent, 0..100

  // Vendor counters reported on the end marker (absent for plain logs).
  std::optional<std::int64_t> pages_turned;
  std::optional<std::int64_t> seconds_read;
  std::optional<std::int64_t> button_presses;
};

struct PageTurnEvent {};

struct DictionaryLookupEvent {
  std::string term;
  std::string dictionary;  // language tag, may be empty
};

struct BrightnessChangeEvent {
  std::int64_t value = 0;
  BrightnessMode mode = BrightnessMode::kManual;
  std::string method;  // vendor adjustment method, may be empty
};

struct BookmarkAddedEvent {
  std::string location;
  std::optional<std::string> note;
};

enum class UnrecognizedReason {
  kUnknownTag,
  kMissingField,
  kBadValue,
};

struct UnrecognizedEvent {
  RawEvent raw;
  UnrecognizedReason reason = UnrecognizedReason::kUnknownTag;
  std::string detail;
};

// Order matches EventKind.
using EventPayload = std::variant<SessionStartEvent,
                                  SessionEndEvent,
                                  PageTurnEvent,
                                  DictionaryLookupEvent,
                                  BrightnessChangeEvent,
                                  BookmarkAddedEvent,
                                  UnrecognizedEvent>;

enum class EventKind {
  kSessionStart = 0,
  kSessionEnd,
  kPageTurn,
  kDictionaryLookup,
  kBrightnessChange,
  kBookmarkAdded,
  kUnrecognized,
};

const char* event_kind_name(EventKind kind) noexcept;

struct ClassifiedEvent {
  std::optional<BookId> book_id;
  TimestampNs timestamp;  // zero when an unrecognized row had no decodable time
  std::uint64_t row_index{0};
  EventPayload payload;

  [[nodiscard]] EventKind kind() const noexcept { return static_cast<EventKind>(payload.index()); }

  template <typename T>
  [[nodiscard]] const T* as() const noexcept {
    return std::get_if<T>(&payload);
  }
};

}  // namespace readlog
