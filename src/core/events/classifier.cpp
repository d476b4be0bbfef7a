// File: src/core/events/classifier.cpp
#include "readlog/core/events/classifier.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace readlog {
namespace {

// Outcome of decoding one known tag.
struct Decoded {
  std::optional<EventPayload> payload;
  UnrecognizedReason reason = UnrecognizedReason::kMissingField;
  std::string detail;

  static Decoded ok(EventPayload p) {
    Decoded d;
    d.payload = std::move(p);
    return d;
  }
  static Decoded missing(std::string what) {
    Decoded d;
    d.reason = UnrecognizedReason::kMissingField;
    d.detail = "missing " + what;
    return d;
  }
  static Decoded bad(std::string what) {
    Decoded d;
    d.reason = UnrecognizedReason::kBadValue;
    d.detail = "bad value for " + what;
    return d;
  }
};

const std::string* find_field(const RawEvent& raw, const char* key) {
  const auto it = raw.fields.find(key);
  if (it == raw.fields.end() || it->second.empty()) return nullptr;
  return &it->second;
}

std::optional<std::int64_t> parse_i64(const std::string& s) {
  std::int64_t v = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return v;
}

bool has_book(const RawEvent& raw) { return raw.book_id.has_value() && !raw.book_id->empty(); }

// Optional integer field: absent is fine, present-but-undecodable is not.
// Returns false on a bad value.
bool read_optional_i64(const RawEvent& raw, const char* key, std::int64_t lo, std::int64_t hi,
                       std::optional<std::int64_t>& out) {
  const std::string* s = find_field(raw, key);
  if (!s) return true;
  const auto v = parse_i64(*s);
  if (!v || *v < lo || *v > hi) return false;
  out = *v;
  return true;
}

constexpr std::int64_t kMaxCounter = std::numeric_limits<std::int64_t>::max();

Decoded decode_session_start(const RawEvent& raw) {
  if (!has_book(raw)) return Decoded::missing("book_id");

  SessionStartEvent e;
  std::optional<std::int64_t> progress;
  if (!read_optional_i64(raw, "progress", 0, 100, progress)) return Decoded::bad("progress");
  if (progress) e.progress = static_cast<int>(*progress);
  if (const std::string* t = find_field(raw, "title")) e.title = *t;
  return Decoded::ok(e);
}

Decoded decode_session_end(const RawEvent& raw) {
  if (!has_book(raw)) return Decoded::missing("book_id");

  SessionEndEvent e;
  std::optional<std::int64_t> progress;
  if (!read_optional_i64(raw, "progress", 0, 100, progress)) return Decoded::bad("progress");
  if (progress) e.progress = static_cast<int>(*progress);
  if (!read_optional_i64(raw, "PagesTurned", 0, kMaxCounter, e.pages_turned)) {
    return Decoded::bad("PagesTurned");
  }
  if (!read_optional_i64(raw, "SecondsRead", 0, kMaxCounter, e.seconds_read)) {
    return Decoded::bad("SecondsRead");
  }
  if (!read_optional_i64(raw, "ButtonPressCount", 0, kMaxCounter, e.button_presses)) {
    return Decoded::bad("ButtonPressCount");
  }
  return Decoded::ok(e);
}

Decoded decode_page_turn(const RawEvent& raw) {
  if (!has_book(raw)) return Decoded::missing("book_id");
  return Decoded::ok(PageTurnEvent{});
}

Decoded decode_dictionary_lookup(const RawEvent& raw) {
  const std::string* word = find_field(raw, "Word");
  if (!word) return Decoded::missing("Word");

  DictionaryLookupEvent e;
  e.term = *word;
  if (const std::string* lang = find_field(raw, "Dictionary")) e.dictionary = *lang;
  return Decoded::ok(e);
}

Decoded decode_brightness(const RawEvent& raw, const char* value_key,
                          std::optional<BrightnessMode> fixed_mode) {
  const std::string* s = find_field(raw, value_key);
  if (!s) return Decoded::missing(value_key);
  const auto v = parse_i64(*s);
  if (!v) return Decoded::bad(value_key);

  BrightnessChangeEvent e;
  e.value = *v;
  if (fixed_mode) {
    e.mode = *fixed_mode;
  } else if (const std::string* m = find_field(raw, "mode")) {
    if (*m == "manual") {
      e.mode = BrightnessMode::kManual;
    } else if (*m == "natural_light") {
      e.mode = BrightnessMode::kNaturalLight;
    } else {
      return Decoded::bad("mode");
    }
  }
  if (const std::string* method = find_field(raw, "Method")) e.method = *method;
  return Decoded::ok(e);
}

Decoded decode_brightness_change(const RawEvent& raw) {
  return decode_brightness(raw, "value", std::nullopt);
}

Decoded decode_brightness_adjusted(const RawEvent& raw) {
  return decode_brightness(raw, "NewBrightness", BrightnessMode::kManual);
}

Decoded decode_natural_light_adjusted(const RawEvent& raw) {
  return decode_brightness(raw, "NewNaturalLight", BrightnessMode::kNaturalLight);
}

Decoded decode_bookmark_added(const RawEvent& raw) {
  if (!has_book(raw)) return Decoded::missing("book_id");
  const std::string* location = find_field(raw, "location");
  if (!location) return Decoded::missing("location");

  BookmarkAddedEvent e;
  e.location = *location;
  if (const std::string* note = find_field(raw, "note")) e.note = *note;
  return Decoded::ok(e);
}

struct TagRule {
  const char* tag;
  EventKind kind;
  Decoded (*decode)(const RawEvent&);
};

// Canonical tags first, then the vendor's analytics names.
constexpr std::array<TagRule, 10> kTagTable = {{
    {"SessionStart", EventKind::kSessionStart, &decode_session_start},
    {"SessionEnd", EventKind::kSessionEnd, &decode_session_end},
    {"PageTurn", EventKind::kPageTurn, &decode_page_turn},
    {"DictionaryLookup", EventKind::kDictionaryLookup, &decode_dictionary_lookup},
    {"BrightnessChange", EventKind::kBrightnessChange, &decode_brightness_change},
    {"BookmarkAdded", EventKind::kBookmarkAdded, &decode_bookmark_added},
    {"OpenContent", EventKind::kSessionStart, &decode_session_start},
    {"LeaveContent", EventKind::kSessionEnd, &decode_session_end},
    {"BrightnessAdjusted", EventKind::kBrightnessChange, &decode_brightness_adjusted},
    {"NaturalLightAdjusted", EventKind::kBrightnessChange, &decode_natural_light_adjusted},
}};

const TagRule* find_rule(const std::string& tag) {
  for (const auto& rule : kTagTable) {
    if (tag == rule.tag) return &rule;
  }
  return nullptr;
}

ClassifiedEvent unrecognized(const RawEvent& raw, UnrecognizedReason reason, std::string detail) {
  ClassifiedEvent out;
  out.book_id = raw.book_id;
  out.timestamp = raw.timestamp.value_or(TimestampNs{0});
  out.row_index = raw.row_index;
  out.payload = UnrecognizedEvent{raw, reason, std::move(detail)};
  return out;
}

}  // namespace

const char* event_kind_name(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kSessionStart: return "session_start";
    case EventKind::kSessionEnd: return "session_end";
    case EventKind::kPageTurn: return "page_turn";
    case EventKind::kDictionaryLookup: return "dictionary_lookup";
    case EventKind::kBrightnessChange: return "brightness_change";
    case EventKind::kBookmarkAdded: return "bookmark_added";
    case EventKind::kUnrecognized: return "unrecognized";
  }
  return "unknown";
}

ClassifiedEvent classify(const RawEvent& raw) {
  const TagRule* rule = find_rule(raw.type_tag);
  if (!rule) {
    return unrecognized(raw, UnrecognizedReason::kUnknownTag, "unknown tag '" + raw.type_tag + "'");
  }
  if (!raw.timestamp) {
    return unrecognized(raw, UnrecognizedReason::kBadValue, "bad value for timestamp");
  }

  Decoded d = rule->decode(raw);
  if (!d.payload) return unrecognized(raw, d.reason, std::move(d.detail));

  ClassifiedEvent out;
  out.book_id = raw.book_id;
  out.timestamp = *raw.timestamp;
  out.row_index = raw.row_index;
  out.payload = std::move(*d.payload);
  return out;
}

std::vector<ClassifiedEvent> classify_all(const std::vector<RawEvent>& raws) {
  std::vector<ClassifiedEvent> out;
  out.reserve(raws.size());
  for (const auto& raw : raws) out.push_back(classify(raw));
  return out;
}

TagSet tags_for(EventKind kind) {
  TagSet out;
  for (const auto& rule : kTagTable) {
    if (rule.kind == kind) out.insert(rule.tag);
  }
  return out;
}

}  // namespace readlog
