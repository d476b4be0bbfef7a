// File: src/core/util/repro_hash.cpp
#include "readlog/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <optional>
#include <string>

namespace readlog {
namespace {

// FNV-1a 64-bit. Not cryptographic.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }

  void add_time(TimestampNs t) { add_i64(t.ns); }

  void add_opt_string(const std::optional<std::string>& s) {
    add_bool(s.has_value());
    if (s) add_string(*s);
  }

  void add_opt_i64(const std::optional<std::int64_t>& v) {
    add_bool(v.has_value());
    if (v) add_i64(*v);
  }

  void add_opt_int(const std::optional<int>& v) {
    add_bool(v.has_value());
    if (v) add_i32(static_cast<std::int32_t>(*v));
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_session(Fnv1a64& h, const ReadingSession& s) {
  h.add_string(s.book_id);
  h.add_time(s.start_time);
  h.add_time(s.end_time);
  h.add_i64(s.pages_turned);
  h.add_bool(s.implicitly_closed);
  h.add_opt_string(s.book_title);
  h.add_opt_int(s.start_progress);
  h.add_opt_int(s.end_progress);
  h.add_opt_i64(s.seconds_read);
  h.add_opt_i64(s.button_presses);
}

void add_report(Fnv1a64& h, const SessionReport& r) {
  h.add_u64(r.sessions.size());
  for (const auto& s : r.sessions) add_session(h, s);

  h.add_u64(r.orphans.size());
  for (const auto& o : r.orphans) {
    h.add_i32(static_cast<std::int32_t>(o.kind));
    h.add_string(o.book_id);
    h.add_time(o.timestamp);
    h.add_i64(o.pages_turned);
  }
  h.add_u64(r.stray_page_turns);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_i32(static_cast<std::int32_t>(cfg.selection));

  // Input.
  h.add_string(cfg.input.type);
  h.add_string(cfg.input.path);

  // Stats.
  h.add_u64(cfg.stats.quantiles.size());
  for (const double q : cfg.stats.quantiles) h.add_double(q);
  h.add_i64(cfg.stats.min_session_ns);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_bool(cfg.output.write_jsonl);

  return to_hex(h.h);
}

std::string compute_result_fingerprint(const AnalysisResult& result) {
  Fnv1a64 h;

  h.add_i32(static_cast<std::int32_t>(result.selection));

  h.add_bool(result.sessions.has_value());
  if (result.sessions) add_report(h, *result.sessions);

  h.add_bool(result.terms.has_value());
  if (result.terms) {
    h.add_u64(result.terms->size());
    for (const auto& t : *result.terms) {
      h.add_string(t.term);
      h.add_opt_string(t.book_id);
      h.add_time(t.timestamp);
      h.add_string(t.dictionary);
    }
  }

  h.add_bool(result.brightness.has_value());
  if (result.brightness) {
    h.add_u64(result.brightness->size());
    for (const auto& b : *result.brightness) {
      h.add_time(b.timestamp);
      h.add_i64(b.value);
      h.add_i32(static_cast<std::int32_t>(b.mode));
      h.add_string(b.method);
    }
  }

  h.add_bool(result.bookmarks.has_value());
  if (result.bookmarks) {
    h.add_u64(result.bookmarks->size());
    for (const auto& b : *result.bookmarks) {
      h.add_string(b.book_id);
      h.add_string(b.location);
      h.add_time(b.timestamp);
      h.add_opt_string(b.note);
    }
  }

  h.add_bool(result.books.has_value());
  if (result.books) {
    h.add_u64(result.books->size());
    for (const auto& b : *result.books) {
      h.add_string(b.id);
      h.add_string(b.title);
      h.add_string(b.authors);
    }
  }

  const ParseDiagnostics& d = result.diagnostics;
  h.add_u64(d.rows_read);
  h.add_u64(d.classified);
  h.add_u64(d.unknown_tags);
  h.add_u64(d.malformed_rows);

  return to_hex(h.h);
}

}  // namespace readlog
