// File: src/core/util/time_format.cpp
#include "readlog/core/util/time_format.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace readlog {
namespace {

constexpr std::int64_t kNsPerSecond = 1'000'000'000;

// Whole seconds that still fit in int64 nanoseconds (about 1677-09-21 to 2262-04-11).
constexpr std::int64_t kMaxWholeSeconds = std::numeric_limits<std::int64_t>::max() / kNsPerSecond;

// Cursor over the input; every read checks bounds.
struct Scanner {
  const std::string& s;
  std::size_t pos = 0;

  bool done() const { return pos >= s.size(); }

  bool digits(std::size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
      const char c = s[pos + i];
      if (c < '0' || c > '9') return false;
      v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
  }

  bool expect(char c) {
    if (done() || s[pos] != c) return false;
    ++pos;
    return true;
  }
};

Result<TimestampNs> fail(const std::string& text) {
  return Result<TimestampNs>::err(Status::parse_error("bad timestamp '" + text + "'"));
}

}  // namespace

Result<TimestampNs> parse_timestamp(const std::string& text) {
  Scanner sc{text};
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!sc.digits(4, year) || !sc.expect('-') || !sc.digits(2, month) || !sc.expect('-') ||
      !sc.digits(2, day)) {
    return fail(text);
  }
  if (sc.done() || (text[sc.pos] != 'T' && text[sc.pos] != ' ')) return fail(text);
  ++sc.pos;
  if (!sc.digits(2, hour) || !sc.expect(':') || !sc.digits(2, minute) || !sc.expect(':') ||
      !sc.digits(2, second)) {
    return fail(text);
  }

  const std::chrono::year_month_day date{std::chrono::year{year},
                                         std::chrono::month{static_cast<unsigned>(month)},
                                         std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) return fail(text);
  if (hour > 23 || minute > 59 || second > 59) return fail(text);

  // Fraction: any number of digits, nanosecond precision kept.
  std::int64_t frac_ns = 0;
  if (!sc.done() && text[sc.pos] == '.') {
    ++sc.pos;
    std::int64_t scale = kNsPerSecond / 10;
    std::size_t n = 0;
    while (!sc.done() && text[sc.pos] >= '0' && text[sc.pos] <= '9') {
      frac_ns += (text[sc.pos] - '0') * scale;
      scale /= 10;
      ++sc.pos;
      ++n;
    }
    if (n == 0) return fail(text);
  }

  std::int64_t offset_s = 0;
  if (!sc.done()) {
    const char z = text[sc.pos];
    if (z == 'Z') {
      ++sc.pos;
    } else if (z == '+' || z == '-') {
      ++sc.pos;
      int oh = 0, om = 0;
      if (!sc.digits(2, oh)) return fail(text);
      sc.expect(':');
      if (!sc.digits(2, om)) return fail(text);
      if (oh > 23 || om > 59) return fail(text);
      offset_s = (oh * 3600 + om * 60) * (z == '+' ? 1 : -1);
    } else {
      return fail(text);
    }
  }
  if (!sc.done()) return fail(text);

  const std::int64_t days = std::chrono::sys_days{date}.time_since_epoch().count();
  const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_s;
  if (secs > kMaxWholeSeconds || secs < -kMaxWholeSeconds) return fail(text);
  const std::int64_t base_ns = secs * kNsPerSecond;
  if (base_ns > std::numeric_limits<std::int64_t>::max() - frac_ns) return fail(text);
  return Result<TimestampNs>::ok(TimestampNs{base_ns + frac_ns});
}

std::string format_timestamp(TimestampNs t) {
  std::int64_t secs = t.ns / kNsPerSecond;
  std::int64_t frac = t.ns % kNsPerSecond;
  if (frac < 0) {
    frac += kNsPerSecond;
    --secs;
  }
  const std::chrono::sys_seconds whole{std::chrono::seconds{secs}};
  const auto day_start = std::chrono::floor<std::chrono::days>(whole);
  const std::chrono::year_month_day date{day_start};
  const std::int64_t rem = (whole - day_start).count();

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lld", static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()),
                static_cast<long long>(rem / 3600),
                static_cast<long long>((rem / 60) % 60), static_cast<long long>(rem % 60));
  std::string out = buf;

  if (frac != 0) {
    char fbuf[16];
    std::snprintf(fbuf, sizeof(fbuf), ".%09lld", static_cast<long long>(frac));
    std::string f = fbuf;
    while (f.back() == '0') f.pop_back();
    out += f;
  }
  out += 'Z';
  return out;
}

}  // namespace readlog
