#include "readlog/core/stats/session_stats.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>

namespace {

using readlog::ReadingSession;
using readlog::SessionMetric;
using readlog::SessionStats;
using readlog::Status;

ReadingSession MakeSession(double start_s, double duration_s, std::int64_t pages = 0) {
  ReadingSession s;
  s.book_id = "book-1";
  s.start_time = readlog::at_seconds(start_s);
  s.end_time = readlog::at_seconds(start_s + duration_s);
  s.pages_turned = pages;
  return s;
}

bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

SessionStats FourSessions() {
  return SessionStats({MakeSession(0, 10, 1), MakeSession(100, 40, 4), MakeSession(200, 20, 2),
                       MakeSession(300, 30, 3)});
}

void TestMedianInterpolates() {
  const auto r = FourSessions().percentile(SessionMetric::kDuration, {0.5});
  assert(r.ok());
  assert(r->size() == 1);
  assert(Near((*r)[0], 25.0));
}

void TestExtremesAreMinAndMax() {
  const auto r = FourSessions().percentile(SessionMetric::kDuration, {0.0, 1.0, 0.25});
  assert(r.ok());
  assert(Near((*r)[0], 10.0));
  assert(Near((*r)[1], 40.0));
  assert(Near((*r)[2], 17.5));
}

void TestPercentileIsMonotone() {
  const SessionStats stats({MakeSession(0, 7), MakeSession(0, 7), MakeSession(0, 1),
                            MakeSession(0, 90), MakeSession(0, 33)});
  std::vector<double> qs;
  for (int i = 0; i <= 20; ++i) qs.push_back(i / 20.0);
  const auto r = stats.percentile(SessionMetric::kDuration, qs);
  assert(r.ok());
  for (std::size_t i = 1; i < r->size(); ++i) assert((*r)[i - 1] <= (*r)[i]);
}

void TestAverage() {
  const auto avg = FourSessions().average(SessionMetric::kDuration);
  assert(avg.ok() && Near(*avg, 25.0));

  const auto pages = FourSessions().average(SessionMetric::kPagesTurned);
  assert(pages.ok() && Near(*pages, 2.5));

  const SessionStats one({MakeSession(5, 42)});
  assert(Near(*one.average(SessionMetric::kDuration), 42.0));
  assert(Near((*one.percentile(SessionMetric::kDuration, {0.9}))[0], 42.0));
}

void TestEmptyInput() {
  const SessionStats empty;
  assert(empty.count() == 0);

  const auto avg = empty.average(SessionMetric::kDuration);
  assert(!avg.ok() && avg.status().code() == Status::Code::kEmptyInput);

  const auto p = empty.percentile(SessionMetric::kDuration, {0.5});
  assert(!p.ok() && p.status().code() == Status::Code::kEmptyInput);

  // Sessions exist but none carries the vendor counter.
  const auto read = FourSessions().average(SessionMetric::kSecondsRead);
  assert(!read.ok() && read.status().code() == Status::Code::kEmptyInput);
}

void TestQuantileOutOfRange() {
  for (const double bad : {-0.1, 1.5, std::numeric_limits<double>::quiet_NaN()}) {
    const auto r = FourSessions().percentile(SessionMetric::kDuration, {0.5, bad});
    assert(!r.ok() && r.status().code() == Status::Code::kInvalidArgument);
  }
  // Range is checked before emptiness.
  const auto r = SessionStats().percentile(SessionMetric::kDuration, {2.0});
  assert(r.status().code() == Status::Code::kInvalidArgument);
}

void TestOptionalMetrics() {
  ReadingSession a = MakeSession(0, 60);
  a.seconds_read = 50;
  a.start_progress = 10;
  a.end_progress = 15;
  ReadingSession b = MakeSession(100, 60);
  b.seconds_read = 30;
  b.start_progress = 20;

  const SessionStats stats({a, b});
  assert(Near(*stats.average(SessionMetric::kSecondsRead), 40.0));
  assert(Near(*stats.average(SessionMetric::kProgressDelta), 5.0));
  assert(!readlog::metric_value(b, SessionMetric::kButtonPresses).has_value());
}

void TestMetricNames() {
  const auto m = readlog::parse_session_metric("progress_delta");
  assert(m.ok() && *m == SessionMetric::kProgressDelta);
  assert(readlog::parse_session_metric("speed").status().code() == Status::Code::kInvalidArgument);
}

void TestFilterMinDuration() {
  const std::vector<ReadingSession> all = {MakeSession(0, 10), MakeSession(100, 60),
                                           MakeSession(200, 59.5), MakeSession(300, 120)};
  const auto kept = readlog::filter_min_duration(all, readlog::seconds_to_ns(60));
  assert(kept.size() == 2);
  assert(kept[0].start_time == readlog::at_seconds(100));
  assert(kept[1].start_time == readlog::at_seconds(300));
  assert(readlog::filter_min_duration(all, 0).size() == all.size());
}

}  // namespace

int main() {
  TestMedianInterpolates();
  TestExtremesAreMinAndMax();
  TestPercentileIsMonotone();
  TestAverage();
  TestEmptyInput();
  TestQuantileOutOfRange();
  TestOptionalMetrics();
  TestMetricNames();
  TestFilterMinDuration();

  std::cout << "readlog_unit_session_stats: pass\n";
  return 0;
}
