#include "readlog/core/sessions/session_reconstructor.hpp"

#include <cassert>
#include <cmath>
#include <limits>
#include <iostream>
#include <string>
#include <vector>

#include "readlog/core/events/classifier.hpp"

namespace {

using readlog::ClassifiedEvent;
using readlog::OrphanKind;
using readlog::RawEvent;
using readlog::SessionReport;

class Log {
 public:
  Log& add(const std::string& tag, double t_s, const std::string& book = "book-1") {
    RawEvent r;
    r.id = std::to_string(raws_.size());
    r.type_tag = tag;
    r.timestamp = readlog::at_seconds(t_s);
    r.book_id = book;
    r.row_index = raws_.size();
    raws_.push_back(r);
    return *this;
  }

  Log& with(const std::string& key, const std::string& value) {
    raws_.back().fields[key] = value;
    return *this;
  }

  SessionReport reconstruct() const {
    return readlog::SessionReconstructor().reconstruct(readlog::classify_all(raws_));
  }

 private:
  std::vector<RawEvent> raws_;
};

void TestPairedSessionCountsPages() {
  const SessionReport r = Log()
                              .add("SessionStart", 0)
                              .add("PageTurn", 10)
                              .add("PageTurn", 20)
                              .add("SessionEnd", 300)
                              .reconstruct();
  assert(r.sessions.size() == 1);
  assert(r.orphans.empty());
  assert(r.sessions[0].duration_s() == 300.0);
  assert(r.sessions[0].pages_turned == 2);
  assert(!r.sessions[0].implicitly_closed);
}

void TestSecondStartClosesImplicitly() {
  const SessionReport r = Log().add("SessionStart", 0).add("SessionStart", 50).reconstruct();
  assert(r.sessions.size() == 1);
  assert(r.sessions[0].start_time == readlog::at_seconds(0));
  assert(r.sessions[0].end_time == readlog::at_seconds(50));
  assert(r.sessions[0].pages_turned == 0);
  assert(r.sessions[0].implicitly_closed);

  assert(r.orphans.size() == 1);
  assert(r.orphans[0].kind == OrphanKind::kOpenSession);
  assert(r.orphans[0].timestamp == readlog::at_seconds(50));
}

// 1900-01-01 to 2200-01-01 is wider than int64 nanoseconds can hold.
void TestCenturiesLongSessionStaysPositive() {
  const SessionReport r =
      Log().add("SessionStart", -2208988800.0).add("SessionEnd", 7258118400.0).reconstruct();
  assert(r.sessions.size() == 1);
  const auto& s = r.sessions[0];
  assert(s.end_time >= s.start_time);
  assert(s.duration_s() > 0.0);
  assert(std::fabs(s.duration_s() - 9467107200.0) < 1.0);
  assert(s.duration_ns() == std::numeric_limits<readlog::DurationNs>::max());
}

void TestDanglingEndAndStrayPages() {
  const SessionReport r =
      Log().add("PageTurn", 1).add("SessionEnd", 5).add("PageTurn", 6).reconstruct();
  assert(r.sessions.empty());
  assert(r.orphans.size() == 1);
  assert(r.orphans[0].kind == OrphanKind::kDanglingEnd);
  assert(r.orphans[0].timestamp == readlog::at_seconds(5));
  assert(r.stray_page_turns == 2);
}

void TestOpenAtEndOfStreamKeepsPages() {
  const SessionReport r =
      Log().add("SessionStart", 100).add("PageTurn", 110).add("PageTurn", 120).reconstruct();
  assert(r.sessions.empty());
  assert(r.orphans.size() == 1);
  assert(r.orphans[0].kind == OrphanKind::kOpenSession);
  assert(r.orphans[0].pages_turned == 2);
}

void TestBooksAreIndependent() {
  // Interleaved books must not close each other.
  const SessionReport r = Log()
                              .add("SessionStart", 0, "a")
                              .add("SessionStart", 10, "b")
                              .add("PageTurn", 15, "a")
                              .add("SessionEnd", 20, "b")
                              .add("SessionEnd", 30, "a")
                              .reconstruct();
  assert(r.sessions.size() == 2);
  assert(r.orphans.empty());
  // Ordered by start time.
  assert(r.sessions[0].book_id == "a");
  assert(r.sessions[0].pages_turned == 1);
  assert(r.sessions[0].duration_s() == 30.0);
  assert(r.sessions[1].book_id == "b");
  assert(r.sessions[1].duration_s() == 10.0);
}

void TestOutOfOrderRowsAreSortedByTime() {
  const SessionReport r =
      Log().add("SessionEnd", 60).add("PageTurn", 30).add("SessionStart", 0).reconstruct();
  assert(r.sessions.size() == 1);
  assert(r.sessions[0].pages_turned == 1);
  assert(r.sessions[0].end_time >= r.sessions[0].start_time);
}

void TestEqualTimestampsKeepArrivalOrder() {
  // Start and end share a timestamp: the start arrived first, so this is a zero-length session.
  const SessionReport r = Log().add("SessionStart", 5).add("SessionEnd", 5).reconstruct();
  assert(r.sessions.size() == 1);
  assert(r.sessions[0].duration_ns() == 0);
}

void TestVendorCountersCarryOver() {
  const SessionReport r = Log()
                              .add("OpenContent", 0)
                              .with("progress", "10")
                              .with("title", "Dune")
                              .add("PageTurn", 5)
                              .add("LeaveContent", 600)
                              .with("progress", "18")
                              .with("PagesTurned", "9")
                              .with("SecondsRead", "580")
                              .with("ButtonPressCount", "1")
                              .reconstruct();
  assert(r.sessions.size() == 1);
  const auto& s = r.sessions[0];
  assert(s.pages_turned == 9);
  assert(s.start_progress == 10);
  assert(s.end_progress == 18);
  assert(s.seconds_read == 580);
  assert(s.button_presses == 1);
  assert(s.book_title == std::string("Dune"));
}

void TestUnrecognizedAndBooklessEventsIgnored() {
  const SessionReport r = Log()
                              .add("SessionStart", 0)
                              .add("Mystery", 10)
                              .add("SessionStart", 20, "")
                              .add("SessionEnd", 30)
                              .reconstruct();
  assert(r.sessions.size() == 1);
  assert(r.orphans.empty());
  assert(r.sessions[0].duration_s() == 30.0);
}

void TestDeterministic() {
  Log log;
  log.add("SessionStart", 0, "x").add("SessionStart", 0, "y").add("SessionEnd", 9, "y");
  log.add("SessionEnd", 9, "x").add("SessionEnd", 12, "z");

  const SessionReport a = log.reconstruct();
  const SessionReport b = log.reconstruct();
  assert(a.sessions.size() == 2 && b.sessions.size() == 2);
  // Equal start times tie-break on book id.
  assert(a.sessions[0].book_id == "x" && a.sessions[1].book_id == "y");
  for (std::size_t i = 0; i < a.sessions.size(); ++i) {
    assert(a.sessions[i].book_id == b.sessions[i].book_id);
    assert(a.sessions[i].end_time == b.sessions[i].end_time);
  }
  assert(a.orphans.size() == 1 && a.orphans[0].book_id == "z");
}

}  // namespace

int main() {
  TestPairedSessionCountsPages();
  TestSecondStartClosesImplicitly();
  TestCenturiesLongSessionStaysPositive();
  TestDanglingEndAndStrayPages();
  TestOpenAtEndOfStreamKeepsPages();
  TestBooksAreIndependent();
  TestOutOfOrderRowsAreSortedByTime();
  TestEqualTimestampsKeepArrivalOrder();
  TestVendorCountersCarryOver();
  TestUnrecognizedAndBooklessEventsIgnored();
  TestDeterministic();

  std::cout << "readlog_unit_session_reconstructor: pass\n";
  return 0;
}
