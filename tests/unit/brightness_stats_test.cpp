#include "readlog/core/stats/brightness_stats.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

using readlog::BrightnessEvent;
using readlog::BrightnessMode;
using readlog::Status;

BrightnessEvent At(double t_s, std::int64_t value, BrightnessMode mode = BrightnessMode::kManual) {
  BrightnessEvent e;
  e.timestamp = readlog::at_seconds(t_s);
  e.value = value;
  e.mode = mode;
  return e;
}

bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void TestEmpty() {
  const auto r = readlog::time_weighted_average({}, BrightnessMode::kManual);
  assert(!r.ok() && r.status().code() == Status::Code::kEmptyInput);

  // Only the other mode present.
  const auto other =
      readlog::time_weighted_average({At(0, 10, BrightnessMode::kNaturalLight)}, BrightnessMode::kManual);
  assert(other.status().code() == Status::Code::kEmptyInput);
}

void TestSingleEvent() {
  const auto r = readlog::time_weighted_average({At(5, 70)}, BrightnessMode::kManual);
  assert(r.ok() && Near(*r, 70.0));
}

void TestWeightedBySpan() {
  // 20 held for 10 s, 80 held for 30 s, last value has no span.
  const auto r = readlog::time_weighted_average({At(0, 20), At(10, 80), At(40, 5)},
                                                BrightnessMode::kManual);
  assert(r.ok());
  assert(Near(*r, (20.0 * 10 + 80.0 * 30) / 40.0));
}

void TestZeroSpanFallsBackToLast() {
  const auto r = readlog::time_weighted_average({At(3, 10), At(3, 90)}, BrightnessMode::kManual);
  assert(r.ok() && Near(*r, 90.0));
}

void TestModesAreSeparate() {
  const std::vector<BrightnessEvent> events = {
      At(0, 100), At(0, 10, BrightnessMode::kNaturalLight), At(10, 0),
      At(20, 30, BrightnessMode::kNaturalLight), At(30, 50)};

  const auto manual = readlog::time_weighted_average(events, BrightnessMode::kManual);
  assert(manual.ok() && Near(*manual, (100.0 * 10 + 0.0 * 20) / 30.0));

  const auto natural = readlog::time_weighted_average(events, BrightnessMode::kNaturalLight);
  assert(natural.ok() && Near(*natural, 10.0));
}

}  // namespace

int main() {
  TestEmpty();
  TestSingleEvent();
  TestWeightedBySpan();
  TestZeroSpanFallsBackToLast();
  TestModesAreSeparate();

  std::cout << "readlog_unit_brightness_stats: pass\n";
  return 0;
}
