// File: src/core/stats/brightness_stats.cpp
#include "readlog/core/stats/brightness_stats.hpp"

#include <string>

namespace readlog {

Result<double> time_weighted_average(const std::vector<BrightnessEvent>& events, BrightnessMode mode) {
  std::vector<const BrightnessEvent*> picked;
  for (const auto& e : events) {
    if (e.mode == mode) picked.push_back(&e);
  }
  if (picked.empty()) {
    return Result<double>::err(Status::empty_input(
        std::string("no ") + brightness_mode_name(mode) + " brightness events"));
  }
  if (picked.size() == 1) return Result<double>::ok(static_cast<double>(picked.front()->value));

  double weighted_sum = 0.0;
  double total_s = 0.0;
  for (std::size_t i = 0; i + 1 < picked.size(); ++i) {
    const double span_s = seconds_between(picked[i]->timestamp, picked[i + 1]->timestamp);
    if (span_s <= 0.0) continue;
    weighted_sum += static_cast<double>(picked[i]->value) * span_s;
    total_s += span_s;
  }

  if (total_s == 0.0) return Result<double>::ok(static_cast<double>(picked.back()->value));
  return Result<double>::ok(weighted_sum / total_s);
}

}  // namespace readlog
