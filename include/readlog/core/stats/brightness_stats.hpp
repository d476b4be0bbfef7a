// File: include/readlog/core/stats/brightness_stats.hpp
#pragma once

#include <vector>

#include "readlog/core/extract/extractors.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// Average light level for one mode, each value weighted by how long it stayed in effect (until
// the next change of the same mode). The last value has no known span and only counts when no
// span is positive. Input must be chronological (extract_brightness output).
// empty_input when there are no events of that mode.
Result<double> time_weighted_average(const std::vector<BrightnessEvent>& events, BrightnessMode mode);

}  // namespace readlog
