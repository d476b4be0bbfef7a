// File: include/readlog/core/util/time_format.hpp
#pragma once

#include <string>

#include "readlog/core/status.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

// ISO-8601 date-time as stored by the reader firmware:
//   YYYY-MM-DDTHH:MM:SS[.fraction][Z|+hh:mm|-hh:mm]
// A space may replace the 'T'. No zone designator means UTC.
// parse_error on anything else, including out-of-range fields.
Result<TimestampNs> parse_timestamp(const std::string& text);

// UTC, 'Z' suffix; the fraction is printed only when non-zero, trailing zeros trimmed.
std::string format_timestamp(TimestampNs t);

}  // namespace readlog
