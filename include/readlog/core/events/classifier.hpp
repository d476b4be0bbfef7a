// File: include/readlog/core/events/classifier.hpp
#pragma once

#include <vector>

#include "readlog/core/events/classified_event.hpp"
#include "readlog/core/io/raw_event.hpp"
#include "readlog/core/io/row_source.hpp"

namespace readlog {

// Total: every RawEvent yields exactly one ClassifiedEvent. Unknown tags, missing fields and
// undecodable values all come back as UnrecognizedEvent carrying the raw row.
ClassifiedEvent classify(const RawEvent& raw);

std::vector<ClassifiedEvent> classify_all(const std::vector<RawEvent>& raws);

// Every tag (canonical and vendor alias) that classifies as `kind`.
// Empty for kUnrecognized.
TagSet tags_for(EventKind kind);

}  // namespace readlog
