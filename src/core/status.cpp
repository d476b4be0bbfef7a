// src/core/status.cpp
#include "readlog/core/status.hpp"

namespace readlog {

const char* status_code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "ok";
    case Status::Code::kInvalidArgument: return "invalid_argument";
    case Status::Code::kEmptyInput: return "empty_input";
    case Status::Code::kNotFound: return "not_found";
    case Status::Code::kIoError: return "io_error";
    case Status::Code::kMissingSource: return "missing_source";
    case Status::Code::kParseError: return "parse_error";
  }
  return "unknown";
}

}  // namespace readlog
