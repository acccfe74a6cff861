#pragma once

#include <chrono>
#include <string>

#include "ulidkit/common.hpp"

namespace ulidkit::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  using Milliseconds = std::chrono::sys_time<std::chrono::milliseconds>;

  // Format time as RFC3339 string in UTC with millisecond precision.
  // Years past 9999 carry a leading '+' (ISO 8601 expanded form).
  static std::string toRfc3339(Milliseconds time);

  // Parse RFC3339 string to time_point. Only UTC ("Z" or no suffix) is accepted.
  static Result<Milliseconds> fromRfc3339(const std::string& str);
};

}  // namespace ulidkit::util
