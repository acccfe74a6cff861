#include "ulidkit/util/time.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace ulidkit::util {

namespace {

constexpr int kMaxFourDigitYear = 9999;

}  // namespace

std::string Time::toRfc3339(Milliseconds time) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(time);
  auto milliseconds = time - seconds;

  std::time_t time_t = static_cast<std::time_t>(seconds.time_since_epoch().count());
  std::tm tm = {};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  if (tm.tm_year + 1900 > kMaxFourDigitYear) {
    oss << '+';
  }
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<Time::Milliseconds> Time::fromRfc3339(const std::string& str) {
  std::regex rfc3339_regex(
      R"((\d{4}|\+\d{5,6})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,3}))?Z?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
      tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_t = timegm(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  Milliseconds time_point{std::chrono::seconds(static_cast<std::int64_t>(time_t))};

  // Fractional part is scaled to milliseconds (".5" is 500ms)
  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(3, '0');
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  return time_point;
}

}  // namespace ulidkit::util
