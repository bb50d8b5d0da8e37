#include "utils/timestamp.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pastebox::utils {

std::string format_timestamp(TimePoint time) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(time);
  std::time_t raw = Clock::to_time_t(TimePoint(seconds));

  std::tm utc{};
  if (!gmtime_r(&raw, &utc)) {
    throw std::invalid_argument("Timestamp: Value out of range");
  }

  std::ostringstream ss;
  ss << std::put_time(&utc, TIMESTAMP_FORMAT);
  return ss.str();
}

TimePoint parse_timestamp(const std::string& text) {
  std::tm utc{};
  std::istringstream ss(text);
  ss >> std::get_time(&utc, TIMESTAMP_FORMAT);

  // Reject partial matches and trailing garbage
  if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
    throw std::invalid_argument("Timestamp: Malformed value: " + text);
  }

  std::time_t raw = timegm(&utc);
  return Clock::from_time_t(raw);
}

TimePoint round_to_seconds(TimePoint time) {
  auto since_epoch = time.time_since_epoch();
  auto floored = std::chrono::floor<std::chrono::seconds>(since_epoch);
  if (since_epoch - floored >= std::chrono::milliseconds(500)) {
    floored += std::chrono::seconds(1);
  }
  return TimePoint(std::chrono::duration_cast<Clock::duration>(floored));
}

} // namespace pastebox::utils
