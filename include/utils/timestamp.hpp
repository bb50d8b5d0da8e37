#ifndef PASTEBOX_UTILS_TIMESTAMP_HPP
#define PASTEBOX_UTILS_TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace pastebox::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Fixed persisted format, also used as the key derivation salt
constexpr const char* TIMESTAMP_FORMAT = "%Y-%m-%d %H:%M:%S";

// Formats as "YYYY-MM-DD HH:MM:SS" in UTC, sub-second precision is dropped
std::string format_timestamp(TimePoint time);

// Parses "YYYY-MM-DD HH:MM:SS" as UTC, throws std::invalid_argument otherwise
TimePoint parse_timestamp(const std::string& text);

// Rounds half up to the nearest whole second
TimePoint round_to_seconds(TimePoint time);

} // namespace pastebox::utils

#endif // PASTEBOX_UTILS_TIMESTAMP_HPP
