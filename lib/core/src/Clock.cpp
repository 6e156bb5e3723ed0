/**
 * @file Clock.cpp
 * @brief Time source and ISO-8601 timestamp utilities
 */

#include "pipemon/core/Clock.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace PIPEMON {

uint64_t getCurrentTimestampNs() {
  using namespace std::chrono;
  auto now = steady_clock::now();
  auto ns = duration_cast<nanoseconds>(now.time_since_epoch());
  return static_cast<uint64_t>(ns.count());
}

int64_t toUnixNs(TimePoint tp) {
  using namespace std::chrono;
  return static_cast<int64_t>(
      duration_cast<nanoseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixNs(int64_t ns) {
  using namespace std::chrono;
  return TimePoint(duration_cast<WallClock::duration>(nanoseconds(ns)));
}

std::string formatIso8601(TimePoint tp) {
  using namespace std::chrono;
  auto since_epoch = duration_cast<microseconds>(tp.time_since_epoch());
  auto secs = duration_cast<seconds>(since_epoch);
  auto micros = since_epoch - secs;
  if (micros.count() < 0) {
    secs -= seconds(1);
    micros += seconds(1);
  }

  std::time_t time_t_value = static_cast<std::time_t>(secs.count());
  std::tm tm_utc{};
  gmtime_r(&time_t_value, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(6) << micros.count() << 'Z';
  return oss.str();
}

std::optional<TimePoint> parseIso8601(const std::string &text) {
  std::tm tm_utc{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  int64_t fraction_ns = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek())) {
      char c = static_cast<char>(iss.get());
      if (digits < 9) {
        fraction_ns = fraction_ns * 10 + (c - '0');
        ++digits;
      }
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 9; ++digits) {
      fraction_ns *= 10;
    }
  }

  if (iss.peek() == 'Z') {
    iss.get();
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return std::nullopt; // Trailing garbage or unsupported offset
  }

  std::time_t secs = timegm(&tm_utc);
  if (secs == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  return fromUnixNs(static_cast<int64_t>(secs) * 1000000000LL + fraction_ns);
}

} // namespace PIPEMON
