#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Time sources and timestamp conversions

namespace PIPEMON {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

/**
 * @brief Source of wall-clock time
 *
 * Measurements, violation records and window cutoffs all read time through
 * this interface so tests can drive time explicitly.
 */
class IClock {
public:
  virtual ~IClock() = default;

  /**
   * @brief Current wall-clock time
   */
  virtual TimePoint Now() const = 0;
};

/**
 * @brief IClock backed by std::chrono::system_clock
 */
class SystemClock : public IClock {
public:
  TimePoint Now() const override { return WallClock::now(); }
};

/**
 * @brief Get current high-resolution timestamp in nanoseconds
 * @return Nanoseconds since steady clock epoch (for relative timing)
 */
uint64_t getCurrentTimestampNs();

/**
 * @brief Convert a wall-clock time point to nanoseconds since Unix epoch
 */
int64_t toUnixNs(TimePoint tp);

/**
 * @brief Convert nanoseconds since Unix epoch to a wall-clock time point
 */
TimePoint fromUnixNs(int64_t ns);

/**
 * @brief Format as ISO-8601 UTC with microseconds
 * @return e.g. "2026-10-19T12:34:56.123456Z"
 */
std::string formatIso8601(TimePoint tp);

/**
 * @brief Parse an ISO-8601 UTC timestamp produced by formatIso8601
 *
 * Accepts an optional fractional part (up to 9 digits) and an optional
 * trailing 'Z'.
 * @return std::nullopt if the text is not a valid timestamp
 */
std::optional<TimePoint> parseIso8601(const std::string &text);

} // namespace PIPEMON
