#pragma once

#include <cstdint>
#include <ctime>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace pmm {

// -----------------------------------------------------------------------------
// Time formatting utilities
// -----------------------------------------------------------------------------
// Epoch milliseconds are the engine's only time representation. These
// helpers render them for log lines and telemetry. Header-only: trivial,
// stateless, safe from any thread (gmtime_r, not gmtime).
// -----------------------------------------------------------------------------

// Minutes → milliseconds, for run durations given in minutes by config.
// Saturates at the int64 range; NaN maps to 0.
inline std::int64_t minutes_to_ms(double minutes) {
  const double ms = minutes * 60.0 * 1000.0;
  if (std::isnan(ms)) {
    return 0;
  }
  // 2^63 as a double; anything at or above it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (ms >= kLimit) {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (ms <= -kLimit) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return static_cast<std::int64_t>(ms);
}

// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.123Z".
inline std::string format_iso8601(std::int64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  int millis = static_cast<int>(epoch_ms % 1000);
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return out.str();
}

}  // namespace pmm
