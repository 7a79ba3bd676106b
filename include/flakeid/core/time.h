#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// 2020-01-01T00:00:00Z in Unix milliseconds.
inline constexpr std::int64_t kDefaultEpochUnixMillis = 1577836800000;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// format_iso8601_millis renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
// Negative values (before 1970) are floored, so -1 renders as 1969-12-31T23:59:59.999Z.
// Returns "" when the instant is outside the range gmtime can represent.
// Not thread-safe: std::gmtime shares one static buffer.
[[nodiscard]] std::string format_iso8601_millis(std::int64_t unix_millis);

}  // namespace flakeid::core
