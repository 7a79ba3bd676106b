#include "flakeid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

std::string format_iso8601_millis(std::int64_t unix_millis) {
  std::int64_t seconds = unix_millis / 1000;
  std::int64_t millis = unix_millis % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  const std::tm* utc = std::gmtime(&time_t_value);
  if (utc == nullptr) {
    return "";
  }

  std::ostringstream oss;
  oss << std::put_time(utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
