#include "flakeid/core/clock.h"

#include "flakeid/core/time.h"

namespace flakeid::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

SystemClock& system_clock() {
  static SystemClock clock;
  return clock;
}

std::int64_t FixedClock::now_unix_millis() {
  return unix_millis_;
}

}  // namespace flakeid::core
