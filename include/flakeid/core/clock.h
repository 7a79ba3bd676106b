#pragma once

#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time as milliseconds since 1970-01-01T00:00:00Z.
  // Contract: callers must tolerate non-monotonic readings (NTP steps, VM pauses).
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// system_clock returns a process-wide SystemClock.
// SystemClock is stateless, so sharing it introduces no shared mutable state.
SystemClock& system_clock();

// Fixed clock: returns a caller-controlled timestamp for deterministic tests/demos.
// Not thread-safe.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t unix_millis) : unix_millis_(unix_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_unix_millis() override;

  void set_unix_millis(std::int64_t unix_millis) { unix_millis_ = unix_millis; }
  void advance(std::int64_t delta_millis) { unix_millis_ += delta_millis; }

 private:
  std::int64_t unix_millis_;
};

}  // namespace flakeid::core
