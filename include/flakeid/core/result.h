#pragma once

#include <utility>
#include <variant>

namespace flakeid::core {

// Error enumeration following E.14 (use purpose-designed types as error indicators).
// Every failure the library can report is one of these values; nothing throws.
enum class IdError {
  kInvalidWorkerId,     // worker id does not fit the worker field
  kInvalidEpoch,        // negative epoch
  kTimestampOverflow,   // FieldOverflow: timestamp delta exceeds its width
  kWorkerIdOverflow,    // FieldOverflow: worker id exceeds its width
  kSequenceOverflow,    // FieldOverflow: sequence exceeds its width
  kClockMovedBackward,  // wall clock regressed below the last issued timestamp
  kClockBeforeEpoch,    // wall clock reads earlier than the configured epoch
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

  // Moves the success value out, for move-only T such as std::unique_ptr.
  // The Result must not be read again afterwards.
  [[nodiscard]] T take_value() { return std::move(std::get<T>(data_)); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace flakeid::core
