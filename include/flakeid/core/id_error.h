#pragma once

#include "flakeid/core/result.h"

#include <string_view>

namespace flakeid::core {

// id_error_to_string returns a stable snake_case name for diagnostics.
// The names are part of the log format; do not rename them.
[[nodiscard]] inline std::string_view id_error_to_string(IdError error) {
  switch (error) {
    case IdError::kInvalidWorkerId:
      return "invalid_worker_id";
    case IdError::kInvalidEpoch:
      return "invalid_epoch";
    case IdError::kTimestampOverflow:
      return "timestamp_overflow";
    case IdError::kWorkerIdOverflow:
      return "worker_id_overflow";
    case IdError::kSequenceOverflow:
      return "sequence_overflow";
    case IdError::kClockMovedBackward:
      return "clock_moved_backward";
    case IdError::kClockBeforeEpoch:
      return "clock_before_epoch";
  }
  return "unknown";
}

// is_field_overflow is true for the errors raised when an encode input
// does not fit its bit field.
[[nodiscard]] inline bool is_field_overflow(IdError error) {
  return error == IdError::kTimestampOverflow || error == IdError::kWorkerIdOverflow ||
         error == IdError::kSequenceOverflow;
}

}  // namespace flakeid::core
