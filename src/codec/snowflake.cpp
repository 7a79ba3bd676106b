#include "flakeid/codec/snowflake.h"

#include "flakeid/codec/bit_layout.h"

#include <charconv>

namespace flakeid::codec {

core::Result<std::uint64_t, core::IdError> encode(std::uint64_t timestamp_ms,
                                                  std::uint64_t worker_id,
                                                  std::uint64_t sequence) {
  using R = core::Result<std::uint64_t, core::IdError>;

  if (timestamp_ms > kMaxTimestamp) {
    return R::err(core::IdError::kTimestampOverflow);
  }
  if (worker_id > kMaxWorkerId) {
    return R::err(core::IdError::kWorkerIdOverflow);
  }
  if (sequence > kMaxSequence) {
    return R::err(core::IdError::kSequenceOverflow);
  }

  return R::ok((timestamp_ms << kTimestampShift) | (worker_id << kWorkerIdShift) |
               (sequence << kSequenceShift));
}

core::Result<std::uint64_t, core::IdError> encode(const Snowflake& snowflake) {
  return encode(snowflake.timestamp_ms, snowflake.worker_id, snowflake.sequence);
}

Snowflake decode(std::uint64_t id) {
  return Snowflake{(id >> kTimestampShift) & kMaxTimestamp, (id >> kWorkerIdShift) & kMaxWorkerId,
                   (id >> kSequenceShift) & kMaxSequence};
}

std::string id_to_string(std::uint64_t id) {
  return std::to_string(id);
}

std::optional<std::uint64_t> parse_id_string(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  // from_chars accepts no sign or whitespace for unsigned types, but it stops
  // at the first non-digit, so the whole input must be consumed.
  std::uint64_t value = 0;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::int64_t snowflake_unix_millis(const Snowflake& snowflake, std::int64_t epoch_unix_millis) {
  // Only the bits the timestamp field can carry take part; 41 bits plus a
  // non-negative epoch stays far below INT64_MAX.
  return epoch_unix_millis + static_cast<std::int64_t>(snowflake.timestamp_ms & kMaxTimestamp);
}

}  // namespace flakeid::codec
