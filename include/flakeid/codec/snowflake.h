#pragma once

#include "flakeid/core/result.h"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::codec {

// Snowflake is the decoded form of an ID.
// Members are declared in bit order, so the defaulted comparison orders
// in-range values exactly like their encoded integers.
struct Snowflake {
  std::uint64_t timestamp_ms{0};  // NOLINT(readability-identifier-naming) ms since epoch
  std::uint64_t worker_id{0};     // NOLINT(readability-identifier-naming)
  std::uint64_t sequence{0};      // NOLINT(readability-identifier-naming)
  auto operator<=>(const Snowflake&) const = default;
};

// encode packs the three fields into one ID.
// Fails with kTimestampOverflow, kWorkerIdOverflow or kSequenceOverflow for the
// first field (in that order) that does not fit its width.
[[nodiscard]] core::Result<std::uint64_t, core::IdError> encode(std::uint64_t timestamp_ms,
                                                                std::uint64_t worker_id,
                                                                std::uint64_t sequence);

[[nodiscard]] core::Result<std::uint64_t, core::IdError> encode(const Snowflake& snowflake);

// decode unpacks any 64-bit value. Never fails; the sign bit is ignored.
[[nodiscard]] Snowflake decode(std::uint64_t id);

// id_to_string returns the decimal representation of an ID.
[[nodiscard]] std::string id_to_string(std::uint64_t id);

// parse_id_string parses a decimal ID.
// Returns nullopt for empty input, any non-digit character (including sign or
// whitespace), or a value that does not fit in 64 bits.
[[nodiscard]] std::optional<std::uint64_t> parse_id_string(std::string_view text);

// snowflake_unix_millis converts the epoch-relative timestamp back to Unix milliseconds.
// Bits of timestamp_ms above the 41-bit field are ignored, as decode would drop them.
[[nodiscard]] std::int64_t snowflake_unix_millis(const Snowflake& snowflake,
                                                 std::int64_t epoch_unix_millis);

}  // namespace flakeid::codec
