#pragma once

// Bit layout of a snowflake ID, most-significant first:
//
//   63      62 .................. 22 21 ........ 12 11 ......... 0
//  +--+------------------------------+-------------+--------------+
//  | 0|  timestamp delta (41 bits)   | worker (10) | sequence (12)|
//  +--+------------------------------+-------------+--------------+
//
// The sign bit stays clear so IDs also fit a signed 64-bit column.
// 41 bits of milliseconds covers roughly 69.7 years past the epoch.

#include <cstdint>

namespace flakeid::codec {

inline constexpr unsigned kTimestampBits = 41;
inline constexpr unsigned kWorkerIdBits = 10;
inline constexpr unsigned kSequenceBits = 12;

static_assert(kTimestampBits + kWorkerIdBits + kSequenceBits <= 63,
              "snowflake fields must leave the sign bit clear");

inline constexpr unsigned kSequenceShift = 0;
inline constexpr unsigned kWorkerIdShift = kSequenceBits;
inline constexpr unsigned kTimestampShift = kSequenceBits + kWorkerIdBits;

inline constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << kTimestampBits) - 1;
inline constexpr std::uint64_t kMaxWorkerId = (std::uint64_t{1} << kWorkerIdBits) - 1;
inline constexpr std::uint64_t kMaxSequence = (std::uint64_t{1} << kSequenceBits) - 1;

}  // namespace flakeid::codec
