#pragma once

#include "flakeid/codec/snowflake.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::codec {

/// Serialize a snowflake to JSON.
/// The packed ID is written as a decimal string: JSON consumers that parse numbers
/// as doubles lose precision above 2^53.
/// Keys: id, timestamp_ms, worker_id, sequence, created_at (ISO 8601, UTC).
/// Out-of-range fields are written as-is, without "id"; "created_at" is omitted
/// when the timestamp does not fit its field.
[[nodiscard]] nlohmann::json snowflake_to_json(const Snowflake& snowflake,
                                               std::int64_t epoch_unix_millis);

/// Deserialize a snowflake from JSON.
/// "id" (decimal string or unsigned number) takes precedence; otherwise the three
/// fields are read and validated against their widths. An id with the sign bit
/// set is rejected.
/// Returns nullopt for malformed input.
[[nodiscard]] std::optional<Snowflake> snowflake_from_json(const nlohmann::json& j);

/// Serialize to compact JSON string
[[nodiscard]] std::string snowflake_to_json_string(const Snowflake& snowflake,
                                                   std::int64_t epoch_unix_millis);

}  // namespace flakeid::codec
