#include "flakeid/codec/snowflake_json.h"

#include "flakeid/codec/bit_layout.h"
#include "flakeid/core/time.h"

#include <limits>

namespace flakeid::codec {

namespace {

// nlohmann stores non-negative literals built in C++ as signed integers, so both
// integer kinds are accepted as long as the value is not negative.
std::optional<std::uint64_t> as_unsigned(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  return std::nullopt;
}

// IDs never set the sign bit; one that does would not survive re-encoding.
std::optional<Snowflake> decode_checked(std::optional<std::uint64_t> id) {
  if (!id.has_value() ||
      id.value() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return decode(id.value());
}

std::optional<std::uint64_t> read_unsigned(const nlohmann::json& j, const char* key) {
  if (!j.contains(key)) {
    return std::nullopt;
  }
  return as_unsigned(j[key]);
}

}  // namespace

nlohmann::json snowflake_to_json(const Snowflake& snowflake, std::int64_t epoch_unix_millis) {
  nlohmann::json j;

  const auto id = encode(snowflake);
  if (id.has_value()) {
    j["id"] = id_to_string(id.value());
  }
  j["timestamp_ms"] = snowflake.timestamp_ms;
  j["worker_id"] = snowflake.worker_id;
  j["sequence"] = snowflake.sequence;
  if (snowflake.timestamp_ms <= kMaxTimestamp) {
    j["created_at"] =
        core::format_iso8601_millis(snowflake_unix_millis(snowflake, epoch_unix_millis));
  }

  return j;
}

std::optional<Snowflake> snowflake_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  if (j.contains("id")) {
    const auto& id_json = j["id"];
    if (id_json.is_string()) {
      return decode_checked(parse_id_string(id_json.get<std::string>()));
    }
    return decode_checked(as_unsigned(id_json));
  }

  const auto timestamp_ms = read_unsigned(j, "timestamp_ms");
  const auto worker_id = read_unsigned(j, "worker_id");
  const auto sequence = read_unsigned(j, "sequence");
  if (!timestamp_ms.has_value() || !worker_id.has_value() || !sequence.has_value()) {
    return std::nullopt;
  }

  Snowflake snowflake{timestamp_ms.value(), worker_id.value(), sequence.value()};
  if (!encode(snowflake).has_value()) {
    return std::nullopt;
  }
  return snowflake;
}

std::string snowflake_to_json_string(const Snowflake& snowflake, std::int64_t epoch_unix_millis) {
  return snowflake_to_json(snowflake, epoch_unix_millis).dump();  // Compact JSON
}

}  // namespace flakeid::codec
