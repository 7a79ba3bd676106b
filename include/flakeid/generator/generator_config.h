#pragma once

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace flakeid::generator {

// GeneratorConfig holds the immutable parameters of one generator.
// worker_id is assigned by the caller; the library does no allocation or coordination.
struct GeneratorConfig {
  std::uint64_t worker_id{0};                             // NOLINT(readability-identifier-naming)
  std::int64_t epoch_ms{core::kDefaultEpochUnixMillis};  // NOLINT(readability-identifier-naming)
};

// validate_generator_config checks a config before a generator is built from it.
//
// Returns: "" on success, non-empty error message on failure.
//
// Checks (first failure is returned):
// - worker_id fits the worker field (0..1023)
// - epoch_ms is not negative
[[nodiscard]] std::string validate_generator_config(const GeneratorConfig& config);

// generator_config_from_json loads and validates a config.
//
// Accepted shape: {"worker_id": <uint>, "epoch_ms": <int>}
// worker_id is required; epoch_ms defaults to 2020-01-01T00:00:00Z.
// Returns an error message when a key has the wrong type or validation fails.
[[nodiscard]] core::Result<GeneratorConfig, std::string> generator_config_from_json(
    const nlohmann::json& j);

[[nodiscard]] nlohmann::json generator_config_to_json(const GeneratorConfig& config);

// generator_config_to_log_string returns a deterministic, human-readable
// representation of a GeneratorConfig for startup diagnostics.
// Format: "worker=<id> epoch=<ISO 8601>"
[[nodiscard]] std::string generator_config_to_log_string(const GeneratorConfig& config);

}  // namespace flakeid::generator
