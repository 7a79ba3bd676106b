#include "flakeid/generator/generator_config.h"

#include "flakeid/codec/bit_layout.h"

namespace flakeid::generator {

std::string validate_generator_config(const GeneratorConfig& config) {
  if (config.worker_id > codec::kMaxWorkerId) {
    return "Error: worker_id " + std::to_string(config.worker_id) + " is out of range.\n"
           "       Valid worker ids are 0.." + std::to_string(codec::kMaxWorkerId) + ".";
  }

  if (config.epoch_ms < 0) {
    return "Error: epoch_ms " + std::to_string(config.epoch_ms) +
           " is negative. The epoch must be at or after 1970-01-01T00:00:00Z.";
  }

  return "";
}

core::Result<GeneratorConfig, std::string> generator_config_from_json(const nlohmann::json& j) {
  using R = core::Result<GeneratorConfig, std::string>;

  if (!j.is_object()) {
    return R::err("Error: generator config must be a JSON object");
  }

  GeneratorConfig config;

  if (!j.contains("worker_id")) {
    return R::err("Error: generator config is missing required key 'worker_id'");
  }
  const auto& worker_json = j["worker_id"];
  if (worker_json.is_number_unsigned()) {
    config.worker_id = worker_json.get<std::uint64_t>();
  } else if (worker_json.is_number_integer() && worker_json.get<std::int64_t>() >= 0) {
    config.worker_id = static_cast<std::uint64_t>(worker_json.get<std::int64_t>());
  } else {
    return R::err("Error: 'worker_id' must be a non-negative integer");
  }

  if (j.contains("epoch_ms")) {
    const auto& epoch_json = j["epoch_ms"];
    if (!epoch_json.is_number_integer()) {
      return R::err("Error: 'epoch_ms' must be an integer (Unix milliseconds)");
    }
    config.epoch_ms = epoch_json.get<std::int64_t>();
  }

  if (auto message = validate_generator_config(config); !message.empty()) {
    return R::err(std::move(message));
  }

  return R::ok(config);
}

nlohmann::json generator_config_to_json(const GeneratorConfig& config) {
  nlohmann::json j;
  j["worker_id"] = config.worker_id;
  j["epoch_ms"] = config.epoch_ms;
  return j;
}

std::string generator_config_to_log_string(const GeneratorConfig& config) {
  return "worker=" + std::to_string(config.worker_id) +
         " epoch=" + core::format_iso8601_millis(config.epoch_ms);
}

}  // namespace flakeid::generator
