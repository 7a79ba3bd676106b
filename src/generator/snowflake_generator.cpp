#include "flakeid/generator/snowflake_generator.h"

#include "flakeid/codec/bit_layout.h"

#include <thread>

namespace flakeid::generator {

core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError> SnowflakeGenerator::create(
    std::uint64_t worker_id) {
  return create(GeneratorConfig{worker_id, core::kDefaultEpochUnixMillis}, core::system_clock());
}

core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError> SnowflakeGenerator::create(
    const GeneratorConfig& config, core::IClock& clock) {
  using R = core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError>;

  if (config.worker_id > codec::kMaxWorkerId) {
    return R::err(core::IdError::kInvalidWorkerId);
  }
  if (config.epoch_ms < 0) {
    return R::err(core::IdError::kInvalidEpoch);
  }

  // Private constructor: std::make_unique cannot reach it.
  return R::ok(std::unique_ptr<SnowflakeGenerator>(new SnowflakeGenerator(config, clock)));
}

SnowflakeGenerator::SnowflakeGenerator(const GeneratorConfig& config, core::IClock& clock)
    : config_(config), clock_(&clock) {}

core::Result<std::uint64_t, core::IdError> SnowflakeGenerator::next() {
  using R = core::Result<std::uint64_t, core::IdError>;

  auto now_result = current_millis();
  if (!now_result.has_value()) {
    return R::err(now_result.error());
  }
  std::uint64_t now = now_result.value();
  std::uint64_t sequence = 0;

  if (last_timestamp_.has_value()) {
    const std::uint64_t last = last_timestamp_.value();

    if (now < last) {
      return R::err(core::IdError::kClockMovedBackward);
    }

    if (now == last) {
      sequence = sequence_ + 1;
      if (sequence > codec::kMaxSequence) {
        auto waited = wait_next_millis(last);
        if (!waited.has_value()) {
          return R::err(waited.error());
        }
        now = waited.value();
        sequence = 0;
      }
    }
  }

  auto id = codec::encode(now, config_.worker_id, sequence);
  if (!id.has_value()) {
    return R::err(id.error());
  }

  last_timestamp_ = now;
  sequence_ = sequence;
  return R::ok(id.value());
}

core::Result<codec::Snowflake, core::IdError> SnowflakeGenerator::next_snowflake() {
  using R = core::Result<codec::Snowflake, core::IdError>;

  auto id = next();
  if (!id.has_value()) {
    return R::err(id.error());
  }
  return R::ok(codec::decode(id.value()));
}

codec::Snowflake SnowflakeGenerator::parse(std::uint64_t id) const {
  return codec::decode(id);
}

core::Result<std::uint64_t, core::IdError> SnowflakeGenerator::current_millis() {
  using R = core::Result<std::uint64_t, core::IdError>;

  const std::int64_t now = clock_->now_unix_millis();
  if (now < config_.epoch_ms) {
    return R::err(core::IdError::kClockBeforeEpoch);
  }
  return R::ok(static_cast<std::uint64_t>(now - config_.epoch_ms));
}

core::Result<std::uint64_t, core::IdError> SnowflakeGenerator::wait_next_millis(
    std::uint64_t last) {
  using R = core::Result<std::uint64_t, core::IdError>;

  while (true) {
    auto now = current_millis();
    if (!now.has_value()) {
      return now;
    }
    if (now.value() > last) {
      return now;
    }
    if (now.value() < last) {
      // The clock stepped back while we were waiting; waiting it out could take arbitrarily long.
      return R::err(core::IdError::kClockMovedBackward);
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
}

}  // namespace flakeid::generator
