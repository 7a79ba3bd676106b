#pragma once

#include "flakeid/codec/snowflake.h"
#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/generator/generator_config.h"
#include "flakeid/generator/id_generator.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace flakeid::generator {

// SnowflakeGenerator issues IDs for one worker.
//
// Per millisecond the generator is either "fresh" (next ID gets sequence 0) or
// "sequence-active" (next ID gets the previous sequence + 1). When the sequence
// field is exhausted the generator sleeps until the clock reaches the next
// millisecond.
//
// Guarantees:
// - Successive successful next() calls return strictly increasing IDs.
// - A clock that moves backward makes next() fail with kClockMovedBackward;
//   no ID is emitted and no state changes.
// - State is committed only when an ID is returned.
//
// Thread-safety: none. Concurrent callers must serialize access
// (see SynchronizedGenerator).
class SnowflakeGenerator final : public IIdGenerator {
 public:
  // Poll interval while waiting for the clock to leave an exhausted millisecond.
  static constexpr std::chrono::microseconds kWaitPollInterval{100};

  // Create a generator on the system clock with the default epoch.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError> create(
      std::uint64_t worker_id);

  // Create a generator on an injected clock.
  // The clock must outlive the generator.
  // Fails with kInvalidWorkerId or kInvalidEpoch.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError> create(
      const GeneratorConfig& config, core::IClock& clock);

  ~SnowflakeGenerator() override = default;

  // Not copyable or movable: a duplicated state would issue duplicate IDs.
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] core::Result<std::uint64_t, core::IdError> next() override;

  // Same as next(), returning the decoded fields of the issued ID.
  [[nodiscard]] core::Result<codec::Snowflake, core::IdError> next_snowflake();

  [[nodiscard]] codec::Snowflake parse(std::uint64_t id) const override;

  [[nodiscard]] std::uint64_t worker_id() const { return config_.worker_id; }
  [[nodiscard]] std::int64_t epoch_unix_millis() const { return config_.epoch_ms; }

  // Epoch-relative timestamp of the last issued ID; nullopt before the first one.
  [[nodiscard]] std::optional<std::uint64_t> last_timestamp() const { return last_timestamp_; }
  [[nodiscard]] std::uint64_t sequence() const { return sequence_; }

 private:
  SnowflakeGenerator(const GeneratorConfig& config, core::IClock& clock);

  // Current clock reading relative to the epoch.
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> current_millis();

  // Sleep-poll until the clock passes `last`.
  [[nodiscard]] core::Result<std::uint64_t, core::IdError> wait_next_millis(std::uint64_t last);

  GeneratorConfig config_;
  core::IClock* clock_;
  std::optional<std::uint64_t> last_timestamp_;
  std::uint64_t sequence_{0};
};

}  // namespace flakeid::generator
