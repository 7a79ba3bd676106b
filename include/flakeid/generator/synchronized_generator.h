#pragma once

#include "flakeid/generator/id_generator.h"
#include "flakeid/generator/snowflake_generator.h"

#include <memory>
#include <mutex>

namespace flakeid::generator {

// SynchronizedGenerator shares one SnowflakeGenerator between threads.
//
// Thread-safety: Uses std::mutex around each whole read-modify-write of the
// wrapped generator (coarse-grained locking). The overflow wait happens under
// the lock, so other callers queue behind it rather than racing for the
// same millisecond.
class SynchronizedGenerator final : public IIdGenerator {
 public:
  // Same contracts and errors as SnowflakeGenerator::create.
  [[nodiscard]] static core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError> create(
      std::uint64_t worker_id);
  [[nodiscard]] static core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError> create(
      const GeneratorConfig& config, core::IClock& clock);

  // Takes ownership of the wrapped generator. `inner` must not be null.
  explicit SynchronizedGenerator(std::unique_ptr<SnowflakeGenerator> inner);
  ~SynchronizedGenerator() override = default;

  // Disable copy/move (mutex not copyable)
  SynchronizedGenerator(const SynchronizedGenerator&) = delete;
  SynchronizedGenerator& operator=(const SynchronizedGenerator&) = delete;
  SynchronizedGenerator(SynchronizedGenerator&&) = delete;
  SynchronizedGenerator& operator=(SynchronizedGenerator&&) = delete;

  [[nodiscard]] core::Result<std::uint64_t, core::IdError> next() override;

  [[nodiscard]] core::Result<codec::Snowflake, core::IdError> next_snowflake();

  // Stateless decode; takes no lock.
  [[nodiscard]] codec::Snowflake parse(std::uint64_t id) const override;

  [[nodiscard]] std::uint64_t worker_id() const { return inner_->worker_id(); }

 private:
  std::mutex mutex_;
  std::unique_ptr<SnowflakeGenerator> inner_;
};

}  // namespace flakeid::generator
