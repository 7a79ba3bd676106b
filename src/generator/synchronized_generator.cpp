#include "flakeid/generator/synchronized_generator.h"

#include <utility>

namespace flakeid::generator {

namespace {

core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError> wrap(
    core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError> inner) {
  using R = core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError>;
  if (!inner.has_value()) {
    return R::err(inner.error());
  }
  return R::ok(std::make_unique<SynchronizedGenerator>(inner.take_value()));
}

}  // namespace

core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError> SynchronizedGenerator::create(
    std::uint64_t worker_id) {
  return wrap(SnowflakeGenerator::create(worker_id));
}

core::Result<std::unique_ptr<SynchronizedGenerator>, core::IdError> SynchronizedGenerator::create(
    const GeneratorConfig& config, core::IClock& clock) {
  return wrap(SnowflakeGenerator::create(config, clock));
}

SynchronizedGenerator::SynchronizedGenerator(std::unique_ptr<SnowflakeGenerator> inner)
    : inner_(std::move(inner)) {}

core::Result<std::uint64_t, core::IdError> SynchronizedGenerator::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->next();
}

core::Result<codec::Snowflake, core::IdError> SynchronizedGenerator::next_snowflake() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->next_snowflake();
}

codec::Snowflake SynchronizedGenerator::parse(std::uint64_t id) const {
  return inner_->parse(id);
}

}  // namespace flakeid::generator
