#pragma once

#include "flakeid/codec/snowflake.h"
#include "flakeid/core/result.h"

#include <cstdint>

namespace flakeid::generator {

// Abstract ID generator interface for dependency injection.
// Allows callers to choose an unsynchronized or a mutex-guarded generator
// without changing call sites.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Issue the next ID.
  // Contract: successive successful calls on one instance return strictly increasing values.
  [[nodiscard]] virtual core::Result<std::uint64_t, core::IdError> next() = 0;

  // Decompose an ID. Never fails and never touches generator state.
  [[nodiscard]] virtual codec::Snowflake parse(std::uint64_t id) const = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

}  // namespace flakeid::generator
