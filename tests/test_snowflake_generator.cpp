#include "flakeid/codec/bit_layout.h"
#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"
#include "flakeid/generator/snowflake_generator.h"
#include "scripted_clock.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

using namespace flakeid;
using codec::Snowflake;
using core::IdError;
using generator::GeneratorConfig;
using generator::SnowflakeGenerator;

namespace {

constexpr std::int64_t kEpoch = core::kDefaultEpochUnixMillis;

}  // namespace

TEST_CASE("SnowflakeGenerator: worker id bound", "[generator]") {
  core::FixedClock clock(kEpoch);

  SECTION("largest worker id is accepted") {
    const auto gen = SnowflakeGenerator::create(GeneratorConfig{codec::kMaxWorkerId, kEpoch}, clock);
    REQUIRE(gen.has_value());
    CHECK(gen.value()->worker_id() == 1023);
  }

  SECTION("2^10 is rejected") {
    const auto gen = SnowflakeGenerator::create(GeneratorConfig{1024, kEpoch}, clock);
    REQUIRE_FALSE(gen.has_value());
    CHECK(gen.error() == IdError::kInvalidWorkerId);
  }

  SECTION("system-clock overload applies the same bound") {
    CHECK(SnowflakeGenerator::create(1023).has_value());
    const auto gen = SnowflakeGenerator::create(1024);
    REQUIRE_FALSE(gen.has_value());
    CHECK(gen.error() == IdError::kInvalidWorkerId);
  }
}

TEST_CASE("SnowflakeGenerator: negative epoch is rejected", "[generator]") {
  core::FixedClock clock(0);
  const auto gen = SnowflakeGenerator::create(GeneratorConfig{1, -1}, clock);
  REQUIRE_FALSE(gen.has_value());
  CHECK(gen.error() == IdError::kInvalidEpoch);
}

TEST_CASE("SnowflakeGenerator: fresh generator has no last timestamp", "[generator]") {
  core::FixedClock clock(kEpoch);
  const auto gen = SnowflakeGenerator::create(GeneratorConfig{7, kEpoch}, clock);
  REQUIRE(gen.has_value());

  CHECK_FALSE(gen.value()->last_timestamp().has_value());
  CHECK(gen.value()->sequence() == 0);
  CHECK(gen.value()->epoch_unix_millis() == kEpoch);
}

TEST_CASE("SnowflakeGenerator: two IDs in the same millisecond", "[generator]") {
  core::FixedClock clock(kEpoch + 1000);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{123, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  const auto first = gen.next();
  const auto second = gen.next();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());

  CHECK(gen.parse(first.value()) == Snowflake{1000, 123, 0});
  CHECK(gen.parse(second.value()) == Snowflake{1000, 123, 1});
  CHECK(first.value() == 4194807808ULL);
  CHECK(second.value() == 4194807809ULL);
}

TEST_CASE("SnowflakeGenerator: sequence steps by one within a millisecond", "[generator]") {
  core::FixedClock clock(kEpoch + 5);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{1, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  for (std::uint64_t i = 0; i < 100; ++i) {
    const auto snowflake = gen.next_snowflake();
    REQUIRE(snowflake.has_value());
    CHECK(snowflake.value().timestamp_ms == 5);
    CHECK(snowflake.value().sequence == i);
  }
  CHECK(gen.sequence() == 99);
}

TEST_CASE("SnowflakeGenerator: sequence resets when the millisecond changes", "[generator]") {
  core::FixedClock clock(kEpoch + 10);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{1, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  REQUIRE(gen.next().has_value());
  REQUIRE(gen.next().has_value());
  REQUIRE(gen.sequence() == 1);

  clock.advance(3);
  const auto snowflake = gen.next_snowflake();
  REQUIRE(snowflake.has_value());
  CHECK(snowflake.value() == Snowflake{13, 1, 0});
  CHECK(gen.last_timestamp() == std::optional<std::uint64_t>{13});
}

TEST_CASE("SnowflakeGenerator: sequence overflow waits for the next millisecond", "[generator]") {
  constexpr std::int64_t kNow = kEpoch + 2000;

  // One reading per ID for a full sequence field, one more for the overflowing
  // call, one wait poll that still sees the same millisecond, then the tick.
  std::vector<std::int64_t> readings(codec::kMaxSequence + 3, kNow);
  readings.push_back(kNow + 1);
  testing::ScriptedClock clock(readings);

  const auto created = SnowflakeGenerator::create(GeneratorConfig{9, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  std::uint64_t previous = 0;
  for (std::uint64_t i = 0; i <= codec::kMaxSequence; ++i) {
    const auto id = gen.next();
    REQUIRE(id.has_value());
    if (i > 0) {
      REQUIRE(id.value() > previous);
    }
    previous = id.value();
  }
  REQUIRE(gen.sequence() == codec::kMaxSequence);

  const auto rolled = gen.next();
  REQUIRE(rolled.has_value());
  CHECK(rolled.value() > previous);
  CHECK(gen.parse(rolled.value()) == Snowflake{2001, 9, 0});
  CHECK(clock.calls() == readings.size());
}

TEST_CASE("SnowflakeGenerator: clock regression fails without emitting an ID", "[generator]") {
  core::FixedClock clock(kEpoch + 500);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{3, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  REQUIRE(gen.next().has_value());
  const auto before = gen.next();
  REQUIRE(before.has_value());

  clock.set_unix_millis(kEpoch + 499);
  const auto regressed = gen.next();
  REQUIRE_FALSE(regressed.has_value());
  CHECK(regressed.error() == IdError::kClockMovedBackward);

  // State is untouched, so the generator resumes where it stopped once the clock recovers.
  CHECK(gen.last_timestamp() == std::optional<std::uint64_t>{500});
  CHECK(gen.sequence() == 1);

  clock.set_unix_millis(kEpoch + 500);
  const auto resumed = gen.next();
  REQUIRE(resumed.has_value());
  CHECK(resumed.value() > before.value());
  CHECK(gen.parse(resumed.value()) == Snowflake{500, 3, 2});
}

TEST_CASE("SnowflakeGenerator: clock regression while waiting on overflow", "[generator]") {
  constexpr std::int64_t kNow = kEpoch + 2000;

  std::vector<std::int64_t> readings(codec::kMaxSequence + 2, kNow);
  readings.push_back(kNow - 1);
  testing::ScriptedClock clock(readings);

  const auto created = SnowflakeGenerator::create(GeneratorConfig{9, kEpoch}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  for (std::uint64_t i = 0; i <= codec::kMaxSequence; ++i) {
    REQUIRE(gen.next().has_value());
  }

  const auto failed = gen.next();
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error() == IdError::kClockMovedBackward);
  CHECK(gen.last_timestamp() == std::optional<std::uint64_t>{2000});
  CHECK(gen.sequence() == codec::kMaxSequence);
}

TEST_CASE("SnowflakeGenerator: clock before the epoch", "[generator]") {
  core::FixedClock clock(kEpoch - 1);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{1, kEpoch}, clock);
  REQUIRE(created.has_value());

  const auto id = created.value()->next();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == IdError::kClockBeforeEpoch);
  CHECK_FALSE(created.value()->last_timestamp().has_value());
}

TEST_CASE("SnowflakeGenerator: timestamp range exhausted", "[generator]") {
  core::FixedClock clock(static_cast<std::int64_t>(codec::kMaxTimestamp));
  const auto created = SnowflakeGenerator::create(GeneratorConfig{1, 0}, clock);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  REQUIRE(gen.next().has_value());

  clock.advance(1);
  const auto id = gen.next();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == IdError::kTimestampOverflow);
  CHECK(gen.last_timestamp() == std::optional<std::uint64_t>{codec::kMaxTimestamp});
}

TEST_CASE("SnowflakeGenerator: IDs are strictly increasing on the system clock",
          "[generator][system]") {
  const auto created = SnowflakeGenerator::create(42);
  REQUIRE(created.has_value());
  auto& gen = *created.value();

  std::uint64_t previous = 0;
  for (int i = 0; i < 20000; ++i) {
    const auto id = gen.next();
    REQUIRE(id.has_value());
    REQUIRE(id.value() > previous);
    REQUIRE(gen.parse(id.value()).worker_id == 42);
    previous = id.value();
  }
}

TEST_CASE("SnowflakeGenerator: distinct workers never collide", "[generator]") {
  core::FixedClock clock(kEpoch + 77);
  const auto a = SnowflakeGenerator::create(GeneratorConfig{1, kEpoch}, clock);
  const auto b = SnowflakeGenerator::create(GeneratorConfig{2, kEpoch}, clock);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  for (int i = 0; i < 10; ++i) {
    const auto id_a = a.value()->next();
    const auto id_b = b.value()->next();
    REQUIRE(id_a.has_value());
    REQUIRE(id_b.has_value());
    CHECK(id_a.value() != id_b.value());
  }
}

TEST_CASE("SnowflakeGenerator: parse leaves state alone", "[generator]") {
  core::FixedClock clock(kEpoch + 1);
  const auto created = SnowflakeGenerator::create(GeneratorConfig{5, kEpoch}, clock);
  REQUIRE(created.has_value());
  const auto& gen = *created.value();

  CHECK(gen.parse(4194807809ULL) == Snowflake{1000, 123, 1});
  CHECK(gen.parse(~std::uint64_t{0}).worker_id == codec::kMaxWorkerId);
  CHECK_FALSE(gen.last_timestamp().has_value());
  CHECK(gen.sequence() == 0);
}
