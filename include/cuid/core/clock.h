#pragma once

#include <chrono>
#include <cstdint>

namespace cuid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return whole milliseconds since the Unix epoch.
  // Throws EnvironmentError if the clock cannot produce a post-epoch reading.
  virtual std::uint64_t now_epoch_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// round_to_millis converts a sub-millisecond duration to whole milliseconds,
// rounding half away from zero (1.5 ms -> 2 ms, 2.5 ms -> 3 ms, -1.5 ms -> -2 ms).
[[nodiscard]] std::int64_t round_to_millis(std::chrono::nanoseconds since_epoch);

// to_epoch_millis rounds with round_to_millis and rejects readings before the epoch.
// Throws EnvironmentError if the rounded value is negative.
[[nodiscard]] std::uint64_t to_epoch_millis(std::chrono::nanoseconds since_epoch);

// Production clock: samples std::chrono::system_clock at its native resolution.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_epoch_millis() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t epoch_millis) : epoch_millis_(epoch_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_epoch_millis() override;

 private:
  std::uint64_t epoch_millis_;
};

}  // namespace cuid::core
