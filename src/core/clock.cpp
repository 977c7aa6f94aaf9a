#include "cuid/core/clock.h"

#include "cuid/core/errors.h"

#include <string>

namespace cuid::core {

std::int64_t round_to_millis(const std::chrono::nanoseconds since_epoch) {
  // Integer arithmetic keeps the half-millisecond boundary exact.
  constexpr std::int64_t kNanosPerMilli = 1'000'000;
  constexpr std::int64_t kHalf = kNanosPerMilli / 2;
  const std::int64_t ns = since_epoch.count();
  if (ns >= 0) {
    return (ns + kHalf) / kNanosPerMilli;
  }
  return -((-ns + kHalf) / kNanosPerMilli);
}

std::uint64_t to_epoch_millis(const std::chrono::nanoseconds since_epoch) {
  const auto millis = round_to_millis(since_epoch);
  if (millis < 0) {
    throw EnvironmentError("system_clock::now",
                           "clock reads " + std::to_string(millis) + " ms before the epoch");
  }
  return static_cast<std::uint64_t>(millis);
}

std::uint64_t SystemClock::now_epoch_millis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return to_epoch_millis(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch));
}

std::uint64_t FixedClock::now_epoch_millis() {
  return epoch_millis_;
}

}  // namespace cuid::core
