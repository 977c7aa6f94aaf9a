#include "cuid/generator/counter_store.h"

#include <stdexcept>
#include <string>

namespace cuid::generator {

CounterStore::CounterStore(const std::uint32_t initial) : value_(initial) {
  if (initial >= core::kMaxCount) {
    throw std::invalid_argument("CounterStore initial value " + std::to_string(initial) +
                                " is outside [0, " + std::to_string(core::kMaxCount - 1) + "]");
  }
}

std::uint32_t CounterStore::read_and_increment() {
  std::uint32_t current = value_.load(std::memory_order_relaxed);
  // compare_exchange_weak reloads current on failure.
  while (!value_.compare_exchange_weak(current, (current + 1) % core::kMaxCount,
                                        std::memory_order_acq_rel, std::memory_order_relaxed)) {
  }
  return current;
}

std::uint32_t CounterStore::peek() const {
  return value_.load(std::memory_order_acquire);
}

CounterStore& CounterStore::process_wide() {
  static CounterStore counter;
  return counter;
}

}  // namespace cuid::generator
