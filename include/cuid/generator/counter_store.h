#pragma once

#include "cuid/core/base36.h"

#include <atomic>
#include <cstdint>

namespace cuid::generator {

// CounterStore is a wrapping counter in [0, kMaxCount).
// Thread-safe. read_and_increment() is a single compare-exchange loop on one
// atomic word, so concurrent callers never lose an update or observe a torn value.
class CounterStore {
 public:
  // Throws std::invalid_argument if initial >= kMaxCount.
  explicit CounterStore(std::uint32_t initial = 0);
  ~CounterStore() = default;

  // Not copyable or movable (contains atomic counter)
  CounterStore(const CounterStore&) = delete;
  CounterStore& operator=(const CounterStore&) = delete;
  CounterStore(CounterStore&&) = delete;
  CounterStore& operator=(CounterStore&&) = delete;

  // Returns the current value and stores (value + 1) mod kMaxCount.
  std::uint32_t read_and_increment();

  // Current value without mutating it. Diagnostics and tests only.
  [[nodiscard]] std::uint32_t peek() const;

  // The single counter shared by every generator in this process.
  // Initialized to 0 on first use; initialization is thread-safe.
  static CounterStore& process_wide();

 private:
  std::atomic<std::uint32_t> value_;
};

}  // namespace cuid::generator
