#include "cuid/core/random_source.h"

#include "cuid/core/errors.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace cuid::core {

namespace {

std::uint32_t draw_seed(const std::function<std::uint32_t()>& seed_source) {
  try {
    return seed_source();
  } catch (const std::exception& e) {
    throw EnvironmentError("random_device", e.what());
  }
}

}  // namespace

MersennePseudoRandomSource::MersennePseudoRandomSource()
    : MersennePseudoRandomSource(
          [] { return static_cast<std::uint32_t>(std::random_device{}()); }) {}

MersennePseudoRandomSource::MersennePseudoRandomSource(
    const std::function<std::uint32_t()>& seed_source)
    : engine_(draw_seed(seed_source)) {}

std::uint32_t MersennePseudoRandomSource::uniform(const std::uint32_t max_inclusive) {
  std::uniform_int_distribution<std::uint32_t> dist(0, max_inclusive);
  std::lock_guard<std::mutex> lock(mutex_);
  return dist(engine_);
}

SequencePseudoRandomSource::SequencePseudoRandomSource(std::vector<std::uint32_t> values)
    : values_(std::move(values)) {
  if (values_.empty()) {
    throw std::invalid_argument("SequencePseudoRandomSource requires at least one value");
  }
}

std::uint32_t SequencePseudoRandomSource::uniform(const std::uint32_t max_inclusive) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto value = values_[next_];
  // A rejected draw leaves the script position unchanged.
  if (value > max_inclusive) {
    throw std::out_of_range("scripted value " + std::to_string(value) + " exceeds maximum " +
                            std::to_string(max_inclusive));
  }
  next_ = (next_ + 1) % values_.size();
  return value;
}

}  // namespace cuid::core
