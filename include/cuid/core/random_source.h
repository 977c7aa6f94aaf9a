#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <vector>

namespace cuid::core {

// Pseudo-random integers for identifier material.
//
// NOT a cryptographic source. Implementations are chosen for speed and
// statistical adequacy only; identifiers built from them are guessable and
// must not be used as secrets, tokens or nonces.
class IPseudoRandomSource {
 public:
  virtual ~IPseudoRandomSource() = default;

  // Uniformly distributed integer in [0, max_inclusive].
  virtual std::uint32_t uniform(std::uint32_t max_inclusive) = 0;

 protected:
  IPseudoRandomSource() = default;
  IPseudoRandomSource(const IPseudoRandomSource&) = default;
  IPseudoRandomSource& operator=(const IPseudoRandomSource&) = default;
  IPseudoRandomSource(IPseudoRandomSource&&) = default;
  IPseudoRandomSource& operator=(IPseudoRandomSource&&) = default;
};

// Production source: one std::mt19937 seeded from std::random_device at construction.
// Thread-safe: draws are serialized by an internal mutex.
class MersennePseudoRandomSource final : public IPseudoRandomSource {
 public:
  // Seeds from std::random_device. Throws EnvironmentError when no entropy
  // source is available.
  MersennePseudoRandomSource();
  // Seeds from seed_source(); any exception it throws is rethrown as EnvironmentError.
  explicit MersennePseudoRandomSource(const std::function<std::uint32_t()>& seed_source);
  explicit MersennePseudoRandomSource(std::uint32_t seed) : engine_(seed) {}
  ~MersennePseudoRandomSource() override = default;

  // Not copyable or movable (contains mutex)
  MersennePseudoRandomSource(const MersennePseudoRandomSource&) = delete;
  MersennePseudoRandomSource& operator=(const MersennePseudoRandomSource&) = delete;
  MersennePseudoRandomSource(MersennePseudoRandomSource&&) = delete;
  MersennePseudoRandomSource& operator=(MersennePseudoRandomSource&&) = delete;

  std::uint32_t uniform(std::uint32_t max_inclusive) override;

 private:
  std::mutex mutex_;
  std::mt19937 engine_;
};

// Deterministic source: replays a fixed sequence of values, cycling when exhausted.
// For tests and demos where reproducible output is required.
class SequencePseudoRandomSource final : public IPseudoRandomSource {
 public:
  // Throws std::invalid_argument if values is empty.
  explicit SequencePseudoRandomSource(std::vector<std::uint32_t> values);
  ~SequencePseudoRandomSource() override = default;

  SequencePseudoRandomSource(const SequencePseudoRandomSource&) = delete;
  SequencePseudoRandomSource& operator=(const SequencePseudoRandomSource&) = delete;
  SequencePseudoRandomSource(SequencePseudoRandomSource&&) = delete;
  SequencePseudoRandomSource& operator=(SequencePseudoRandomSource&&) = delete;

  // Throws std::out_of_range if the next scripted value exceeds max_inclusive.
  std::uint32_t uniform(std::uint32_t max_inclusive) override;

 private:
  std::mutex mutex_;
  std::vector<std::uint32_t> values_;
  std::size_t next_{0};
};

}  // namespace cuid::core
