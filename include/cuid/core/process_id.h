#pragma once

#include <cstdint>

namespace cuid::core {

// Capability interface for the calling process's numeric identifier.
// The fingerprint depends only on this interface; the platform call lives in
// SystemProcessIdProvider.
class IProcessIdProvider {
 public:
  virtual ~IProcessIdProvider() = default;

  // Throws EnvironmentError if the operating system cannot report the ID.
  virtual std::uint64_t current_process_id() = 0;

 protected:
  IProcessIdProvider() = default;
  IProcessIdProvider(const IProcessIdProvider&) = default;
  IProcessIdProvider& operator=(const IProcessIdProvider&) = default;
  IProcessIdProvider(IProcessIdProvider&&) = default;
  IProcessIdProvider& operator=(IProcessIdProvider&&) = default;
};

// Windows: GetCurrentProcessId (a zero result is treated as failure).
// POSIX: getpid.
class SystemProcessIdProvider final : public IProcessIdProvider {
 public:
  SystemProcessIdProvider() = default;
  ~SystemProcessIdProvider() override = default;

  SystemProcessIdProvider(const SystemProcessIdProvider&) = default;
  SystemProcessIdProvider& operator=(const SystemProcessIdProvider&) = default;
  SystemProcessIdProvider(SystemProcessIdProvider&&) = default;
  SystemProcessIdProvider& operator=(SystemProcessIdProvider&&) = default;

  std::uint64_t current_process_id() override;
};

// Fixed process ID for deterministic tests/demos.
class FixedProcessIdProvider final : public IProcessIdProvider {
 public:
  explicit FixedProcessIdProvider(std::uint64_t pid) : pid_(pid) {}
  ~FixedProcessIdProvider() override = default;

  FixedProcessIdProvider(const FixedProcessIdProvider&) = default;
  FixedProcessIdProvider& operator=(const FixedProcessIdProvider&) = default;
  FixedProcessIdProvider(FixedProcessIdProvider&&) = default;
  FixedProcessIdProvider& operator=(FixedProcessIdProvider&&) = default;

  std::uint64_t current_process_id() override { return pid_; }

 private:
  std::uint64_t pid_;
};

}  // namespace cuid::core
