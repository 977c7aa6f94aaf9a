#pragma once

#include <string>

namespace cuid::core {

// Capability interface for the local hostname.
class IHostNameProvider {
 public:
  virtual ~IHostNameProvider() = default;

  // Throws EnvironmentError if the hostname cannot be read.
  virtual std::string host_name() = 0;

 protected:
  IHostNameProvider() = default;
  IHostNameProvider(const IHostNameProvider&) = default;
  IHostNameProvider& operator=(const IHostNameProvider&) = default;
  IHostNameProvider(IHostNameProvider&&) = default;
  IHostNameProvider& operator=(IHostNameProvider&&) = default;
};

// POSIX: gethostname. Windows: GetComputerNameExA(ComputerNameDnsHostname).
// Queried on every call; nothing is cached.
class SystemHostNameProvider final : public IHostNameProvider {
 public:
  SystemHostNameProvider() = default;
  ~SystemHostNameProvider() override = default;

  SystemHostNameProvider(const SystemHostNameProvider&) = default;
  SystemHostNameProvider& operator=(const SystemHostNameProvider&) = default;
  SystemHostNameProvider(SystemHostNameProvider&&) = default;
  SystemHostNameProvider& operator=(SystemHostNameProvider&&) = default;

  std::string host_name() override;
};

// Fixed hostname for deterministic tests/demos.
class FixedHostNameProvider final : public IHostNameProvider {
 public:
  explicit FixedHostNameProvider(std::string host_name) : host_name_(std::move(host_name)) {}
  ~FixedHostNameProvider() override = default;

  FixedHostNameProvider(const FixedHostNameProvider&) = default;
  FixedHostNameProvider& operator=(const FixedHostNameProvider&) = default;
  FixedHostNameProvider(FixedHostNameProvider&&) = default;
  FixedHostNameProvider& operator=(FixedHostNameProvider&&) = default;

  std::string host_name() override { return host_name_; }

 private:
  std::string host_name_;
};

}  // namespace cuid::core
