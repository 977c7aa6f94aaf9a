#pragma once

#include <string>

namespace cuid::core {

// Abstract ID generator interface for dependency injection.
// Allows callers to hold any identifier source (system-backed or fully scripted).
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate the next identifier.
  // Contract: returned ID is non-empty and starts with a letter.
  virtual std::string next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

}  // namespace cuid::core
