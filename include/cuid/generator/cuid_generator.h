#pragma once

#include "cuid/core/id_generator.h"
#include "cuid/core/ids.h"
#include "cuid/generator/environment.h"

#include <string>

namespace cuid::generator {

constexpr char kCuidPrefix = 'c';

// CuidGenerator assembles "c" + time + counter + fingerprint + random + random.
//
// The leading letter keeps identifiers valid as HTML/XML element IDs.
// Thread-safe as long as the bound Environment is (system_environment() is).
// Any environment failure propagates; a partial identifier is never returned.
class CuidGenerator final : public core::IIdGenerator {
 public:
  // Binds to system_environment().
  CuidGenerator();
  explicit CuidGenerator(Environment& environment) : environment_(environment) {}
  ~CuidGenerator() override = default;

  CuidGenerator(const CuidGenerator&) = default;
  CuidGenerator& operator=(const CuidGenerator&) = delete;
  CuidGenerator(CuidGenerator&&) = default;
  CuidGenerator& operator=(CuidGenerator&&) = delete;

  std::string next() override;
  core::Cuid next_cuid() { return core::Cuid{next()}; }

 private:
  Environment& environment_;
};

}  // namespace cuid::generator
