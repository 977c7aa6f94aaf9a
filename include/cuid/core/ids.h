#pragma once

#include "cuid/core/id_generator.h"

#include <string>

namespace cuid::core {

// Strong ID type following C++ Core Guidelines C.11 (Make concrete types regular).
// A vocabulary type so that collision-resistant IDs are not confused with other strings.
struct Cuid {
  std::string value;
  auto operator<=>(const Cuid&) const = default;  // C++20: generates ==, !=, <, <=, >, >=
};

inline Cuid new_cuid(IIdGenerator& gen) { return Cuid{gen.next()}; }

}  // namespace cuid::core
