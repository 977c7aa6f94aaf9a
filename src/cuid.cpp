#include "cuid/cuid.h"

#include "cuid/generator/cuid_generator.h"

namespace cuid {

core::Cuid new_cuid() {
  generator::CuidGenerator gen;
  return gen.next_cuid();
}

}  // namespace cuid
