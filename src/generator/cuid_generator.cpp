#include "cuid/generator/cuid_generator.h"

#include "cuid/generator/segments.h"

namespace cuid::generator {

CuidGenerator::CuidGenerator() : environment_(system_environment()) {}

std::string CuidGenerator::next() {
  std::string id(1, kCuidPrefix);
  id += encode_timestamp(environment_.clock);
  id += encode_counter(environment_.counter);
  id += encode_fingerprint(environment_.process_ids, environment_.host_names);
  // Two independent draws.
  id += encode_random_block(environment_.random);
  id += encode_random_block(environment_.random);
  return id;
}

}  // namespace cuid::generator
