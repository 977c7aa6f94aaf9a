#include "cuid/generator/environment.h"

namespace cuid::generator {

Environment& system_environment() {
  static core::SystemClock clock;
  static core::SystemProcessIdProvider process_ids;
  static core::SystemHostNameProvider host_names;
  static core::MersennePseudoRandomSource random;
  static Environment environment{clock, CounterStore::process_wide(), process_ids, host_names,
                                 random};
  return environment;
}

}  // namespace cuid::generator
