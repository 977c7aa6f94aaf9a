#pragma once

#include "cuid/core/clock.h"
#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"
#include "cuid/core/random_source.h"
#include "cuid/generator/counter_store.h"

namespace cuid::generator {

// Environment is a composition root that bundles every collaborator a generator reads.
// It holds references (not ownership); whoever builds it manages the lifetimes.
struct Environment {
  core::IClock& clock;                      // NOLINT(readability-identifier-naming)
  CounterStore& counter;                    // NOLINT(readability-identifier-naming)
  core::IProcessIdProvider& process_ids;    // NOLINT(readability-identifier-naming)
  core::IHostNameProvider& host_names;      // NOLINT(readability-identifier-naming)
  core::IPseudoRandomSource& random;        // NOLINT(readability-identifier-naming)

  Environment(core::IClock& clock, CounterStore& counter, core::IProcessIdProvider& process_ids,
              core::IHostNameProvider& host_names, core::IPseudoRandomSource& random)
      : clock(clock),
        counter(counter),
        process_ids(process_ids),
        host_names(host_names),
        random(random) {}

  ~Environment() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;
  Environment(Environment&&) = delete;
  Environment& operator=(Environment&&) = delete;
};

// Process-wide environment backed by the system clock, OS process-ID and
// hostname queries, a shared MersennePseudoRandomSource and
// CounterStore::process_wide(). Built once on first use; thread-safe.
Environment& system_environment();

}  // namespace cuid::generator
