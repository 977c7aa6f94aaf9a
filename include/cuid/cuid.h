#pragma once

#include "cuid/core/ids.h"

namespace cuid {

// new_cuid returns a fresh identifier from the process-wide system environment,
// e.g. "cmgj6k3cw0000tltlx9k21q0e".
//
// Not cryptographically random: identifiers reveal their creation time and are
// guessable. Throws core::EnvironmentError if the clock, process ID, hostname or
// random source cannot be read.
[[nodiscard]] core::Cuid new_cuid();

}  // namespace cuid
