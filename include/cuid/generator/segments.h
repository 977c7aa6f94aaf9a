#pragma once

#include "cuid/core/clock.h"
#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"
#include "cuid/core/random_source.h"
#include "cuid/generator/counter_store.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace cuid::generator {

// Segment encoders. Each produces one independent slice of an identifier;
// none reads another's output. All environment failures propagate as
// core::EnvironmentError.

constexpr std::uint64_t kHostSumOffset = 36;

// Milliseconds since the epoch, base-36, unpadded. Width grows with calendar time.
[[nodiscard]] std::string encode_timestamp(core::IClock& clock);

// Post-increment of the counter, base-36, left-padded to 4.
[[nodiscard]] std::string encode_counter(CounterStore& counter);

// 36 + character count + sum of character codes, with the name decoded as UTF-8.
// Bytes that are not part of a valid UTF-8 sequence count as one character each.
// A collision-reducing sum, not a hash.
[[nodiscard]] std::uint64_t host_sum(std::string_view host_name);

// fit_right(base36(pid), 2) followed by fit_right(base36(host_sum), 2).
[[nodiscard]] std::string encode_fingerprint(core::IProcessIdProvider& process_ids,
                                             core::IHostNameProvider& host_names);

// Uniform draw in [0, kMaxCount - 1], base-36, left-padded to 4. Not cryptographic.
[[nodiscard]] std::string encode_random_block(core::IPseudoRandomSource& random);

}  // namespace cuid::generator
