#pragma once

#include "cuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuid::core {

// Number formatting constants shared by every identifier segment.
constexpr std::uint64_t kFormatBase = 36;
constexpr std::size_t kBlockSize = 4;
// 36^4: one past the largest value a padded block can hold.
constexpr std::uint32_t kMaxCount = 36 * 36 * 36 * 36;
constexpr std::size_t kFingerprintPartWidth = 2;

// encode_base36 renders value with digits 0-9 then a-z, no padding.
// 0 encodes as "0".
[[nodiscard]] std::string encode_base36(std::uint64_t value);

// decode_base36 is the inverse of encode_base36. Accepts lowercase digits only.
// Errors: kInvalidFormat for empty input or a character outside [0-9a-z],
//         kOverflow if the value exceeds 64 bits.
[[nodiscard]] Result<std::uint64_t, ParseError> decode_base36(std::string_view digits);

// left_pad prepends '0' until the string is at least width long. Never truncates.
[[nodiscard]] std::string left_pad(std::string digits, std::size_t width);

// fit_right yields exactly width characters: the rightmost width characters when
// longer, otherwise left-padded with '0'.
[[nodiscard]] std::string fit_right(std::string digits, std::size_t width);

// Convenience compositions used by the segment encoders.
[[nodiscard]] std::string encode_block(std::uint64_t value);       // left_pad(base36, 4)
[[nodiscard]] std::string encode_two_of(std::uint64_t value);      // fit_right(base36, 2)

}  // namespace cuid::core
