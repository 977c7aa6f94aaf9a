#include "cuid/core/base36.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace cuid::core {

namespace {

constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

int digit_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 10;
  }
  return -1;
}

}  // namespace

std::string encode_base36(std::uint64_t value) {
  if (value == 0) {
    return "0";
  }

  std::string out;
  while (value > 0) {
    out.push_back(kDigits[value % kFormatBase]);
    value /= kFormatBase;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

Result<std::uint64_t, ParseError> decode_base36(const std::string_view digits) {
  using R = Result<std::uint64_t, ParseError>;
  if (digits.empty()) {
    return R::err(ParseError::kInvalidFormat);
  }

  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (const char ch : digits) {
    const int d = digit_value(ch);
    if (d < 0) {
      return R::err(ParseError::kInvalidFormat);
    }
    const auto digit = static_cast<std::uint64_t>(d);
    if (value > (kMax - digit) / kFormatBase) {
      return R::err(ParseError::kOverflow);
    }
    value = value * kFormatBase + digit;
  }
  return R::ok(value);
}

std::string left_pad(std::string digits, const std::size_t width) {
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return digits;
}

std::string fit_right(std::string digits, const std::size_t width) {
  if (digits.size() > width) {
    return digits.substr(digits.size() - width);
  }
  return left_pad(std::move(digits), width);
}

std::string encode_block(const std::uint64_t value) {
  return left_pad(encode_base36(value), kBlockSize);
}

std::string encode_two_of(const std::uint64_t value) {
  return fit_right(encode_base36(value), kFingerprintPartWidth);
}

}  // namespace cuid::core
