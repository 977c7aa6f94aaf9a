#include "cuid/generator/segments.h"

#include "cuid/core/base36.h"

#include <cstddef>

namespace cuid::generator {

std::string encode_timestamp(core::IClock& clock) {
  return core::encode_base36(clock.now_epoch_millis());
}

std::string encode_counter(CounterStore& counter) {
  return core::encode_block(counter.read_and_increment());
}

namespace {

// Decodes one UTF-8 sequence starting at pos and advances pos past it.
// A malformed or truncated sequence yields its lead byte as a single character.
std::uint32_t next_code_point(const std::string_view text, std::size_t& pos) {
  // Explicit cast to unsigned char to avoid sign-extension (ES.46: avoid narrowing conversions).
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t extra = 0;
  std::uint32_t cp = lead;
  std::uint32_t min = 0;
  if (lead >= 0xC2 && lead <= 0xDF) {
    extra = 1;
    cp = lead & 0x1FU;
    min = 0x80;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    extra = 2;
    cp = lead & 0x0FU;
    min = 0x800;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    extra = 3;
    cp = lead & 0x07U;
    min = 0x10000;
  }

  if (extra == 0 || pos + extra >= text.size()) {
    ++pos;
    return lead;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0U) != 0x80U) {
      ++pos;
      return lead;
    }
    cp = (cp << 6U) | (cont & 0x3FU);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    ++pos;
    return lead;
  }
  pos += extra + 1;
  return cp;
}

}  // namespace

std::uint64_t host_sum(const std::string_view host_name) {
  std::uint64_t length = 0;
  std::uint64_t codes = 0;
  std::size_t pos = 0;
  while (pos < host_name.size()) {
    codes += next_code_point(host_name, pos);
    ++length;
  }
  return kHostSumOffset + length + codes;
}

std::string encode_fingerprint(core::IProcessIdProvider& process_ids,
                               core::IHostNameProvider& host_names) {
  const auto pid = process_ids.current_process_id();
  const auto name = host_names.host_name();
  return core::encode_two_of(pid) + core::encode_two_of(host_sum(name));
}

std::string encode_random_block(core::IPseudoRandomSource& random) {
  return core::encode_block(random.uniform(core::kMaxCount - 1));
}

}  // namespace cuid::generator
