#pragma once

#include "cuid/core/base36.h"
#include "cuid/core/id_generator.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

// GenerateOptions controls how many identifiers are produced and how they are printed.
struct GenerateOptions {
  std::size_t count{1};  // NOLINT(readability-identifier-naming)
  bool json{false};      // NOLINT(readability-identifier-naming)
};

// Upper bound for --count; one process can only emit kMaxCount distinct counter values
// before wrapping, so larger batches stop adding collision resistance.
constexpr std::size_t kMaxBatchCount = cuid::core::kMaxCount;

// parse_count accepts a decimal integer in [1, kMaxBatchCount].
[[nodiscard]] std::optional<std::size_t> parse_count(const std::string& value);

// execute_generate writes options.count identifiers from gen to out:
// one per line, or {"count": N, "ids": [...]} when options.json is set.
// Takes only the interface type so tests can inject a scripted environment.
int execute_generate(const GenerateOptions& options, cuid::core::IIdGenerator& gen,
                     std::ostream& out);
