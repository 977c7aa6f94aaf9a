#include "generate_logic.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <system_error>
#include <string>

std::optional<std::size_t> parse_count(const std::string& value) {
  std::size_t count = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, count);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  if (count == 0 || count > kMaxBatchCount) {
    return std::nullopt;
  }
  return count;
}

int execute_generate(const GenerateOptions& options, cuid::core::IIdGenerator& gen,
                     std::ostream& out) {
  if (!options.json) {
    for (std::size_t i = 0; i < options.count; ++i) {
      out << gen.next() << "\n";
    }
    return 0;
  }

  nlohmann::json doc;
  doc["count"] = options.count;
  doc["ids"] = nlohmann::json::array();
  for (std::size_t i = 0; i < options.count; ++i) {
    doc["ids"].push_back(gen.next());
  }
  out << doc.dump(2) << "\n";
  return 0;
}
