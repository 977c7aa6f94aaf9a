#include "generate.h"

#include "cuid/generator/cuid_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_generate(int argc, char* argv[], int start) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cuid::apps::Option<GenerateOptions>> options = {
      {"--count", true, "Number of identifiers to generate (1-1679616, default 1)",
       [](GenerateOptions& c, const std::string& v) {
         const auto count = parse_count(v);
         if (!count.has_value()) {
           std::cerr << "Invalid --count: " << v << " (expected an integer in 1..1679616)\n";
           return false;
         }
         c.count = count.value();
         return true;
       }},
      {"--json", false, "Print a JSON document instead of one ID per line",
       [](GenerateOptions& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
  };
  const auto config = cuid::apps::parse_options(argc, argv, options, start);
  if (!config.has_value()) {
    std::cerr << "Usage: cuid_cli generate [--count N] [--json]\n";
    cuid::apps::print_options(std::cerr, options);
    return 1;
  }

  cuid::generator::CuidGenerator gen;
  return execute_generate(config.value(), gen, std::cout);
}
