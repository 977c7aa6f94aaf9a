#include "fingerprint.h"

#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"

#include "fingerprint_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct FingerprintCliConfig {
  bool json{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_fingerprint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cuid::apps::Option<FingerprintCliConfig>> options = {
      {"--json", false, "Print pid, hostname and host_sum alongside the fingerprint",
       [](FingerprintCliConfig& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
  };
  const auto config = cuid::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    std::cerr << "Usage: cuid_cli fingerprint [--json]\n";
    return 1;
  }

  cuid::core::SystemProcessIdProvider process_ids;
  cuid::core::SystemHostNameProvider host_names;
  return execute_fingerprint(config->json, process_ids, host_names, std::cout);
}
