#include "fingerprint_logic.h"

#include "cuid/generator/segments.h"

#include <nlohmann/json.hpp>

#include <string>

int execute_fingerprint(bool json, cuid::core::IProcessIdProvider& process_ids,
                        cuid::core::IHostNameProvider& host_names, std::ostream& out) {
  if (!json) {
    out << cuid::generator::encode_fingerprint(process_ids, host_names) << "\n";
    return 0;
  }

  // Query each input once so the reported values match the fingerprint.
  const auto pid = process_ids.current_process_id();
  const auto host = host_names.host_name();
  cuid::core::FixedProcessIdProvider fixed_pid(pid);
  cuid::core::FixedHostNameProvider fixed_host(host);

  nlohmann::json doc;
  doc["pid"] = pid;
  doc["hostname"] = host;
  doc["host_sum"] = cuid::generator::host_sum(host);
  doc["fingerprint"] = cuid::generator::encode_fingerprint(fixed_pid, fixed_host);
  out << doc.dump(2) << "\n";
  return 0;
}
