#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"

#include <catch2/catch.hpp>

#include "commands/fingerprint_logic.h"
#include <nlohmann/json.hpp>

#include <sstream>

using namespace cuid;

TEST_CASE("execute_fingerprint: plain output is the segment", "[cli][fingerprint]") {
  core::FixedProcessIdProvider pid(4242);
  core::FixedHostNameProvider host("build-host");
  std::ostringstream out;
  REQUIRE(execute_fingerprint(false, pid, host, out) == 0);
  CHECK(out.str() == "9utl\n");
}

TEST_CASE("execute_fingerprint: JSON output shows its inputs", "[cli][fingerprint]") {
  core::FixedProcessIdProvider pid(4242);
  core::FixedHostNameProvider host("build-host");
  std::ostringstream out;
  REQUIRE(execute_fingerprint(true, pid, host, out) == 0);

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["pid"] == 4242);
  CHECK(doc["hostname"] == "build-host");
  CHECK(doc["host_sum"] == 1065);
  CHECK(doc["fingerprint"] == "9utl");
}
