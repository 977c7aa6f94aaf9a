#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"
#include "cuid/generator/environment.h"
#include "cuid/generator/segments.h"

#include <catch2/catch.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include <cstdint>
#include <string>
#include <vector>

using namespace cuid;

TEST_CASE("SystemProcessIdProvider reports the calling process", "[environment]") {
  core::SystemProcessIdProvider provider;
  const auto pid = provider.current_process_id();
  CHECK(pid > 0U);
  CHECK(provider.current_process_id() == pid);
#if !defined(_WIN32)
  CHECK(pid == static_cast<std::uint64_t>(::getpid()));
#endif
}

TEST_CASE("SystemHostNameProvider reports the local hostname", "[environment]") {
  core::SystemHostNameProvider provider;
  const auto name = provider.host_name();
  CHECK(provider.host_name() == name);
#if !defined(_WIN32)
  std::vector<char> buffer(256, '\0');
  REQUIRE(::gethostname(buffer.data(), buffer.size() - 1) == 0);
  CHECK(name == std::string(buffer.data()));
#endif
}

TEST_CASE("system fingerprint is four stable base-36 characters", "[environment][fingerprint]") {
  auto& env = generator::system_environment();
  const auto first = generator::encode_fingerprint(env.process_ids, env.host_names);
  const auto second = generator::encode_fingerprint(env.process_ids, env.host_names);

  REQUIRE(first.size() == 4);
  for (const char ch : first) {
    CHECK(((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z')));
  }
  CHECK(first == second);
}

TEST_CASE("system_environment is built once", "[environment]") {
  auto& a = generator::system_environment();
  auto& b = generator::system_environment();
  CHECK(&a == &b);
  CHECK(&a.counter == &generator::CounterStore::process_wide());
}
