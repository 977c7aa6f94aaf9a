#include "cuid/core/base36.h"
#include "cuid/core/errors.h"
#include "cuid/core/ids.h"
#include "cuid/cuid.h"
#include "cuid/generator/cuid_generator.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <mutex>
#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace cuid;

namespace {

const std::regex kCuidPattern("^c[0-9a-z]+$");

class FailingClock final : public core::IClock {
 public:
  std::uint64_t now_epoch_millis() override {
    throw core::EnvironmentError("system_clock::now", "injected");
  }
};

class FailingProcessIdProvider final : public core::IProcessIdProvider {
 public:
  std::uint64_t current_process_id() override {
    throw core::EnvironmentError("getpid", "injected");
  }
};

class FailingHostNameProvider final : public core::IHostNameProvider {
 public:
  std::string host_name() override { throw core::EnvironmentError("gethostname", "injected"); }
};

class FailingRandomSource final : public core::IPseudoRandomSource {
 public:
  std::uint32_t uniform(std::uint32_t /*max_inclusive*/) override {
    throw core::EnvironmentError("random_device", "injected");
  }
};

}  // namespace

TEST_CASE("CuidGenerator concatenates segments in order", "[generator]") {
  core::FixedClock clock(1'700'000'000'000ULL);
  generator::CounterStore counter;
  core::FixedProcessIdProvider pid(4242);
  core::FixedHostNameProvider host("build-host");
  core::SequencePseudoRandomSource random({0, core::kMaxCount - 1});
  generator::Environment env{clock, counter, pid, host, random};

  generator::CuidGenerator gen(env);

  // c | loyw3v28 | 0000 | 9u tl | 0000 | zzzz
  CHECK(gen.next() == "cloyw3v2800009utl0000zzzz");
  CHECK(gen.next() == "cloyw3v2800019utl0000zzzz");
  CHECK(counter.peek() == 2U);
}

TEST_CASE("CuidGenerator draws the two random blocks independently", "[generator]") {
  core::FixedClock clock(0);
  generator::CounterStore counter;
  core::FixedProcessIdProvider pid(37);
  core::FixedHostNameProvider host("");
  core::SequencePseudoRandomSource random({1, 2, 3, 4});
  generator::Environment env{clock, counter, pid, host, random};

  generator::CuidGenerator gen(env);
  CHECK(gen.next() == "c0000011100001" "0002");
  CHECK(gen.next() == "c0000111100003" "0004");
}

TEST_CASE("CuidGenerator: length is 17 plus timestamp width", "[generator]") {
  core::FixedClock clock(1'760'000'000'000ULL);
  generator::CounterStore counter(core::kMaxCount - 1);
  core::FixedProcessIdProvider pid(1);
  core::FixedHostNameProvider host("localhost");
  core::MersennePseudoRandomSource random;
  generator::Environment env{clock, counter, pid, host, random};

  generator::CuidGenerator gen(env);
  const auto id = gen.next();
  CHECK(id.size() == 17 + 8);
  CHECK(id.substr(0, 9) == "cmgj6k3cw");
  CHECK(id.substr(9, 4) == "zzzz");
  CHECK(id.substr(13, 4) == "01s6");

  // Counter wrapped for the next identifier.
  CHECK(gen.next().substr(9, 4) == "0000");
}

TEST_CASE("CuidGenerator propagates environment failures", "[generator]") {
  core::FixedClock clock(0);
  generator::CounterStore counter;
  core::FixedProcessIdProvider pid(1);
  core::FixedHostNameProvider host("localhost");
  core::SequencePseudoRandomSource random({0});

  SECTION("clock") {
    FailingClock failing;
    generator::Environment env{failing, counter, pid, host, random};
    generator::CuidGenerator gen(env);
    CHECK_THROWS_AS(gen.next(), core::EnvironmentError);
  }

  SECTION("process ID") {
    FailingProcessIdProvider failing;
    generator::Environment env{clock, counter, failing, host, random};
    generator::CuidGenerator gen(env);
    CHECK_THROWS_AS(gen.next(), core::EnvironmentError);
  }

  SECTION("hostname") {
    FailingHostNameProvider failing;
    generator::Environment env{clock, counter, pid, failing, random};
    generator::CuidGenerator gen(env);
    CHECK_THROWS_AS(gen.next(), core::EnvironmentError);
  }

  SECTION("random source") {
    FailingRandomSource failing;
    generator::Environment env{clock, counter, pid, host, failing};
    generator::CuidGenerator gen(env);
    CHECK_THROWS_AS(gen.next(), core::EnvironmentError);
  }
}

TEST_CASE("new_cuid: system identifiers have the documented shape", "[generator]") {
  for (int i = 0; i < 100; ++i) {
    const auto id = new_cuid();
    REQUIRE(std::regex_match(id.value, kCuidPattern));
    REQUIRE(id.value.size() >= 17);
    REQUIRE(id.value.front() == 'c');
  }
}

TEST_CASE("new_cuid: timestamp segment accounts for the remaining length", "[generator]") {
  const auto id = new_cuid().value;
  const auto time_width = id.size() - 17;
  const auto millis = core::decode_base36(id.substr(1, time_width));
  REQUIRE(millis.has_value());
  // After 2020-01-01: eight base-36 digits until the year 2059.
  CHECK(millis.value() > 1'577'836'800'000ULL);
  CHECK(time_width == 8);
}

TEST_CASE("new_cuid: consecutive identifiers differ", "[generator]") {
  const auto a = new_cuid();
  const auto b = new_cuid();
  CHECK(a != b);
}

TEST_CASE("new_cuid: fingerprint is stable within the process", "[generator]") {
  const auto a = new_cuid().value;
  const auto b = new_cuid().value;
  const auto fingerprint = [](const std::string& id) { return id.substr(id.size() - 12, 4); };
  CHECK(fingerprint(a) == fingerprint(b));
}

TEST_CASE("CuidGenerator: concurrent callers get unique identifiers",
          "[generator][concurrency]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 5'000;

  std::mutex mutex;
  std::set<std::string> ids;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      generator::CuidGenerator gen;
      std::vector<std::string> local;
      local.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(gen.next());
      }
      std::lock_guard<std::mutex> lock(mutex);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto& w : workers) {
    w.join();
  }

  CHECK(ids.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("Cuid strong type compares by value", "[generator][ids]") {
  const core::Cuid a{"ca"};
  const core::Cuid b{"cb"};
  CHECK(a < b);
  CHECK(a == core::Cuid{"ca"});

  core::FixedClock clock(0);
  generator::CounterStore counter;
  core::FixedProcessIdProvider pid(0);
  core::FixedHostNameProvider host("");
  core::SequencePseudoRandomSource random({0});
  generator::Environment env{clock, counter, pid, host, random};
  generator::CuidGenerator gen(env);
  CHECK(core::new_cuid(gen).value == "c00000001000000000");
}
