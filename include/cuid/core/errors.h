#pragma once

#include <stdexcept>
#include <string>

namespace cuid::core {

// EnvironmentError reports a failed query against the host environment
// (clock, process ID, hostname, random source). These are not recoverable
// by the library and propagate to the caller unchanged.
class EnvironmentError : public std::runtime_error {
 public:
  EnvironmentError(const std::string& query, const std::string& detail)
      : std::runtime_error(query + " failed: " + detail), query_(query) {}

  [[nodiscard]] const std::string& query() const noexcept { return query_; }

 private:
  std::string query_;
};

}  // namespace cuid::core
