#include "cuid/core/host_name.h"

#include "cuid/core/errors.h"

#include <cerrno>
#include <cstring>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#else
#include <climits>
#include <unistd.h>
#endif

namespace cuid::core {

#if defined(_WIN32)

std::string SystemHostNameProvider::host_name() {
  DWORD size = 0;
  // First call reports the required buffer size (including the terminator).
  ::GetComputerNameExA(ComputerNameDnsHostname, nullptr, &size);
  if (size == 0) {
    throw EnvironmentError("GetComputerNameExA",
                           "error " + std::to_string(::GetLastError()));
  }

  std::vector<char> buffer(size);
  if (::GetComputerNameExA(ComputerNameDnsHostname, buffer.data(), &size) == 0) {
    throw EnvironmentError("GetComputerNameExA",
                           "error " + std::to_string(::GetLastError()));
  }
  return std::string(buffer.data(), size);
}

#else

std::string SystemHostNameProvider::host_name() {
#if defined(HOST_NAME_MAX)
  constexpr std::size_t kMaxHostName = HOST_NAME_MAX;
#else
  constexpr std::size_t kMaxHostName = 255;
#endif
  // One extra byte guarantees termination even when the name is truncated.
  std::vector<char> buffer(kMaxHostName + 1, '\0');
  if (::gethostname(buffer.data(), kMaxHostName) != 0) {
    throw EnvironmentError("gethostname", std::strerror(errno));
  }
  return std::string(buffer.data());
}

#endif

}  // namespace cuid::core
