#include "cuid/core/process_id.h"

#include "cuid/core/errors.h"

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace cuid::core {

#if defined(_WIN32)

std::uint64_t SystemProcessIdProvider::current_process_id() {
  const DWORD pid = ::GetCurrentProcessId();
  if (pid == 0) {
    throw EnvironmentError("GetCurrentProcessId",
                           "returned 0 (error " + std::to_string(::GetLastError()) + ")");
  }
  return static_cast<std::uint64_t>(pid);
}

#else

std::uint64_t SystemProcessIdProvider::current_process_id() {
  // getpid() always succeeds on POSIX systems.
  return static_cast<std::uint64_t>(::getpid());
}

#endif

}  // namespace cuid::core
