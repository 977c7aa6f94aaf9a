#pragma once

#include "cuid/core/host_name.h"
#include "cuid/core/process_id.h"

#include <ostream>

// execute_fingerprint prints the 4-character fingerprint segment for the given
// process/host. With json set, also prints the inputs it was derived from.
int execute_fingerprint(bool json, cuid::core::IProcessIdProvider& process_ids,
                        cuid::core::IHostNameProvider& host_names, std::ostream& out);
