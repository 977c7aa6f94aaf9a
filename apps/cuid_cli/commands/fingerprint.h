#pragma once

// cmd_fingerprint: print the fingerprint segment for this process (--json for details).
int cmd_fingerprint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
