#pragma once

// cmd_generate: print one or more new identifiers (--count N, --json).
// start is the index of the first option token in argv.
int cmd_generate(int argc, char* argv[], int start);  // NOLINT(modernize-avoid-c-arrays)
