#include "cuid/core/version.h"

#include "commands/fingerprint.h"
#include "commands/generate.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "cuid_cli v" << cuid::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  cuid_cli [generate] [--count N] [--json]   Print new identifiers\n"
            << "  cuid_cli fingerprint [--json]              Print this process's fingerprint\n"
            << "  cuid_cli --version                         Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    // Without a subcommand, options apply to generate.
    if (argc < 2) {
      return cmd_generate(argc, argv, 1);
    }

    const std::string subcommand = argv[1];
    if (subcommand == "generate") {
      return cmd_generate(argc, argv, 2);
    }
    if (subcommand == "fingerprint") {
      return cmd_fingerprint(argc, argv);
    }
    if (subcommand == "--version") {
      std::cout << cuid::core::kBuildVersion << "\n";
      return 0;
    }
    if (subcommand == "--help" || subcommand == "help") {
      print_usage();
      return 0;
    }
    if (!subcommand.empty() && subcommand[0] == '-') {
      return cmd_generate(argc, argv, 1);
    }

    std::cerr << "Unknown subcommand: " << subcommand << "\n";
    print_usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
