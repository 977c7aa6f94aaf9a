#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cuid::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Handlers
// report their own diagnostics to stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Every flag is processed so all problems are reported in one pass; the result
// is nullopt if any handler failed, a value was missing, or a token was not a
// recognised flag.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          ok = opt->handler(config,
                            argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
               ok;
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          ok = false;
        }
      } else {
        ok = opt->handler(config, "") && ok;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      ok = false;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      ok = false;
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// print_options writes one "  <flag> <description>" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace cuid::apps
