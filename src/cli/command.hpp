#pragma once
#include "gitusr/git_config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitusr::cli {

// Handler receives argv with argv[0] set to the command word.
using command_fn = int (*)(int argc, char **argv);

struct Args {
  std::vector<std::string> positional; // everything after argv[0] that is not a flag
  std::vector<std::string> unknown;    // unrecognised "--..." options
  bool global = false;                 // --global
};

Args parse_args(int argc, char **argv);

// Print "<cmd>: unknown option ..." for each stray flag; false if any.
bool check_flags(std::string_view cmd, const Args &args);

inline Scope scope_of(const Args &args) { return args.global ? Scope::Global : Scope::Local; }

// Scope to read the current identity from: global when asked, else effective.
inline std::optional<Scope> read_scope_of(const Args &args) {
  return args.global ? std::optional<Scope>{Scope::Global} : std::nullopt;
}

} // namespace gitusr::cli
