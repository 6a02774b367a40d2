#include "cli/command.hpp"

#include <iostream>

namespace gitusr::cli {

Args parse_args(int argc, char **argv) {
  Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--global") {
      out.global = true;
    } else if (a.size() > 2 && a.rfind("--", 0) == 0) {
      out.unknown.push_back(a);
    } else {
      out.positional.push_back(a);
    }
  }
  return out;
}

bool check_flags(std::string_view cmd, const Args &args) {
  for (const auto &flag : args.unknown)
    std::cerr << cmd << ": unknown option " << flag << "\n";
  return args.unknown.empty();
}

} // namespace gitusr::cli
