#include "cli/command.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using gitusr::Scope;

  {
    std::vector<std::string> words{"add", "work", "--global", "Jane Doe", "jane@x.com"};
    std::vector<char *> argv;
    for (auto &w : words)
      argv.push_back(w.data());
    const auto args = gitusr::cli::parse_args(static_cast<int>(argv.size()), argv.data());
    if (!args.global || gitusr::cli::scope_of(args) != Scope::Global) {
      std::cerr << "--global not detected\n";
      return 1;
    }
    if (args.positional != std::vector<std::string>{"work", "Jane Doe", "jane@x.com"}) {
      std::cerr << "positional args mismatch\n";
      return 1;
    }
    if (!args.unknown.empty() || !gitusr::cli::check_flags("add", args)) {
      std::cerr << "clean command line reported unknown flags\n";
      return 1;
    }
  }

  {
    std::vector<std::string> words{"work", "--glob"};
    std::vector<char *> argv;
    for (auto &w : words)
      argv.push_back(w.data());
    const auto args = gitusr::cli::parse_args(static_cast<int>(argv.size()), argv.data());
    if (args.global || gitusr::cli::scope_of(args) != Scope::Local || gitusr::cli::read_scope_of(args)) {
      std::cerr << "scope should stay local\n";
      return 1;
    }
    if (args.unknown != std::vector<std::string>{"--glob"} || gitusr::cli::check_flags("work", args)) {
      std::cerr << "unknown flag not reported\n";
      return 1;
    }
  }

  std::cout << "cli_args OK\n";
  return 0;
}
