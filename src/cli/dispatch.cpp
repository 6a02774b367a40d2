#include "cli/dispatch.hpp"

#include "cli/registry.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_switch(int argc, char **argv);
int cmd_help(int argc, char **argv);

namespace gitusr::cli {

int run(int argc, char **argv) {
  register_all_commands(); // defined in register_commands.cpp

  // `git usr --global work` and `git usr work --global` are equivalent
  int cmd_at = 0;
  for (int i = 1; i < argc && cmd_at == 0; ++i) {
    if (std::string(argv[i]) != "--global")
      cmd_at = i;
  }
  if (cmd_at == 0)
    return ::cmd_help(argc, argv);

  std::vector<char *> args{argv[cmd_at]};
  for (int i = 1; i < argc; ++i) {
    if (i != cmd_at)
      args.push_back(argv[i]);
  }
  args.push_back(nullptr);
  const int n = static_cast<int>(args.size()) - 1;

  const std::string cmd = argv[cmd_at];
  if (const auto fn = find_command(cmd))
    return fn(n, args.data());

  if (cmd.rfind("-", 0) == 0) {
    std::cerr << "unknown option: " << cmd << "\n\n";
    print_usage(std::cerr);
    return 1;
  }
  return ::cmd_switch(n, args.data());
}

} // namespace gitusr::cli
