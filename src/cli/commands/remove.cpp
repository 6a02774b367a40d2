#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>

int cmd_remove(int argc, char **argv) {
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags("remove", args))
    return 1;
  if (args.positional.size() != 1) {
    std::cerr << "usage: git usr remove <profile>\n";
    return 1;
  }

  try {
    gitusr::cli::Session session;
    session.manager().remove(args.positional[0]);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "remove: " << e.what() << "\n";
    return 1;
  }
}
