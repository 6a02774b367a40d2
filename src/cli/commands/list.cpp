#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>

int cmd_list(int argc, char **argv) {
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags("list", args))
    return 1;

  try {
    gitusr::cli::Session session;
    session.manager().list(gitusr::cli::read_scope_of(args));
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "list: " << e.what() << "\n";
    return 1;
  }
}
