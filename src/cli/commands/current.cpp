#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>

int cmd_current(int argc, char **argv) {
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags("current", args))
    return 1;

  try {
    gitusr::cli::Session session;
    // an unset identity is reported, not treated as a failure
    session.manager().show_current(gitusr::cli::read_scope_of(args));
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "current: " << e.what() << "\n";
    return 1;
  }
}
