#include "gitusr/errors.hpp"

#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>

// git usr <profile> [--global]
int cmd_switch(int argc, char **argv) {
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags(argv[0], args))
    return 1;
  if (!args.positional.empty()) {
    std::cerr << "usage: git usr <profile> [--global]\n";
    return 1;
  }

  try {
    gitusr::cli::Session session;
    session.manager().switch_to(argv[0], gitusr::cli::scope_of(args));
    return 0;
  } catch (const gitusr::NotFoundError &e) {
    std::cerr << "switch: " << e.what() << "\n";
    std::cerr << "use `git usr add " << argv[0] << "` to create it\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "switch: " << e.what() << "\n";
    return 1;
  }
}
