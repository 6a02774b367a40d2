#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>
#include <string>
#include <utility>

int cmd_add(int argc, char **argv) {
  // git usr add <profile> [name] [email]
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags("add", args))
    return 1;
  if (args.positional.empty() || args.positional.size() > 3) {
    std::cerr << "usage: git usr add <profile> [name] [email]\n";
    return 1;
  }

  const std::string &profile = args.positional[0];
  std::string name = args.positional.size() > 1 ? args.positional[1] : std::string();
  std::string email = args.positional.size() > 2 ? args.positional[2] : std::string();

  try {
    gitusr::cli::Session session;
    session.manager().add(profile, std::move(name), std::move(email));
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
