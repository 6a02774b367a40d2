#include "gitusr/completion.hpp"

#include "cli/command.hpp"
#include "cli/session.hpp"

#include <iostream>

int cmd_completion(int argc, char **argv) {
  const auto args = gitusr::cli::parse_args(argc, argv);
  if (!gitusr::cli::check_flags("completion", args))
    return 1;
  if (args.positional.size() != 1) {
    std::cerr << "usage: git usr completion <bash|zsh|fish|powershell>\n";
    return 1;
  }

  try {
    gitusr::cli::Session session;
    std::cout << gitusr::completion::script_for(args.positional[0],
                                                session.manager().profile_names());
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "completion: " << e.what() << "\n";
    return 1;
  }
}
