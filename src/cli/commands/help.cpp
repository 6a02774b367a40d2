#include "gitusr/consts.hpp"
#include "gitusr/store.hpp"

#include "cli/registry.hpp"

#include <iostream>

int cmd_help(int /*argc*/, char ** /*argv*/) {
  std::cout << gitusr::consts::kToolName << " - switch git user profiles\n\n";
  gitusr::cli::print_usage(std::cout);
  std::cout << "\nexamples:\n"
               "  git usr work                  switch this repository to the work profile\n"
               "  git usr personal --global     switch the global identity\n"
               "  git usr add work \"John Doe\" \"john@company.com\"\n"
               "  git usr list\n";

  try {
    std::cout << "\nprofiles: " << gitusr::ProfileStore::open_default().path().string() << "\n";
  } catch (const std::exception &e) {
    std::cerr << "help: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
