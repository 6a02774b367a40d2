#include "gitusr/consts.hpp"

#include <iostream>

int cmd_version(int /*argc*/, char ** /*argv*/) {
  std::cout << gitusr::consts::kToolName << " version " << gitusr::consts::kVersion << "\n";
  return 0;
}
