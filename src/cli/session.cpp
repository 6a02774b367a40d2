#include "cli/session.hpp"

#include <iostream>

namespace gitusr::cli {

Session::Session()
    : store_(ProfileStore::open_default()), input_(std::cin, std::cout),
      manager_(store_, git_, input_, std::cout) {}

} // namespace gitusr::cli
