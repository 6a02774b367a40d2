#pragma once
#include <iosfwd>
#include <string>
#include "cli/command.hpp"

namespace gitusr::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
// Alternate spelling of a registered command; not listed in usage.
void register_alias(const std::string& alias, const std::string& name);
command_fn find_command(const std::string& name);
void print_usage(std::ostream& os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitusr::cli
