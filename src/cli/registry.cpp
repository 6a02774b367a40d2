#include "cli/registry.hpp"

#include <iomanip>
#include <map>
#include <ostream>

namespace gitusr::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}
static std::map<std::string, std::string> &aliases() {
  static std::map<std::string, std::string> a;
  return a;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

void register_alias(const std::string &alias, const std::string &name) { aliases()[alias] = name; }

command_fn find_command(const std::string &name) {
  const auto al = aliases().find(name);
  const std::string &key = al == aliases().end() ? name : al->second;
  const auto it = table().find(key);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &os) {
  os << "usage: git usr <profile> [--global]\n";
  os << "       git usr <command> [args]\n\n";
  os << "commands:\n";
  for (auto &[name, e] : table()) {
    os << "  " << std::left << std::setw(12) << name << e.help << "\n";
  }
  os << "\n  --global    apply to the global git config instead of this repository\n";
}

} // namespace gitusr::cli
