#include "cli/registry.hpp"

int cmd_list(int argc, char **argv);
int cmd_current(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_remove(int, char **);
int cmd_completion(int, char **);
int cmd_help(int, char **);
int cmd_version(int, char **);

namespace gitusr::cli {

void register_all_commands() {
  register_command("list", ::cmd_list, "List all profiles, marking the current one");
  register_command("current", ::cmd_current, "Show the current git identity");
  register_command("add", ::cmd_add,
                   "Add or update a profile: git usr add <profile> [name] [email]");
  register_command("remove", ::cmd_remove, "Remove a profile: git usr remove <profile>");
  register_command("completion", ::cmd_completion,
                   "Print a completion script: git usr completion <bash|zsh|fish|powershell>");
  register_command("help", ::cmd_help, "Show this help");
  register_command("version", ::cmd_version, "Show version information");

  register_alias("--help", "help");
  register_alias("-h", "help");
  register_alias("--version", "version");
  register_alias("-v", "version");
}

} // namespace gitusr::cli
