#include "gitusr/completion.hpp"
#include "gitusr/errors.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  const std::vector<std::string> profiles{"personal", "work"};

  struct Case {
    const char *shell;
    const char *marker;
  };
  const Case cases[] = {
      {"bash", "complete -F _git_usr git-usr"},
      {"zsh", "#compdef git-usr"},
      {"fish", "complete -c git-usr"},
      {"powershell", "Register-ArgumentCompleter"},
  };

  for (const auto &[shell, marker] : cases) {
    const std::string s = gitusr::completion::script_for(shell, profiles);
    if (s.find(marker) == std::string::npos) {
      std::cerr << shell << ": missing " << marker << "\n";
      return 1;
    }
    for (const auto &p : profiles) {
      if (s.find(p) == std::string::npos) {
        std::cerr << shell << ": missing profile " << p << "\n";
        return 1;
      }
    }
    if (s.find("--global") == std::string::npos && s.find("-l global") == std::string::npos) {
      std::cerr << shell << ": missing --global\n";
      return 1;
    }
  }

  if (gitusr::completion::bash_script(profiles).find(
          "local commands=\"list current add remove help version completion personal work\"") ==
      std::string::npos) {
    std::cerr << "bash: profiles not appended to the command list\n";
    return 1;
  }
  if (gitusr::completion::zsh_script(profiles).find("profiles=(personal work)") ==
      std::string::npos) {
    std::cerr << "zsh: profile array mismatch\n";
    return 1;
  }
  if (gitusr::completion::powershell_script(profiles).find("@('personal', 'work')") ==
      std::string::npos) {
    std::cerr << "powershell: profile array mismatch\n";
    return 1;
  }
  if (gitusr::completion::fish_script(profiles).find(
          "__fish_seen_subcommand_from remove\" -a \"work\"") == std::string::npos) {
    std::cerr << "fish: remove completion for work missing\n";
    return 1;
  }

  try {
    (void)gitusr::completion::script_for("tcsh", profiles);
    std::cerr << "unsupported shell accepted\n";
    return 1;
  } catch (const gitusr::ValidationError &e) {
    if (std::string(e.what()).find("powershell") == std::string::npos) {
      std::cerr << "error does not list supported shells: " << e.what() << "\n";
      return 1;
    }
  }

  std::cout << "completion OK\n";
  return 0;
}
