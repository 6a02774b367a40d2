#include "gitusr/completion.hpp"

#include "gitusr/errors.hpp"
#include "gitusr/util.hpp"

namespace gitusr::completion {

const std::vector<std::string> &supported_shells() {
  static const std::vector<std::string> shells{"bash", "zsh", "fish", "powershell"};
  return shells;
}

std::string bash_script(const std::vector<std::string> &profiles) {
  const std::string names = strutil::join(profiles, " ");
  std::string s = R"sh(# bash completion for git-usr
_git_usr() {
    local cur prev
    COMPREPLY=()
    cur="${COMP_WORDS[COMP_CWORD]}"
    prev="${COMP_WORDS[COMP_CWORD-1]}"

    local commands="list current add remove help version completion )sh";
  s += names;
  s += R"sh("

    case "${prev}" in
        completion)
            COMPREPLY=( $(compgen -W "bash zsh fish powershell" -- "${cur}") )
            return 0
            ;;
        remove)
            COMPREPLY=( $(compgen -W ")sh";
  s += names;
  s += R"sh(" -- "${cur}") )
            return 0
            ;;
    esac

    COMPREPLY=( $(compgen -W "${commands} --global" -- "${cur}") )
    return 0
}

complete -F _git_usr git-usr

# Installation: add this to ~/.bashrc or ~/.bash_completion,
# or save it as /etc/bash_completion.d/git-usr
)sh";
  return s;
}

std::string zsh_script(const std::vector<std::string> &profiles) {
  std::string s = R"sh(#compdef git-usr

_git_usr() {
    local -a commands profiles
    commands=(
        'list:List all profiles'
        'current:Show current git identity'
        'add:Add or update a profile'
        'remove:Remove a profile'
        'version:Show version information'
        'help:Show help'
        'completion:Generate completion script'
    )

    profiles=()sh";
  s += strutil::join(profiles, " ");
  s += R"sh()

    _arguments -C \
        '1: :->command' \
        '2: :->args' \
        '*::arg:->args' \
        '--global[Apply globally]'

    case $state in
        command)
            _describe -t commands 'git-usr commands' commands
            _describe -t profiles 'profiles' profiles
            ;;
        args)
            case $words[1] in
                completion)
                    _values 'shell' bash zsh fish powershell
                    ;;
                remove)
                    _describe -t profiles 'profiles' profiles
                    ;;
            esac
            ;;
    esac
}

_git_usr "$@"

# Installation: save as _git-usr in a directory on $fpath, e.g. ~/.zsh/completions,
# then in ~/.zshrc: fpath=(~/.zsh/completions $fpath) && autoload -U compinit && compinit
)sh";
  return s;
}

std::string fish_script(const std::vector<std::string> &profiles) {
  std::string s = R"sh(# fish completion for git-usr

# Commands
complete -c git-usr -f -n "__fish_use_subcommand" -a "list" -d "List all profiles"
complete -c git-usr -f -n "__fish_use_subcommand" -a "current" -d "Show current git identity"
complete -c git-usr -f -n "__fish_use_subcommand" -a "add" -d "Add or update a profile"
complete -c git-usr -f -n "__fish_use_subcommand" -a "remove" -d "Remove a profile"
complete -c git-usr -f -n "__fish_use_subcommand" -a "version" -d "Show version information"
complete -c git-usr -f -n "__fish_use_subcommand" -a "help" -d "Show help"
complete -c git-usr -f -n "__fish_use_subcommand" -a "completion" -d "Generate completion script"

# Profiles
)sh";
  for (const auto &p : profiles) {
    s += "complete -c git-usr -f -n \"__fish_use_subcommand\" -a \"" + p +
         "\" -d \"Switch to " + p + " profile\"\n";
  }
  s += R"sh(
# completion <shell>
complete -c git-usr -f -n "__fish_seen_subcommand_from completion" -a "bash zsh fish powershell"

# remove <profile>
)sh";
  for (const auto &p : profiles) {
    s += "complete -c git-usr -f -n \"__fish_seen_subcommand_from remove\" -a \"" + p + "\"\n";
  }
  s += R"sh(
complete -c git-usr -l global -d "Apply globally"

# Installation: save as ~/.config/fish/completions/git-usr.fish
)sh";
  return s;
}

std::string powershell_script(const std::vector<std::string> &profiles) {
  std::string quoted;
  for (std::size_t i = 0; i < profiles.size(); ++i) {
    if (i)
      quoted += ", ";
    quoted += "'" + profiles[i] + "'";
  }

  std::string s = R"ps(# PowerShell completion for git-usr

Register-ArgumentCompleter -Native -CommandName git-usr -ScriptBlock {
    param($wordToComplete, $commandAst, $cursorPosition)

    $commands = @('list', 'current', 'add', 'remove', 'version', 'help', 'completion')
    $profiles = @()ps";
  s += quoted;
  s += R"ps()
    $shells = @('bash', 'zsh', 'fish', 'powershell')

    $tokens = $commandAst.ToString() -split '\s+'

    if ($tokens.Count -eq 2) {
        $allOptions = $commands + $profiles + @('--global')
        $allOptions | Where-Object { $_ -like "$wordToComplete*" } | ForEach-Object {
            [System.Management.Automation.CompletionResult]::new($_, $_, 'ParameterValue', $_)
        }
    }
    elseif ($tokens.Count -eq 3) {
        switch ($tokens[1]) {
            'completion' {
                $shells | Where-Object { $_ -like "$wordToComplete*" } | ForEach-Object {
                    [System.Management.Automation.CompletionResult]::new($_, $_, 'ParameterValue', $_)
                }
            }
            'remove' {
                $profiles | Where-Object { $_ -like "$wordToComplete*" } | ForEach-Object {
                    [System.Management.Automation.CompletionResult]::new($_, $_, 'ParameterValue', $_)
                }
            }
        }
    }
}

# Installation: add this to your PowerShell profile ($PROFILE),
# or dot-source it: . path\to\git-usr-completion.ps1
)ps";
  return s;
}

std::string script_for(std::string_view shell, const std::vector<std::string> &profiles) {
  if (shell == "bash")
    return bash_script(profiles);
  if (shell == "zsh")
    return zsh_script(profiles);
  if (shell == "fish")
    return fish_script(profiles);
  if (shell == "powershell")
    return powershell_script(profiles);
  throw ValidationError("unsupported shell: " + std::string(shell) +
                        " (supported: " + strutil::join(supported_shells(), ", ") + ")");
}

} // namespace gitusr::completion
