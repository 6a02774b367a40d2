#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitusr::completion {

// Shells with a completion template, in the order help text lists them.
const std::vector<std::string> &supported_shells();

std::string bash_script(const std::vector<std::string> &profiles);
std::string zsh_script(const std::vector<std::string> &profiles);
std::string fish_script(const std::vector<std::string> &profiles);
std::string powershell_script(const std::vector<std::string> &profiles);

// Dispatch on shell name; throws ValidationError for an unknown shell.
std::string script_for(std::string_view shell, const std::vector<std::string> &profiles);

} // namespace gitusr::completion
