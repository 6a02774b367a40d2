#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitusr::strutil {

// Strip trailing CR/LF characters in place
void rstrip_newlines(std::string& str);

// Copy without leading/trailing spaces, tabs, CR and LF
std::string trim(std::string_view sv);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

} // namespace gitusr::strutil
