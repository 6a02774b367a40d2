#include "gitusr/util.hpp"

namespace gitusr::strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace gitusr::strutil
