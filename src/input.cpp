#include "gitusr/input.hpp"

#include "gitusr/util.hpp"

#include <istream>
#include <ostream>

namespace gitusr {

std::optional<std::string> StreamInput::read_line(std::string_view prompt) {
  out_ << prompt << std::flush;
  std::string line;
  if (!std::getline(in_, line))
    return std::nullopt;
  return strutil::trim(line);
}

} // namespace gitusr
