#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace gitusr {

// Source of interactive answers for prompts.
class InputSource {
public:
  virtual ~InputSource() = default;

  // Show `prompt` and read one line; nullopt at end of input.
  virtual std::optional<std::string> read_line(std::string_view prompt) = 0;
};

class StreamInput : public InputSource {
public:
  StreamInput(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  std::optional<std::string> read_line(std::string_view prompt) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace gitusr
