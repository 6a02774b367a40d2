#pragma once
#include "gitusr/git_config.hpp"
#include "gitusr/input.hpp"
#include "gitusr/manager.hpp"
#include "gitusr/store.hpp"

namespace gitusr::cli {

// Collaborators of one CLI invocation: the default profile store, git in the
// current directory, and the terminal for prompts and output.
class Session {
public:
  Session();
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  [[nodiscard]] ProfileManager &manager() { return manager_; }

private:
  ProfileStore store_;
  GitConfig git_;
  StreamInput input_;
  ProfileManager manager_;
};

} // namespace gitusr::cli
