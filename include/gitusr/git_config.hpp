#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitusr {

enum class Scope {
  Local,  // --local: the repository in the working directory
  Global, // --global: the user's ~/.gitconfig
};

std::string_view scope_flag(Scope scope); // "--local" / "--global"

struct Identity {
  std::string name;
  std::string email;

  [[nodiscard]] bool complete() const { return !name.empty() && !email.empty(); }
};

// Get/set access to git configuration keys.
class ConfigBackend {
public:
  virtual ~ConfigBackend() = default;

  // Value of `key`, or nullopt when unset. Without a scope git reports the
  // effective value across system, global and local files.
  virtual std::optional<std::string> get(std::string_view key,
                                         std::optional<Scope> scope) const = 0;

  // Throws ExternalToolError when the value could not be written.
  virtual void set(std::string_view key, std::string_view value, Scope scope) = 0;
};

// Runs `git config` as a child process.
class GitConfig : public ConfigBackend {
public:
  // Executable from $GIT_USR_GIT (default "git"), run in the current directory.
  GitConfig();
  GitConfig(std::filesystem::path work_dir, std::string executable);

  std::optional<std::string> get(std::string_view key,
                                 std::optional<Scope> scope) const override;
  void set(std::string_view key, std::string_view value, Scope scope) override;

private:
  struct RunResult {
    int status;
    std::string out;
    std::string err;
  };
  RunResult run(const std::vector<std::string> &args) const;

  std::filesystem::path work_dir_;
  std::string executable_;
};

// user.name + user.email; unset keys come back as empty fields
Identity read_identity(const ConfigBackend &backend, std::optional<Scope> scope = std::nullopt);

// Set user.name, then user.email, at `scope`.
void write_identity(ConfigBackend &backend, const Identity &id, Scope scope);

} // namespace gitusr
