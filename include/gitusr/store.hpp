#pragma once
#include "gitusr/profile.hpp"

#include <filesystem>

namespace gitusr {

// Platform config directory for the tool, created if missing:
//   Windows: %APPDATA%\git-usr
//   else:    $XDG_CONFIG_HOME/git-usr or ~/.config/git-usr
// Throws IoError when no home directory is known or mkdir fails.
std::filesystem::path resolve_config_dir();

// resolve_config_dir() / "profiles.json"
std::filesystem::path resolve_config_path();

class ProfileStore {
public:
  explicit ProfileStore(std::filesystem::path file);

  // Store at $GIT_USR_PROFILES if set, otherwise at resolve_config_path().
  static ProfileStore open_default();

  [[nodiscard]] const std::filesystem::path &path() const { return file_; }

  // Read the profiles file. A missing file is seeded with default_profiles()
  // and those are returned. Throws IoError / ParseError.
  [[nodiscard]] auto load() const -> ProfileSet;

  // Overwrite the profiles file with the whole set. Throws IoError.
  void save(const ProfileSet &set) const;

private:
  std::filesystem::path file_;
};

} // namespace gitusr
