#pragma once
#include "gitusr/git_config.hpp"
#include "gitusr/input.hpp"
#include "gitusr/store.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace gitusr {

// The profile operations behind the CLI. Every call loads the profile set
// fresh from the store; mutations save the whole set back.
class ProfileManager {
public:
  ProfileManager(const ProfileStore &store, ConfigBackend &git, InputSource &input,
                 std::ostream &out);

  // Print all profiles, marking the first one whose name+email equal the
  // identity git currently reports (effective value, or the `read_scope` value).
  void list(std::optional<Scope> read_scope = std::nullopt) const;

  // Apply a stored profile. Throws NotFoundError / ExternalToolError.
  auto switch_to(const std::string &profile, Scope scope) const -> Profile;

  // Create or update a profile. Returns false when the profile already
  // exists and name or email was left empty (nothing is changed then).
  // Missing fields of a new profile are prompted for; throws ValidationError
  // if they stay empty.
  bool add(const std::string &profile, std::string name, std::string email) const;

  // Throws NotFoundError for an unknown profile.
  void remove(const std::string &profile) const;

  // Print the identity git reports. Returns false when none is configured.
  bool show_current(std::optional<Scope> read_scope = std::nullopt) const;

  [[nodiscard]] auto profile_names() const -> std::vector<std::string>;

private:
  const ProfileStore &store_;
  ConfigBackend &git_;
  InputSource &input_;
  std::ostream &out_;
};

} // namespace gitusr
