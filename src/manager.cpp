#include "gitusr/manager.hpp"

#include "gitusr/errors.hpp"
#include "gitusr/util.hpp"

#include <ostream>
#include <string_view>

namespace {

void print_profile(std::ostream &out, const gitusr::Profile &p, std::string_view indent) {
  out << indent << "Name:  " << p.name << "\n";
  out << indent << "Email: " << p.email << "\n";
}

} // namespace

namespace gitusr {

ProfileManager::ProfileManager(const ProfileStore &store, ConfigBackend &git, InputSource &input,
                               std::ostream &out)
    : store_(store), git_(git), input_(input), out_(out) {}

void ProfileManager::list(std::optional<Scope> read_scope) const {
  const auto set = store_.load();
  const Identity current = read_identity(git_, read_scope);

  out_ << "Available profiles:\n";
  out_ << std::string(50, '-') << "\n";

  bool marked = false;
  for (const auto &[key, profile] : set) {
    const bool is_current = !marked && current.complete() && profile.name == current.name &&
                            profile.email == current.email;
    marked = marked || is_current;
    out_ << (is_current ? "* " : "  ") << key << "\n";
    print_profile(out_, profile, "    ");
  }
  if (set.empty())
    out_ << "  (none; add one with `git usr add <profile>`)\n";
}

auto ProfileManager::switch_to(const std::string &profile, Scope scope) const -> Profile {
  const auto set = store_.load();
  const auto it = set.find(profile);
  if (it == set.end()) {
    throw NotFoundError("profile '" + profile + "' not found (available: " +
                        strutil::join(gitusr::profile_names(set), ", ") + ")");
  }

  const Profile &p = it->second;
  write_identity(git_, Identity{.name = p.name, .email = p.email}, scope);

  out_ << "Switched to '" << profile << "' profile "
       << (scope == Scope::Global ? "globally" : "for this repository") << "\n";
  print_profile(out_, p, "  ");
  return p;
}

bool ProfileManager::add(const std::string &profile, std::string name, std::string email) const {
  auto set = store_.load();

  if (const auto it = set.find(profile); it != set.end() && (name.empty() || email.empty())) {
    out_ << "Profile '" << profile << "' already exists:\n";
    print_profile(out_, it->second, "  ");
    out_ << "\nTo update it, provide both name and email.\n";
    return false;
  }

  if (name.empty())
    name = input_.read_line("Enter name: ").value_or("");
  if (email.empty())
    email = input_.read_line("Enter email: ").value_or("");
  if (name.empty() || email.empty())
    throw ValidationError("name and email are required");

  set[profile] = Profile{.name = name, .email = email};
  store_.save(set);

  out_ << "Profile '" << profile << "' saved\n";
  print_profile(out_, set[profile], "  ");
  out_ << "\nUse: git usr " << profile << "\n";
  return true;
}

void ProfileManager::remove(const std::string &profile) const {
  auto set = store_.load();
  if (set.erase(profile) == 0)
    throw NotFoundError("profile '" + profile + "' not found");
  store_.save(set);
  out_ << "Profile '" << profile << "' removed\n";
}

bool ProfileManager::show_current(std::optional<Scope> read_scope) const {
  const Identity id = read_identity(git_, read_scope);
  if (!id.complete()) {
    out_ << "No git identity configured";
    if (read_scope)
      out_ << " (" << scope_flag(*read_scope) << ")";
    out_ << "\n";
    return false;
  }
  out_ << "Current git identity:\n";
  print_profile(out_, Profile{.name = id.name, .email = id.email}, "  ");
  return true;
}

auto ProfileManager::profile_names() const -> std::vector<std::string> {
  return gitusr::profile_names(store_.load());
}

} // namespace gitusr
