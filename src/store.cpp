#include "gitusr/store.hpp"

#include "gitusr/consts.hpp"
#include "gitusr/errors.hpp"
#include "gitusr/fs.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace {

std::string env(std::string_view name) {
  const char *v = std::getenv(std::string(name).c_str());
  return v ? std::string(v) : std::string();
}

std::filesystem::path home_dir() {
#ifdef _WIN32
  if (auto h = env("USERPROFILE"); !h.empty())
    return h;
  const auto drive = env("HOMEDRIVE");
  const auto path = env("HOMEPATH");
  if (!drive.empty() && !path.empty())
    return drive + path;
#else
  if (auto h = env("HOME"); !h.empty())
    return h;
  if (const passwd *pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir)
    return pw->pw_dir;
#endif
  throw gitusr::IoError("cannot determine the user's home directory");
}

std::filesystem::path base_config_dir() {
#ifdef _WIN32
  if (auto appdata = env("APPDATA"); !appdata.empty())
    return appdata;
  return home_dir() / "AppData" / "Roaming";
#else
  if (std::filesystem::path xdg = env("XDG_CONFIG_HOME"); xdg.is_absolute())
    return xdg;
  return home_dir() / ".config";
#endif
}

} // namespace

namespace gitusr {

std::filesystem::path resolve_config_dir() {
  auto dir = base_config_dir() / consts::kConfigDirName;
  fs::ensure_dir(dir);
  return dir;
}

std::filesystem::path resolve_config_path() {
  return resolve_config_dir() / consts::kProfilesFile;
}

ProfileStore::ProfileStore(std::filesystem::path file) : file_(std::move(file)) {}

ProfileStore ProfileStore::open_default() {
  if (std::filesystem::path p = env(consts::kEnvProfiles); !p.empty()) {
    fs::ensure_parent_dir(p);
    return ProfileStore{std::move(p)};
  }
  return ProfileStore{resolve_config_path()};
}

auto ProfileStore::load() const -> ProfileSet {
  if (!fs::exists(file_)) {
    auto seeded = default_profiles();
    save(seeded);
    return seeded;
  }
  const std::string text = fs::read_file(file_);
  try {
    return from_json(text);
  } catch (const ParseError &e) {
    throw ParseError(file_.string() + ": " + e.what());
  }
}

void ProfileStore::save(const ProfileSet &set) const {
  fs::write_file_atomic(file_, to_json(set));
}

} // namespace gitusr
