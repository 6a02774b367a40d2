#include "gitusr/profile.hpp"

#include "gitusr/consts.hpp"
#include "gitusr/errors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// A missing or null member reads as empty; anything but a string is an error.
std::string field(const json &entry, std::string_view key, const std::string &profile) {
  const auto it = entry.find(std::string(key));
  if (it == entry.end() || it->is_null())
    return {};
  if (!it->is_string())
    throw gitusr::ParseError("profile '" + profile + "': \"" + std::string(key) +
                             "\" must be a string");
  return it->get<std::string>();
}

} // namespace

namespace gitusr {

ProfileSet default_profiles() {
  return ProfileSet{
      {"work", Profile{.name = "Your Work Name", .email = "you@work.com"}},
      {"personal", Profile{.name = "Your Personal Name", .email = "you@personal.com"}},
  };
}

std::vector<std::string> profile_names(const ProfileSet &set) {
  std::vector<std::string> names;
  names.reserve(set.size());
  for (const auto &[key, _] : set)
    names.push_back(key);
  return names;
}

std::string to_json(const ProfileSet &set) {
  json root = json::object();
  for (const auto &[key, profile] : set) {
    root[key] = {{std::string(consts::kFieldName), profile.name},
                 {std::string(consts::kFieldEmail), profile.email}};
  }
  // invalid UTF-8 from the command line is replaced rather than rejected
  return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

ProfileSet from_json(std::string_view text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ParseError("malformed profiles JSON at byte " + std::to_string(e.byte) + ": " +
                     e.what());
  }

  ProfileSet out;
  if (root.is_null())
    return out;
  if (!root.is_object())
    throw ParseError(std::string("profiles JSON must be an object, not ") + root.type_name());

  for (const auto &[key, entry] : root.items()) {
    if (!entry.is_object())
      throw ParseError("profile '" + key + "' must be an object");
    out[key] = Profile{.name = field(entry, consts::kFieldName, key),
                       .email = field(entry, consts::kFieldEmail, key)};
  }
  return out;
}

} // namespace gitusr
