#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace gitusr {

struct Profile {
  std::string name;  // display name written to user.name
  std::string email; // written to user.email

  bool operator==(const Profile&) const = default;
};

// profile name -> profile; ordered so listings come out sorted
using ProfileSet = std::map<std::string, Profile>;

// The two placeholder entries written on first run.
ProfileSet default_profiles();

std::vector<std::string> profile_names(const ProfileSet& set);

// Pretty-printed JSON object; an empty set serializes as "{}".
std::string to_json(const ProfileSet& set);

// Parse a JSON object of profiles. Throws ParseError on malformed input or
// when the document is not an object of objects.
ProfileSet from_json(std::string_view text);

} // namespace gitusr
