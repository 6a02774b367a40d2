#include "gitusr/errors.hpp"
#include "gitusr/profile.hpp"

#include <iostream>
#include <string>

using gitusr::Profile;
using gitusr::ProfileSet;

int main() {
  // ---- 1) to_json -> from_json keeps every profile, dotted names included
  const ProfileSet set{
      {"work", Profile{.name = "Jane Doe", .email = "jane@corp.example"}},
      {"oss.github", Profile{.name = "jd", .email = "jd@users.noreply.github.com"}},
      {"quotes", Profile{.name = "Jane \"JD\" Doe", .email = "j\\d@example.com"}},
  };
  const std::string text = gitusr::to_json(set);
  if (text.find("\"oss.github\"") == std::string::npos) {
    std::cerr << "dotted profile name not written verbatim:\n" << text;
    return 1;
  }
  if (text.find('\n') == text.size() - 1) {
    std::cerr << "expected pretty-printed output:\n" << text;
    return 1;
  }
  if (gitusr::from_json(text) != set) {
    std::cerr << "profiles changed after to_json/from_json:\n" << text;
    return 1;
  }

  // ---- 2) empty set is an empty object, and reads back empty
  const std::string empty = gitusr::to_json(ProfileSet{});
  if (empty != "{}\n") {
    std::cerr << "empty set serialized as [" << empty << "]\n";
    return 1;
  }
  if (!gitusr::from_json(empty).empty() || !gitusr::from_json("null").empty()) {
    std::cerr << "empty documents should read as no profiles\n";
    return 1;
  }

  // ---- 3) lenient fields: missing members are empty, extras ignored, last duplicate wins
  const auto loose = gitusr::from_json(R"({
    "a": {"name": "A"},
    "b": {"name": "B", "email": "b@x.com", "signingkey": "ABC"},
    "a": {"name": "A2", "email": "a2@x.com"}
  })");
  if (loose.size() != 2 || loose.at("a").name != "A2" || loose.at("a").email != "a2@x.com") {
    std::cerr << "duplicate key handling mismatch\n";
    return 1;
  }
  if (loose.at("b").email != "b@x.com") {
    std::cerr << "extra member disturbed parsing\n";
    return 1;
  }
  if (!gitusr::from_json(R"({"c": {"email": "c@x.com"}})").at("c").name.empty()) {
    std::cerr << "missing name should read as empty\n";
    return 1;
  }
  const auto nulls = gitusr::from_json(R"({"d": {"name": null, "email": "d@x.com"}})");
  if (!nulls.at("d").name.empty() || nulls.at("d").email != "d@x.com") {
    std::cerr << "null name should read as empty, got [" << nulls.at("d").name << "]\n";
    return 1;
  }

  // ---- 4) malformed or wrongly shaped documents
  const char *bad[] = {
      "",
      "{",
      "{\"work\": {\"name\": \"A\", }",
      "[{\"name\": \"A\", \"email\": \"a@x.com\"}]",
      "\"just a string\"",
      "{\"work\": \"A <a@x.com>\"}",
      "{\"work\": {\"name\": {\"first\": \"A\"}, \"email\": \"a@x.com\"}}",
      "\"\"",
      "42",
      "[]",
      "{\"work\": \"\"}",
      "{\"work\": null}",
      "{\"work\": []}",
      "{\"work\": [\"A\", \"a@x.com\"]}",
      "{\"work\": {\"name\": 42, \"email\": \"a@x.com\"}}",
      "{\"work\": {\"name\": \"A\", \"email\": true}}",
      "{\"work\": {\"name\": [\"A\"], \"email\": \"a@x.com\"}}",
  };
  for (const char *doc : bad) {
    bool threw = false;
    try {
      (void)gitusr::from_json(doc);
    } catch (const gitusr::ParseError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "no ParseError for: " << doc << "\n";
      return 1;
    }
  }

  // ---- 5) seed profiles
  const auto seeded = gitusr::default_profiles();
  const auto names = gitusr::profile_names(seeded);
  if (names.size() != 2 || names[0] != "personal" || names[1] != "work") {
    std::cerr << "default profiles mismatch\n";
    return 1;
  }

  std::cout << "profile_json OK\n";
  return 0;
}
