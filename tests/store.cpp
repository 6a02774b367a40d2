#include "gitusr/errors.hpp"
#include "gitusr/store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static int run(const fs::path &dir) {
  const fs::path file = dir / "nested" / "profiles.json";
  const gitusr::ProfileStore store{file};

  // ---- 1) first load seeds the file with the two defaults
  if (fs::exists(file)) {
    std::cerr << "profiles file unexpectedly present\n";
    return 1;
  }
  const auto seeded = store.load();
  if (seeded != gitusr::default_profiles()) {
    std::cerr << "first load did not return the defaults\n";
    return 1;
  }
  if (!fs::exists(file)) {
    std::cerr << "first load did not write the profiles file\n";
    return 1;
  }
  if (slurp(file).find("you@work.com") == std::string::npos) {
    std::cerr << "seeded file missing work profile\n";
    return 1;
  }

  // ---- 2) save then load yields the same mapping
  gitusr::ProfileSet set = seeded;
  set["oss"] = gitusr::Profile{.name = "Octo Cat", .email = "octo@example.org"};
  set.erase("personal");
  store.save(set);
  if (store.load() != set) {
    std::cerr << "save/load mismatch\n";
    return 1;
  }
  if (fs::exists(fs::path(file) += ".tmp")) {
    std::cerr << "temporary file left behind\n";
    return 1;
  }

  // a save that fails leaves the previous file in place
  {
    const fs::path blocker = fs::path(file) += ".tmp";
    fs::create_directories(blocker / "occupied");
    gitusr::ProfileSet other{{"solo", gitusr::Profile{.name = "S", .email = "s@x.com"}}};
    try {
      store.save(other);
      std::cerr << "save through a blocked temp path succeeded\n";
      return 1;
    } catch (const gitusr::IoError &) {
    }
    if (!fs::exists(file) || store.load() != set) {
      std::cerr << "failed save lost the existing profiles\n";
      return 1;
    }
    fs::remove_all(blocker);
  }

  // an emptied set stays empty, it is not reseeded
  store.save({});
  if (!store.load().empty()) {
    std::cerr << "empty set reseeded on load\n";
    return 1;
  }

  // ---- 3) malformed content -> ParseError naming the file
  {
    std::ofstream ofs(file, std::ios::trunc);
    ofs << "{ \"work\": ";
  }
  try {
    (void)store.load();
    std::cerr << "malformed file loaded without error\n";
    return 1;
  } catch (const gitusr::ParseError &e) {
    if (std::string(e.what()).find(file.string()) == std::string::npos) {
      std::cerr << "ParseError does not name the file: " << e.what() << "\n";
      return 1;
    }
  }

  // ---- 4) unreadable path -> IoError
  const fs::path as_dir = dir / "is_a_dir.json";
  fs::create_directories(as_dir);
  try {
    (void)gitusr::ProfileStore{as_dir}.load();
    std::cerr << "directory loaded as profiles file\n";
    return 1;
  } catch (const gitusr::IoError &) {
  }

  // ---- 5) unwritable target -> IoError
  try {
    gitusr::ProfileStore{as_dir}.save(set);
    std::cerr << "save over a directory did not fail\n";
    return 1;
  } catch (const gitusr::IoError &) {
  }
  return 0;
}

int main() {
  const fs::path dir =
      fs::temp_directory_path() / ("gitusr_store_test_" + std::to_string(std::random_device{}()));
  int rc = 1;
  try {
    fs::create_directories(dir);
    rc = run(dir);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (rc == 0)
    std::cout << "store OK\n";
  return rc;
}
