#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace gitusr::fs {

bool exists(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& dir);
void ensure_parent_dir(const std::filesystem::path& p);

// Throws IoError when the file cannot be opened or read.
std::string read_file(const std::filesystem::path& p);

// Write to "<p>.tmp" and rename over p; throws IoError on failure.
void write_file_atomic(const std::filesystem::path& p, std::string_view data);

} // namespace gitusr::fs
