#include "gitusr/fs.hpp"

#include "gitusr/errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace gitusr::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_dir(const std::filesystem::path &dir) {
  if (dir.empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    throw IoError("mkdir -p failed: " + dir.string() + ": " + ec.message());
}

void ensure_parent_dir(const std::filesystem::path &p) { ensure_dir(p.parent_path()); }

std::string read_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec))
    throw IoError("not a regular file: " + p.string());
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }
  std::string buf{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad())
    throw IoError("read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::string_view data) {
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec))
    throw IoError("not a regular file: " + p.string());
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw IoError("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw IoError("flush temp failed: " + tmp.string());
  }
  std::filesystem::rename(tmp, p, ec);
#ifdef _WIN32
  // rename may refuse an existing target here; overwrite in place instead
  if (ec) {
    ec.clear();
    std::filesystem::copy_file(tmp, p, std::filesystem::copy_options::overwrite_existing, ec);
  }
#endif
  if (ec) {
    // p is never removed, so a failed save keeps the previous contents
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw IoError("atomic replace failed: " + p.string() + ": " + ec.message());
  }
#ifdef _WIN32
  std::error_code ignored;
  std::filesystem::remove(tmp, ignored);
#endif
}

} // namespace gitusr::fs
