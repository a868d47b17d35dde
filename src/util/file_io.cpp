#include "rapport/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rapport {

namespace {

std::filesystem::path temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string base = target.filename().string() + ".tmp." + std::to_string(stamp);
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::string name = base;
    if (attempt > 0) name += "." + std::to_string(attempt);
    const std::filesystem::path candidate = dir.empty() ? std::filesystem::path(name) : (dir / name);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }
  return dir.empty() ? std::filesystem::path(base) : (dir / base);
}

// Removes the temp file unless the write completed.
struct TempFileGuard {
  std::filesystem::path path;
  bool armed{true};
  explicit TempFileGuard(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFileGuard() {
    if (!armed) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory: " + p.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  TempFileGuard guard(temp_sibling_path(p));
  {
    std::ofstream out(guard.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + guard.path.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + guard.path.string());
  }

  std::error_code ec;
  std::filesystem::rename(guard.path, p, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(p, rm_ec);
    ec.clear();
    std::filesystem::rename(guard.path, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  guard.armed = false;
}

} // namespace rapport
