// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace equirelay {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool ok = fsync(fd) == 0;
  close(fd);
  return ok;
}

// Write all bytes, retrying partial writes
bool write_all(int fd, const std::string &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp";

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  if (!write_all(fd, data) || fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return parent.empty() || sync_directory(parent);
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".equirelay";
  }
  return std::filesystem::current_path() / ".equirelay";
}

} // namespace util
} // namespace equirelay
