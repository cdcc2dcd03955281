// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <pwd.h>
#include <random>
#include <sstream>
#include <unistd.h>

namespace draftops {
namespace util {

namespace {

constexpr std::uintmax_t MAX_READ_SIZE = 16 * 1024 * 1024;

// Sync directory so the rename is durable
bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec || size > MAX_READ_SIZE) {
    return std::nullopt;
  }

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
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }

  if (home) {
    return std::filesystem::path(home) / ".draftops";
  }
  return std::filesystem::path(".draftops");
}

} // namespace util
} // namespace draftops
