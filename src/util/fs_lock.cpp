// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace draftops {
namespace util {

DataDirLock::DataDirLock(std::filesystem::path directory, std::string lockfile_name)
    : directory_(std::move(directory)), lockfile_name_(std::move(lockfile_name)) {}

DataDirLock::~DataDirLock() { Release(); }

LockResult DataDirLock::Acquire() {
  if (held_) {
    return LockResult::Success;
  }

  const auto path = LockFilePath();

  // O_CLOEXEC: child processes must not inherit the lock
  fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", path.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    close(fd_);
    fd_ = -1;
    LOG_ERROR("Failed to lock data directory {}: {}", directory_.string(), reason_);
    return LockResult::ErrorLock;
  }

  held_ = true;
  LOG_TRACE("Acquired data directory lock: {}", directory_.string());
  return LockResult::Success;
}

void DataDirLock::Release() {
  if (fd_ != -1) {
    // Closing the fd releases the fcntl lock
    close(fd_);
    fd_ = -1;
  }
  if (held_) {
    held_ = false;
    LOG_TRACE("Released data directory lock: {}", directory_.string());
  }
}

} // namespace util
} // namespace draftops
