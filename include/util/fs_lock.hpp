// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace draftops {
namespace util {

/**
 * Result of a data directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create or open the lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * DataDirLock - exclusive fcntl() lock on <datadir>/<name>
 *
 * Keeps two daemons from sharing one data directory (and so one RPC socket
 * and state file). The lock is held until Release() or destruction; it is
 * also dropped by the kernel if the process dies.
 */
class DataDirLock {
public:
  explicit DataDirLock(std::filesystem::path directory,
                       std::string lockfile_name = ".lock");
  ~DataDirLock();

  DataDirLock(const DataDirLock &) = delete;
  DataDirLock &operator=(const DataDirLock &) = delete;

  LockResult Acquire();
  void Release();

  bool IsHeld() const { return held_; }
  const std::string &GetReason() const { return reason_; }
  std::filesystem::path LockFilePath() const { return directory_ / lockfile_name_; }

private:
  std::filesystem::path directory_;
  std::string lockfile_name_;
  std::string reason_;
  int fd_{-1};
  bool held_{false};
};

} // namespace util
} // namespace draftops
