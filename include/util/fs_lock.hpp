// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace blockledger {
namespace util {

/**
 * Result of directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired successfully
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held by another holder
};

/**
 * DataDirLock - exclusive lock on a data directory
 *
 * Creates <directory>/<lockfile_name> and takes an flock() on it, so a
 * second daemon (or a second DataDirLock in the same process) pointed at the
 * same directory fails with ErrorLock instead of sharing the block file.
 * The lock is released when the object is destroyed.
 */
class DataDirLock {
public:
  explicit DataDirLock(std::filesystem::path directory,
                       std::string lockfile_name = ".lock");
  ~DataDirLock();

  DataDirLock(const DataDirLock &) = delete;
  DataDirLock &operator=(const DataDirLock &) = delete;

  LockResult TryAcquire();
  void Release();

  bool IsHeld() const { return held_; }
  const std::string &GetReason() const { return reason_; }
  std::filesystem::path GetLockFilePath() const {
    return directory_ / lockfile_name_;
  }

private:
  std::filesystem::path directory_;
  std::string lockfile_name_;
  std::string reason_;
  int fd_{-1};
  bool held_{false};
};

} // namespace util
} // namespace blockledger
