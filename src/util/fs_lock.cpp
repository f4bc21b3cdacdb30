// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace blockledger {
namespace util {

DataDirLock::DataDirLock(std::filesystem::path directory,
                         std::string lockfile_name)
    : directory_(std::move(directory)), lockfile_name_(std::move(lockfile_name)) {}

DataDirLock::~DataDirLock() { Release(); }

LockResult DataDirLock::TryAcquire() {
  if (held_) {
    return LockResult::Success;
  }

  const std::filesystem::path lockfile_path = GetLockFilePath();

  // O_CLOEXEC: the lock is not inherited by child processes
  fd_ = open(lockfile_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", lockfile_path.string(),
              reason_);
    return LockResult::ErrorWrite;
  }

  // flock() locks belong to the open file description, so a second open of
  // the same file in this process conflicts as well
  if (flock(fd_, LOCK_EX | LOCK_NB) == -1) {
    reason_ = std::strerror(errno);
    close(fd_);
    fd_ = -1;
    LOG_ERROR("Failed to lock directory {}: {}", directory_.string(), reason_);
    return LockResult::ErrorLock;
  }

  held_ = true;
  LOG_TRACE("Acquired directory lock: {}", directory_.string());
  return LockResult::Success;
}

void DataDirLock::Release() {
  if (fd_ != -1) {
    // Closing the descriptor releases the flock
    close(fd_);
    fd_ = -1;
  }
  if (held_) {
    held_ = false;
    LOG_TRACE("Released directory lock: {}", directory_.string());
  }
}

} // namespace util
} // namespace blockledger
