// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <mutex>
#include <unistd.h>

namespace bridgerelay {
namespace util {

// Currently held directory locks, keyed by lock file path
static std::mutex g_dir_locks_mutex;
static std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

FileLock::FileLock(const fs::path &file) {
  // O_CLOEXEC: don't leak the fd (and the lock) into child processes
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    // Closing the fd releases the fcntl lock
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

LockResult LockDirectory(const fs::path &directory, std::string &reason,
                         const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  fs::path lockfile_path = directory / lockfile_name;
  std::string key = lockfile_path.string();
  if (g_dir_locks.find(key) != g_dir_locks.end()) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->IsOpen()) {
    reason = file_lock->GetReason();
    return LockResult::ErrorWrite;
  }
  if (!file_lock->TryLock()) {
    reason = file_lock->GetReason();
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(key, std::move(file_lock));
  return LockResult::Success;
}

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  g_dir_locks.erase((directory / lockfile_name).string());
}

} // namespace util
} // namespace bridgerelay
