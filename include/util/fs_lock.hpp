// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace bridgerelay {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive fcntl() lock on a file, released when the object is destroyed
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  explicit FileLock(const fs::path &file);
  ~FileLock();

  // Try to acquire the lock without blocking
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
};

enum class LockResult {
  Success,    // Lock acquired (or already held by this process)
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock held by another process
};

/**
 * Lock a data directory so two relay processes never write the same
 * header logs. The lock is held until UnlockDirectory() or process exit.
 *
 * @param reason Filled with the OS error on failure
 */
LockResult LockDirectory(const fs::path &directory, std::string &reason,
                         const std::string &lockfile_name = ".lock");

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name = ".lock");

} // namespace util
} // namespace bridgerelay
