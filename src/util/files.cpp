// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace bridgerelay {
namespace util {

namespace {

// Sync directory so a newly created entry survives a crash
bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

} // anonymous namespace

bool truncate_and_append(const std::filesystem::path &path, uint64_t keep_bytes,
                         std::string_view data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  std::error_code ec;
  bool existed = std::filesystem::exists(path, ec);

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return false;
  }

  if (ftruncate(fd, static_cast<off_t>(keep_bytes)) != 0) {
    close(fd);
    return false;
  }

  // Write data at the truncation point (handle partial writes)
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = pwrite(fd, data.data() + total, data.size() - total,
                       static_cast<off_t>(keep_bytes + total));
    if (n <= 0) {
      close(fd);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    return false;
  }
  close(fd);

  if (!existed && !parent.empty() && !sync_directory(parent)) {
    return false;
  }
  return true;
}

std::string read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return {};
  }

  // Refuse files larger than 100MB
  constexpr std::streamsize MAX_FILE_SIZE = 100 * 1024 * 1024;
  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0 || size > MAX_FILE_SIZE) {
    return {};
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);
  if (!file) {
    return {};
  }
  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".bridge-relay";
  }
  return std::filesystem::current_path() / ".bridge-relay";
}

} // namespace util
} // namespace bridgerelay
