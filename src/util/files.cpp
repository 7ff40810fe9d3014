// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace hive {
namespace util {

namespace {

bool fsync_fd(int fd) {
#if defined(__APPLE__)
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0) {
    return false;
  }
  const bool ok = fsync_fd(fd);
  close(fd);
  return ok;
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[17];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  return buf;
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  const auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + temp_suffix();

  // O_EXCL|O_NOFOLLOW: never write through a pre-planted file or symlink.
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create {}: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  std::error_code ignored;
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {}", temp_path.string(), written,
                data.size(), std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp_path, ignored);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (!fsync_fd(fd)) {
    LOG_ERROR("atomic_write_file: fsync {} failed: {}", temp_path.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp_path, ignored);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  if (!parent.empty() && !fsync_directory(parent)) {
    // The rename is done; only its durability across a crash is in doubt.
    LOG_WARN("atomic_write_file: fsync of directory {} failed", parent.string());
  }
  return true;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    LOG_ERROR("get_default_datadir: HOME is not set, use --datadir");
    return {};
  }
  return std::filesystem::path(home) / ".hive";
}

}  // namespace util
}  // namespace hive
