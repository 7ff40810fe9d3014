// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace hive {
namespace util {

std::unique_ptr<DirectoryLock> DirectoryLock::Acquire(const std::filesystem::path& directory, LockResult& result,
                                                      const std::string& name) {
  auto lock_path = directory / name;

  // O_CLOEXEC: a child process must not inherit the lock.
  int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to open lock file {}: {}", lock_path.string(), std::strerror(errno));
    result = LockResult::ErrorWrite;
    return nullptr;
  }

  struct flock fl;
  std::memset(&fl, 0, sizeof(fl));
  fl.l_type = F_WRLCK;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;
  if (fcntl(fd, F_SETLK, &fl) == -1) {
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(), std::strerror(errno));
    close(fd);
    result = LockResult::ErrorLock;
    return nullptr;
  }

  LOG_DEBUG("Acquired directory lock {}", lock_path.string());
  result = LockResult::Success;
  return std::unique_ptr<DirectoryLock>(new DirectoryLock(std::move(lock_path), fd));
}

DirectoryLock::~DirectoryLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

}  // namespace util
}  // namespace hive
