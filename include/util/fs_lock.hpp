// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace hive {
namespace util {

enum class LockResult {
  Success,
  ErrorWrite,  // lock file could not be created
  ErrorLock,   // another process holds the lock
};

/**
 * DirectoryLock - exclusive fcntl() lock on <dir>/<name>
 *
 * Keeps two daemons from sharing a data directory. The lock is released when
 * the object is destroyed (closing the descriptor drops the fcntl lock).
 * POSIX only.
 */
class DirectoryLock {
public:
  // nullptr on failure, with the reason in `result`.
  static std::unique_ptr<DirectoryLock> Acquire(const std::filesystem::path& directory, LockResult& result,
                                                const std::string& name = ".lock");

  ~DirectoryLock();

  DirectoryLock(const DirectoryLock&) = delete;
  DirectoryLock& operator=(const DirectoryLock&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  DirectoryLock(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

  std::filesystem::path path_;
  int fd_;
};

}  // namespace util
}  // namespace hive
