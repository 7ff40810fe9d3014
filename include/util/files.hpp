// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace hive {
namespace util {

// Write `data` to `path` atomically: temp file in the same directory, fsync,
// rename over the target, fsync the directory. Creates missing parent
// directories. Returns false (and leaves any existing file untouched) on error.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode = 0644);

// Create `dir` and its parents; true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

// ~/.hive, or an empty path when HOME is not set.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace hive
