// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#define HIVE_VERSION_MAJOR 0
#define HIVE_VERSION_MINOR 3
#define HIVE_VERSION_PATCH 0

namespace hive {

inline std::string GetVersionString() {
  return std::to_string(HIVE_VERSION_MAJOR) + "." + std::to_string(HIVE_VERSION_MINOR) + "." +
         std::to_string(HIVE_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "hived version v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\n"
         "Distributed under the MIT software license";
}

inline std::string GetStartupBanner() {
  return "\n"
         "  hive overlay node v" + GetVersionString() + "\n"
         "  Kademlia topology manager\n"
         "\n";
}

}  // namespace hive
