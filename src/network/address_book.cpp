// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address_book.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace hive {
namespace network {

namespace {

std::optional<std::string> NormalizeUnderlay(const std::string& underlay) {
  std::string ip;
  uint16_t port = 0;
  if (!util::ParseIPPort(underlay, ip, port)) {
    return std::nullopt;
  }
  return util::FormatIPPort(ip, port);
}

}  // namespace

bool AddressBook::Put(const swarm::Address& overlay, const std::string& underlay) {
  if (overlay.IsZero()) {
    return false;
  }
  auto normalized = NormalizeUnderlay(underlay);
  if (!normalized) {
    LOG_NET_DEBUG("AddressBook: rejecting underlay '{}' for {}", underlay, overlay.ShortHex());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_[overlay] = *normalized;
  return true;
}

std::optional<std::string> AddressBook::Get(const swarm::Address& overlay) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(overlay);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool AddressBook::Remove(const swarm::Address& overlay) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(overlay) > 0;
}

std::vector<swarm::Address> AddressBook::Overlays() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<swarm::Address> out;
  out.reserve(entries_.size());
  for (const auto& [overlay, underlay] : entries_) {
    out.push_back(overlay);
  }
  return out;
}

size_t AddressBook::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void AddressBook::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

bool AddressBook::Save(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);
  using json = nlohmann::json;

  try {
    json root;
    root["version"] = FILE_VERSION;
    json entries = json::array();
    for (const auto& [overlay, underlay] : entries_) {
      entries.push_back({{"overlay", overlay.ToHex()}, {"underlay", underlay}});
    }
    root["entries"] = std::move(entries);

    // Owner-only: the file reveals who we talk to.
    if (!util::atomic_write_file(filepath, root.dump(2), 0600)) {
      LOG_NET_ERROR("Failed to save address book to {}", filepath);
      return false;
    }
    LOG_NET_DEBUG("saved {} address book entries to {}", entries_.size(), filepath);
    return true;

  } catch (const std::exception& e) {
    LOG_NET_ERROR("Exception during AddressBook::Save: {}", e.what());
    return false;
  }
}

bool AddressBook::Load(const std::string& filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  using json = nlohmann::json;

  try {
    std::ifstream file(filepath);
    if (!file.is_open()) {
      LOG_NET_DEBUG("address book not found: {} (starting fresh)", filepath);
      return false;
    }

    json root;
    file >> root;

    const int version = root.value("version", 0);
    if (version != FILE_VERSION) {
      LOG_NET_ERROR("Unsupported address book version {} in {}", version, filepath);
      entries_.clear();
      return false;
    }

    entries_.clear();
    size_t skipped = 0;
    for (const auto& entry : root.value("entries", json::array())) {
      if (!entry.is_object() || !entry.contains("overlay") || !entry["overlay"].is_string() ||
          !entry.contains("underlay") || !entry["underlay"].is_string()) {
        ++skipped;
        continue;
      }
      auto overlay = swarm::Address::FromHex(entry.value("overlay", ""));
      auto underlay = NormalizeUnderlay(entry.value("underlay", ""));
      if (!overlay || overlay->IsZero() || !underlay) {
        ++skipped;
        continue;
      }
      entries_[*overlay] = *underlay;
    }

    if (skipped > 0) {
      LOG_NET_WARN("skipped {} invalid address book entries in {}", skipped, filepath);
    }
    LOG_NET_INFO("loaded {} address book entries from {}", entries_.size(), filepath);
    return true;

  } catch (const std::exception& e) {
    LOG_NET_ERROR("Exception during AddressBook::Load: {}", e.what());
    entries_.clear();
    return false;
  }
}

}  // namespace network
}  // namespace hive
