// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressBook - overlay → underlay mapping for dialing

 Purpose
 - Remember where each overlay address can be reached ("IP:port")
 - Serve as the AddressResolver of the Kademlia manager
 - Persist across restarts as peers.json in the data directory

 File format (version 1)
   {
     "version": 1,
     "entries": [ { "overlay": "<64 hex>", "underlay": "1.2.3.4:1634" }, ... ]
   }
 Entries that fail validation are skipped on load. A file that does not
 parse, or has an unsupported version, loads as failure and leaves the book
 empty.

 Threading
 - All methods take mutex_; safe to call from the topology worker, the
   network thread and the application thread.
*/

#include "topology/topology.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hive {
namespace network {

class AddressBook : public topology::AddressResolver {
public:
  static constexpr int FILE_VERSION = 1;

  AddressBook() = default;

  // Record (or replace) the underlay of `overlay`. The underlay must parse as
  // IP:port and is stored normalized. False for a zero overlay or bad underlay.
  bool Put(const swarm::Address& overlay, const std::string& underlay);

  std::optional<std::string> Get(const swarm::Address& overlay) override;

  bool Remove(const swarm::Address& overlay);

  std::vector<swarm::Address> Overlays() const;
  size_t Size() const;
  void Clear();

  bool Save(const std::string& filepath) const;
  bool Load(const std::string& filepath);

private:
  mutable std::mutex mutex_;
  std::map<swarm::Address, std::string> entries_;
};

}  // namespace network
}  // namespace hive
