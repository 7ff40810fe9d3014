// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "topology/topology.hpp"

#include <array>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hive {
namespace topology {

/**
 * BinnedPeerSet - overlay addresses grouped by proximity bin
 *
 * Each bin keeps its peers in insertion order. An address is stored at most
 * once across all bins; the bin it was added under is remembered so Exists()
 * does not need the caller to know it.
 *
 * Not synchronized. The owner (Kademlia) serializes access with its mutex.
 */
class BinnedPeerSet {
public:
  // False if `addr` is already present or `bin` is out of range.
  bool Add(const swarm::Address& addr, uint8_t bin);

  // False if `addr` is not stored in `bin`.
  bool Remove(const swarm::Address& addr, uint8_t bin);

  bool Exists(const swarm::Address& addr) const;
  std::optional<uint8_t> BinOf(const swarm::Address& addr) const;

  size_t Length() const { return index_.size(); }
  size_t BinSize(uint8_t bin) const;

  // Shallowest bin first.
  IterationResult EachBin(const PeerVisitor& fn) const;
  // Deepest bin first.
  IterationResult EachBinRev(const PeerVisitor& fn) const;

  // Lowest empty bin strictly shallower than the deepest occupied bin.
  // nullopt when the occupied bins form a contiguous run starting at 0, or
  // when the set is empty.
  std::optional<uint8_t> ShallowestEmpty() const;

  // Ascending-bin copy of the contents.
  std::vector<std::pair<swarm::Address, uint8_t>> Peers() const;
  std::vector<swarm::Address> BinPeers(uint8_t bin) const;

  void Clear();

private:
  // False when the visitor ended the traversal; `result` then says how.
  bool VisitBin(uint8_t bin, const PeerVisitor& fn, IterationResult& result) const;

  std::array<std::vector<swarm::Address>, swarm::MAX_BINS> bins_;
  std::unordered_map<swarm::Address, uint8_t, swarm::AddressHasher> index_;
};

}  // namespace topology
}  // namespace hive
