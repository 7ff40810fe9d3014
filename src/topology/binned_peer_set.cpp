// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/binned_peer_set.hpp"

#include <algorithm>

namespace hive {
namespace topology {

bool BinnedPeerSet::Add(const swarm::Address& addr, uint8_t bin) {
  if (bin >= swarm::MAX_BINS) {
    return false;
  }
  auto [it, inserted] = index_.emplace(addr, bin);
  if (!inserted) {
    return false;
  }
  bins_[bin].push_back(addr);
  return true;
}

bool BinnedPeerSet::Remove(const swarm::Address& addr, uint8_t bin) {
  auto it = index_.find(addr);
  if (it == index_.end() || it->second != bin) {
    return false;
  }
  auto& peers = bins_[bin];
  peers.erase(std::find(peers.begin(), peers.end(), addr));
  index_.erase(it);
  return true;
}

bool BinnedPeerSet::Exists(const swarm::Address& addr) const {
  return index_.find(addr) != index_.end();
}

std::optional<uint8_t> BinnedPeerSet::BinOf(const swarm::Address& addr) const {
  auto it = index_.find(addr);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t BinnedPeerSet::BinSize(uint8_t bin) const {
  if (bin >= swarm::MAX_BINS) {
    return 0;
  }
  return bins_[bin].size();
}

bool BinnedPeerSet::VisitBin(uint8_t bin, const PeerVisitor& fn, IterationResult& result) const {
  for (const auto& addr : bins_[bin]) {
    switch (fn(addr, bin)) {
      case VisitAction::Continue:
        break;
      case VisitAction::SkipBin:
        return true;
      case VisitAction::Stop:
        result = IterationResult::Stopped;
        return false;
      case VisitAction::Abort:
        result = IterationResult::Aborted;
        return false;
    }
  }
  return true;
}

IterationResult BinnedPeerSet::EachBin(const PeerVisitor& fn) const {
  IterationResult result = IterationResult::Completed;
  for (uint8_t bin = 0; bin < swarm::MAX_BINS; ++bin) {
    if (!VisitBin(bin, fn, result)) {
      break;
    }
  }
  return result;
}

IterationResult BinnedPeerSet::EachBinRev(const PeerVisitor& fn) const {
  IterationResult result = IterationResult::Completed;
  for (int bin = swarm::MAX_BINS - 1; bin >= 0; --bin) {
    if (!VisitBin(static_cast<uint8_t>(bin), fn, result)) {
      break;
    }
  }
  return result;
}

std::optional<uint8_t> BinnedPeerSet::ShallowestEmpty() const {
  int deepest = -1;
  for (int bin = swarm::MAX_BINS - 1; bin >= 0; --bin) {
    if (!bins_[bin].empty()) {
      deepest = bin;
      break;
    }
  }
  for (int bin = 0; bin < deepest; ++bin) {
    if (bins_[bin].empty()) {
      return static_cast<uint8_t>(bin);
    }
  }
  return std::nullopt;
}

std::vector<std::pair<swarm::Address, uint8_t>> BinnedPeerSet::Peers() const {
  std::vector<std::pair<swarm::Address, uint8_t>> out;
  out.reserve(index_.size());
  for (uint8_t bin = 0; bin < swarm::MAX_BINS; ++bin) {
    for (const auto& addr : bins_[bin]) {
      out.emplace_back(addr, bin);
    }
  }
  return out;
}

std::vector<swarm::Address> BinnedPeerSet::BinPeers(uint8_t bin) const {
  if (bin >= swarm::MAX_BINS) {
    return {};
  }
  return bins_[bin];
}

void BinnedPeerSet::Clear() {
  for (auto& peers : bins_) {
    peers.clear();
  }
  index_.clear();
}

}  // namespace topology
}  // namespace hive
