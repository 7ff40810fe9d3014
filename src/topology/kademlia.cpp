// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/kademlia.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <cassert>
#include <exception>
#include <vector>

#include <asio/post.hpp>
#include <nlohmann/json.hpp>

namespace hive {
namespace topology {

using swarm::Address;

const char* TopologyResultName(TopologyResult result) {
  switch (result) {
    case TopologyResult::Success:
      return "success";
    case TopologyResult::AlreadyKnown:
      return "already known";
    case TopologyResult::InvalidAddress:
      return "invalid address";
    case TopologyResult::Closed:
      return "closed";
  }
  return "unknown";
}

Kademlia::Kademlia(const Address& base, AddressResolver& resolver, Connector& connector, const Config& config)
    : base_(base), resolver_(resolver), connector_(connector), config_(config) {}

Kademlia::~Kademlia() {
  assert(worker_.get_id() != std::this_thread::get_id() && "Kademlia destroyed from its own worker thread");
  Close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool Kademlia::Start() {
  std::lock_guard<std::mutex> guard(start_stop_mutex_);
  if (closed_.load(std::memory_order_acquire) || started_.load(std::memory_order_acquire)) {
    return false;
  }

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  worker_ = std::thread([this]() { io_context_.run(); });
  started_.store(true, std::memory_order_release);

  LOG_TOPO_INFO("Kademlia started: base={} nn_low_watermark={} saturation_peers={}", base_.ToHex(),
                config_.nn_low_watermark, config_.saturation_peers);

  // Peers added before Start() already queued a pass; this covers the empty case.
  NotifyManageLoop();
  return true;
}

void Kademlia::Close() {
  std::lock_guard<std::mutex> guard(start_stop_mutex_);
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  if (work_guard_) {
    work_guard_.reset();
  }
  io_context_.stop();

  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
  LOG_TOPO_DEBUG("Kademlia closed");
}

TopologyResult Kademlia::AddPeer(const Address& addr) {
  if (closed_.load(std::memory_order_acquire)) {
    return TopologyResult::Closed;
  }
  if (addr == base_) {
    LOG_TOPO_DEBUG("AddPeer: refusing own base address");
    return TopologyResult::InvalidAddress;
  }

  const uint8_t po = swarm::Proximity(base_, addr);
  bool added;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    added = !known_.Exists(addr) && known_.Add(addr, po);
  }

  NotifyManageLoop();
  if (!added) {
    LOG_TOPO_TRACE("AddPeer: {} already known", addr.ShortHex());
    return TopologyResult::AlreadyKnown;
  }
  LOG_TOPO_DEBUG("AddPeer: {} bin {}", addr.ShortHex(), po);
  return TopologyResult::Success;
}

TopologyResult Kademlia::Disconnected(const Address& addr) {
  if (closed_.load(std::memory_order_acquire)) {
    return TopologyResult::Closed;
  }

  const uint8_t po = swarm::Proximity(base_, addr);
  uint8_t depth;
  bool removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = connected_.Remove(addr, po);
    auto dialing = dialing_.find(addr);
    if (dialing != dialing_.end()) {
      dialing->second = true;
    }
    depth_ = RecalcDepthLocked();
    depth = depth_;
  }

  if (removed) {
    LOG_TOPO_DEBUG("Disconnected: {} bin {}, depth now {}", addr.ShortHex(), po, depth);
  }
  NotifyManageLoop();
  return TopologyResult::Success;
}

TopologyResult Kademlia::Remove(const Address& addr) {
  if (closed_.load(std::memory_order_acquire)) {
    return TopologyResult::Closed;
  }

  const uint8_t po = swarm::Proximity(base_, addr);
  uint8_t depth;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.Remove(addr, po);
    known_.Remove(addr, po);
    auto dialing = dialing_.find(addr);
    if (dialing != dialing_.end()) {
      dialing->second = true;
    }
    depth_ = RecalcDepthLocked();
    depth = depth_;
  }

  LOG_TOPO_DEBUG("Remove: {} bin {}, depth now {}", addr.ShortHex(), po, depth);
  NotifyManageLoop();
  return TopologyResult::Success;
}

void Kademlia::NotifyManageLoop() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  if (manage_pending_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  asio::post(io_context_, [this]() {
    manage_pending_.store(false, std::memory_order_release);
    Manage();
  });
}

void Kademlia::Manage() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  manage_passes_.fetch_add(1, std::memory_order_relaxed);

  std::vector<std::pair<Address, uint8_t>> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates = known_.Peers();
  }

  for (const auto& [peer, bin] : candidates) {
    if (closed_.load(std::memory_order_acquire)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!known_.Exists(peer) || connected_.Exists(peer) || BinSaturatedLocked(bin)) {
        continue;
      }
      dialing_[peer] = false;
    }
    ConnectPeer(peer, bin);
  }
}

void Kademlia::ConnectPeer(const Address& peer, uint8_t bin) {
  std::optional<std::string> underlay;
  try {
    underlay = resolver_.Get(peer);
  } catch (const std::exception& e) {
    LOG_TOPO_WARN_RL("Address resolution for {} threw: {}", peer.ShortHex(), e.what());
  }
  if (!underlay) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      FinishDialLocked(peer);
    }
    resolve_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_TOPO_DEBUG("No underlay for peer {}, skipping", peer.ShortHex());
    return;
  }

  dial_attempts_.fetch_add(1, std::memory_order_relaxed);
  std::optional<Address> confirmed;
  try {
    confirmed = connector_.Connect(*underlay);
  } catch (const std::exception& e) {
    LOG_TOPO_WARN_RL("Dial {} ({}) threw: {}", peer.ShortHex(), *underlay, e.what());
  }

  bool dropped;
  uint8_t depth = 0;
  bool recorded = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = FinishDialLocked(peer);
    if (!closed_.load(std::memory_order_acquire) && confirmed && *confirmed == peer && !dropped &&
        known_.Exists(peer)) {
      connected_.Add(peer, bin);
      depth_ = RecalcDepthLocked();
      depth = depth_;
      recorded = true;
    }
  }

  if (recorded) {
    dial_successes_.fetch_add(1, std::memory_order_relaxed);
    LOG_TOPO_DEBUG("Connected to {} ({}) bin {}, depth now {}", peer.ShortHex(), *underlay, bin, depth);
    NotifyManageLoop();
    return;
  }

  if (closed_.load(std::memory_order_acquire)) {
    LOG_TOPO_DEBUG("Discarding dial result for {}: closed", peer.ShortHex());
    return;
  }
  if (!confirmed) {
    dial_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_TOPO_DEBUG_RL("Dial {} ({}) failed", peer.ShortHex(), *underlay);
    return;
  }
  if (*confirmed != peer) {
    dial_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_TOPO_WARN_RL("Dial {} reached overlay {} instead", peer.ShortHex(), confirmed->ShortHex());
    return;
  }
  // Disconnected() or Remove() arrived before the dial returned.
  LOG_TOPO_DEBUG("Peer {} dropped while dialing, discarding result", peer.ShortHex());
  NotifyManageLoop();
}

bool Kademlia::FinishDialLocked(const Address& peer) {
  auto it = dialing_.find(peer);
  if (it == dialing_.end()) {
    return false;
  }
  const bool dropped = it->second;
  dialing_.erase(it);
  return dropped;
}

bool Kademlia::BinSaturatedLocked(uint8_t bin) const {
  if (bin >= depth_) {
    return false;
  }
  return connected_.BinSize(bin) >= config_.saturation_peers;
}

bool Kademlia::BinSaturated(uint8_t bin) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return BinSaturatedLocked(bin);
}

uint8_t Kademlia::RecalcDepthLocked() const {
  if (connected_.Length() <= config_.nn_low_watermark) {
    return 0;
  }

  size_t seen = 0;
  uint8_t candidate = 0;
  connected_.EachBinRev([&](const Address&, uint8_t bin) {
    ++seen;
    if (seen >= config_.nn_low_watermark) {
      candidate = bin;
      return VisitAction::Stop;
    }
    return VisitAction::Continue;
  });

  auto hole = connected_.ShallowestEmpty();
  if (!hole || *hole > candidate) {
    return candidate;
  }
  return *hole;
}

uint8_t Kademlia::NeighborhoodDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return depth_;
}

std::optional<Address> Kademlia::ClosestPeer(const Address& target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<Address> best;
  uint8_t best_po = 0;
  connected_.EachBin([&](const Address& peer, uint8_t) {
    const uint8_t po = swarm::Proximity(target, peer);
    if (!best || po > best_po || (po == best_po && swarm::DistanceCmp(target, peer, *best) > 0)) {
      best = peer;
      best_po = po;
    }
    return VisitAction::Continue;
  });
  return best;
}

IterationResult Kademlia::EachPeerScored(const Address& target, const ScoreFunc& score_fn,
                                         const std::function<VisitAction(const Address&)>& visit_fn) const {
  std::vector<std::pair<Address, uint8_t>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = connected_.Peers();
  }

  struct Scored {
    Address addr;
    double score;
    uint8_t po;
  };
  std::vector<Scored> scored;
  scored.reserve(snapshot.size());
  for (const auto& [peer, bin] : snapshot) {
    scored.push_back(Scored{peer, score_fn(peer), swarm::Proximity(target, peer)});
  }

  std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.po > b.po;
  });

  for (const auto& entry : scored) {
    switch (visit_fn(entry.addr)) {
      case VisitAction::Continue:
      case VisitAction::SkipBin:
        break;
      case VisitAction::Stop:
        return IterationResult::Stopped;
      case VisitAction::Abort:
        return IterationResult::Aborted;
    }
  }
  return IterationResult::Completed;
}

size_t Kademlia::KnownCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_.Length();
}

size_t Kademlia::ConnectedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_.Length();
}

bool Kademlia::IsKnown(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_.Exists(addr);
}

bool Kademlia::IsConnected(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_.Exists(addr);
}

Kademlia::Stats Kademlia::GetStats() const {
  Stats stats;
  stats.manage_passes = manage_passes_.load(std::memory_order_relaxed);
  stats.dial_attempts = dial_attempts_.load(std::memory_order_relaxed);
  stats.dial_successes = dial_successes_.load(std::memory_order_relaxed);
  stats.dial_failures = dial_failures_.load(std::memory_order_relaxed);
  stats.resolve_failures = resolve_failures_.load(std::memory_order_relaxed);
  return stats;
}

nlohmann::json Kademlia::Snapshot() const {
  nlohmann::json out;
  out["base"] = base_.ToHex();
  out["timestamp"] = util::GetTime();
  out["nn_low_watermark"] = config_.nn_low_watermark;

  std::lock_guard<std::mutex> lock(mutex_);
  out["population"] = known_.Length();
  out["connected"] = connected_.Length();
  out["depth"] = depth_;

  nlohmann::json bins = nlohmann::json::array();
  for (uint8_t bin = 0; bin < swarm::MAX_BINS; ++bin) {
    nlohmann::json known_peers = nlohmann::json::array();
    for (const auto& addr : known_.BinPeers(bin)) {
      known_peers.push_back(addr.ToHex());
    }
    nlohmann::json connected_peers = nlohmann::json::array();
    for (const auto& addr : connected_.BinPeers(bin)) {
      connected_peers.push_back(addr.ToHex());
    }
    bins.push_back({{"bin", bin},
                    {"known", known_.BinSize(bin)},
                    {"connected", connected_.BinSize(bin)},
                    {"known_peers", std::move(known_peers)},
                    {"connected_peers", std::move(connected_peers)}});
  }
  out["bins"] = std::move(bins);
  return out;
}

std::string Kademlia::ToString() const {
  return Snapshot().dump(2);
}

}  // namespace topology
}  // namespace hive
