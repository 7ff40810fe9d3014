// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Kademlia - connectivity manager for the overlay topology

 Purpose
 - Keep two binned views of the network relative to the node's base address:
   • known: every peer we have been told about (discovery, bootnodes, address book)
   • connected: peers with a live overlay connection (always a subset of known)
 - Decide which known peers to dial, and stop dialing a bin once it holds
   enough connections
 - Track the neighborhood depth: the proximity order at and beyond which the
   node must be connected to everyone it knows

 Reconciliation
 - Any change (new peer, disconnect, removal, successful dial) posts a
   wake-up. Wake-ups are coalesced: at most one pass is queued at a time and
   every pass re-reads current state, so a burst of AddPeer calls costs one pass.
 - A pass walks known peers shallowest bin first and dials each one that is
   not connected and whose bin is not saturated. The lock is released around
   resolution and dialing.
 - Failed resolutions and dials are skipped; the peer stays known and is
   retried on a later pass. There is no backoff.

 Depth
 - With at most nn_low_watermark connected peers the depth is 0.
 - Otherwise, counting connected peers from the deepest bin down, the bin at
   which the count reaches nn_low_watermark is the candidate depth. An empty
   bin shallower than the candidate caps the depth at that bin.

 Saturation
 - Bins at or beyond depth are never saturated: every neighbor is dialed.
 - A shallower bin is saturated once it holds saturation_peers connections.

 Threading
 - All public methods are thread-safe. known_, connected_ and depth_ share
   mutex_, which is never held while calling the resolver or the connector.
 - Reconciliation runs on a private io_context driven by one worker thread.
 - A Disconnected() or Remove() that arrives while the peer is being dialed
   (the transport can lose a session before Connect() returns) drops that
   dial's result, so a lost session is never recorded as connected.
 - Close() stops the worker. A dial in flight completes and its result is
   discarded.
 - The object must not be destroyed from the worker thread, i.e. from inside
   an AddressResolver or Connector callback.
*/

#include "topology/binned_peer_set.hpp"
#include "topology/topology.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json_fwd.hpp>

namespace hive {
namespace topology {

class Kademlia {
public:
  struct Config {
    size_t nn_low_watermark;  // neighbors required before depth moves off 0
    size_t saturation_peers;  // connections that saturate a bin shallower than depth

    Config() : nn_low_watermark(2), saturation_peers(2) {}
  };

  // Counters for diagnostics; monotonically increasing.
  struct Stats {
    uint64_t manage_passes{0};
    uint64_t dial_attempts{0};
    uint64_t dial_successes{0};
    uint64_t dial_failures{0};
    uint64_t resolve_failures{0};
  };

  // `resolver` and `connector` must outlive this object.
  Kademlia(const swarm::Address& base, AddressResolver& resolver, Connector& connector,
           const Config& config = Config{});
  // Closes and joins the worker. Must not run on the worker thread.
  ~Kademlia();

  Kademlia(const Kademlia&) = delete;
  Kademlia& operator=(const Kademlia&) = delete;

  // Launch the reconciliation worker. False if already started or closed.
  bool Start();

  // Register a peer as known and schedule reconciliation.
  TopologyResult AddPeer(const swarm::Address& addr);

  // A connection to `addr` was lost. The peer stays known and will be redialed.
  TopologyResult Disconnected(const swarm::Address& addr);

  // Forget `addr` entirely (known and connected).
  TopologyResult Remove(const swarm::Address& addr);

  uint8_t NeighborhoodDepth() const;

  // Connected peer closest to `target`; nullopt when nothing is connected.
  std::optional<swarm::Address> ClosestPeer(const swarm::Address& target) const;

  // Visit connected peers best score first (ties: nearer to `target` first).
  // Callbacks run without the lock held; exceptions they throw reach the caller.
  IterationResult EachPeerScored(const swarm::Address& target, const ScoreFunc& score_fn,
                                 const std::function<VisitAction(const swarm::Address&)>& visit_fn) const;

  // Terminal and idempotent.
  void Close();
  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

  bool BinSaturated(uint8_t bin) const;

  const swarm::Address& Base() const { return base_; }
  const Config& GetConfig() const { return config_; }
  size_t KnownCount() const;
  size_t ConnectedCount() const;
  bool IsKnown(const swarm::Address& addr) const;
  bool IsConnected(const swarm::Address& addr) const;
  Stats GetStats() const;

  // Point-in-time JSON view of both peer sets.
  nlohmann::json Snapshot() const;
  std::string ToString() const;

private:
  // Queue one reconciliation pass unless one is already pending.
  void NotifyManageLoop();
  void Manage();

  // Resolve and dial one candidate, recording it as connected on success.
  // The caller has registered `peer` in dialing_.
  void ConnectPeer(const swarm::Address& peer, uint8_t bin);

  // Callers hold mutex_. Ends the dial of `peer`; true if it was dropped meanwhile.
  bool FinishDialLocked(const swarm::Address& peer);

  // Callers hold mutex_.
  bool BinSaturatedLocked(uint8_t bin) const;
  uint8_t RecalcDepthLocked() const;

  const swarm::Address base_;
  AddressResolver& resolver_;
  Connector& connector_;
  const Config config_;

  mutable std::mutex mutex_;
  BinnedPeerSet known_;
  BinnedPeerSet connected_;
  uint8_t depth_{0};
  // Peers with a dial in flight -> dropped by Disconnected()/Remove() meanwhile.
  std::unordered_map<swarm::Address, bool, swarm::AddressHasher> dialing_;

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread worker_;
  std::mutex start_stop_mutex_;

  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};
  std::atomic<bool> manage_pending_{false};

  std::atomic<uint64_t> manage_passes_{0};
  std::atomic<uint64_t> dial_attempts_{0};
  std::atomic<uint64_t> dial_successes_{0};
  std::atomic<uint64_t> dial_failures_{0};
  std::atomic<uint64_t> resolve_failures_{0};
};

}  // namespace topology
}  // namespace hive
