// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Shared topology types and the contracts the connectivity manager consumes.

#include "swarm/address.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace hive {
namespace topology {

// Outcome of a mutating topology operation.
enum class TopologyResult {
  Success,
  AlreadyKnown,    // peer was registered before; nothing changed
  InvalidAddress,  // e.g. the node's own base address
  Closed,          // manager has been shut down
};

const char* TopologyResultName(TopologyResult result);

// Returned by traversal callbacks.
enum class VisitAction {
  Continue,
  SkipBin,  // skip the remaining peers of the current bin
  Stop,     // end traversal, no error
  Abort,    // end traversal, error
};

enum class IterationResult {
  Completed,
  Stopped,
  Aborted,
};

using PeerVisitor = std::function<VisitAction(const swarm::Address& addr, uint8_t bin)>;
using ScoreFunc = std::function<double(const swarm::Address& addr)>;

/**
 * Connector - establishes an overlay connection to a peer
 *
 * Connect() may block for as long as the dial takes. On success it returns
 * the overlay address the remote side confirmed during the handshake; the
 * caller checks it against the peer it meant to reach.
 */
class Connector {
public:
  virtual ~Connector() = default;
  virtual std::optional<swarm::Address> Connect(const std::string& underlay) = 0;
};

/**
 * AddressResolver - maps overlay addresses to dialable underlay addresses
 *
 * nullopt means the overlay is unknown to the resolver.
 */
class AddressResolver {
public:
  virtual ~AddressResolver() = default;
  virtual std::optional<std::string> Get(const swarm::Address& overlay) = 0;
};

}  // namespace topology
}  // namespace hive
