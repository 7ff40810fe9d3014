// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TcpConnector - Connector over plain TCP with the overlay greeting

 Connect() is called from the topology worker and blocks it: the dial itself
 (async connect, greeting exchange, timeouts) runs on the network io_context
 and the caller waits for the outcome. The network io_context must be run by
 some other thread, one thread only.

 Established sessions are kept and watched. When the remote side goes away
 the disconnect callback is invoked with its overlay (on the network thread);
 the daemon forwards it to Kademlia::Disconnected. Stop() closes every session
 without invoking the callback.
*/

#include "network/overlay_session.hpp"
#include "topology/topology.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>

#include <asio/io_context.hpp>

namespace hive {
namespace network {

class TcpConnector : public topology::Connector {
public:
  using DisconnectCallback = std::function<void(const swarm::Address&)>;

  struct Config {
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds handshake_timeout;

    Config() : connect_timeout(std::chrono::seconds(5)), handshake_timeout(std::chrono::seconds(5)) {}
  };

  // `io_context` must outlive this object.
  TcpConnector(asio::io_context& io_context, const swarm::Address& local_overlay, const Config& config = Config{});
  ~TcpConnector() override;

  TcpConnector(const TcpConnector&) = delete;
  TcpConnector& operator=(const TcpConnector&) = delete;

  // Dial "IP:port" and return the overlay the remote side announced.
  std::optional<swarm::Address> Connect(const std::string& underlay) override;

  // Set before the first Connect().
  void SetDisconnectCallback(DisconnectCallback callback);

  // Close every session. Later Connect() calls fail.
  void Stop();

  size_t SessionCount() const;
  bool HasSession(const swarm::Address& overlay) const;

private:
  // Network thread only.
  void AdoptSession(const OverlaySessionPtr& session);
  void OnSessionClosed(const OverlaySessionPtr& session, const swarm::Address& overlay);

  asio::io_context& io_context_;
  const swarm::Address local_overlay_;
  const Config config_;

  DisconnectCallback disconnect_callback_;
  std::atomic<bool> stopped_{false};

  mutable std::mutex sessions_mutex_;
  std::map<swarm::Address, OverlaySessionPtr> sessions_;
};

}  // namespace network
}  // namespace hive
