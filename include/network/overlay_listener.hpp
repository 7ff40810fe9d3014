// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// OverlayListener - accepts inbound TCP connections and answers the overlay
// greeting. Inbound peers are held open until they disconnect; they are not
// reported to the topology (their source port is not dialable).

#include "network/overlay_session.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace hive {
namespace network {

class OverlayListener {
public:
  // Called on the network thread after a successful inbound handshake.
  using InboundCallback = std::function<void(const swarm::Address& overlay, const std::string& endpoint)>;

  OverlayListener(asio::io_context& io_context, const swarm::Address& local_overlay,
                  std::chrono::milliseconds handshake_timeout = std::chrono::seconds(5));
  ~OverlayListener();

  OverlayListener(const OverlayListener&) = delete;
  OverlayListener& operator=(const OverlayListener&) = delete;

  // Bind (dual-stack when available) and start accepting. Port 0 picks an
  // ephemeral port; see ListeningPort().
  bool Listen(uint16_t port);

  void SetInboundCallback(InboundCallback callback) { inbound_callback_ = std::move(callback); }

  // Close the acceptor and every inbound session.
  void Stop();

  uint16_t ListeningPort() const { return listening_port_.load(std::memory_order_acquire); }
  size_t SessionCount() const;

private:
  void StartAccept();
  void HandleAccept(const asio::error_code& ec, asio::ip::tcp::socket socket);
  void Forget(const OverlaySessionPtr& session);

  asio::io_context& io_context_;
  const swarm::Address local_overlay_;
  const std::chrono::milliseconds handshake_timeout_;

  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::atomic<uint16_t> listening_port_{0};
  InboundCallback inbound_callback_;

  mutable std::mutex sessions_mutex_;
  std::set<OverlaySessionPtr> sessions_;
};

}  // namespace network
}  // namespace hive
