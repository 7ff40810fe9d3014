// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 OverlaySession - one TCP connection carrying the overlay greeting

 Wire handshake
 - Each side writes its 32-byte overlay address as the first bytes on the
   connection, then reads the peer's 32 bytes. Nothing else is framed yet.
 - A greeting that is all zero, or equal to our own overlay, fails the
   handshake (self-connection).

 After the handshake the session is watched: reads are drained until the
 peer closes or the socket errors, then the close callback fires once.

 Threading
 - All socket work runs on the io_context passed to Create(). The io_context
   must be driven by a single thread.
*/

#include "swarm/address.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

namespace hive {
namespace network {

class OverlaySession : public std::enable_shared_from_this<OverlaySession> {
public:
  using HandshakeCallback = std::function<void(std::optional<swarm::Address>)>;
  using CloseCallback = std::function<void(const swarm::Address&)>;

  static std::shared_ptr<OverlaySession> Create(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                                const swarm::Address& local_overlay, bool inbound);

  OverlaySession(const OverlaySession&) = delete;
  OverlaySession& operator=(const OverlaySession&) = delete;

  // Exchange greetings. `callback` runs exactly once on the io_context, with
  // the peer's overlay or nullopt on error/timeout (the socket is closed then).
  void Handshake(std::chrono::milliseconds timeout, HandshakeCallback callback);

  // Drain reads until the connection ends; then `callback(remote_overlay)`.
  void Watch(CloseCallback callback);

  void Close();

  bool IsOpen() const { return socket_.is_open(); }
  const swarm::Address& RemoteOverlay() const { return remote_overlay_; }
  const std::string& RemoteEndpoint() const { return remote_endpoint_; }

private:
  OverlaySession(asio::io_context& io_context, asio::ip::tcp::socket socket, const swarm::Address& local_overlay,
                 bool inbound);

  void FinishHandshake(std::optional<swarm::Address> result);
  void ReadSome();

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  const swarm::Address local_overlay_;
  const bool inbound_;  // direction, for logging
  std::string remote_endpoint_;

  std::array<uint8_t, swarm::Address::SIZE> greeting_out_;
  std::array<uint8_t, swarm::Address::SIZE> greeting_in_{};
  std::array<uint8_t, 4096> read_buffer_{};

  swarm::Address remote_overlay_;
  HandshakeCallback handshake_callback_;
  CloseCallback close_callback_;
  bool handshake_done_{false};
  bool close_delivered_{false};
};

using OverlaySessionPtr = std::shared_ptr<OverlaySession>;

}  // namespace network
}  // namespace hive
