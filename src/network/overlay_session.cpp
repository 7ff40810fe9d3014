// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/overlay_session.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

namespace hive {
namespace network {

std::shared_ptr<OverlaySession> OverlaySession::Create(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                                       const swarm::Address& local_overlay, bool inbound) {
  return std::shared_ptr<OverlaySession>(new OverlaySession(io_context, std::move(socket), local_overlay, inbound));
}

OverlaySession::OverlaySession(asio::io_context& io_context, asio::ip::tcp::socket socket,
                               const swarm::Address& local_overlay, bool inbound)
    : socket_(std::move(socket)), timer_(io_context), local_overlay_(local_overlay), inbound_(inbound),
      greeting_out_(local_overlay.bytes()) {
  asio::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_endpoint_ = util::FormatIPPort(ep.address().to_string(), ep.port());
  }
}

void OverlaySession::Handshake(std::chrono::milliseconds timeout, HandshakeCallback callback) {
  handshake_callback_ = std::move(callback);
  auto self = shared_from_this();

  timer_.expires_after(timeout);
  timer_.async_wait([self](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    LOG_NET_DEBUG("{} handshake with {} timed out", self->inbound_ ? "inbound" : "outbound", self->remote_endpoint_);
    self->FinishHandshake(std::nullopt);
  });

  asio::async_write(socket_, asio::buffer(greeting_out_), [self](const asio::error_code& ec, size_t) {
    if (ec) {
      self->FinishHandshake(std::nullopt);
      return;
    }
    asio::async_read(self->socket_, asio::buffer(self->greeting_in_), [self](const asio::error_code& read_ec, size_t) {
      if (read_ec) {
        LOG_NET_DEBUG("{} handshake read from {} failed: {}", self->inbound_ ? "inbound" : "outbound",
                      self->remote_endpoint_, read_ec.message());
        self->FinishHandshake(std::nullopt);
        return;
      }
      swarm::Address remote(self->greeting_in_);
      if (remote.IsZero() || remote == self->local_overlay_) {
        LOG_NET_WARN_RL("rejecting greeting {} from {}", remote.ShortHex(), self->remote_endpoint_);
        self->FinishHandshake(std::nullopt);
        return;
      }
      self->FinishHandshake(remote);
    });
  });
}

void OverlaySession::FinishHandshake(std::optional<swarm::Address> result) {
  if (handshake_done_) {
    return;
  }
  handshake_done_ = true;
  timer_.cancel();

  if (result) {
    remote_overlay_ = *result;
  } else {
    asio::error_code ec;
    socket_.close(ec);
  }

  auto callback = std::move(handshake_callback_);
  handshake_callback_ = nullptr;
  if (callback) {
    callback(result);
  }
}

void OverlaySession::Watch(CloseCallback callback) {
  close_callback_ = std::move(callback);
  ReadSome();
}

void OverlaySession::ReadSome() {
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(read_buffer_), [self](const asio::error_code& ec, size_t) {
    if (!ec) {
      self->ReadSome();
      return;
    }
    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
      LOG_NET_DEBUG("{} session {} read error: {}", self->inbound_ ? "inbound" : "outbound", self->remote_endpoint_,
                    ec.message());
    }
    asio::error_code ignored;
    self->socket_.close(ignored);
    if (self->close_delivered_) {
      return;
    }
    self->close_delivered_ = true;
    auto callback = std::move(self->close_callback_);
    self->close_callback_ = nullptr;
    if (callback) {
      callback(self->remote_overlay_);
    }
  });
}

void OverlaySession::Close() {
  asio::error_code ec;
  timer_.cancel();
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

}  // namespace network
}  // namespace hive
