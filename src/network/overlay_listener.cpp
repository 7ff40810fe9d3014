// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/overlay_listener.hpp"

#include "util/logging.hpp"

#include <vector>

#include <asio/post.hpp>

namespace hive {
namespace network {

using asio::ip::tcp;

OverlayListener::OverlayListener(asio::io_context& io_context, const swarm::Address& local_overlay,
                                 std::chrono::milliseconds handshake_timeout)
    : io_context_(io_context), local_overlay_(local_overlay), handshake_timeout_(handshake_timeout) {}

OverlayListener::~OverlayListener() {
  Stop();
}

bool OverlayListener::Listen(uint16_t port) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Dual-stack first; some hosts have IPv6 disabled.
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    } catch (const std::exception&) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    }

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_.store(ec ? 0 : ep.port(), std::memory_order_release);

    LOG_NET_INFO("listening for overlay connections on port {}", ListeningPort());
    StartAccept();
    return true;

  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void OverlayListener::StartAccept() {
  if (!acceptor_) {
    return;
  }
  acceptor_->async_accept(
      [this](const asio::error_code& ec, tcp::socket socket) { HandleAccept(ec, std::move(socket)); });
}

void OverlayListener::HandleAccept(const asio::error_code& ec, tcp::socket socket) {
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      StartAccept();
    }
    return;
  }

  auto session = OverlaySession::Create(io_context_, std::move(socket), local_overlay_, true);
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(session);
  }

  std::weak_ptr<OverlaySession> weak = session;
  session->Handshake(handshake_timeout_, [this, weak](std::optional<swarm::Address> remote) {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    if (!remote) {
      Forget(self);
      return;
    }
    LOG_NET_DEBUG("inbound session from {} ({})", remote->ShortHex(), self->RemoteEndpoint());
    if (inbound_callback_) {
      inbound_callback_(*remote, self->RemoteEndpoint());
    }
    self->Watch([this, weak](const swarm::Address& overlay) {
      if (auto closed = weak.lock()) {
        LOG_NET_DEBUG("inbound peer {} went away", overlay.ShortHex());
        Forget(closed);
      }
    });
  });

  StartAccept();
}

void OverlayListener::Forget(const OverlaySessionPtr& session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(session);
}

void OverlayListener::Stop() {
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listening_port_.store(0, std::memory_order_release);

  std::vector<OverlaySessionPtr> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.assign(sessions_.begin(), sessions_.end());
    sessions_.clear();
  }
  for (const auto& session : sessions) {
    session->Close();
  }
}

size_t OverlayListener::SessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

}  // namespace network
}  // namespace hive
