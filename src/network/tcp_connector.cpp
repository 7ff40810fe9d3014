// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_connector.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <future>
#include <vector>

#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

namespace hive {
namespace network {

namespace {

struct DialState {
  explicit DialState(asio::io_context& io_context) : socket(io_context), timer(io_context) {}

  asio::ip::tcp::socket socket;
  asio::steady_timer timer;
  std::promise<std::optional<swarm::Address>> promise;
  bool done{false};  // connect phase finished (network thread only)
};

}  // namespace

TcpConnector::TcpConnector(asio::io_context& io_context, const swarm::Address& local_overlay, const Config& config)
    : io_context_(io_context), local_overlay_(local_overlay), config_(config) {}

TcpConnector::~TcpConnector() {
  Stop();
}

void TcpConnector::SetDisconnectCallback(DisconnectCallback callback) {
  disconnect_callback_ = std::move(callback);
}

std::optional<swarm::Address> TcpConnector::Connect(const std::string& underlay) {
  if (stopped_.load(std::memory_order_acquire)) {
    return std::nullopt;
  }

  std::string ip;
  uint16_t port = 0;
  if (!util::ParseIPPort(underlay, ip, port)) {
    LOG_NET_WARN_RL("refusing to dial malformed underlay '{}'", underlay);
    return std::nullopt;
  }
  asio::error_code ec;
  auto address = asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  const asio::ip::tcp::endpoint endpoint(address, port);

  auto state = std::make_shared<DialState>(io_context_);
  auto result = state->promise.get_future();

  asio::post(io_context_, [this, state, endpoint]() {
    state->timer.expires_after(config_.connect_timeout);
    state->timer.async_wait([state](const asio::error_code& timer_ec) {
      if (timer_ec == asio::error::operation_aborted || state->done) {
        return;
      }
      state->done = true;
      asio::error_code ignored;
      state->socket.close(ignored);
      state->promise.set_value(std::nullopt);
    });

    state->socket.async_connect(endpoint, [this, state, endpoint](const asio::error_code& connect_ec) {
      if (state->done) {
        return;
      }
      state->done = true;
      state->timer.cancel();
      if (connect_ec) {
        LOG_NET_DEBUG("connect to {} failed: {}",
                      util::FormatIPPort(endpoint.address().to_string(), endpoint.port()), connect_ec.message());
        state->promise.set_value(std::nullopt);
        return;
      }

      auto session = OverlaySession::Create(io_context_, std::move(state->socket), local_overlay_, false);
      session->Handshake(config_.handshake_timeout, [this, state, session](std::optional<swarm::Address> remote) {
        if (remote && stopped_.load(std::memory_order_acquire)) {
          session->Close();
          remote.reset();
        }
        if (remote) {
          AdoptSession(session);
        }
        state->promise.set_value(remote);
      });
    });
  });

  const auto wait = config_.connect_timeout + config_.handshake_timeout + std::chrono::seconds(1);
  if (result.wait_for(wait) != std::future_status::ready) {
    LOG_NET_WARN_RL("dial {} did not complete (network thread not running?)", underlay);
    return std::nullopt;
  }
  auto remote = result.get();
  if (remote) {
    LOG_NET_DEBUG("outbound session to {} ({}) established", remote->ShortHex(), underlay);
  }
  return remote;
}

void TcpConnector::AdoptSession(const OverlaySessionPtr& session) {
  const swarm::Address overlay = session->RemoteOverlay();
  OverlaySessionPtr previous;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& slot = sessions_[overlay];
    previous = std::move(slot);
    slot = session;
  }
  if (previous) {
    LOG_NET_DEBUG("replacing existing session to {}", overlay.ShortHex());
    previous->Close();
  }

  std::weak_ptr<OverlaySession> weak = session;
  session->Watch([this, weak](const swarm::Address& remote) {
    if (auto closed = weak.lock()) {
      OnSessionClosed(closed, remote);
    }
  });
}

void TcpConnector::OnSessionClosed(const OverlaySessionPtr& session, const swarm::Address& overlay) {
  if (stopped_.load(std::memory_order_acquire)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(overlay);
    // A replaced session closing is not a disconnect.
    if (it == sessions_.end() || it->second != session) {
      return;
    }
    sessions_.erase(it);
  }

  LOG_NET_INFO("peer {} ({}) disconnected", overlay.ShortHex(), session->RemoteEndpoint());
  if (disconnect_callback_) {
    disconnect_callback_(overlay);
  }
}

void TcpConnector::Stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  std::vector<OverlaySessionPtr> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [overlay, session] : sessions_) {
      sessions.push_back(std::move(session));
    }
    sessions_.clear();
  }
  if (sessions.empty()) {
    return;
  }

  LOG_NET_DEBUG("closing {} outbound sessions", sessions.size());
  asio::post(io_context_, [sessions = std::move(sessions)]() {
    for (const auto& session : sessions) {
      session->Close();
    }
  });
}

size_t TcpConnector::SessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

bool TcpConnector::HasSession(const swarm::Address& overlay) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.find(overlay) != sessions_.end();
}

}  // namespace network
}  // namespace hive
