// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <csignal>
#include <fstream>
#include <iostream>
#include <random>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace hive {
namespace app {

Application* Application::instance_ = nullptr;

namespace {

swarm::Address RandomOverlay() {
  std::random_device rd;
  std::array<uint8_t, swarm::Address::SIZE> bytes;
  for (auto& b : bytes) {
    b = static_cast<uint8_t>(rd());
  }
  return swarm::Address(bytes);
}

}  // namespace

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  std::cout << GetStartupBanner() << std::flush;

  LOG_APP_INFO("Initializing hive...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }
  if (!init_identity()) {
    LOG_APP_ERROR("Failed to establish overlay address");
    return false;
  }
  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize network");
    return false;
  }

  kademlia_ = std::make_unique<topology::Kademlia>(overlay_, *address_book_, *connector_, config_.topology_config);
  connector_->SetDisconnectCallback([this](const swarm::Address& peer) {
    auto result = kademlia_->Disconnected(peer);
    if (result != topology::TopologyResult::Success) {
      LOG_APP_DEBUG("Disconnected({}) -> {}", peer.ShortHex(), topology::TopologyResultName(result));
    }
  });

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    LOG_APP_ERROR("Data directory is not set. Use --datadir.");
    return false;
  }
  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  std::error_code ec;
  std::filesystem::permissions(config_.datadir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    LOG_APP_WARN("Could not restrict permissions on {}: {}", config_.datadir.string(), ec.message());
  }

  util::LockResult lock_result;
  datadir_lock_ = util::DirectoryLock::Acquire(config_.datadir, lock_result);
  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_APP_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }
  if (lock_result == util::LockResult::ErrorLock) {
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. hived is probably already running.",
                  config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_identity() {
  const auto overlay_file = config_.datadir / "overlay";

  if (config_.overlay) {
    overlay_ = *config_.overlay;
    LOG_APP_INFO("Using overlay address from command line: {}", overlay_.ToHex());
    return true;
  }

  std::ifstream in(overlay_file);
  if (in.is_open()) {
    std::string hex;
    in >> hex;
    auto stored = swarm::Address::FromHex(hex);
    if (!stored || stored->IsZero()) {
      LOG_APP_ERROR("Overlay file {} is corrupted; delete it to generate a new identity", overlay_file.string());
      return false;
    }
    overlay_ = *stored;
    LOG_APP_INFO("Overlay address: {}", overlay_.ToHex());
    return true;
  }

  overlay_ = RandomOverlay();
  if (!util::atomic_write_file(overlay_file, overlay_.ToHex() + "\n", 0600)) {
    LOG_APP_ERROR("Failed to store overlay address in {}", overlay_file.string());
    return false;
  }
  LOG_APP_INFO("Generated new overlay address: {}", overlay_.ToHex());
  return true;
}

bool Application::init_network() {
  io_context_ = std::make_unique<asio::io_context>();

  address_book_ = std::make_unique<network::AddressBook>();
  const std::string peers_file = (config_.datadir / "peers.json").string();
  if (address_book_->Load(peers_file)) {
    LOG_APP_INFO("Address book: {} entries", address_book_->Size());
  }

  connector_ = std::make_unique<network::TcpConnector>(*io_context_, overlay_, config_.connector_config);

  if (config_.listen_enabled) {
    listener_ = std::make_unique<network::OverlayListener>(*io_context_, overlay_,
                                                           config_.connector_config.handshake_timeout);
    listener_->SetInboundCallback([](const swarm::Address& peer, const std::string& endpoint) {
      LOG_APP_INFO("Inbound peer {} from {}", peer.ShortHex(), endpoint);
    });
  }
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting hive...");
  setup_signal_handlers();

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(*io_context_));
  network_thread_ = std::thread([this]() { io_context_->run(); });
  running_ = true;

  if (listener_ && !listener_->Listen(config_.listen_port)) {
    LOG_APP_ERROR("Failed to listen on port {}", config_.listen_port);
    shutdown();
    return false;
  }

  if (!kademlia_->Start()) {
    LOG_APP_ERROR("Failed to start topology manager");
    shutdown();
    return false;
  }

  seed_topology();

  last_peer_save_ = std::chrono::steady_clock::now();
  status_timer_ = std::make_unique<asio::steady_timer>(*io_context_);
  schedule_status();

  LOG_APP_INFO("hive started, overlay {}", overlay_.ToHex());
  if (listener_) {
    LOG_APP_INFO("Listening on port: {}", listener_->ListeningPort());
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::seed_topology() {
  for (const auto& boot : config_.bootnodes) {
    if (!address_book_->Put(boot.overlay, boot.underlay)) {
      LOG_APP_WARN("Ignoring bootnode {}@{}: invalid underlay", boot.overlay.ShortHex(), boot.underlay);
      continue;
    }
    LOG_APP_INFO("Bootnode {} at {}", boot.overlay.ShortHex(), boot.underlay);
  }

  size_t added = 0;
  for (const auto& peer : address_book_->Overlays()) {
    if (kademlia_->AddPeer(peer) == topology::TopologyResult::Success) {
      ++added;
    }
  }
  LOG_APP_INFO("Seeded topology with {} known peers", added);
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down hive...");

  // Topology first: its worker may be blocked in a dial that needs the
  // network thread to finish.
  if (kademlia_) {
    LOG_APP_INFO("Stopping topology manager...");
    kademlia_->Close();
  }

  LOG_APP_INFO("Stopping network...");
  if (work_guard_) {
    work_guard_.reset();
  }
  io_context_->stop();
  if (network_thread_.joinable()) {
    network_thread_.join();
  }
  if (listener_) {
    listener_->Stop();
  }
  if (connector_) {
    connector_->Stop();
  }

  save_peers();

  datadir_lock_.reset();
  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Broken connections must not kill the process.
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    instance_->shutdown_requested_ = true;
  }
}

void Application::schedule_status() {
  if (config_.status_interval.count() <= 0 || !status_timer_) {
    return;
  }
  status_timer_->expires_after(config_.status_interval);
  status_timer_->async_wait([this](const asio::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    report_status();
    if (std::chrono::steady_clock::now() - last_peer_save_ >= config_.peer_save_interval) {
      save_peers();
      last_peer_save_ = std::chrono::steady_clock::now();
    }
    schedule_status();
  });
}

void Application::report_status() {
  const auto stats = kademlia_->GetStats();
  LOG_APP_INFO("topology: depth={} connected={} known={} dials={} ok={} failed={}",
               kademlia_->NeighborhoodDepth(), kademlia_->ConnectedCount(), kademlia_->KnownCount(),
               stats.dial_attempts, stats.dial_successes, stats.dial_failures);
  LOG_APP_DEBUG("topology snapshot:\n{}", kademlia_->ToString());
}

void Application::save_peers() {
  if (!address_book_) {
    return;
  }
  const std::string peers_file = (config_.datadir / "peers.json").string();
  LOG_APP_DEBUG("Saving address book to {}", peers_file);
  if (!address_book_->Save(peers_file)) {
    LOG_APP_ERROR("Failed to save address book");
  }
}

}  // namespace app
}  // namespace hive
