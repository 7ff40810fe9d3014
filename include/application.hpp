// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address_book.hpp"
#include "network/overlay_listener.hpp"
#include "network/tcp_connector.hpp"
#include "topology/kademlia.hpp"
#include "util/fs_lock.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace hive {
namespace app {

// A peer to seed the topology with at startup.
struct BootNode {
  swarm::Address overlay;
  std::string underlay;  // IP:port
};

struct AppConfig {
  std::filesystem::path datadir;

  // Overlay address of this node. When unset it is read from <datadir>/overlay,
  // or generated and stored there on first start.
  std::optional<swarm::Address> overlay;

  uint16_t listen_port = 1634;
  bool listen_enabled = true;
  std::vector<BootNode> bootnodes;

  topology::Kademlia::Config topology_config;
  network::TcpConnector::Config connector_config;

  // Topology summary is logged this often; 0 disables it.
  std::chrono::seconds status_interval{60};
  std::chrono::minutes peer_save_interval{15};
};

/**
 * Application - wires the daemon together
 *
 * initialize() builds every component, start() brings them up and seeds the
 * topology, wait_for_shutdown() blocks until SIGINT/SIGTERM, shutdown() tears
 * everything down and persists the address book.
 *
 * Threads: the caller's thread, one network thread running io_context_, and
 * the Kademlia worker.
 */
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  static Application* instance();

  const swarm::Address& overlay() const { return overlay_; }
  topology::Kademlia* kademlia() { return kademlia_.get(); }
  network::AddressBook* address_book() { return address_book_.get(); }
  uint16_t listening_port() const { return listener_ ? listener_->ListeningPort() : 0; }

private:
  bool init_datadir();
  bool init_identity();
  bool init_network();
  void seed_topology();

  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  void schedule_status();
  void report_status();
  void save_peers();

  AppConfig config_;
  swarm::Address overlay_;

  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::unique_ptr<asio::io_context> io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread network_thread_;
  std::unique_ptr<asio::steady_timer> status_timer_;
  std::chrono::steady_clock::time_point last_peer_save_;

  std::unique_ptr<network::AddressBook> address_book_;
  std::unique_ptr<network::TcpConnector> connector_;
  std::unique_ptr<network::OverlayListener> listener_;
  std::unique_ptr<topology::Kademlia> kademlia_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace hive
