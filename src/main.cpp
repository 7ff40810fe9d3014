// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program_name) {
  std::cout << "hived - overlay node with a Kademlia topology manager\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --datadir=<path>           Data directory (default: ~/.hive)\n"
            << "  --overlay=<hex>            Overlay address, 64 hex characters\n"
            << "                             (default: stored in <datadir>/overlay)\n"
            << "  --listen=<port>            Listen port (default: 1634)\n"
            << "  --nolisten                 Do not accept inbound connections\n"
            << "  --bootnode=<hex>@<ip:port> Seed peer; may be repeated\n"
            << "  --nnlowwatermark=<n>       Neighbors required for depth > 0 (default: 2)\n"
            << "  --saturationpeers=<n>      Connections that saturate a shallow bin (default: 2)\n"
            << "  --dialtimeout=<ms>         Connect timeout per dial (default: 5000)\n"
            << "  --statusinterval=<s>       Topology status log interval, 0 = off (default: 60)\n"
            << "  --loglevel=<level>         trace, debug, info, warn, error, off (default: info)\n"
            << "  --debug=<component>[:<level>]  Per-component level: network, topology, app, all\n"
            << "  --version                  Show version information\n"
            << "  --help                     Show this help message\n"
            << std::endl;
}

template <typename T>
bool ParseNumber(const std::string& text, T& out) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return !text.empty() && ec == std::errc() && ptr == last;
}

bool ParseBootNode(const std::string& value, hive::app::BootNode& out) {
  const size_t at = value.find('@');
  if (at == std::string::npos) {
    return false;
  }
  auto overlay = hive::swarm::Address::FromHex(value.substr(0, at));
  if (!overlay) {
    return false;
  }
  std::string ip;
  uint16_t port = 0;
  const std::string underlay = value.substr(at + 1);
  if (!hive::util::ParseIPPort(underlay, ip, port)) {
    return false;
  }
  out.overlay = *overlay;
  out.underlay = hive::util::FormatIPPort(ip, port);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    hive::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_flags;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << hive::GetFullVersionString() << std::endl;
        std::cout << hive::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--datadir=")) {
        config.datadir = arg.substr(10);
        if (config.datadir.empty()) {
          std::cerr << "Error: --datadir requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--overlay=")) {
        auto overlay = hive::swarm::Address::FromHex(arg.substr(10));
        if (!overlay || overlay->IsZero()) {
          std::cerr << "Error: --overlay expects 64 hex characters (non-zero)\n";
          return 1;
        }
        config.overlay = *overlay;
      } else if (arg.starts_with("--listen=")) {
        if (!ParseNumber(arg.substr(9), config.listen_port)) {
          std::cerr << "Error: invalid --listen port\n";
          return 1;
        }
      } else if (arg == "--nolisten") {
        config.listen_enabled = false;
      } else if (arg.starts_with("--bootnode=")) {
        hive::app::BootNode boot;
        if (!ParseBootNode(arg.substr(11), boot)) {
          std::cerr << "Error: --bootnode expects <overlayhex>@<ip:port>, got '" << arg.substr(11) << "'\n";
          return 1;
        }
        config.bootnodes.push_back(boot);
      } else if (arg.starts_with("--nnlowwatermark=")) {
        if (!ParseNumber(arg.substr(17), config.topology_config.nn_low_watermark)) {
          std::cerr << "Error: invalid --nnlowwatermark\n";
          return 1;
        }
      } else if (arg.starts_with("--saturationpeers=")) {
        if (!ParseNumber(arg.substr(18), config.topology_config.saturation_peers)) {
          std::cerr << "Error: invalid --saturationpeers\n";
          return 1;
        }
      } else if (arg.starts_with("--dialtimeout=")) {
        unsigned ms = 0;
        if (!ParseNumber(arg.substr(14), ms) || ms == 0) {
          std::cerr << "Error: invalid --dialtimeout\n";
          return 1;
        }
        config.connector_config.connect_timeout = std::chrono::milliseconds(ms);
      } else if (arg.starts_with("--statusinterval=")) {
        unsigned seconds = 0;
        if (!ParseNumber(arg.substr(17), seconds)) {
          std::cerr << "Error: invalid --statusinterval\n";
          return 1;
        }
        config.status_interval = std::chrono::seconds(seconds);
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--debug=")) {
        debug_flags.push_back(arg.substr(8));
      } else {
        std::cerr << "Error: unknown option '" << arg << "'\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (config.datadir.empty()) {
      config.datadir = hive::util::get_default_datadir();
      if (config.datadir.empty()) {
        std::cerr << "Error: HOME environment variable not set.\n"
                  << "Please set HOME or use --datadir explicitly.\n";
        return 1;
      }
    }
    if (!hive::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: cannot create data directory " << config.datadir << "\n";
      return 1;
    }

    hive::util::LogManager::Initialize(log_level, true, (config.datadir / "debug.log").string());
    for (const auto& flag : debug_flags) {
      const size_t colon = flag.find(':');
      const std::string component = flag.substr(0, colon);
      const std::string level = colon == std::string::npos ? "debug" : flag.substr(colon + 1);
      if (component == "all") {
        hive::util::LogManager::SetLogLevel(level);
      } else if (!hive::util::LogManager::SetComponentLevel(component, level)) {
        std::cerr << "Warning: unknown log component '" << component << "'\n";
      }
    }

    hive::app::Application app(config);
    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      hive::util::LogManager::Shutdown();
      return 1;
    }
    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      hive::util::LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();
    hive::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
