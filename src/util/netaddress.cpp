// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include <charconv>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace hive {
namespace util {

namespace {

std::optional<uint16_t> ParsePort(const std::string& text) {
  if (text.empty() || text.size() > 5) {
    return std::nullopt;
  }
  unsigned value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

}  // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()).to_string();
  }
  return ip.to_string();
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_text;
  if (address_port.front() == '[') {
    const size_t close = address_port.find(']');
    if (close == std::string::npos || close < 2) {
      return false;
    }
    if (close + 1 >= address_port.size() || address_port[close + 1] != ':') {
      return false;
    }
    host = address_port.substr(1, close - 1);
    port_text = address_port.substr(close + 2);
  } else {
    const size_t colon = address_port.find(':');
    // A second colon means an unbracketed IPv6 address.
    if (colon == std::string::npos || address_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    host = address_port.substr(0, colon);
    port_text = address_port.substr(colon + 1);
  }

  auto port = ParsePort(port_text);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(host);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::string FormatIPPort(const std::string& ip, uint16_t port) {
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]:" + std::to_string(port);
  }
  return ip + ":" + std::to_string(port);
}

}  // namespace util
}  // namespace hive
