// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Underlay address helpers

 Underlay (transport) addresses are carried as "IP:port" strings, with IPv6
 written as "[IPv6]:port". Only numeric IPs are accepted; hostnames are not
 resolved. IPv4-mapped IPv6 addresses are normalized to plain IPv4 so that
 one endpoint has exactly one spelling.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace hive {
namespace util {

// Canonical form of a numeric IP, or nullopt if `address` is not one.
//   "192.168.1.1"        -> "192.168.1.1"
//   "::ffff:192.168.1.1" -> "192.168.1.1"
//   "2001:DB8::1"        -> "2001:db8::1"
//   "localhost"          -> nullopt
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

// Parse "IP:port" / "[IPv6]:port". Port 0 and trailing garbage are rejected.
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

// Inverse of ParseIPPort (brackets IPv6).
std::string FormatIPPort(const std::string& ip, uint16_t port);

}  // namespace util
}  // namespace hive
