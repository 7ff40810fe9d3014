// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "swarm/address.hpp"

#include <algorithm>
#include <cstring>

namespace hive {
namespace swarm {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<Address> Address::FromHex(std::string_view hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }
  Address addr;
  for (size_t i = 0; i < SIZE; ++i) {
    const int hi = HexValue(hex[2 * i]);
    const int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    addr.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return addr;
}

std::string Address::ToHex() const {
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t b : bytes_) {
    out.push_back(HEX_DIGITS[b >> 4]);
    out.push_back(HEX_DIGITS[b & 0x0f]);
  }
  return out;
}

std::string Address::ShortHex() const {
  return ToHex().substr(0, 8);
}

bool Address::IsZero() const {
  return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

size_t AddressHasher::operator()(const Address& addr) const noexcept {
  // Overlay addresses are hash outputs already; the first word is uniform enough.
  size_t h;
  std::memcpy(&h, addr.data(), sizeof(h));
  return h;
}

uint8_t Proximity(std::span<const uint8_t> a, std::span<const uint8_t> b) {
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    const uint8_t diff = a[i] ^ b[i];
    if (diff == 0) {
      continue;
    }
    unsigned po = static_cast<unsigned>(i) * 8;
    for (uint8_t mask = 0x80; (diff & mask) == 0; mask >>= 1) {
      ++po;
    }
    return static_cast<uint8_t>(std::min<unsigned>(po, MAX_PO));
  }
  return MAX_PO;
}

int DistanceCmp(const Address& target, const Address& a, const Address& b) {
  for (size_t i = 0; i < Address::SIZE; ++i) {
    const uint8_t da = target.bytes()[i] ^ a.bytes()[i];
    const uint8_t db = target.bytes()[i] ^ b.bytes()[i];
    if (da == db) {
      continue;
    }
    return da < db ? 1 : -1;
  }
  return 0;
}

}  // namespace swarm
}  // namespace hive
