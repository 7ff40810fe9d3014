// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Overlay addresses and the proximity metric

 Every node and every chunk of content lives at a fixed-length overlay
 address. The distance between two addresses is read from the left: the
 number of leading bits they share is their proximity order (PO). Peers of a
 node are grouped by PO into bins; bin 0 holds the farthest half of the
 network, bin MAX_PO the nearest sliver.

 PO is saturated at MAX_PO, so bin MAX_PO collects every peer that shares at
 least MAX_PO leading bits with the base.
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hive {
namespace swarm {

// Deepest proximity order distinguished by the topology.
static constexpr uint8_t MAX_PO = 15;
// Number of bins, [0, MAX_PO].
static constexpr uint8_t MAX_BINS = MAX_PO + 1;

/**
 * Address - 32-byte overlay address
 *
 * Plain value type. operator< is a byte-wise order for use as a container
 * key only; it says nothing about closeness (see Proximity / DistanceCmp).
 */
class Address {
public:
  static constexpr size_t SIZE = 32;

  Address() : bytes_{} {}
  explicit Address(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}

  // 64 hex characters, either case. nullopt on wrong length or non-hex input.
  static std::optional<Address> FromHex(std::string_view hex);
  static Address Zero() { return Address(); }

  // Lowercase hex.
  std::string ToHex() const;
  // First 8 hex characters, for log lines.
  std::string ShortHex() const;

  bool IsZero() const;

  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }
  std::array<uint8_t, SIZE>& bytes() { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }
  std::span<const uint8_t> span() const { return std::span<const uint8_t>(bytes_); }

  bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Address& other) const { return bytes_ < other.bytes_; }

private:
  std::array<uint8_t, SIZE> bytes_;
};

struct AddressHasher {
  size_t operator()(const Address& addr) const noexcept;
};

// Number of leading bits `a` and `b` have in common, capped at MAX_PO.
// Only the shared prefix is compared when the lengths differ.
uint8_t Proximity(std::span<const uint8_t> a, std::span<const uint8_t> b);

inline uint8_t Proximity(const Address& a, const Address& b) {
  return Proximity(a.span(), b.span());
}

// Compare XOR distances to `target`:
//   1 if `a` is closer, -1 if `b` is closer, 0 if equidistant.
int DistanceCmp(const Address& target, const Address& a, const Address& b);

}  // namespace swarm
}  // namespace hive
