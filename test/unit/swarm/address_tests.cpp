// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for overlay addresses and the proximity metric

#include <catch2/catch_test_macros.hpp>
#include "swarm/address.hpp"
#include "topology_test_utils.hpp"
#include <unordered_set>
#include <vector>

using namespace hive::swarm;
using hive::test::RandomAddress;
using hive::test::RandomAddressAt;

static Address FromBytes(std::initializer_list<uint8_t> prefix) {
    std::array<uint8_t, Address::SIZE> bytes{};
    size_t i = 0;
    for (uint8_t b : prefix) {
        bytes[i++] = b;
    }
    return Address(bytes);
}

TEST_CASE("Address hex encoding", "[swarm][address]") {
    SECTION("Zero address") {
        Address zero = Address::Zero();
        REQUIRE(zero.IsZero());
        REQUIRE(zero.ToHex() == std::string(64, '0'));
    }

    SECTION("Round trip keeps bytes and lowercases") {
        const std::string hex = "ABCDEF0123456789abcdef0123456789ABCDEF0123456789abcdef0123456789";
        auto addr = Address::FromHex(hex);
        REQUIRE(addr.has_value());
        REQUIRE(addr->bytes()[0] == 0xab);
        REQUIRE(addr->bytes()[31] == 0x89);
        REQUIRE(addr->ToHex() == "abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123456789");
        REQUIRE(addr->ShortHex() == "abcdef01");
        REQUIRE_FALSE(addr->IsZero());
    }

    SECTION("Rejects wrong length") {
        REQUIRE_FALSE(Address::FromHex("").has_value());
        REQUIRE_FALSE(Address::FromHex(std::string(62, 'a')).has_value());
        REQUIRE_FALSE(Address::FromHex(std::string(66, 'a')).has_value());
    }

    SECTION("Rejects non-hex characters") {
        std::string hex(64, '0');
        hex[17] = 'g';
        REQUIRE_FALSE(Address::FromHex(hex).has_value());
        hex[17] = ' ';
        REQUIRE_FALSE(Address::FromHex(hex).has_value());
    }
}

TEST_CASE("Address equality and hashing", "[swarm][address]") {
    Address a = RandomAddress();
    Address b = a;
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    b.bytes()[31] ^= 0x01;
    REQUIRE(a != b);
    REQUIRE((a < b || b < a));

    std::unordered_set<Address, AddressHasher> set;
    set.insert(a);
    set.insert(a);
    set.insert(b);
    REQUIRE(set.size() == 2);
}

TEST_CASE("Proximity order", "[swarm][proximity]") {
    SECTION("Identical addresses saturate at MAX_PO") {
        Address a = RandomAddress();
        REQUIRE(Proximity(a, a) == MAX_PO);
    }

    SECTION("First bit differs") {
        REQUIRE(Proximity(FromBytes({0x00}), FromBytes({0x80})) == 0);
    }

    SECTION("Counts leading equal bits across bytes") {
        REQUIRE(Proximity(FromBytes({0xff, 0x00}), FromBytes({0xff, 0x80})) == 8);
        REQUIRE(Proximity(FromBytes({0xff, 0x00}), FromBytes({0xff, 0x01})) == 15);
        REQUIRE(Proximity(FromBytes({0x0f}), FromBytes({0x0e})) == 7);
        REQUIRE(Proximity(FromBytes({0x10}), FromBytes({0x00})) == 3);
    }

    SECTION("Capped at MAX_PO for deeper matches") {
        REQUIRE(Proximity(FromBytes({0xaa, 0xbb, 0x00}), FromBytes({0xaa, 0xbb, 0x80})) == MAX_PO);
    }

    SECTION("Commutative") {
        for (int i = 0; i < 50; ++i) {
            Address a = RandomAddress();
            Address b = RandomAddress();
            REQUIRE(Proximity(a, b) == Proximity(b, a));
        }
    }

    SECTION("RandomAddressAt lands in the requested bin") {
        Address base = RandomAddress();
        for (int po = 0; po < MAX_BINS; ++po) {
            REQUIRE(Proximity(base, RandomAddressAt(base, po)) == po);
        }
    }

    SECTION("Unequal lengths compare the shared prefix") {
        std::vector<uint8_t> shorter = {0xf0};
        std::vector<uint8_t> longer = {0xf0, 0x00, 0x12};
        REQUIRE(Proximity(std::span<const uint8_t>(shorter), std::span<const uint8_t>(longer)) == MAX_PO);

        std::vector<uint8_t> other = {0xe0};
        REQUIRE(Proximity(std::span<const uint8_t>(other), std::span<const uint8_t>(longer)) == 3);
    }
}

TEST_CASE("DistanceCmp", "[swarm][proximity]") {
    Address target = FromBytes({0x00});
    Address near = FromBytes({0x01});
    Address far = FromBytes({0x80});

    REQUIRE(DistanceCmp(target, near, far) == 1);
    REQUIRE(DistanceCmp(target, far, near) == -1);
    REQUIRE(DistanceCmp(target, near, near) == 0);

    SECTION("Breaks ties that proximity cannot") {
        Address base = RandomAddress();
        Address a = base;
        Address b = base;
        a.bytes()[20] ^= 0x01;
        b.bytes()[20] ^= 0x10;
        REQUIRE(Proximity(base, a) == Proximity(base, b));
        REQUIRE(DistanceCmp(base, a, b) == 1);
    }
}
