// Fuzz target for overlay addresses and the proximity metric
// Tests Address::FromHex, Proximity and DistanceCmp
//
// Target code:
// - src/swarm/address.cpp

#include "swarm/address.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

using namespace hive::swarm;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    // TEST 1: hex parsing never throws; accepted input round-trips
    std::string_view text(reinterpret_cast<const char*>(data), size);
    auto parsed = Address::FromHex(text);
    if (parsed.has_value()) {
        auto again = Address::FromHex(parsed->ToHex());
        if (!again.has_value() || *again != *parsed) {
            __builtin_trap();
        }
    }

    // TEST 2: metric properties on three raw addresses
    if (size >= 3 * Address::SIZE) {
        std::array<uint8_t, Address::SIZE> raw[3];
        for (int i = 0; i < 3; ++i) {
            memcpy(raw[i].data(), data + i * Address::SIZE, Address::SIZE);
        }
        Address target(raw[0]);
        Address a(raw[1]);
        Address b(raw[2]);

        const uint8_t po_ab = Proximity(a, b);
        if (po_ab > MAX_PO || po_ab != Proximity(b, a)) {
            __builtin_trap();
        }
        if (Proximity(a, a) != MAX_PO) {
            __builtin_trap();
        }
        if (DistanceCmp(target, a, b) != -DistanceCmp(target, b, a)) {
            __builtin_trap();
        }
        if ((DistanceCmp(target, a, b) == 0) != (a == b)) {
            __builtin_trap();
        }
        // Strictly higher proximity to the target means strictly closer
        if (Proximity(target, a) > Proximity(target, b) && Proximity(target, a) < MAX_PO &&
            DistanceCmp(target, a, b) != 1) {
            __builtin_trap();
        }
    }

    // TEST 3: spans of unequal length
    if (size >= 2) {
        std::span<const uint8_t> left(data, size / 2);
        std::span<const uint8_t> right(data + size / 2, size - size / 2);
        if (Proximity(left, right) > MAX_PO) {
            __builtin_trap();
        }
    }

    return 0;
}
