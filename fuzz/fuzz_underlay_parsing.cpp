// Fuzz target for underlay address parsing
// Tests ValidateAndNormalizeIP, ParseIPPort and FormatIPPort
//
// Underlays come from the command line and from peers.json on disk. Parsing
// must never throw, and normalization must give each endpoint one spelling so
// that the address book cannot hold two entries for the same peer.
//
// Target code:
// - src/util/netaddress.cpp

#include "util/netaddress.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

using namespace hive::util;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    const uint8_t mode = data[0];
    const std::string input(reinterpret_cast<const char*>(data + 1), size - 1);

    try {
        // TEST 1: normalization is idempotent
        if ((mode & 0x03) == 0) {
            auto result = ValidateAndNormalizeIP(input);
            if (result.has_value()) {
                auto again = ValidateAndNormalizeIP(*result);
                if (!again.has_value() || *again != *result) {
                    __builtin_trap();
                }
            }
        }

        // TEST 2: ParseIPPort output survives Format -> Parse unchanged
        if ((mode & 0x03) == 1) {
            std::string ip;
            uint16_t port = 0;
            if (ParseIPPort(input, ip, port)) {
                if (port == 0 || !ValidateAndNormalizeIP(ip).has_value()) {
                    __builtin_trap();
                }
                std::string ip2;
                uint16_t port2 = 0;
                if (!ParseIPPort(FormatIPPort(ip, port), ip2, port2) || ip2 != ip || port2 != port) {
                    __builtin_trap();
                }
            }
        }

        // TEST 3: IPv4-mapped IPv6 collapses to the IPv4 spelling
        if ((mode & 0x03) == 2 && size >= 5) {
            char ipv4[32];
            char mapped[64];
            snprintf(ipv4, sizeof(ipv4), "%u.%u.%u.%u", data[1], data[2], data[3], data[4]);
            snprintf(mapped, sizeof(mapped), "::ffff:%u.%u.%u.%u", data[1], data[2], data[3], data[4]);
            auto v4 = ValidateAndNormalizeIP(ipv4);
            auto v6 = ValidateAndNormalizeIP(mapped);
            if (!v4.has_value() || !v6.has_value() || *v4 != *v6) {
                __builtin_trap();
            }
        }

        // TEST 4: bracketed input
        if ((mode & 0x03) == 3) {
            std::string ip;
            uint16_t port = 0;
            (void)ParseIPPort("[" + input + "]:1634", ip, port);
            (void)ParseIPPort(input + ":1634", ip, port);
        }
    } catch (...) {
        // None of these functions may throw
        __builtin_trap();
    }

    return 0;
}
