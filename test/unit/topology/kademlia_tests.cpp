// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the Kademlia connectivity manager

#include <catch2/catch_test_macros.hpp>
#include "topology/kademlia.hpp"
#include "topology_test_utils.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace hive::topology;
using hive::swarm::Address;
using hive::swarm::MAX_BINS;
using hive::test::MockConnector;
using hive::test::MockResolver;
using hive::test::RandomAddress;
using hive::test::RandomAddressAt;
using hive::test::WaitFor;

namespace {

// Owns the collaborators of one manager under test.
struct KadFixture {
    explicit KadFixture(const Kademlia::Config& config = Kademlia::Config{})
        : base(RandomAddress()), kad(base, resolver, connector, config) {}

    bool WaitDepth(uint8_t depth) {
        return WaitFor([&]() { return kad.NeighborhoodDepth() == depth; });
    }

    bool WaitConnects(int count) {
        return WaitFor([&]() { return connector.connects() == count; });
    }

    Address base;
    MockResolver resolver;
    MockConnector connector;
    Kademlia kad;
};

Kademlia::Config Unsaturated() {
    Kademlia::Config config;
    config.saturation_peers = 1000;
    return config;
}

}  // namespace

TEST_CASE("Kademlia neighborhood depth", "[topology][kademlia]") {
    KadFixture f;
    REQUIRE(f.kad.Start());

    std::vector<Address> peers;
    for (int i = 0; i < 8; ++i) {
        peers.push_back(RandomAddressAt(f.base, i));
    }
    std::vector<Address> bin_eight = {RandomAddressAt(f.base, 8), RandomAddressAt(f.base, 8)};

    // Empty topology
    REQUIRE(f.kad.NeighborhoodDepth() == 0);

    // Two neighbors at bin 8 do not exceed the low watermark
    REQUIRE(f.kad.AddPeer(bin_eight[0]) == TopologyResult::Success);
    REQUIRE(f.kad.AddPeer(bin_eight[1]) == TopologyResult::Success);
    REQUIRE(f.WaitConnects(2));
    REQUIRE(f.WaitDepth(0));

    // Bins 0 and 1: depth is the shallowest empty bin
    f.kad.AddPeer(peers[0]);
    f.kad.AddPeer(peers[1]);
    REQUIRE(f.WaitConnects(4));
    REQUIRE(f.WaitDepth(2));

    f.connector.ResetCount();
    for (int i = 2; i < 7; ++i) {
        f.kad.AddPeer(peers[i]);
        REQUIRE(f.WaitConnects(1));
        REQUIRE(f.WaitDepth(static_cast<uint8_t>(i + 1)));
        f.connector.ResetCount();
    }

    // Bin 7 closes the last gap; two neighbors at bin 8 give depth 8
    f.kad.AddPeer(peers[7]);
    REQUIRE(f.WaitConnects(1));
    REQUIRE(f.WaitDepth(8));
    f.connector.ResetCount();

    // One peer at bin 9 is not enough to move the depth
    f.kad.AddPeer(RandomAddressAt(f.base, 9));
    REQUIRE(f.WaitConnects(1));
    REQUIRE(f.WaitDepth(8));
    f.connector.ResetCount();

    for (int i = 10; i < MAX_BINS; ++i) {
        f.kad.AddPeer(RandomAddressAt(f.base, i));
        REQUIRE(f.WaitConnects(1));
        REQUIRE(f.WaitDepth(static_cast<uint8_t>(i - 1)));
        f.connector.ResetCount();
    }

    // A second peer in the deepest bin
    Address deepest = RandomAddressAt(f.base, 15);
    f.kad.AddPeer(deepest);
    REQUIRE(f.WaitConnects(1));
    REQUIRE(f.WaitDepth(15));

    f.kad.Remove(deepest);
    REQUIRE(f.kad.NeighborhoodDepth() == 14);

    // Removing the bin 1 peer opens a gap at 1
    f.kad.Remove(peers[1]);
    REQUIRE(f.kad.NeighborhoodDepth() == 1);

    SECTION("Adding a removed peer back restores the depth") {
        f.connector.ResetCount();
        REQUIRE(f.kad.AddPeer(peers[1]) == TopologyResult::Success);
        REQUIRE(f.WaitConnects(1));
        REQUIRE(f.WaitDepth(14));
    }
}

TEST_CASE("Kademlia AddPeer results", "[topology][kademlia]") {
    KadFixture f;
    Address peer = RandomAddress();

    SECTION("Peers can be added before Start and are dialed afterwards") {
        REQUIRE(f.kad.AddPeer(peer) == TopologyResult::Success);
        REQUIRE(f.kad.IsKnown(peer));
        REQUIRE_FALSE(f.kad.IsConnected(peer));
        REQUIRE(f.connector.connects() == 0);

        REQUIRE(f.kad.Start());
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(peer); }));
    }

    SECTION("Duplicate registration is reported and changes nothing") {
        REQUIRE(f.kad.Start());
        REQUIRE(f.kad.AddPeer(peer) == TopologyResult::Success);
        REQUIRE(f.kad.AddPeer(peer) == TopologyResult::AlreadyKnown);
        REQUIRE(f.kad.KnownCount() == 1);
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(peer); }));
        REQUIRE(f.kad.AddPeer(peer) == TopologyResult::AlreadyKnown);
        REQUIRE(f.kad.ConnectedCount() == 1);
    }

    SECTION("Own base address is rejected") {
        REQUIRE(f.kad.AddPeer(f.base) == TopologyResult::InvalidAddress);
        REQUIRE(f.kad.KnownCount() == 0);
    }

    SECTION("Start twice fails") {
        REQUIRE(f.kad.Start());
        REQUIRE_FALSE(f.kad.Start());
    }
}

TEST_CASE("Kademlia saturation", "[topology][kademlia]") {
    KadFixture f;
    REQUIRE(f.kad.Start());

    // Bins 0..4 one peer each, two at bin 5: depth 5
    for (int i = 0; i < 5; ++i) {
        f.kad.AddPeer(RandomAddressAt(f.base, i));
    }
    f.kad.AddPeer(RandomAddressAt(f.base, 5));
    f.kad.AddPeer(RandomAddressAt(f.base, 5));
    REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == 7; }));
    REQUIRE(f.WaitDepth(5));

    REQUIRE_FALSE(f.kad.BinSaturated(0));
    REQUIRE_FALSE(f.kad.BinSaturated(5));

    SECTION("A shallow bin stops taking connections at saturation_peers") {
        f.connector.ResetCount();
        std::vector<Address> extra = {RandomAddressAt(f.base, 0), RandomAddressAt(f.base, 0),
                                      RandomAddressAt(f.base, 0)};
        for (const auto& addr : extra) {
            f.kad.AddPeer(addr);
        }

        REQUIRE(f.WaitConnects(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE(f.connector.connects() == 1);
        REQUIRE(f.kad.BinSaturated(0));
        REQUIRE(f.kad.KnownCount() == 10);
        REQUIRE(f.kad.ConnectedCount() == 8);
    }

    SECTION("Bins at or beyond depth are never saturated") {
        f.connector.ResetCount();
        for (int i = 0; i < 4; ++i) {
            f.kad.AddPeer(RandomAddressAt(f.base, 6));
        }
        REQUIRE(f.WaitConnects(4));
        REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == 11; }));
        REQUIRE_FALSE(f.kad.BinSaturated(6));
    }
}

TEST_CASE("Kademlia dial failures", "[topology][kademlia]") {
    KadFixture f(Unsaturated());
    Address good = RandomAddress();
    Address bad = RandomAddress();
    Address unknown = RandomAddress();

    f.connector.FailFor(bad);
    f.resolver.SetMissing(unknown);
    REQUIRE(f.kad.Start());

    f.kad.AddPeer(bad);
    f.kad.AddPeer(unknown);
    f.kad.AddPeer(good);

    SECTION("Failures do not stop the pass and leave peers known") {
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(good); }));
        REQUIRE(WaitFor([&]() { return f.kad.GetStats().dial_failures >= 1; }));
        REQUIRE(f.kad.IsKnown(bad));
        REQUIRE(f.kad.IsKnown(unknown));
        REQUIRE_FALSE(f.kad.IsConnected(bad));
        REQUIRE_FALSE(f.kad.IsConnected(unknown));
        REQUIRE(f.kad.GetStats().resolve_failures >= 1);
    }

    SECTION("Failed peers are retried on a later pass") {
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(good); }));
        f.connector.ClearFailures();
        f.resolver.ClearMissing();

        // Any new event triggers another pass
        f.kad.AddPeer(RandomAddress());
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(bad) && f.kad.IsConnected(unknown); }));
    }
}

TEST_CASE("Kademlia rejects a dial answered by another overlay", "[topology][kademlia]") {
    KadFixture f;
    Address peer = RandomAddress();
    f.connector.AnswerAs(RandomAddress());
    REQUIRE(f.kad.Start());

    f.kad.AddPeer(peer);
    REQUIRE(WaitFor([&]() { return f.kad.GetStats().dial_failures >= 1; }));
    REQUIRE_FALSE(f.kad.IsConnected(peer));
    REQUIRE(f.kad.ConnectedCount() == 0);
}

TEST_CASE("Kademlia Disconnected and Remove", "[topology][kademlia]") {
    KadFixture f;
    REQUIRE(f.kad.Start());
    Address peer = RandomAddressAt(f.base, 3);
    f.kad.AddPeer(peer);
    REQUIRE(WaitFor([&]() { return f.kad.IsConnected(peer); }));

    SECTION("A disconnected peer stays known and is redialed") {
        f.connector.Hold();
        REQUIRE(f.kad.Disconnected(peer) == TopologyResult::Success);
        REQUIRE(f.kad.IsKnown(peer));
        REQUIRE(f.connector.WaitInFlight());
        REQUIRE_FALSE(f.kad.IsConnected(peer));
        f.connector.Release();
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(peer); }));
    }

    SECTION("Remove forgets the peer") {
        REQUIRE(f.kad.Remove(peer) == TopologyResult::Success);
        REQUIRE_FALSE(f.kad.IsKnown(peer));
        REQUIRE_FALSE(f.kad.IsConnected(peer));
        REQUIRE(f.kad.KnownCount() == 0);
    }

    SECTION("Disconnected for an unknown peer is harmless") {
        REQUIRE(f.kad.Disconnected(RandomAddress()) == TopologyResult::Success);
        REQUIRE(f.kad.ConnectedCount() == 1);
    }
}

TEST_CASE("Kademlia discards a dial whose session is lost before it returns", "[topology][kademlia]") {
    KadFixture f;
    Address peer = RandomAddressAt(f.base, 2);
    Address other = RandomAddressAt(f.base, 5);
    std::atomic<bool> fired{false};
    std::atomic<bool> hook_ok{false};

    // The transport reports the loss from inside Connect(), before the dial result is seen
    SECTION("Disconnected during the dial leads to a redial") {
        f.connector.SetOnConnect([&](const Address& overlay) {
            if (overlay == peer && !fired.exchange(true)) {
                hook_ok = f.kad.Disconnected(peer) == TopologyResult::Success;
            }
        });
        REQUIRE(f.kad.Start());
        f.kad.AddPeer(peer);

        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(peer); }));
        REQUIRE(fired.load());
        REQUIRE(hook_ok.load());
        REQUIRE(f.connector.connects() == 2);
        REQUIRE(f.kad.GetStats().dial_successes == 1);
        REQUIRE(f.kad.ConnectedCount() == 1);
    }

    SECTION("Remove during the dial leaves nothing behind") {
        f.connector.SetOnConnect([&](const Address& overlay) {
            if (overlay == peer && !fired.exchange(true)) {
                hook_ok = f.kad.Remove(peer) == TopologyResult::Success;
            }
        });
        REQUIRE(f.kad.Start());
        f.kad.AddPeer(peer);
        REQUIRE(WaitFor([&]() { return fired.load(); }));

        // The worker is serial: once `other` is connected the first dial has been handled
        f.kad.AddPeer(other);
        REQUIRE(WaitFor([&]() { return f.kad.IsConnected(other); }));
        REQUIRE(hook_ok.load());
        REQUIRE_FALSE(f.kad.IsConnected(peer));
        REQUIRE_FALSE(f.kad.IsKnown(peer));
        REQUIRE(f.kad.ConnectedCount() == 1);
        REQUIRE(f.connector.connects() == 2);
    }
}

TEST_CASE("Kademlia survives throwing collaborators", "[topology][kademlia]") {
    KadFixture f(Unsaturated());
    Address unresolvable = RandomAddressAt(f.base, 1);
    Address broken = RandomAddressAt(f.base, 2);
    Address good = RandomAddressAt(f.base, 3);
    f.resolver.ThrowFor(unresolvable);
    f.connector.ThrowFor(broken);
    REQUIRE(f.kad.Start());

    f.kad.AddPeer(unresolvable);
    f.kad.AddPeer(broken);
    f.kad.AddPeer(good);

    // The pass moves on to the next candidate after each failure
    REQUIRE(WaitFor([&]() { return f.kad.IsConnected(good); }));
    REQUIRE(WaitFor([&]() {
        const auto stats = f.kad.GetStats();
        return stats.resolve_failures >= 1 && stats.dial_failures >= 1;
    }));
    REQUIRE_FALSE(f.kad.IsConnected(unresolvable));
    REQUIRE_FALSE(f.kad.IsConnected(broken));
    REQUIRE(f.kad.IsKnown(unresolvable));
    REQUIRE(f.kad.IsKnown(broken));

    // The worker keeps serving later passes
    Address later = RandomAddressAt(f.base, 4);
    f.kad.AddPeer(later);
    REQUIRE(WaitFor([&]() { return f.kad.IsConnected(later); }));
    REQUIRE(f.kad.ConnectedCount() == 2);
}

TEST_CASE("Kademlia destructor waits for an in-flight dial", "[topology][kademlia]") {
    MockResolver resolver;
    MockConnector connector;
    Address base = RandomAddress();
    auto kad = std::make_unique<Kademlia>(base, resolver, connector);
    connector.Hold();
    REQUIRE(kad->Start());
    kad->AddPeer(RandomAddress());
    REQUIRE(connector.WaitInFlight());

    std::atomic<bool> destroyed{false};
    std::thread destroyer([&]() {
        kad.reset();
        destroyed.store(true);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(destroyed.load());
    connector.Release();
    destroyer.join();
    REQUIRE(destroyed.load());
    REQUIRE(connector.connects() == 1);
}

TEST_CASE("Kademlia after Close", "[topology][kademlia]") {
    KadFixture f;
    Address peer = RandomAddress();
    REQUIRE(f.kad.Start());
    f.kad.Close();
    f.kad.Close();

    REQUIRE(f.kad.IsClosed());
    REQUIRE_FALSE(f.kad.Start());
    REQUIRE(f.kad.AddPeer(peer) == TopologyResult::Closed);
    REQUIRE(f.kad.Disconnected(peer) == TopologyResult::Closed);
    REQUIRE(f.kad.Remove(peer) == TopologyResult::Closed);
    REQUIRE(f.kad.NeighborhoodDepth() == 0);
    REQUIRE_FALSE(f.kad.ClosestPeer(peer).has_value());
}

TEST_CASE("Kademlia discards a dial that completes after Close", "[topology][kademlia]") {
    KadFixture f;
    Address peer = RandomAddress();
    f.connector.Hold();
    REQUIRE(f.kad.Start());
    f.kad.AddPeer(peer);
    REQUIRE(f.connector.WaitInFlight());

    // Close blocks until the worker returns from the dial
    std::thread closer([&]() { f.kad.Close(); });
    REQUIRE(WaitFor([&]() { return f.kad.IsClosed(); }));
    f.connector.Release();
    closer.join();

    REQUIRE_FALSE(f.kad.IsConnected(peer));
    REQUIRE(f.kad.ConnectedCount() == 0);
}

TEST_CASE("Kademlia coalesces wake-ups", "[topology][kademlia]") {
    KadFixture f(Unsaturated());

    SECTION("A burst before Start costs one pass plus one follow-up") {
        for (int i = 0; i < 100; ++i) {
            f.kad.AddPeer(RandomAddress());
        }
        REQUIRE(f.kad.Start());
        REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == 100; }));
        REQUIRE(WaitFor([&]() { return f.kad.GetStats().manage_passes == 2; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE(f.kad.GetStats().manage_passes == 2);
        REQUIRE(f.connector.connects() == 100);
    }

    SECTION("Concurrent AddPeer from many threads") {
        REQUIRE(f.kad.Start());
        constexpr int THREADS = 8;
        constexpr int PER_THREAD = 50;
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < PER_THREAD; ++i) {
                    f.kad.AddPeer(RandomAddress());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(f.kad.KnownCount() == THREADS * PER_THREAD);
        REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == THREADS * PER_THREAD; }));
        REQUIRE(f.connector.connects() == THREADS * PER_THREAD);
    }
}

TEST_CASE("Kademlia ClosestPeer", "[topology][kademlia]") {
    KadFixture f(Unsaturated());
    Address target = RandomAddress();

    SECTION("Nothing connected") {
        REQUIRE_FALSE(f.kad.ClosestPeer(target).has_value());
    }

    SECTION("Known but unconnected peers do not count") {
        f.kad.AddPeer(RandomAddress());
        REQUIRE_FALSE(f.kad.ClosestPeer(target).has_value());
    }

    SECTION("Picks the connected peer nearest to the target") {
        REQUIRE(f.kad.Start());
        std::vector<Address> peers;
        for (int i = 0; i < 20; ++i) {
            peers.push_back(RandomAddress());
        }
        // Two peers sharing the full capped prefix with the target
        Address a = target;
        Address b = target;
        a.bytes()[10] ^= 0x04;
        b.bytes()[10] ^= 0x40;
        peers.push_back(b);
        peers.push_back(a);

        for (const auto& peer : peers) {
            f.kad.AddPeer(peer);
        }
        REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == peers.size(); }));

        auto closest = f.kad.ClosestPeer(target);
        REQUIRE(closest.has_value());
        REQUIRE(*closest == a);
    }
}

TEST_CASE("Kademlia EachPeerScored", "[topology][kademlia]") {
    KadFixture f(Unsaturated());
    REQUIRE(f.kad.Start());
    Address target = RandomAddress();

    std::vector<Address> peers;
    std::map<Address, double> scores;
    for (int i = 0; i < 6; ++i) {
        Address peer = RandomAddress();
        peers.push_back(peer);
        scores[peer] = static_cast<double>(i % 3);
        f.kad.AddPeer(peer);
    }
    REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == peers.size(); }));
    auto score = [&](const Address& addr) { return scores.at(addr); };

    SECTION("Visits best score first, ties nearer to the target first") {
        std::vector<Address> order;
        REQUIRE(f.kad.EachPeerScored(target, score, [&](const Address& addr) {
            order.push_back(addr);
            return VisitAction::Continue;
        }) == IterationResult::Completed);

        REQUIRE(order.size() == peers.size());
        for (size_t i = 1; i < order.size(); ++i) {
            const double prev = scores.at(order[i - 1]);
            const double cur = scores.at(order[i]);
            REQUIRE(prev >= cur);
            if (prev == cur) {
                REQUIRE(hive::swarm::Proximity(target, order[i - 1]) >= hive::swarm::Proximity(target, order[i]));
            }
        }
    }

    SECTION("Stop after the first peer") {
        int visits = 0;
        REQUIRE(f.kad.EachPeerScored(target, score, [&](const Address& addr) {
            ++visits;
            REQUIRE(scores.at(addr) == 2.0);
            return VisitAction::Stop;
        }) == IterationResult::Stopped);
        REQUIRE(visits == 1);
    }

    SECTION("Abort is reported") {
        REQUIRE(f.kad.EachPeerScored(target, score, [](const Address&) { return VisitAction::Abort; }) ==
                IterationResult::Aborted);
    }
}

TEST_CASE("Kademlia snapshot", "[topology][kademlia]") {
    KadFixture f;
    REQUIRE(f.kad.Start());
    Address near = RandomAddressAt(f.base, 12);
    Address far = RandomAddressAt(f.base, 0);
    f.kad.AddPeer(near);
    f.kad.AddPeer(far);
    REQUIRE(WaitFor([&]() { return f.kad.ConnectedCount() == 2; }));

    auto snap = f.kad.Snapshot();
    REQUIRE(snap["base"] == f.base.ToHex());
    REQUIRE(snap["population"] == 2);
    REQUIRE(snap["connected"] == 2);
    REQUIRE(snap["depth"] == 0);
    REQUIRE(snap["nn_low_watermark"] == 2);
    REQUIRE(snap.contains("timestamp"));
    REQUIRE(snap["bins"].size() == MAX_BINS);
    REQUIRE(snap["bins"][12]["bin"] == 12);
    REQUIRE(snap["bins"][12]["known"] == 1);
    REQUIRE(snap["bins"][12]["connected_peers"][0] == near.ToHex());
    REQUIRE(snap["bins"][0]["known_peers"][0] == far.ToHex());
    REQUIRE(snap["bins"][5]["known"] == 0);

    auto text = f.kad.ToString();
    REQUIRE(nlohmann::json::parse(text) == snap);
}
