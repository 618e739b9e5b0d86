// SPDX-License-Identifier: Apache-2.0
#include "liveness_monitor.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace csms;
using namespace csms::testing;

int main() {
    const auto t0 = at("2024-05-01T10:00:00Z");
    const auto deadline = std::chrono::milliseconds(750000); // 300s heartbeat * 2.5

    // Demotion happens on the first tick after the deadline, not before
    {
        FakeStorage storage;
        ConnectionRegistry registry;
        auto conn = std::make_shared<FakeConnection>();
        registry.register_connection("CP1", conn, t0);
        registry.touch("CP1", t0);

        LivenessMonitor monitor(registry, storage, LivenessConfig{std::chrono::milliseconds(100000), deadline});
        assert(monitor.tick(t0 + std::chrono::seconds(700)).empty());
        assert(monitor.tick(t0 + deadline).empty());
        assert(registry.reachability("CP1") == Reachability::Online);

        const auto demoted = monitor.tick(t0 + deadline + std::chrono::seconds(1));
        assert(demoted.size() == 1);
        assert(demoted[0] == "CP1");
        assert(registry.lookup("CP1") == nullptr);
        assert(conn->closed());
        assert(storage.charge_points.at("CP1").reachability == Reachability::Offline);
        assert(storage.charge_points.at("CP1").last_seen.value() == t0);

        // Stored Offline, so the registry forgets it
        assert(registry.reachability("CP1") == Reachability::Unknown);
        assert(registry.known_count() == 0);
        assert(registry.lock_count() == 0);

        // Never demoted twice, never promoted
        assert(monitor.tick(t0 + deadline * 4).empty());
        assert(registry.reachability("CP1") == Reachability::Unknown);
    }

    // Activity pushes the deadline out; only silent charge points are demoted
    {
        FakeStorage storage;
        ConnectionRegistry registry;
        registry.register_connection("CP1", std::make_shared<FakeConnection>(), t0);
        registry.register_connection("CP2", std::make_shared<FakeConnection>(), t0);
        registry.touch("CP1", t0);
        registry.touch("CP2", t0);
        registry.touch("CP2", t0 + std::chrono::seconds(600));

        LivenessMonitor monitor(registry, storage, LivenessConfig{std::chrono::milliseconds(100000), deadline});
        const auto demoted = monitor.tick(t0 + std::chrono::seconds(800));
        assert(demoted.size() == 1 && demoted[0] == "CP1");
        assert(registry.reachability("CP2") == Reachability::Online);
        assert(registry.known_count() == 1);
    }

    // Storage failure is logged and the in-memory demotion still holds until it is stored
    {
        FakeStorage storage;
        storage.fail_writes = true;
        ConnectionRegistry registry;
        registry.register_connection("CP1", std::make_shared<FakeConnection>(), t0);
        registry.touch("CP1", t0);
        LivenessMonitor monitor(registry, storage, LivenessConfig{std::chrono::milliseconds(100000), deadline});
        assert(monitor.tick(t0 + deadline * 2).size() == 1);
        assert(registry.reachability("CP1") == Reachability::Offline);
        assert(registry.known_count() == 1);
    }

    // Traffic that lands between the demotion and its Offline write wins
    {
        FakeStorage storage;
        ConnectionRegistry registry;
        auto conn = std::make_shared<FakeConnection>();
        registry.register_connection("CP1", conn, t0);
        registry.touch("CP1", t0);
        LivenessMonitor monitor(registry, storage, LivenessConfig{std::chrono::milliseconds(100000), deadline});

        const auto late = t0 + deadline * 2;
        auto cp_lock = registry.lock_for("CP1");
        std::vector<std::string> demoted;
        {
            std::unique_lock<std::mutex> held(*cp_lock);
            std::thread sweep([&]() { demoted = monitor.tick(late); });
            for (int i = 0; i < 500 && !conn->closed(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            assert(conn->closed());

            // What an inbound message does under the same lock
            assert(registry.touch("CP1", late));
            storage.update_reachability("CP1", Reachability::Online, late);
            held.unlock();
            sweep.join();
        }
        assert(demoted.size() == 1);
        assert(registry.reachability("CP1") == Reachability::Online);
        assert(storage.charge_points.at("CP1").reachability == Reachability::Online);
        assert(storage.charge_points.at("CP1").last_seen.value() == late);
        assert(registry.known_count() == 1);
    }

    // Background loop demotes on its own and stops promptly
    {
        FakeStorage storage;
        ConnectionRegistry registry;
        const auto long_ago = std::chrono::system_clock::now() - std::chrono::hours(1);
        registry.register_connection("CP1", std::make_shared<FakeConnection>(), long_ago);
        registry.touch("CP1", long_ago);
        LivenessMonitor monitor(registry, storage,
                                LivenessConfig{std::chrono::milliseconds(10), std::chrono::milliseconds(1000)});
        monitor.start();
        for (int i = 0; i < 200 && registry.reachability("CP1") == Reachability::Online; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        monitor.stop();
        assert(registry.reachability("CP1") != Reachability::Online);
        assert(registry.lookup("CP1") == nullptr);
    }

    std::cout << "liveness_monitor_tests passed\n";
    return 0;
}
