// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "connection_registry.hpp"
#include "storage.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace csms {

struct LivenessConfig {
    std::chrono::milliseconds check_interval{100000};
    std::chrono::milliseconds missed_heartbeat_deadline{750000};
};

/// \brief Background sweep that moves silent charge points from Online to Offline. Never promotes.
class LivenessMonitor {
public:
    LivenessMonitor(ConnectionRegistry& registry, Storage& storage, LivenessConfig cfg);
    ~LivenessMonitor();

    void start();
    void stop();

    /// \brief One sweep at \p now. Returns the charge points demoted by this sweep.
    std::vector<std::string> tick(Timestamp now);

private:
    ConnectionRegistry& registry_;
    Storage& storage_;
    LivenessConfig cfg_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    void run();
};

} // namespace csms
