// SPDX-License-Identifier: Apache-2.0
#include "liveness_monitor.hpp"

#include <everest/logging.hpp>

namespace csms {

LivenessMonitor::LivenessMonitor(ConnectionRegistry& registry, Storage& storage, LivenessConfig cfg) :
    registry_(registry), storage_(storage), cfg_(cfg) {
}

LivenessMonitor::~LivenessMonitor() {
    stop();
}

void LivenessMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    EVLOG_info << "Liveness monitor started: interval=" << cfg_.check_interval.count()
               << "ms deadline=" << cfg_.missed_heartbeat_deadline.count() << "ms";
    thread_ = std::thread([this]() { run(); });
}

void LivenessMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::vector<std::string> LivenessMonitor::tick(Timestamp now) {
    std::vector<std::string> demoted_ids;
    auto demoted = registry_.demote_stale(now, cfg_.missed_heartbeat_deadline);
    for (auto& entry : demoted) {
        const auto& charge_point_id = entry.first;
        demoted_ids.push_back(charge_point_id);
        if (entry.second) {
            entry.second->close();
        }
        bool persisted = false;
        {
            auto cp_lock = registry_.lock_for(charge_point_id);
            std::lock_guard<std::mutex> lock(*cp_lock);
            // Traffic after the sweep has already stored Online; an Offline write now would overwrite it.
            if (registry_.reachability(charge_point_id) == Reachability::Online) {
                EVLOG_info << "Charge point " << charge_point_id << " was active again before it was stored Offline";
                continue;
            }
            const auto last_seen = registry_.last_activity(charge_point_id).value_or(now);
            EVLOG_warning << "Charge point " << charge_point_id << " missed its heartbeat deadline (last activity "
                          << to_rfc3339(last_seen) << "); marking Offline";
            try {
                storage_.update_reachability(charge_point_id, Reachability::Offline, last_seen);
                persisted = true;
            } catch (const StorageError& e) {
                EVLOG_error << "Failed to persist Offline state for " << charge_point_id << ": " << e.what();
            }
        }
        // Until Offline is stored, the registry is the only place that knows it.
        if (persisted) {
            registry_.forget_if_idle(charge_point_id);
        }
    }
    return demoted_ids;
}

void LivenessMonitor::run() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, cfg_.check_interval, [this]() { return !running_; });
        }
        if (!running_) {
            break;
        }
        try {
            tick(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            EVLOG_warning << "Liveness sweep error: " << e.what();
        }
    }
}

} // namespace csms
