// SPDX-License-Identifier: Apache-2.0
#include "connection_registry.hpp"

#include <algorithm>

#include <everest/logging.hpp>

namespace csms {

bool ConnectionRegistry::register_connection(const std::string& charge_point_id,
                                             std::shared_ptr<Connection> connection, Timestamp now) {
    std::shared_ptr<Connection> stale;
    entries_.with_shard(charge_point_id, [&](auto& entries) {
        auto& presence = entries[charge_point_id];
        if (presence.connection && presence.connection != connection) {
            stale = std::move(presence.connection);
        }
        presence.connection = std::move(connection);
        presence.last_activity = now;
    });
    if (!stale) {
        return false;
    }
    EVLOG_warning << "Charge point " << charge_point_id << " reconnected; closing superseded connection "
                  << stale->identity();
    stale->close();
    return true;
}

std::shared_ptr<Connection> ConnectionRegistry::lookup(const std::string& charge_point_id) const {
    return entries_.with_shard(charge_point_id, [&](const auto& entries) -> std::shared_ptr<Connection> {
        const auto it = entries.find(charge_point_id);
        if (it == entries.end()) {
            return nullptr;
        }
        return it->second.connection;
    });
}

bool ConnectionRegistry::unregister_connection(const std::string& charge_point_id,
                                               const std::shared_ptr<Connection>& connection) {
    return entries_.with_shard(charge_point_id, [&](auto& entries) {
        const auto it = entries.find(charge_point_id);
        if (it == entries.end() || !it->second.connection || it->second.connection != connection) {
            return false;
        }
        it->second.connection.reset();
        it->second.reachability = Reachability::Offline;
        return true;
    });
}

bool ConnectionRegistry::touch(const std::string& charge_point_id, Timestamp now) {
    return entries_.with_shard(charge_point_id, [&](auto& entries) {
        auto& presence = entries[charge_point_id];
        presence.last_activity = std::max(presence.last_activity, now);
        const bool came_online = presence.reachability != Reachability::Online;
        presence.reachability = Reachability::Online;
        return came_online;
    });
}

ConnectionRegistry::Demoted ConnectionRegistry::demote_stale(Timestamp now, std::chrono::milliseconds deadline) {
    Demoted demoted;
    entries_.for_each_shard([&](auto& entries) {
        for (auto& kv : entries) {
            auto& presence = kv.second;
            if (presence.reachability != Reachability::Online) {
                continue;
            }
            if (now - presence.last_activity <= deadline) {
                continue;
            }
            presence.reachability = Reachability::Offline;
            demoted.emplace_back(kv.first, std::move(presence.connection));
            presence.connection.reset();
        }
    });
    return demoted;
}

Reachability ConnectionRegistry::reachability(const std::string& charge_point_id) const {
    return entries_.with_shard(charge_point_id, [&](const auto& entries) {
        const auto it = entries.find(charge_point_id);
        return it == entries.end() ? Reachability::Unknown : it->second.reachability;
    });
}

std::optional<Timestamp> ConnectionRegistry::last_activity(const std::string& charge_point_id) const {
    return entries_.with_shard(charge_point_id, [&](const auto& entries) -> std::optional<Timestamp> {
        const auto it = entries.find(charge_point_id);
        if (it == entries.end()) {
            return std::nullopt;
        }
        return it->second.last_activity;
    });
}

std::vector<std::string> ConnectionRegistry::connected_ids() const {
    std::vector<std::string> ids;
    entries_.for_each_shard([&](const auto& entries) {
        for (const auto& kv : entries) {
            if (kv.second.connection) {
                ids.push_back(kv.first);
            }
        }
    });
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::shared_ptr<std::mutex> ConnectionRegistry::lock_for(const std::string& charge_point_id) {
    return locks_.with_shard(charge_point_id, [&](auto& locks) {
        auto& slot = locks[charge_point_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    });
}

bool ConnectionRegistry::forget_if_idle(const std::string& charge_point_id) {
    const bool forgotten = entries_.with_shard(charge_point_id, [&](auto& entries) {
        const auto it = entries.find(charge_point_id);
        if (it == entries.end() || it->second.connection || it->second.reachability == Reachability::Online) {
            return false;
        }
        entries.erase(it);
        return true;
    });
    if (!forgotten && reachability(charge_point_id) != Reachability::Unknown) {
        return false;
    }
    // Copies are only handed out under the shard lock, so a count of one means no holder and no waiter.
    locks_.with_shard(charge_point_id, [&](auto& locks) {
        const auto it = locks.find(charge_point_id);
        if (it != locks.end() && it->second.use_count() == 1) {
            locks.erase(it);
        }
    });
    return forgotten;
}

std::size_t ConnectionRegistry::known_count() const {
    std::size_t count = 0;
    entries_.for_each_shard([&](const auto& entries) { count += entries.size(); });
    return count;
}

std::size_t ConnectionRegistry::lock_count() const {
    std::size_t count = 0;
    locks_.for_each_shard([&](const auto& locks) { count += locks.size(); });
    return count;
}

std::size_t ConnectionRegistry::connected_count() const {
    std::size_t count = 0;
    entries_.for_each_shard([&](const auto& entries) {
        count += static_cast<std::size_t>(
            std::count_if(entries.begin(), entries.end(), [](const auto& kv) { return kv.second.connection != nullptr; }));
    });
    return count;
}

} // namespace csms
