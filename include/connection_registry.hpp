// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "domain_types.hpp"
#include "sharded_map.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csms {

/// \brief Transport-side handle of one charge point connection. send() and close() must be thread-safe.
class Connection {
public:
    virtual ~Connection() = default;

    /// \brief Queue one OCPP-J text frame for delivery.
    virtual void send(const std::string& frame) = 0;
    virtual void close() = 0;
    /// \brief Peer description for logs.
    virtual std::string identity() const = 0;
};

class ConnectionRegistry {
public:
    using Demoted = std::vector<std::pair<std::string, std::shared_ptr<Connection>>>;

    /// \brief Store \p connection as the live handle. A different handle already present is closed.
    /// \returns true if a prior handle was superseded
    bool register_connection(const std::string& charge_point_id, std::shared_ptr<Connection> connection,
                             Timestamp now);

    /// \returns the live handle, or nullptr when the charge point is not connected
    std::shared_ptr<Connection> lookup(const std::string& charge_point_id) const;

    /// \brief Remove \p connection if it is still the live handle; marks the charge point Offline.
    /// \returns false when the handle had already been superseded or removed
    bool unregister_connection(const std::string& charge_point_id, const std::shared_ptr<Connection>& connection);

    /// \brief Record activity and mark the charge point Online.
    /// \returns true when this moved the charge point into Online
    bool touch(const std::string& charge_point_id, Timestamp now);

    /// \brief Demote every Online entry idle for longer than \p deadline to Offline and detach its handle.
    Demoted demote_stale(Timestamp now, std::chrono::milliseconds deadline);

    Reachability reachability(const std::string& charge_point_id) const;
    std::optional<Timestamp> last_activity(const std::string& charge_point_id) const;
    std::vector<std::string> connected_ids() const;
    std::size_t connected_count() const;

    /// \brief Mutex serializing every state change of one charge point, shared by all holders of the registry.
    std::shared_ptr<std::mutex> lock_for(const std::string& charge_point_id);

    /// \brief Drop what the registry tracks for a charge point that is neither connected nor Online, and its mutex
    /// once nobody else holds it. Reachability then reads Unknown; the persisted record is authoritative.
    /// \returns true when the presence entry was removed
    bool forget_if_idle(const std::string& charge_point_id);

    /// \brief Number of charge points with a presence entry.
    std::size_t known_count() const;
    std::size_t lock_count() const;

private:
    struct Presence {
        std::shared_ptr<Connection> connection;
        Timestamp last_activity{};
        Reachability reachability{Reachability::Unknown};
    };

    ShardedMap<std::string, Presence> entries_;
    ShardedMap<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace csms
