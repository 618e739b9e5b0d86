// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "admin_console.hpp"
#include "authorization_cache.hpp"
#include "connection_registry.hpp"
#include "csms_config.hpp"
#include "liveness_monitor.hpp"
#include "message_router.hpp"
#include "session_coordinator.hpp"
#include "sqlite_storage.hpp"
#include "transaction_ledger.hpp"
#include "websocket_server.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace csms {

/// \brief Owns and wires every component of the central system for the lifetime of the process.
class CentralSystem {
public:
    explicit CentralSystem(CsmsConfig cfg);
    ~CentralSystem();

    /// \brief Initialize logging, open storage, restore state and start accepting charge points. Starts the stdin
    /// console when it is enabled.
    bool start();

    /// \brief Joins the console thread before any component it uses is torn down. Commands still waiting for a
    /// device complete with Timeout.
    void stop();

    /// \brief True once the operator typed quit on the console.
    bool quit_requested() const;

private:
    CsmsConfig cfg_;
    // Declared first so its io_context outlives the connection handles held by the registry.
    std::unique_ptr<WebSocketServer> server_;
    std::unique_ptr<SqliteStorage> storage_;
    ConnectionRegistry registry_;
    std::unique_ptr<AuthorizationCache> auth_cache_;
    std::unique_ptr<TransactionLedger> ledger_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::unique_ptr<MessageRouter> router_;
    std::unique_ptr<LivenessMonitor> liveness_;
    std::unique_ptr<AdminConsole> console_;
    std::thread console_thread_;
    std::atomic<bool> console_running_{false};
    bool started_{false};

    void seed_id_tags();
};

} // namespace csms
