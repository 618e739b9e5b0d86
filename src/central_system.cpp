// SPDX-License-Identifier: Apache-2.0
#include "central_system.hpp"

#include <iostream>
#include <stdexcept>

#include <unistd.h>

#include <everest/logging.hpp>

namespace csms {

CentralSystem::CentralSystem(CsmsConfig cfg) : cfg_(std::move(cfg)) {
}

CentralSystem::~CentralSystem() {
    stop();
}

bool CentralSystem::start() {
    Everest::Logging::init(cfg_.logging_config.string(), "ocpp-csms");

    const auto backoff = std::chrono::milliseconds(cfg_.storage.read_retry_backoff_ms);
    try {
        storage_ = std::make_unique<SqliteStorage>(cfg_.storage.database_path.string());
        auth_cache_ = std::make_unique<AuthorizationCache>(*storage_, std::chrono::seconds(cfg_.auth_cache_lifetime_s),
                                                           backoff);
        ledger_ = std::make_unique<TransactionLedger>(*storage_, backoff);

        CoordinatorConfig coordinator_cfg;
        coordinator_cfg.heartbeat_interval = cfg_.heartbeat_interval();
        coordinator_cfg.command_timeout = std::chrono::seconds(cfg_.command_timeout_s);
        coordinator_cfg.read_retry_backoff = backoff;
        coordinator_ =
            std::make_unique<SessionCoordinator>(coordinator_cfg, *storage_, registry_, *auth_cache_, *ledger_);
        router_ = std::make_unique<MessageRouter>(*coordinator_);

        seed_id_tags();
        ledger_->restore();
    } catch (const std::exception& e) {
        EVLOG_critical << "Failed to prepare storage at " << cfg_.storage.database_path << ": " << e.what();
        return false;
    }

    LivenessConfig liveness_cfg;
    liveness_cfg.check_interval = cfg_.liveness_check_interval();
    liveness_cfg.missed_heartbeat_deadline = cfg_.missed_heartbeat_deadline();
    liveness_ = std::make_unique<LivenessMonitor>(registry_, *storage_, liveness_cfg);

    WebSocketServer::Callbacks callbacks;
    callbacks.on_open = [this](const std::string& charge_point_id, std::shared_ptr<Connection> connection) {
        coordinator_->on_connected(charge_point_id, std::move(connection));
    };
    callbacks.on_close = [this](const std::string& charge_point_id, const std::shared_ptr<Connection>& connection) {
        coordinator_->on_disconnected(charge_point_id, connection);
    };
    callbacks.on_frame = [this](const std::string& charge_point_id, const std::string& text) {
        return router_->handle_frame(charge_point_id, text);
    };
    server_ = std::make_unique<WebSocketServer>(cfg_.server, std::move(callbacks));
    try {
        server_->start();
    } catch (const std::exception& e) {
        EVLOG_critical << "Failed to listen on " << cfg_.server.host << ":" << cfg_.server.port << ": " << e.what();
        return false;
    }
    liveness_->start();
    started_ = true;

    if (cfg_.admin_console) {
        console_ = std::make_unique<AdminConsole>(*coordinator_);
        console_running_ = true;
        console_thread_ = std::thread([this]() { console_->run(STDIN_FILENO, std::cout, console_running_); });
    }
    EVLOG_info << "Central system started: heartbeat " << cfg_.heartbeat_interval_s << "s, liveness deadline "
               << cfg_.missed_heartbeat_deadline().count() << "ms, command timeout " << cfg_.command_timeout_s << "s";
    return true;
}

void CentralSystem::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    console_running_ = false;
    coordinator_->shutdown();
    if (console_thread_.joinable()) {
        console_thread_.join();
    }
    liveness_->stop();
    server_->stop();
    EVLOG_info << "Central system stopped";
}

bool CentralSystem::quit_requested() const {
    return console_ && console_->quit_requested();
}

void CentralSystem::seed_id_tags() {
    for (const auto& seed : cfg_.id_tags) {
        IdTagRecord record;
        record.id_tag = seed.id_tag;
        try {
            record.status = ocpp::v16::conversions::string_to_authorization_status(seed.status);
        } catch (const std::exception&) {
            throw std::runtime_error("idTags entry " + seed.id_tag + " has unknown status " + seed.status);
        }
        if (seed.expiry_date) {
            record.expiry_date = parse_rfc3339(*seed.expiry_date);
            if (!record.expiry_date) {
                throw std::runtime_error("idTags entry " + seed.id_tag + " has malformed expiryDate " +
                                         *seed.expiry_date);
            }
        }
        record.parent_id_tag = seed.parent_id_tag;
        coordinator_->provision_tag(record);
    }
    if (!cfg_.id_tags.empty()) {
        EVLOG_info << "Seeded " << cfg_.id_tags.size() << " id tag(s) from configuration";
    }
}

} // namespace csms
