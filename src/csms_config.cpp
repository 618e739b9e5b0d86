// SPDX-License-Identifier: Apache-2.0
#include "csms_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace csms {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

SeedIdTag parse_id_tag(const nlohmann::json& tag_json) {
    SeedIdTag tag;
    tag.id_tag = tag_json.value("idTag", "");
    if (tag.id_tag.empty()) {
        throw std::runtime_error("idTags entry without idTag");
    }
    if (tag.id_tag.size() > 20) {
        throw std::runtime_error("idTag longer than 20 characters: " + tag.id_tag);
    }
    tag.status = tag_json.value("status", "Accepted");
    tag.expiry_date = optional_string(tag_json, "expiryDate");
    tag.parent_id_tag = optional_string(tag_json, "parentIdTag");
    return tag;
}

void validate(const CsmsConfig& cfg) {
    if (cfg.server.worker_threads < 1) {
        throw std::runtime_error("server.workerThreads must be >= 1");
    }
    if (cfg.heartbeat_interval_s < 1) {
        throw std::runtime_error("heartbeatIntervalSeconds must be >= 1");
    }
    if (cfg.liveness_check_interval_s < 0) {
        throw std::runtime_error("livenessCheckIntervalSeconds must not be negative");
    }
    if (cfg.missed_heartbeat_factor <= 1.0) {
        throw std::runtime_error("missedHeartbeatFactor must be greater than 1");
    }
    if (cfg.auth_cache_lifetime_s < 0) {
        throw std::runtime_error("authCacheLifetimeSeconds must not be negative");
    }
    if (cfg.command_timeout_s < 1) {
        throw std::runtime_error("commandTimeoutSeconds must be >= 1");
    }
    if (cfg.storage.read_retry_backoff_ms < 0) {
        throw std::runtime_error("storage.readRetryBackoffMs must not be negative");
    }
}
} // namespace

std::chrono::seconds CsmsConfig::heartbeat_interval() const {
    return std::chrono::seconds(heartbeat_interval_s);
}

std::chrono::milliseconds CsmsConfig::liveness_check_interval() const {
    if (liveness_check_interval_s > 0) {
        return std::chrono::seconds(liveness_check_interval_s);
    }
    return std::chrono::milliseconds(std::max<std::int64_t>(1, heartbeat_interval_s * 1000LL / 3));
}

std::chrono::milliseconds CsmsConfig::missed_heartbeat_deadline() const {
    return std::chrono::milliseconds(static_cast<std::int64_t>(heartbeat_interval_s * 1000.0 * missed_heartbeat_factor));
}

CsmsConfig load_csms_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    CsmsConfig cfg{};
    const auto server = json.value("server", nlohmann::json::object());
    cfg.server.host = server.value("host", cfg.server.host);
    const int port = server.value("port", static_cast<int>(cfg.server.port));
    if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error("server.port out of range: " + std::to_string(port));
    }
    cfg.server.port = static_cast<std::uint16_t>(port);
    cfg.server.worker_threads = server.value("workerThreads", cfg.server.worker_threads);
    cfg.server.subprotocol = server.value("subprotocol", cfg.server.subprotocol);
    std::transform(cfg.server.subprotocol.begin(), cfg.server.subprotocol.end(), cfg.server.subprotocol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto storage = json.value("storage", nlohmann::json::object());
    cfg.storage.database_path = make_absolute(base_dir, storage.value("databasePath", "data/csms.db"));
    cfg.storage.read_retry_backoff_ms = storage.value("readRetryBackoffMs", cfg.storage.read_retry_backoff_ms);

    cfg.heartbeat_interval_s = json.value("heartbeatIntervalSeconds", cfg.heartbeat_interval_s);
    cfg.liveness_check_interval_s = json.value("livenessCheckIntervalSeconds", cfg.liveness_check_interval_s);
    cfg.missed_heartbeat_factor = json.value("missedHeartbeatFactor", cfg.missed_heartbeat_factor);
    cfg.auth_cache_lifetime_s = json.value("authCacheLifetimeSeconds", cfg.auth_cache_lifetime_s);
    cfg.command_timeout_s = json.value("commandTimeoutSeconds", cfg.command_timeout_s);
    cfg.admin_console = json.value("adminConsole", cfg.admin_console);
    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));

    if (json.contains("idTags") && json["idTags"].is_array()) {
        for (const auto& tag_json : json["idTags"]) {
            cfg.id_tags.push_back(parse_id_tag(tag_json));
        }
    }

    validate(cfg);
    fs::create_directories(cfg.storage.database_path.parent_path());
    return cfg;
}

} // namespace csms
