// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace csms {

namespace fs = std::filesystem;

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{9000};
    int worker_threads{4};
    std::string subprotocol{"ocpp1.6"};
};

struct StorageConfig {
    fs::path database_path;
    int read_retry_backoff_ms{50};
};

/// \brief Identity tag provisioned into storage at start-up (idTags block of csms.json).
struct SeedIdTag {
    std::string id_tag;
    std::string status{"Accepted"};
    std::optional<std::string> expiry_date; // RFC 3339
    std::optional<std::string> parent_id_tag;
};

struct CsmsConfig {
    ServerConfig server;
    StorageConfig storage;
    int heartbeat_interval_s{300};
    int liveness_check_interval_s{0}; // 0 => heartbeat_interval_s / 3
    double missed_heartbeat_factor{2.5};
    int auth_cache_lifetime_s{60};
    int command_timeout_s{30};
    bool admin_console{true};
    fs::path logging_config;
    std::vector<SeedIdTag> id_tags;

    std::chrono::seconds heartbeat_interval() const;
    std::chrono::milliseconds liveness_check_interval() const;
    std::chrono::milliseconds missed_heartbeat_deadline() const;
};

/// \brief Load csms.json and populate a CsmsConfig with absolute paths. Throws std::runtime_error on invalid input.
CsmsConfig load_csms_config(const fs::path& config_path);

} // namespace csms
