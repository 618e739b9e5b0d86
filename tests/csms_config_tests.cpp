// SPDX-License-Identifier: Apache-2.0
#include "csms_config.hpp"

#include <cassert>
#include <fstream>
#include <iostream>

using namespace csms;

namespace {

fs::path write_config(const fs::path& dir, const std::string& name, const std::string& body) {
    const auto path = dir / name;
    std::ofstream out(path);
    out << body;
    return path;
}

bool rejected(const fs::path& path) {
    try {
        load_csms_config(path);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    const auto dir = fs::temp_directory_path() / "csms_config_tests";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // Defaults
    {
        const auto cfg = load_csms_config(write_config(dir, "empty.json", "{}"));
        assert(cfg.server.port == 9000);
        assert(cfg.server.subprotocol == "ocpp1.6");
        assert(cfg.heartbeat_interval() == std::chrono::seconds(300));
        assert(cfg.liveness_check_interval() == std::chrono::milliseconds(100000));
        assert(cfg.missed_heartbeat_deadline() == std::chrono::milliseconds(750000));
        assert(cfg.auth_cache_lifetime_s == 60);
        assert(cfg.command_timeout_s == 30);
        assert(cfg.admin_console);
        assert(cfg.storage.database_path == fs::weakly_canonical(dir / "data/csms.db"));
        assert(cfg.logging_config == fs::weakly_canonical(dir / "logging.ini"));
        assert(fs::exists(dir / "data"));
        assert(cfg.id_tags.empty());
    }

    // Explicit values
    {
        const auto cfg = load_csms_config(write_config(dir, "full.json", R"({
            "server": {"host": "127.0.0.1", "port": 8887, "workerThreads": 2, "subprotocol": "OCPP1.6"},
            "storage": {"databasePath": "db/test.db", "readRetryBackoffMs": 5},
            "heartbeatIntervalSeconds": 60,
            "livenessCheckIntervalSeconds": 10,
            "missedHeartbeatFactor": 3.0,
            "authCacheLifetimeSeconds": 0,
            "commandTimeoutSeconds": 5,
            "adminConsole": false,
            "loggingConfig": "/etc/csms/logging.ini",
            "idTags": [
                {"idTag": "TAG001"},
                {"idTag": "CHILD001", "status": "Blocked", "expiryDate": "2030-01-01T00:00:00Z",
                 "parentIdTag": "TAG001"}
            ]
        })"));
        assert(cfg.server.host == "127.0.0.1");
        assert(cfg.server.port == 8887);
        assert(cfg.server.worker_threads == 2);
        assert(cfg.server.subprotocol == "ocpp1.6");
        assert(cfg.storage.read_retry_backoff_ms == 5);
        assert(cfg.liveness_check_interval() == std::chrono::milliseconds(10000));
        assert(cfg.missed_heartbeat_deadline() == std::chrono::milliseconds(180000));
        assert(cfg.auth_cache_lifetime_s == 0);
        assert(!cfg.admin_console);
        assert(cfg.logging_config == fs::path("/etc/csms/logging.ini"));
        assert(cfg.id_tags.size() == 2);
        assert(cfg.id_tags[0].status == "Accepted");
        assert(!cfg.id_tags[0].expiry_date.has_value());
        assert(cfg.id_tags[1].status == "Blocked");
        assert(cfg.id_tags[1].expiry_date.value() == "2030-01-01T00:00:00Z");
        assert(cfg.id_tags[1].parent_id_tag.value() == "TAG001");
    }

    // Invalid input
    assert(rejected(dir / "missing.json"));
    assert(rejected(write_config(dir, "syntax.json", "{ not json")));
    assert(rejected(write_config(dir, "port.json", R"({"server": {"port": 70000}})")));
    assert(rejected(write_config(dir, "threads.json", R"({"server": {"workerThreads": 0}})")));
    assert(rejected(write_config(dir, "heartbeat.json", R"({"heartbeatIntervalSeconds": 0})")));
    assert(rejected(write_config(dir, "factor.json", R"({"missedHeartbeatFactor": 1.0})")));
    assert(rejected(write_config(dir, "timeout.json", R"({"commandTimeoutSeconds": 0})")));
    assert(rejected(write_config(dir, "cache.json", R"({"authCacheLifetimeSeconds": -1})")));
    assert(rejected(write_config(dir, "tag.json", R"({"idTags": [{"status": "Accepted"}]})")));
    assert(rejected(write_config(dir, "longtag.json", R"({"idTags": [{"idTag": "ABCDEFGHIJKLMNOPQRSTU"}]})")));

    fs::remove_all(dir);
    std::cout << "csms_config_tests passed\n";
    return 0;
}
