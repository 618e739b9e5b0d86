// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "storage.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace csms {

/// \brief Storage on a single SQLite database file. All calls are serialized on one connection.
class SqliteStorage : public Storage {
public:
    /// \brief Open (creating if needed) the database at \p database_path and apply the schema. ":memory:" opens a
    /// private in-memory database.
    explicit SqliteStorage(const std::string& database_path);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    void upsert_charge_point(const ChargePointRecord& record) override;
    void update_reachability(const std::string& charge_point_id, Reachability reachability,
                             Timestamp last_seen) override;
    void update_charge_point_status(const std::string& charge_point_id, const std::string& status) override;
    std::optional<ChargePointRecord> get_charge_point(const std::string& charge_point_id) override;
    std::vector<ChargePointRecord> list_charge_points() override;

    void upsert_connector(const ConnectorRecord& record) override;
    std::vector<ConnectorRecord> list_connectors(const std::string& charge_point_id) override;

    void upsert_id_tag(const IdTagRecord& record) override;
    std::optional<IdTagRecord> get_id_tag(const std::string& id_tag) override;

    void insert_session(const SessionRecord& record) override;
    void complete_session(std::int32_t transaction_id, std::int32_t meter_stop, Timestamp stopped_at,
                          const std::optional<std::string>& reason,
                          const std::vector<MeterSampleRecord>& transaction_data) override;
    std::optional<SessionRecord> get_session(std::int32_t transaction_id) override;
    std::optional<SessionRecord> find_active_session(const std::string& charge_point_id,
                                                     std::int32_t connector_id) override;
    std::vector<SessionRecord> list_active_sessions() override;
    std::optional<std::int32_t> max_transaction_id() override;

    void insert_meter_samples(const std::vector<MeterSampleRecord>& records) override;
    std::vector<MeterSampleRecord> list_meter_samples(std::int32_t transaction_id) override;
    std::vector<MeterSampleRecord> list_orphaned_samples(const std::string& charge_point_id) override;

    void record_data_transfer(const DataTransferRecord& record) override;

    void set_configuration(const std::string& key, const std::string& value) override;
    std::optional<std::string> get_configuration(const std::string& key) override;

private:
    sqlite3* db_{nullptr};
    std::mutex mutex_;

    void exec(const char* sql);
    void rollback();
    void create_schema();
    void ensure_charge_point(const std::string& charge_point_id);
    void insert_sample_row(const MeterSampleRecord& record);
};

} // namespace csms
