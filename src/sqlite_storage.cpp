// SPDX-License-Identifier: Apache-2.0
#include "sqlite_storage.hpp"

#include <sqlite3.h>

#include <everest/logging.hpp>

namespace csms {

namespace {

constexpr const char* SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS charge_points (
    id TEXT PRIMARY KEY,
    vendor TEXT NOT NULL DEFAULT '',
    model TEXT NOT NULL DEFAULT '',
    charge_point_serial_number TEXT,
    charge_box_serial_number TEXT,
    firmware_version TEXT,
    iccid TEXT,
    imsi TEXT,
    meter_type TEXT,
    meter_serial_number TEXT,
    status TEXT,
    reachability TEXT NOT NULL DEFAULT 'Unknown',
    last_seen TEXT
);
CREATE TABLE IF NOT EXISTS connectors (
    charge_point_id TEXT NOT NULL REFERENCES charge_points(id) ON DELETE CASCADE,
    connector_id INTEGER NOT NULL,
    status TEXT NOT NULL,
    availability TEXT NOT NULL,
    error_code TEXT NOT NULL,
    info TEXT,
    vendor_error_code TEXT,
    updated_at TEXT NOT NULL,
    PRIMARY KEY (charge_point_id, connector_id)
);
CREATE TABLE IF NOT EXISTS id_tags (
    id_tag TEXT PRIMARY KEY,
    status TEXT NOT NULL,
    expiry_date TEXT,
    parent_id_tag TEXT
);
CREATE TABLE IF NOT EXISTS sessions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    transaction_id INTEGER NOT NULL UNIQUE,
    charge_point_id TEXT NOT NULL REFERENCES charge_points(id) ON DELETE CASCADE,
    connector_id INTEGER NOT NULL,
    id_tag TEXT NOT NULL,
    meter_start INTEGER NOT NULL,
    meter_stop INTEGER,
    start_timestamp TEXT NOT NULL,
    stop_timestamp TEXT,
    stop_reason TEXT,
    status TEXT NOT NULL CHECK (status IN ('Active', 'Completed'))
);
CREATE UNIQUE INDEX IF NOT EXISTS sessions_one_active_per_connector
    ON sessions (charge_point_id, connector_id) WHERE status = 'Active';
CREATE TABLE IF NOT EXISTS meter_values (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id INTEGER REFERENCES sessions(id) ON DELETE CASCADE,
    charge_point_id TEXT NOT NULL,
    connector_id INTEGER NOT NULL,
    timestamp TEXT NOT NULL,
    value REAL NOT NULL,
    measurand TEXT NOT NULL,
    unit TEXT NOT NULL,
    context TEXT,
    phase TEXT,
    location TEXT,
    orphaned INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS meter_values_session ON meter_values (session_id);
CREATE TABLE IF NOT EXISTS configuration (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS data_transfers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    charge_point_id TEXT NOT NULL,
    vendor_id TEXT NOT NULL,
    message_id TEXT,
    data TEXT,
    timestamp TEXT NOT NULL
);
)sql";

constexpr const char* SESSION_COLUMNS = "transaction_id, charge_point_id, connector_id, id_tag, meter_start, "
                                        "meter_stop, start_timestamp, stop_timestamp, stop_reason, status";

constexpr const char* SAMPLE_COLUMNS = "s.transaction_id, mv.charge_point_id, mv.connector_id, mv.timestamp, "
                                       "mv.value, mv.measurand, mv.unit, mv.context, mv.phase, mv.location, "
                                       "mv.orphaned";

/// \brief Prepared statement, finalized on scope exit. Bind indexes are 1-based, column indexes 0-based.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError("prepare failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    void bind(int index, const std::optional<std::int32_t>& value) {
        if (value) {
            bind(index, static_cast<std::int64_t>(*value));
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    /// \returns true while a row is available
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw StorageError("step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    void run() {
        while (step()) {
        }
    }

    bool is_null(int column) const {
        return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
    }

    std::string text(int column) const {
        const auto* raw = sqlite3_column_text(stmt_, column);
        return raw ? std::string(reinterpret_cast<const char*>(raw)) : std::string{};
    }

    std::optional<std::string> optional_text(int column) const {
        if (is_null(column)) {
            return std::nullopt;
        }
        return text(column);
    }

    std::int64_t integer(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::optional<std::int32_t> optional_int(int column) const {
        if (is_null(column)) {
            return std::nullopt;
        }
        return static_cast<std::int32_t>(integer(column));
    }

    double real(int column) const {
        return sqlite3_column_double(stmt_, column);
    }

    Timestamp timestamp(int column) const {
        const auto value = text(column);
        const auto parsed = parse_rfc3339(value);
        if (!parsed) {
            throw StorageError("malformed timestamp '" + value + "' in column " + std::to_string(column));
        }
        return *parsed;
    }

    std::optional<Timestamp> optional_timestamp(int column) const {
        if (is_null(column)) {
            return std::nullopt;
        }
        return timestamp(column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError("bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
};

std::optional<std::string> optional_rfc3339(const std::optional<Timestamp>& t) {
    if (!t) {
        return std::nullopt;
    }
    return to_rfc3339(*t);
}

// Enum columns are written by us; an unknown name means the row was edited by hand or is corrupt.
template <typename Fn>
auto decode_enum(Fn&& fn, const std::string& value, const char* column) -> decltype(fn(value)) {
    try {
        return fn(value);
    } catch (const std::exception&) {
        throw StorageError("unknown value '" + value + "' in column " + column);
    }
}

ChargePointRecord read_charge_point(const Statement& stmt) {
    ChargePointRecord record;
    record.id = stmt.text(0);
    record.vendor = stmt.text(1);
    record.model = stmt.text(2);
    record.charge_point_serial_number = stmt.optional_text(3);
    record.charge_box_serial_number = stmt.optional_text(4);
    record.firmware_version = stmt.optional_text(5);
    record.iccid = stmt.optional_text(6);
    record.imsi = stmt.optional_text(7);
    record.meter_type = stmt.optional_text(8);
    record.meter_serial_number = stmt.optional_text(9);
    record.status = stmt.optional_text(10);
    record.reachability = reachability_from_string(stmt.text(11));
    record.last_seen = stmt.optional_timestamp(12);
    return record;
}

SessionRecord read_session(const Statement& stmt) {
    SessionRecord record;
    record.transaction_id = static_cast<std::int32_t>(stmt.integer(0));
    record.charge_point_id = stmt.text(1);
    record.connector_id = static_cast<std::int32_t>(stmt.integer(2));
    record.id_tag = stmt.text(3);
    record.meter_start = static_cast<std::int32_t>(stmt.integer(4));
    record.meter_stop = stmt.optional_int(5);
    record.start_timestamp = stmt.timestamp(6);
    record.stop_timestamp = stmt.optional_timestamp(7);
    record.stop_reason = stmt.optional_text(8);
    try {
        record.status = session_status_from_string(stmt.text(9));
    } catch (const std::invalid_argument& e) {
        throw StorageError(e.what());
    }
    return record;
}

MeterSampleRecord read_sample(const Statement& stmt) {
    MeterSampleRecord record;
    record.transaction_id = stmt.optional_int(0);
    record.charge_point_id = stmt.text(1);
    record.connector_id = static_cast<std::int32_t>(stmt.integer(2));
    record.timestamp = stmt.timestamp(3);
    record.value = stmt.real(4);
    record.measurand = stmt.text(5);
    record.unit = stmt.text(6);
    record.context = stmt.optional_text(7);
    record.phase = stmt.optional_text(8);
    record.location = stmt.optional_text(9);
    record.orphaned = stmt.integer(10) != 0;
    return record;
}

} // namespace

SqliteStorage::SqliteStorage(const std::string& database_path) {
    if (sqlite3_open_v2(database_path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database " + database_path + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec("PRAGMA foreign_keys = ON;");
        exec("PRAGMA journal_mode = WAL;");
        create_schema();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    EVLOG_info << "Opened database " << database_path;
}

SqliteStorage::~SqliteStorage() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteStorage::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        const std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void SqliteStorage::rollback() {
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        EVLOG_error << "Rollback failed: " << sqlite3_errmsg(db_);
    }
}

void SqliteStorage::create_schema() {
    exec(SCHEMA);
}

void SqliteStorage::ensure_charge_point(const std::string& charge_point_id) {
    Statement stmt(db_, "INSERT OR IGNORE INTO charge_points (id) VALUES (?1)");
    stmt.bind(1, charge_point_id);
    stmt.run();
}

void SqliteStorage::upsert_charge_point(const ChargePointRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO charge_points (id, vendor, model, charge_point_serial_number, "
                        "charge_box_serial_number, firmware_version, iccid, imsi, meter_type, meter_serial_number, "
                        "reachability, last_seen) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12) "
                        "ON CONFLICT (id) DO UPDATE SET vendor = excluded.vendor, model = excluded.model, "
                        "charge_point_serial_number = excluded.charge_point_serial_number, "
                        "charge_box_serial_number = excluded.charge_box_serial_number, "
                        "firmware_version = excluded.firmware_version, iccid = excluded.iccid, "
                        "imsi = excluded.imsi, meter_type = excluded.meter_type, "
                        "meter_serial_number = excluded.meter_serial_number, "
                        "reachability = excluded.reachability, last_seen = excluded.last_seen");
    stmt.bind(1, record.id);
    stmt.bind(2, record.vendor);
    stmt.bind(3, record.model);
    stmt.bind(4, record.charge_point_serial_number);
    stmt.bind(5, record.charge_box_serial_number);
    stmt.bind(6, record.firmware_version);
    stmt.bind(7, record.iccid);
    stmt.bind(8, record.imsi);
    stmt.bind(9, record.meter_type);
    stmt.bind(10, record.meter_serial_number);
    stmt.bind(11, reachability_to_string(record.reachability));
    stmt.bind(12, optional_rfc3339(record.last_seen));
    stmt.run();
}

void SqliteStorage::update_reachability(const std::string& charge_point_id, Reachability reachability,
                                        Timestamp last_seen) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO charge_points (id, reachability, last_seen) VALUES (?1, ?2, ?3) "
                        "ON CONFLICT (id) DO UPDATE SET reachability = excluded.reachability, "
                        "last_seen = excluded.last_seen");
    stmt.bind(1, charge_point_id);
    stmt.bind(2, reachability_to_string(reachability));
    stmt.bind(3, to_rfc3339(last_seen));
    stmt.run();
}

void SqliteStorage::update_charge_point_status(const std::string& charge_point_id, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO charge_points (id, status) VALUES (?1, ?2) "
                        "ON CONFLICT (id) DO UPDATE SET status = excluded.status");
    stmt.bind(1, charge_point_id);
    stmt.bind(2, status);
    stmt.run();
}

std::optional<ChargePointRecord> SqliteStorage::get_charge_point(const std::string& charge_point_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT id, vendor, model, charge_point_serial_number, charge_box_serial_number, "
                        "firmware_version, iccid, imsi, meter_type, meter_serial_number, status, reachability, "
                        "last_seen FROM charge_points WHERE id = ?1");
    stmt.bind(1, charge_point_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_charge_point(stmt);
}

std::vector<ChargePointRecord> SqliteStorage::list_charge_points() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT id, vendor, model, charge_point_serial_number, charge_box_serial_number, "
                        "firmware_version, iccid, imsi, meter_type, meter_serial_number, status, reachability, "
                        "last_seen FROM charge_points ORDER BY id");
    std::vector<ChargePointRecord> records;
    while (stmt.step()) {
        records.push_back(read_charge_point(stmt));
    }
    return records;
}

void SqliteStorage::upsert_connector(const ConnectorRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        ensure_charge_point(record.charge_point_id);
        Statement stmt(db_, "INSERT INTO connectors (charge_point_id, connector_id, status, availability, error_code, "
                            "info, vendor_error_code, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
                            "ON CONFLICT (charge_point_id, connector_id) DO UPDATE SET status = excluded.status, "
                            "availability = excluded.availability, error_code = excluded.error_code, "
                            "info = excluded.info, vendor_error_code = excluded.vendor_error_code, "
                            "updated_at = excluded.updated_at");
        stmt.bind(1, record.charge_point_id);
        stmt.bind(2, static_cast<std::int64_t>(record.connector_id));
        stmt.bind(3, ocpp::v16::conversions::charge_point_status_to_string(record.status));
        stmt.bind(4, ocpp::v16::conversions::availability_type_to_string(record.availability));
        stmt.bind(5, ocpp::v16::conversions::charge_point_error_code_to_string(record.error_code));
        stmt.bind(6, record.info);
        stmt.bind(7, record.vendor_error_code);
        stmt.bind(8, to_rfc3339(record.updated_at));
        stmt.run();
        exec("COMMIT;");
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}

std::vector<ConnectorRecord> SqliteStorage::list_connectors(const std::string& charge_point_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT charge_point_id, connector_id, status, availability, error_code, info, "
                        "vendor_error_code, updated_at FROM connectors WHERE charge_point_id = ?1 "
                        "ORDER BY connector_id");
    stmt.bind(1, charge_point_id);
    std::vector<ConnectorRecord> records;
    while (stmt.step()) {
        ConnectorRecord record;
        record.charge_point_id = stmt.text(0);
        record.connector_id = static_cast<std::int32_t>(stmt.integer(1));
        record.status = decode_enum(ocpp::v16::conversions::string_to_charge_point_status, stmt.text(2), "status");
        record.availability =
            decode_enum(ocpp::v16::conversions::string_to_availability_type, stmt.text(3), "availability");
        record.error_code =
            decode_enum(ocpp::v16::conversions::string_to_charge_point_error_code, stmt.text(4), "error_code");
        record.info = stmt.optional_text(5);
        record.vendor_error_code = stmt.optional_text(6);
        record.updated_at = stmt.timestamp(7);
        records.push_back(std::move(record));
    }
    return records;
}

void SqliteStorage::upsert_id_tag(const IdTagRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO id_tags (id_tag, status, expiry_date, parent_id_tag) VALUES (?1, ?2, ?3, ?4) "
                        "ON CONFLICT (id_tag) DO UPDATE SET status = excluded.status, "
                        "expiry_date = excluded.expiry_date, parent_id_tag = excluded.parent_id_tag");
    stmt.bind(1, record.id_tag);
    stmt.bind(2, ocpp::v16::conversions::authorization_status_to_string(record.status));
    stmt.bind(3, optional_rfc3339(record.expiry_date));
    stmt.bind(4, record.parent_id_tag);
    stmt.run();
}

std::optional<IdTagRecord> SqliteStorage::get_id_tag(const std::string& id_tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT id_tag, status, expiry_date, parent_id_tag FROM id_tags WHERE id_tag = ?1");
    stmt.bind(1, id_tag);
    if (!stmt.step()) {
        return std::nullopt;
    }
    IdTagRecord record;
    record.id_tag = stmt.text(0);
    record.status = decode_enum(ocpp::v16::conversions::string_to_authorization_status, stmt.text(1), "status");
    record.expiry_date = stmt.optional_timestamp(2);
    record.parent_id_tag = stmt.optional_text(3);
    return record;
}

void SqliteStorage::insert_session(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        ensure_charge_point(record.charge_point_id);
        Statement stmt(db_, std::string("INSERT INTO sessions (") + SESSION_COLUMNS +
                                ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
        stmt.bind(1, static_cast<std::int64_t>(record.transaction_id));
        stmt.bind(2, record.charge_point_id);
        stmt.bind(3, static_cast<std::int64_t>(record.connector_id));
        stmt.bind(4, record.id_tag);
        stmt.bind(5, static_cast<std::int64_t>(record.meter_start));
        stmt.bind(6, record.meter_stop);
        stmt.bind(7, to_rfc3339(record.start_timestamp));
        stmt.bind(8, optional_rfc3339(record.stop_timestamp));
        stmt.bind(9, record.stop_reason);
        stmt.bind(10, session_status_to_string(record.status));
        stmt.run();
        exec("COMMIT;");
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}

void SqliteStorage::complete_session(std::int32_t transaction_id, std::int32_t meter_stop, Timestamp stopped_at,
                                     const std::optional<std::string>& reason,
                                     const std::vector<MeterSampleRecord>& transaction_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        Statement stmt(db_, "UPDATE sessions SET meter_stop = ?2, stop_timestamp = ?3, stop_reason = ?4, "
                            "status = 'Completed' WHERE transaction_id = ?1 AND status = 'Active'");
        stmt.bind(1, static_cast<std::int64_t>(transaction_id));
        stmt.bind(2, static_cast<std::int64_t>(meter_stop));
        stmt.bind(3, to_rfc3339(stopped_at));
        stmt.bind(4, reason);
        stmt.run();
        if (sqlite3_changes(db_) != 1) {
            throw StorageError("no Active session with transaction id " + std::to_string(transaction_id));
        }
        for (const auto& record : transaction_data) {
            insert_sample_row(record);
        }
        exec("COMMIT;");
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}

std::optional<SessionRecord> SqliteStorage::get_session(std::int32_t transaction_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + SESSION_COLUMNS + " FROM sessions WHERE transaction_id = ?1");
    stmt.bind(1, static_cast<std::int64_t>(transaction_id));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_session(stmt);
}

std::optional<SessionRecord> SqliteStorage::find_active_session(const std::string& charge_point_id,
                                                                std::int32_t connector_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + SESSION_COLUMNS +
                            " FROM sessions WHERE charge_point_id = ?1 AND connector_id = ?2 AND status = 'Active'");
    stmt.bind(1, charge_point_id);
    stmt.bind(2, static_cast<std::int64_t>(connector_id));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_session(stmt);
}

std::vector<SessionRecord> SqliteStorage::list_active_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + SESSION_COLUMNS +
                            " FROM sessions WHERE status = 'Active' ORDER BY transaction_id");
    std::vector<SessionRecord> records;
    while (stmt.step()) {
        records.push_back(read_session(stmt));
    }
    return records;
}

std::optional<std::int32_t> SqliteStorage::max_transaction_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT MAX(transaction_id) FROM sessions");
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.optional_int(0);
}

void SqliteStorage::insert_meter_samples(const std::vector<MeterSampleRecord>& records) {
    if (records.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        for (const auto& record : records) {
            insert_sample_row(record);
        }
        exec("COMMIT;");
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}

void SqliteStorage::insert_sample_row(const MeterSampleRecord& record) {
    Statement stmt(db_, "INSERT INTO meter_values (session_id, charge_point_id, connector_id, timestamp, value, "
                        "measurand, unit, context, phase, location, orphaned) VALUES ("
                        "(SELECT id FROM sessions WHERE transaction_id = ?1), ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, "
                        "?11)");
    stmt.bind(1, record.transaction_id);
    stmt.bind(2, record.charge_point_id);
    stmt.bind(3, static_cast<std::int64_t>(record.connector_id));
    stmt.bind(4, to_rfc3339(record.timestamp));
    stmt.bind(5, record.value);
    stmt.bind(6, record.measurand);
    stmt.bind(7, record.unit);
    stmt.bind(8, record.context);
    stmt.bind(9, record.phase);
    stmt.bind(10, record.location);
    stmt.bind(11, static_cast<std::int64_t>(record.orphaned || !record.transaction_id ? 1 : 0));
    stmt.run();
}

std::vector<MeterSampleRecord> SqliteStorage::list_meter_samples(std::int32_t transaction_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + SAMPLE_COLUMNS +
                            " FROM meter_values mv JOIN sessions s ON mv.session_id = s.id "
                            "WHERE s.transaction_id = ?1 ORDER BY mv.timestamp, mv.id");
    stmt.bind(1, static_cast<std::int64_t>(transaction_id));
    std::vector<MeterSampleRecord> records;
    while (stmt.step()) {
        records.push_back(read_sample(stmt));
    }
    return records;
}

std::vector<MeterSampleRecord> SqliteStorage::list_orphaned_samples(const std::string& charge_point_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + SAMPLE_COLUMNS +
                            " FROM meter_values mv LEFT JOIN sessions s ON mv.session_id = s.id "
                            "WHERE mv.charge_point_id = ?1 AND mv.orphaned = 1 ORDER BY mv.timestamp, mv.id");
    stmt.bind(1, charge_point_id);
    std::vector<MeterSampleRecord> records;
    while (stmt.step()) {
        records.push_back(read_sample(stmt));
    }
    return records;
}

void SqliteStorage::record_data_transfer(const DataTransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO data_transfers (charge_point_id, vendor_id, message_id, data, timestamp) "
                        "VALUES (?1, ?2, ?3, ?4, ?5)");
    stmt.bind(1, record.charge_point_id);
    stmt.bind(2, record.vendor_id);
    stmt.bind(3, record.message_id);
    stmt.bind(4, record.data);
    stmt.bind(5, to_rfc3339(record.timestamp));
    stmt.run();
}

void SqliteStorage::set_configuration(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO configuration (key, value, updated_at) VALUES (?1, ?2, ?3) "
                        "ON CONFLICT (key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
    stmt.bind(1, key);
    stmt.bind(2, value);
    stmt.bind(3, to_rfc3339(std::chrono::system_clock::now()));
    stmt.run();
}

std::optional<std::string> SqliteStorage::get_configuration(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT value FROM configuration WHERE key = ?1");
    stmt.bind(1, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.text(0);
}

} // namespace csms
