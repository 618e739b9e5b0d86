// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "connection_registry.hpp"
#include "storage.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace csms::testing {

inline Timestamp at(const std::string& rfc3339) {
    return parse_rfc3339(rfc3339).value();
}

/// \brief In-memory Storage with call counters and failure injection.
class FakeStorage : public Storage {
public:
    mutable std::mutex mutex;
    std::map<std::string, ChargePointRecord> charge_points;
    std::map<std::pair<std::string, std::int32_t>, ConnectorRecord> connectors;
    std::map<std::string, IdTagRecord> id_tags;
    std::map<std::int32_t, SessionRecord> sessions;
    std::vector<MeterSampleRecord> samples;
    std::vector<DataTransferRecord> data_transfers;
    std::map<std::string, std::string> configuration;

    std::atomic<int> get_id_tag_calls{0};
    std::atomic<int> insert_session_calls{0};
    std::atomic<int> complete_session_calls{0};
    /// Number of upcoming reads that throw StorageError.
    std::atomic<int> failing_reads{0};
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_session_writes{false};
    std::atomic<bool> fail_sample_writes{false};

    void add_tag(const std::string& id_tag, ocpp::v16::AuthorizationStatus status,
                 std::optional<Timestamp> expiry = std::nullopt, std::optional<std::string> parent = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex);
        id_tags[id_tag] = IdTagRecord{id_tag, status, expiry, std::move(parent)};
    }

    void upsert_charge_point(const ChargePointRecord& record) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        auto status = charge_points[record.id].status;
        charge_points[record.id] = record;
        charge_points[record.id].status = status;
    }

    void update_reachability(const std::string& charge_point_id, Reachability reachability,
                             Timestamp last_seen) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        auto& record = charge_points[charge_point_id];
        record.id = charge_point_id;
        record.reachability = reachability;
        record.last_seen = last_seen;
    }

    void update_charge_point_status(const std::string& charge_point_id, const std::string& status) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        auto& record = charge_points[charge_point_id];
        record.id = charge_point_id;
        record.status = status;
    }

    std::optional<ChargePointRecord> get_charge_point(const std::string& charge_point_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = charge_points.find(charge_point_id);
        if (it == charge_points.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<ChargePointRecord> list_charge_points() override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<ChargePointRecord> result;
        for (const auto& kv : charge_points) {
            result.push_back(kv.second);
        }
        return result;
    }

    void upsert_connector(const ConnectorRecord& record) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        connectors[{record.charge_point_id, record.connector_id}] = record;
    }

    std::vector<ConnectorRecord> list_connectors(const std::string& charge_point_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<ConnectorRecord> result;
        for (const auto& kv : connectors) {
            if (kv.first.first == charge_point_id) {
                result.push_back(kv.second);
            }
        }
        return result;
    }

    void upsert_id_tag(const IdTagRecord& record) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        id_tags[record.id_tag] = record;
    }

    std::optional<IdTagRecord> get_id_tag(const std::string& id_tag) override {
        ++get_id_tag_calls;
        read();
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = id_tags.find(id_tag);
        if (it == id_tags.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void insert_session(const SessionRecord& record) override {
        ++insert_session_calls;
        write();
        if (fail_session_writes) {
            throw StorageError("injected session write failure");
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (sessions.count(record.transaction_id) != 0) {
            throw StorageError("duplicate transaction id");
        }
        sessions[record.transaction_id] = record;
    }

    void complete_session(std::int32_t transaction_id, std::int32_t meter_stop, Timestamp stopped_at,
                          const std::optional<std::string>& reason,
                          const std::vector<MeterSampleRecord>& transaction_data) override {
        ++complete_session_calls;
        write();
        if (fail_session_writes) {
            throw StorageError("injected session write failure");
        }
        if (fail_sample_writes && !transaction_data.empty()) {
            throw StorageError("injected sample write failure");
        }
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(transaction_id);
        if (it == sessions.end() || it->second.status != SessionStatus::Active) {
            throw StorageError("no Active session");
        }
        it->second.meter_stop = meter_stop;
        it->second.stop_timestamp = stopped_at;
        it->second.stop_reason = reason;
        it->second.status = SessionStatus::Completed;
        samples.insert(samples.end(), transaction_data.begin(), transaction_data.end());
    }

    std::optional<SessionRecord> get_session(std::int32_t transaction_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(transaction_id);
        if (it == sessions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<SessionRecord> find_active_session(const std::string& charge_point_id,
                                                     std::int32_t connector_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& kv : sessions) {
            const auto& s = kv.second;
            if (s.charge_point_id == charge_point_id && s.connector_id == connector_id &&
                s.status == SessionStatus::Active) {
                return s;
            }
        }
        return std::nullopt;
    }

    std::vector<SessionRecord> list_active_sessions() override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<SessionRecord> result;
        for (const auto& kv : sessions) {
            if (kv.second.status == SessionStatus::Active) {
                result.push_back(kv.second);
            }
        }
        return result;
    }

    std::optional<std::int32_t> max_transaction_id() override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        if (sessions.empty()) {
            return std::nullopt;
        }
        return sessions.rbegin()->first;
    }

    void insert_meter_samples(const std::vector<MeterSampleRecord>& records) override {
        write();
        if (fail_sample_writes) {
            throw StorageError("injected sample write failure");
        }
        std::lock_guard<std::mutex> lock(mutex);
        samples.insert(samples.end(), records.begin(), records.end());
    }

    std::vector<MeterSampleRecord> list_meter_samples(std::int32_t transaction_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<MeterSampleRecord> result;
        for (const auto& s : samples) {
            if (s.transaction_id && *s.transaction_id == transaction_id) {
                result.push_back(s);
            }
        }
        return result;
    }

    std::vector<MeterSampleRecord> list_orphaned_samples(const std::string& charge_point_id) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<MeterSampleRecord> result;
        for (const auto& s : samples) {
            if (s.orphaned && s.charge_point_id == charge_point_id) {
                result.push_back(s);
            }
        }
        return result;
    }

    void record_data_transfer(const DataTransferRecord& record) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        data_transfers.push_back(record);
    }

    void set_configuration(const std::string& key, const std::string& value) override {
        write();
        std::lock_guard<std::mutex> lock(mutex);
        configuration[key] = value;
    }

    std::optional<std::string> get_configuration(const std::string& key) override {
        read();
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = configuration.find(key);
        if (it == configuration.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    void read() {
        int remaining = failing_reads.load();
        while (remaining > 0) {
            if (failing_reads.compare_exchange_weak(remaining, remaining - 1)) {
                throw StorageError("injected read failure");
            }
        }
    }

    void write() {
        if (fail_writes) {
            throw StorageError("injected write failure");
        }
    }
};

/// \brief Connection that records outbound frames. An optional responder sees every frame after it is recorded.
class FakeConnection : public Connection {
public:
    explicit FakeConnection(std::string name = "fake") : name_(std::move(name)) {
    }

    void send(const std::string& frame) override {
        std::function<void(const std::string&)> responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back(frame);
            responder = responder_;
        }
        if (responder) {
            responder(frame);
        }
    }

    void close() override {
        closed_ = true;
    }

    std::string identity() const override {
        return name_;
    }

    void set_responder(std::function<void(const std::string&)> responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    std::vector<std::string> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    bool closed() const {
        return closed_;
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::string> frames_;
    std::function<void(const std::string&)> responder_;
    std::atomic<bool> closed_{false};
};

/// \brief Message id of a CALL frame [2, id, action, payload].
inline std::string call_id(const std::string& frame) {
    return nlohmann::json::parse(frame).at(1).get<std::string>();
}

inline std::string call_action(const std::string& frame) {
    return nlohmann::json::parse(frame).at(2).get<std::string>();
}

inline nlohmann::json call_payload(const std::string& frame) {
    return nlohmann::json::parse(frame).at(3);
}

} // namespace csms::testing
