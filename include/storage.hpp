// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "domain_types.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <everest/logging.hpp>

namespace csms {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Persistence collaborator. Every operation throws StorageError on failure; single-record writes are atomic.
class Storage {
public:
    virtual ~Storage() = default;

    virtual void upsert_charge_point(const ChargePointRecord& record) = 0;
    /// \brief Creates a bare record when the charge point never booted.
    virtual void update_reachability(const std::string& charge_point_id, Reachability reachability,
                                     Timestamp last_seen) = 0;
    virtual void update_charge_point_status(const std::string& charge_point_id, const std::string& status) = 0;
    virtual std::optional<ChargePointRecord> get_charge_point(const std::string& charge_point_id) = 0;
    virtual std::vector<ChargePointRecord> list_charge_points() = 0;

    virtual void upsert_connector(const ConnectorRecord& record) = 0;
    virtual std::vector<ConnectorRecord> list_connectors(const std::string& charge_point_id) = 0;

    virtual void upsert_id_tag(const IdTagRecord& record) = 0;
    virtual std::optional<IdTagRecord> get_id_tag(const std::string& id_tag) = 0;

    virtual void insert_session(const SessionRecord& record) = 0;
    /// \brief Complete the Active session and append its transaction data in one atomic write.
    virtual void complete_session(std::int32_t transaction_id, std::int32_t meter_stop, Timestamp stopped_at,
                                  const std::optional<std::string>& reason,
                                  const std::vector<MeterSampleRecord>& transaction_data) = 0;
    virtual std::optional<SessionRecord> get_session(std::int32_t transaction_id) = 0;
    virtual std::optional<SessionRecord> find_active_session(const std::string& charge_point_id,
                                                             std::int32_t connector_id) = 0;
    virtual std::vector<SessionRecord> list_active_sessions() = 0;
    virtual std::optional<std::int32_t> max_transaction_id() = 0;

    /// \brief Append a batch of samples; either every record is stored or none is.
    virtual void insert_meter_samples(const std::vector<MeterSampleRecord>& records) = 0;
    virtual std::vector<MeterSampleRecord> list_meter_samples(std::int32_t transaction_id) = 0;
    virtual std::vector<MeterSampleRecord> list_orphaned_samples(const std::string& charge_point_id) = 0;

    virtual void record_data_transfer(const DataTransferRecord& record) = 0;

    virtual void set_configuration(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_configuration(const std::string& key) = 0;
};

/// \brief Run an idempotent read, retrying once after \p backoff if the first attempt throws StorageError.
template <typename Fn>
auto with_read_retry(Fn&& fn, std::chrono::milliseconds backoff, const char* what) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StorageError& e) {
        EVLOG_warning << "Storage read '" << what << "' failed (" << e.what() << "); retrying in " << backoff.count()
                      << "ms";
    }
    std::this_thread::sleep_for(backoff);
    return fn();
}

} // namespace csms
