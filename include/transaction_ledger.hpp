// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "sharded_map.hpp"
#include "storage.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace csms {

struct ActiveTransaction {
    std::int32_t transaction_id{0};
    std::int32_t connector_id{0};
    std::string id_tag;
    std::int32_t meter_start{0};
    Timestamp started_at{};
};

enum class LedgerStatus { Ok, AlreadyActive, NotFound, StorageFailure };

std::string ledger_status_to_string(LedgerStatus status);

struct BeginOutcome {
    LedgerStatus status{LedgerStatus::Ok};
    std::optional<ActiveTransaction> transaction;
};

struct EndOutcome {
    LedgerStatus status{LedgerStatus::Ok};
    std::optional<SessionRecord> session; // the completed session on Ok
};

/// \brief Idle/Active state machine per (charge point, connector). Transitions are persisted before they are
/// visible as committed; a failed write leaves the previous state in place.
class TransactionLedger {
public:
    explicit TransactionLedger(Storage& storage,
                               std::chrono::milliseconds read_retry_backoff = std::chrono::milliseconds(50));

    /// \brief Rebuild the Active map from storage and continue transaction ids after the highest stored one.
    void restore();

    /// \brief Idle -> Active. Allocates the transaction id only when the transition is admitted.
    BeginOutcome begin(const std::string& charge_point_id, std::int32_t connector_id, const std::string& id_tag,
                       std::int32_t meter_start, Timestamp started_at);

    /// \brief Active -> Idle for the connector whose Active session carries \p transaction_id. The session's
    /// \p transaction_data is written in the same storage transaction as its completion.
    EndOutcome end(const std::string& charge_point_id, std::int32_t transaction_id, std::int32_t meter_stop,
                   Timestamp stopped_at, const std::optional<std::string>& reason,
                   const std::vector<MeterSampleRecord>& transaction_data = {});

    std::optional<ActiveTransaction> active(const std::string& charge_point_id, std::int32_t connector_id) const;
    std::optional<ActiveTransaction> find(const std::string& charge_point_id, std::int32_t transaction_id) const;
    std::vector<ActiveTransaction> active_for(const std::string& charge_point_id) const;
    std::size_t active_count() const;

private:
    using ConnectorMap = std::map<std::int32_t, ActiveTransaction>;

    Storage& storage_;
    std::chrono::milliseconds read_retry_backoff_;
    std::atomic<std::int32_t> next_transaction_id_{1};
    ShardedMap<std::string, ConnectorMap> sessions_;

    void release(const std::string& charge_point_id, std::int32_t connector_id, std::int32_t transaction_id);
};

} // namespace csms
