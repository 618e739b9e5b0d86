// SPDX-License-Identifier: Apache-2.0
#include "transaction_ledger.hpp"

#include <algorithm>

#include <everest/logging.hpp>

namespace csms {

std::string ledger_status_to_string(LedgerStatus status) {
    switch (status) {
    case LedgerStatus::Ok:
        return "Ok";
    case LedgerStatus::AlreadyActive:
        return "AlreadyActive";
    case LedgerStatus::NotFound:
        return "NotFound";
    case LedgerStatus::StorageFailure:
        return "StorageFailure";
    }
    return "Unknown";
}

TransactionLedger::TransactionLedger(Storage& storage, std::chrono::milliseconds read_retry_backoff) :
    storage_(storage), read_retry_backoff_(read_retry_backoff) {
}

void TransactionLedger::restore() {
    const auto max_id = with_read_retry([&]() { return storage_.max_transaction_id(); }, read_retry_backoff_,
                                        "max_transaction_id");
    next_transaction_id_ = max_id.value_or(0) + 1;

    const auto active_sessions = with_read_retry([&]() { return storage_.list_active_sessions(); },
                                                 read_retry_backoff_, "list_active_sessions");
    std::size_t restored = 0;
    for (const auto& session : active_sessions) {
        ActiveTransaction tx;
        tx.transaction_id = session.transaction_id;
        tx.connector_id = session.connector_id;
        tx.id_tag = session.id_tag;
        tx.meter_start = session.meter_start;
        tx.started_at = session.start_timestamp;
        sessions_.with_shard(session.charge_point_id, [&](auto& entries) {
            auto& connectors = entries[session.charge_point_id];
            const auto it = connectors.find(tx.connector_id);
            if (it != connectors.end()) {
                EVLOG_warning << "Storage holds more than one Active session for " << session.charge_point_id
                              << " connector " << tx.connector_id << " (transactions " << it->second.transaction_id
                              << " and " << tx.transaction_id << "); keeping the newest";
                if (it->second.started_at > tx.started_at) {
                    return;
                }
                it->second = tx;
                return;
            }
            connectors.emplace(tx.connector_id, tx);
            ++restored;
        });
    }
    EVLOG_info << "Transaction ledger restored " << restored << " active session(s); next transaction id "
               << next_transaction_id_.load();
}

BeginOutcome TransactionLedger::begin(const std::string& charge_point_id, std::int32_t connector_id,
                                      const std::string& id_tag, std::int32_t meter_start, Timestamp started_at) {
    BeginOutcome outcome;
    std::optional<std::int32_t> blocking_tx;
    sessions_.with_shard(charge_point_id, [&](auto& entries) {
        auto& connectors = entries[charge_point_id];
        const auto it = connectors.find(connector_id);
        if (it != connectors.end()) {
            blocking_tx = it->second.transaction_id;
            return;
        }
        ActiveTransaction tx;
        tx.transaction_id = next_transaction_id_++;
        tx.connector_id = connector_id;
        tx.id_tag = id_tag;
        tx.meter_start = meter_start;
        tx.started_at = started_at;
        connectors.emplace(connector_id, tx);
        outcome.transaction = tx;
    });

    if (blocking_tx) {
        EVLOG_warning << "Start refused on " << charge_point_id << " connector " << connector_id
                      << ": transaction " << *blocking_tx << " is still active";
        outcome.status = LedgerStatus::AlreadyActive;
        return outcome;
    }

    SessionRecord record;
    record.transaction_id = outcome.transaction->transaction_id;
    record.charge_point_id = charge_point_id;
    record.connector_id = connector_id;
    record.id_tag = id_tag;
    record.meter_start = meter_start;
    record.start_timestamp = started_at;
    record.status = SessionStatus::Active;
    try {
        storage_.insert_session(record);
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to persist transaction " << record.transaction_id << " on " << charge_point_id
                    << " connector " << connector_id << ": " << e.what() << "; rolling back";
        release(charge_point_id, connector_id, record.transaction_id);
        outcome.status = LedgerStatus::StorageFailure;
        outcome.transaction.reset();
        return outcome;
    }

    EVLOG_info << "Transaction " << record.transaction_id << " started on " << charge_point_id << " connector "
               << connector_id << " idTag=" << id_tag << " meterStart=" << meter_start;
    outcome.status = LedgerStatus::Ok;
    return outcome;
}

EndOutcome TransactionLedger::end(const std::string& charge_point_id, std::int32_t transaction_id,
                                  std::int32_t meter_stop, Timestamp stopped_at,
                                  const std::optional<std::string>& reason,
                                  const std::vector<MeterSampleRecord>& transaction_data) {
    EndOutcome outcome;
    const auto current = find(charge_point_id, transaction_id);
    if (!current) {
        outcome.status = LedgerStatus::NotFound;
        return outcome;
    }

    if (meter_stop < current->meter_start) {
        EVLOG_warning << "Meter regression on transaction " << transaction_id << " (start=" << current->meter_start
                      << "Wh, stop=" << meter_stop << "Wh); clamping to start reading";
        meter_stop = current->meter_start;
    }

    try {
        storage_.complete_session(transaction_id, meter_stop, stopped_at, reason, transaction_data);
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to complete transaction " << transaction_id << " on " << charge_point_id << ": "
                    << e.what() << "; session stays Active";
        outcome.status = LedgerStatus::StorageFailure;
        return outcome;
    }
    release(charge_point_id, current->connector_id, transaction_id);

    SessionRecord session;
    session.transaction_id = transaction_id;
    session.charge_point_id = charge_point_id;
    session.connector_id = current->connector_id;
    session.id_tag = current->id_tag;
    session.meter_start = current->meter_start;
    session.meter_stop = meter_stop;
    session.start_timestamp = current->started_at;
    session.stop_timestamp = stopped_at;
    session.stop_reason = reason;
    session.status = SessionStatus::Completed;
    EVLOG_info << "Transaction " << transaction_id << " stopped on " << charge_point_id << " connector "
               << current->connector_id << " energy=" << (meter_stop - current->meter_start) << "Wh"
               << (reason ? " reason=" + *reason : std::string{});
    outcome.status = LedgerStatus::Ok;
    outcome.session = session;
    return outcome;
}

std::optional<ActiveTransaction> TransactionLedger::active(const std::string& charge_point_id,
                                                           std::int32_t connector_id) const {
    return sessions_.with_shard(charge_point_id, [&](const auto& entries) -> std::optional<ActiveTransaction> {
        const auto cp_it = entries.find(charge_point_id);
        if (cp_it == entries.end()) {
            return std::nullopt;
        }
        const auto it = cp_it->second.find(connector_id);
        if (it == cp_it->second.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::optional<ActiveTransaction> TransactionLedger::find(const std::string& charge_point_id,
                                                         std::int32_t transaction_id) const {
    return sessions_.with_shard(charge_point_id, [&](const auto& entries) -> std::optional<ActiveTransaction> {
        const auto cp_it = entries.find(charge_point_id);
        if (cp_it == entries.end()) {
            return std::nullopt;
        }
        for (const auto& kv : cp_it->second) {
            if (kv.second.transaction_id == transaction_id) {
                return kv.second;
            }
        }
        return std::nullopt;
    });
}

std::vector<ActiveTransaction> TransactionLedger::active_for(const std::string& charge_point_id) const {
    return sessions_.with_shard(charge_point_id, [&](const auto& entries) {
        std::vector<ActiveTransaction> result;
        const auto cp_it = entries.find(charge_point_id);
        if (cp_it != entries.end()) {
            for (const auto& kv : cp_it->second) {
                result.push_back(kv.second);
            }
        }
        return result;
    });
}

std::size_t TransactionLedger::active_count() const {
    std::size_t count = 0;
    sessions_.for_each_shard([&](const auto& entries) {
        for (const auto& kv : entries) {
            count += kv.second.size();
        }
    });
    return count;
}

void TransactionLedger::release(const std::string& charge_point_id, std::int32_t connector_id,
                                std::int32_t transaction_id) {
    sessions_.with_shard(charge_point_id, [&](auto& entries) {
        const auto cp_it = entries.find(charge_point_id);
        if (cp_it == entries.end()) {
            return;
        }
        const auto it = cp_it->second.find(connector_id);
        if (it != cp_it->second.end() && it->second.transaction_id == transaction_id) {
            cp_it->second.erase(it);
        }
    });
}

} // namespace csms
