// SPDX-License-Identifier: Apache-2.0
#include "sqlite_storage.hpp"
#include "test_support.hpp"
#include "transaction_ledger.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <limits>

using namespace csms;
using namespace csms::testing;
using ocpp::v16::AuthorizationStatus;

namespace {

const auto T0 = at("2024-05-01T10:00:00Z");

SessionRecord active_session(std::int32_t transaction_id, const std::string& cp, std::int32_t connector) {
    SessionRecord record;
    record.transaction_id = transaction_id;
    record.charge_point_id = cp;
    record.connector_id = connector;
    record.id_tag = "TAG001";
    record.meter_start = 100;
    record.start_timestamp = T0;
    record.status = SessionStatus::Active;
    return record;
}

template <typename Fn>
bool throws_storage_error(Fn&& fn) {
    try {
        fn();
    } catch (const StorageError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // Charge points: boot upsert keeps the connector-0 status, reachability updates create bare rows
    {
        SqliteStorage storage(":memory:");
        assert(!storage.get_charge_point("CP1").has_value());

        storage.update_charge_point_status("CP1", "Available");
        ChargePointRecord record;
        record.id = "CP1";
        record.vendor = "VendorX";
        record.model = "ModelY";
        record.firmware_version = std::string("1.0");
        record.reachability = Reachability::Online;
        record.last_seen = T0;
        storage.upsert_charge_point(record);
        record.firmware_version = std::string("1.1");
        storage.upsert_charge_point(record);

        const auto stored = storage.get_charge_point("CP1").value();
        assert(stored.vendor == "VendorX");
        assert(stored.firmware_version.value() == "1.1");
        assert(!stored.iccid.has_value());
        assert(stored.status.value() == "Available");
        assert(stored.reachability == Reachability::Online);
        assert(stored.last_seen.value() == T0);

        storage.update_reachability("CP2", Reachability::Offline, T0 + std::chrono::seconds(5));
        const auto bare = storage.get_charge_point("CP2").value();
        assert(bare.vendor.empty());
        assert(bare.reachability == Reachability::Offline);

        const auto all = storage.list_charge_points();
        assert(all.size() == 2);
        assert(all[0].id == "CP1" && all[1].id == "CP2");
    }

    // Connectors
    {
        SqliteStorage storage(":memory:");
        ConnectorRecord connector;
        connector.charge_point_id = "CP1";
        connector.connector_id = 1;
        connector.status = ocpp::v16::ChargePointStatus::Faulted;
        connector.error_code = ocpp::v16::ChargePointErrorCode::OverCurrentFailure;
        connector.info = std::string("trip");
        connector.updated_at = T0;
        storage.upsert_connector(connector);
        connector.status = ocpp::v16::ChargePointStatus::Available;
        connector.error_code = ocpp::v16::ChargePointErrorCode::NoError;
        connector.info.reset();
        storage.upsert_connector(connector);

        const auto connectors = storage.list_connectors("CP1");
        assert(connectors.size() == 1);
        assert(connectors[0].status == ocpp::v16::ChargePointStatus::Available);
        assert(connectors[0].error_code == ocpp::v16::ChargePointErrorCode::NoError);
        assert(!connectors[0].info.has_value());
        assert(storage.get_charge_point("CP1").has_value());
    }

    // Id tags
    {
        SqliteStorage storage(":memory:");
        storage.upsert_id_tag(IdTagRecord{"TAG001", AuthorizationStatus::Accepted, at("2030-01-01T00:00:00Z"),
                                          std::string("PARENT")});
        const auto tag = storage.get_id_tag("TAG001").value();
        assert(tag.status == AuthorizationStatus::Accepted);
        assert(tag.expiry_date.value() == at("2030-01-01T00:00:00Z"));
        assert(tag.parent_id_tag.value() == "PARENT");

        storage.upsert_id_tag(IdTagRecord{"TAG001", AuthorizationStatus::Blocked, std::nullopt, std::nullopt});
        const auto replaced = storage.get_id_tag("TAG001").value();
        assert(replaced.status == AuthorizationStatus::Blocked);
        assert(!replaced.expiry_date.has_value());
        assert(!storage.get_id_tag("NOPE").has_value());
    }

    // Sessions and samples
    {
        SqliteStorage storage(":memory:");
        assert(!storage.max_transaction_id().has_value());
        storage.insert_session(active_session(1, "CP1", 1));
        assert(storage.get_charge_point("CP1").has_value());

        // Transaction ids are unique; one Active session per connector
        assert(throws_storage_error([&]() { storage.insert_session(active_session(1, "CP1", 2)); }));
        assert(throws_storage_error([&]() { storage.insert_session(active_session(2, "CP1", 1)); }));
        storage.insert_session(active_session(3, "CP1", 2));
        assert(storage.list_active_sessions().size() == 2);
        assert(storage.find_active_session("CP1", 2)->transaction_id == 3);
        assert(storage.max_transaction_id().value() == 3);

        MeterSampleRecord sample;
        sample.transaction_id = 1;
        sample.charge_point_id = "CP1";
        sample.connector_id = 1;
        sample.timestamp = T0 + std::chrono::seconds(60);
        sample.value = 120.5;
        sample.context = std::string("Sample.Periodic");
        storage.insert_meter_samples({sample});

        MeterSampleRecord orphan;
        orphan.charge_point_id = "CP1";
        orphan.connector_id = 4;
        orphan.timestamp = T0;
        orphan.value = 7;
        orphan.orphaned = true;
        storage.insert_meter_samples({orphan});

        const auto linked = storage.list_meter_samples(1);
        assert(linked.size() == 1);
        assert(linked[0].transaction_id.value() == 1);
        assert(linked[0].value == 120.5);
        assert(linked[0].context.value() == "Sample.Periodic");
        assert(!linked[0].phase.has_value());
        const auto orphans = storage.list_orphaned_samples("CP1");
        assert(orphans.size() == 1);
        assert(!orphans[0].transaction_id.has_value());
        assert(orphans[0].connector_id == 4);

        // A batch with one unstorable sample (NaN binds as NULL) leaves nothing behind
        MeterSampleRecord broken = sample;
        broken.value = std::numeric_limits<double>::quiet_NaN();
        assert(throws_storage_error([&]() { storage.insert_meter_samples({sample, broken}); }));
        assert(storage.list_meter_samples(1).size() == 1);

        // Completion fails as a whole when its transaction data cannot be stored
        assert(throws_storage_error([&]() {
            storage.complete_session(1, 150, T0 + std::chrono::seconds(600), std::string("Remote"), {sample, broken});
        }));
        assert(storage.find_active_session("CP1", 1).has_value());
        assert(storage.list_meter_samples(1).size() == 1);

        MeterSampleRecord final_sample = sample;
        final_sample.timestamp = T0 + std::chrono::seconds(590);
        final_sample.value = 149;
        storage.complete_session(1, 150, T0 + std::chrono::seconds(600), std::string("Remote"), {final_sample});
        assert(storage.list_meter_samples(1).size() == 2);
        assert(storage.list_meter_samples(1)[1].value == 149);
        const auto done = storage.get_session(1).value();
        assert(done.status == SessionStatus::Completed);
        assert(done.meter_stop.value() == 150);
        assert(done.stop_reason.value() == "Remote");
        assert(done.stop_timestamp.value() == T0 + std::chrono::seconds(600));
        assert(!storage.find_active_session("CP1", 1).has_value());

        // Completing twice, or an unknown transaction, is an error
        assert(throws_storage_error([&]() { storage.complete_session(1, 160, T0, std::nullopt, {}); }));
        assert(throws_storage_error([&]() { storage.complete_session(42, 160, T0, std::nullopt, {}); }));

        // The connector is free again
        storage.insert_session(active_session(4, "CP1", 1));
    }

    // Configuration and data transfers
    {
        SqliteStorage storage(":memory:");
        assert(!storage.get_configuration("CP1.HeartbeatInterval").has_value());
        storage.set_configuration("CP1.HeartbeatInterval", "300");
        storage.set_configuration("CP1.HeartbeatInterval", "60");
        assert(storage.get_configuration("CP1.HeartbeatInterval").value() == "60");

        DataTransferRecord transfer;
        transfer.charge_point_id = "CP1";
        transfer.vendor_id = "com.example";
        transfer.timestamp = T0;
        storage.record_data_transfer(transfer);
    }

    // State survives reopening the file; the ledger picks up where it left off
    {
        const auto path = std::filesystem::temp_directory_path() / "csms_sqlite_storage_tests.db";
        std::filesystem::remove(path);
        {
            SqliteStorage storage(path.string());
            TransactionLedger ledger(storage, std::chrono::milliseconds(1));
            ledger.restore();
            const auto first = ledger.begin("CP1", 1, "TAG001", 0, T0);
            const auto second = ledger.begin("CP1", 2, "TAG001", 0, T0);
            assert(first.status == LedgerStatus::Ok && second.status == LedgerStatus::Ok);
            assert(ledger.end("CP1", first.transaction->transaction_id, 10, T0, std::nullopt).status ==
                   LedgerStatus::Ok);
        }
        {
            SqliteStorage storage(path.string());
            TransactionLedger ledger(storage, std::chrono::milliseconds(1));
            ledger.restore();
            assert(ledger.active_count() == 1);
            assert(ledger.active("CP1", 2).has_value());
            assert(ledger.begin("CP1", 1, "TAG001", 0, T0).transaction->transaction_id == 3);
        }
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
    }

    // Unopenable path
    assert(throws_storage_error([]() { SqliteStorage storage("/nonexistent-dir/for/sure/csms.db"); }));

    std::cout << "sqlite_storage_tests passed\n";
    return 0;
}
