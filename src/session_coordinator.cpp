// SPDX-License-Identifier: Apache-2.0
#include "session_coordinator.hpp"

#include "ocpp_frames.hpp"

#include <algorithm>
#include <random>
#include <set>
#include <sstream>

#include <everest/logging.hpp>
#include <ocpp/v16/messages/ChangeAvailability.hpp>
#include <ocpp/v16/messages/ChangeConfiguration.hpp>
#include <ocpp/v16/messages/ClearCache.hpp>
#include <ocpp/v16/messages/RemoteStartTransaction.hpp>
#include <ocpp/v16/messages/RemoteStopTransaction.hpp>
#include <ocpp/v16/messages/Reset.hpp>

namespace csms {

namespace {
constexpr std::size_t ID_TAG_MAX_LENGTH = 20;
constexpr std::size_t CONFIGURATION_KEY_MAX_LENGTH = 50;
constexpr std::size_t CONFIGURATION_VALUE_MAX_LENGTH = 500;

std::string make_correlation_token() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << dist(gen);
    return ss.str();
}

ocpp::v16::AvailabilityType availability_for(ocpp::v16::ChargePointStatus status) {
    return status == ocpp::v16::ChargePointStatus::Unavailable ? ocpp::v16::AvailabilityType::Inoperative
                                                               : ocpp::v16::AvailabilityType::Operative;
}

// Validate a device reply against the typed response and lift its status field into the reply.
template <typename Response>
CommandReply interpret(CommandReply reply) {
    if (reply.code != ResultCode::Ok) {
        return reply;
    }
    try {
        (void)reply.payload.get<Response>();
        reply.status = reply.payload.at("status").get<std::string>();
    } catch (const std::exception& e) {
        EVLOG_warning << "Malformed command reply " << reply.payload.dump() << ": " << e.what();
        reply.code = ResultCode::ProtocolRejected;
        reply.status = "FormationViolation";
        reply.error_description = e.what();
        return reply;
    }
    if (reply.status == "Rejected" || reply.status == "NotSupported") {
        reply.code = ResultCode::ProtocolRejected;
    }
    return reply;
}

CommandReply rejected(const std::string& status, const std::string& description) {
    CommandReply reply;
    reply.code = ResultCode::ProtocolRejected;
    reply.status = status;
    reply.error_description = description;
    return reply;
}
} // namespace

std::string result_code_to_string(ResultCode code) {
    switch (code) {
    case ResultCode::Ok:
        return "Ok";
    case ResultCode::ProtocolRejected:
        return "ProtocolRejected";
    case ResultCode::NotFound:
        return "NotFound";
    case ResultCode::Unreachable:
        return "Unreachable";
    case ResultCode::Timeout:
        return "Timeout";
    case ResultCode::Busy:
        return "Busy";
    case ResultCode::StorageFailure:
        return "StorageFailure";
    }
    return "Unknown";
}

SessionCoordinator::SessionCoordinator(CoordinatorConfig cfg, Storage& storage, ConnectionRegistry& registry,
                                       AuthorizationCache& auth_cache, TransactionLedger& ledger, Clock clock) :
    cfg_(cfg),
    storage_(storage),
    registry_(registry),
    auth_cache_(auth_cache),
    ledger_(ledger),
    clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {
}

void SessionCoordinator::on_connected(const std::string& charge_point_id, std::shared_ptr<Connection> connection) {
    const auto now = clock_();
    const auto peer = connection ? connection->identity() : std::string("<none>");
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    registry_.register_connection(charge_point_id, std::move(connection), now);
    registry_.touch(charge_point_id, now);
    persist_reachability(charge_point_id, Reachability::Online, now);
    EVLOG_info << "Charge point " << charge_point_id << " connected from " << peer;
}

void SessionCoordinator::on_disconnected(const std::string& charge_point_id,
                                         const std::shared_ptr<Connection>& connection) {
    bool persisted = false;
    {
        auto cp_lock = registry_.lock_for(charge_point_id);
        std::lock_guard<std::mutex> lock(*cp_lock);
        if (!registry_.unregister_connection(charge_point_id, connection)) {
            EVLOG_debug << "Ignoring disconnect of superseded connection for " << charge_point_id;
            return;
        }
        const auto last_seen = registry_.last_activity(charge_point_id).value_or(clock_());
        persisted = persist_reachability(charge_point_id, Reachability::Offline, last_seen);
        EVLOG_info << "Charge point " << charge_point_id << " disconnected";
    }
    // Once Offline is stored the registry need not remember this charge point any longer.
    if (persisted) {
        registry_.forget_if_idle(charge_point_id);
    }
}

BootResult SessionCoordinator::on_boot(const std::string& charge_point_id, const BootInfo& info) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    registry_.touch(charge_point_id, now);

    BootResult result;
    result.current_time = now;
    result.interval = cfg_.heartbeat_interval;

    ChargePointRecord record;
    record.id = charge_point_id;
    record.vendor = info.vendor;
    record.model = info.model;
    record.charge_point_serial_number = info.charge_point_serial_number;
    record.charge_box_serial_number = info.charge_box_serial_number;
    record.firmware_version = info.firmware_version;
    record.iccid = info.iccid;
    record.imsi = info.imsi;
    record.meter_type = info.meter_type;
    record.meter_serial_number = info.meter_serial_number;
    record.reachability = Reachability::Online;
    record.last_seen = now;
    try {
        storage_.upsert_charge_point(record);
    } catch (const StorageError& e) {
        // Pending asks the device to boot again after the interval instead of operating unregistered.
        EVLOG_error << "Failed to register charge point " << charge_point_id << ": " << e.what()
                    << "; answering Pending";
        result.status = ocpp::v16::RegistrationStatus::Pending;
        return result;
    }
    result.status = ocpp::v16::RegistrationStatus::Accepted;
    EVLOG_info << "BootNotification from " << charge_point_id << " vendor=" << info.vendor << " model=" << info.model
               << (info.firmware_version ? " firmware=" + *info.firmware_version : std::string{})
               << "; Accepted, interval=" << cfg_.heartbeat_interval.count() << "s";
    return result;
}

Timestamp SessionCoordinator::on_heartbeat(const std::string& charge_point_id) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    registry_.touch(charge_point_id, now);
    persist_reachability(charge_point_id, Reachability::Online, now);
    EVLOG_debug << "Heartbeat from " << charge_point_id;
    return now;
}

Verdict SessionCoordinator::on_authorize(const std::string& charge_point_id, const std::string& id_tag) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    note_activity(charge_point_id, now);
    const auto verdict = auth_cache_.resolve(id_tag, now);
    EVLOG_info << "Authorize from " << charge_point_id << " idTag=" << id_tag << ": " << verdict.status;
    return verdict;
}

void SessionCoordinator::on_status_notification(const std::string& charge_point_id, const StatusReport& report) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    note_activity(charge_point_id, now);

    const auto status_text = ocpp::v16::conversions::charge_point_status_to_string(report.status);
    EVLOG_info << "StatusNotification from " << charge_point_id << " connector " << report.connector_id << ": "
               << status_text << " error=" << report.error_code
               << (report.info ? " info=" + *report.info : std::string{});
    try {
        if (report.connector_id == 0) {
            storage_.update_charge_point_status(charge_point_id, status_text);
            return;
        }
        ConnectorRecord record;
        record.charge_point_id = charge_point_id;
        record.connector_id = report.connector_id;
        record.status = report.status;
        record.availability = availability_for(report.status);
        record.error_code = report.error_code;
        record.info = report.info;
        record.vendor_error_code = report.vendor_error_code;
        record.updated_at = report.timestamp.value_or(now);
        storage_.upsert_connector(record);
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to persist status of " << charge_point_id << " connector " << report.connector_id
                    << ": " << e.what();
    }
}

StartResult SessionCoordinator::on_start_transaction(const std::string& charge_point_id, std::int32_t connector_id,
                                                     const std::string& id_tag, std::int32_t meter_start,
                                                     Timestamp started_at) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    note_activity(charge_point_id, now);

    StartResult result;
    if (connector_id <= 0) {
        EVLOG_warning << "StartTransaction from " << charge_point_id << " on invalid connector " << connector_id;
        result.code = ResultCode::ProtocolRejected;
        result.id_tag_info.status = ocpp::v16::AuthorizationStatus::Invalid;
        return result;
    }

    result.id_tag_info = auth_cache_.resolve(id_tag, now);
    if (!result.id_tag_info.accepted()) {
        EVLOG_warning << "StartTransaction from " << charge_point_id << " connector " << connector_id
                      << " rejected: idTag " << id_tag << " is " << result.id_tag_info.status;
        result.code = ResultCode::ProtocolRejected;
        return result;
    }

    const auto outcome = ledger_.begin(charge_point_id, connector_id, id_tag, meter_start, started_at);
    switch (outcome.status) {
    case LedgerStatus::Ok:
        result.code = ResultCode::Ok;
        result.transaction_id = outcome.transaction->transaction_id;
        break;
    case LedgerStatus::AlreadyActive:
        result.code = ResultCode::ProtocolRejected;
        result.id_tag_info.status = ocpp::v16::AuthorizationStatus::ConcurrentTx;
        break;
    case LedgerStatus::StorageFailure:
    case LedgerStatus::NotFound:
        result.code = ResultCode::StorageFailure;
        result.id_tag_info.status = ocpp::v16::AuthorizationStatus::Invalid;
        break;
    }
    return result;
}

StopResult SessionCoordinator::on_stop_transaction(const std::string& charge_point_id, const StopReport& report) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    note_activity(charge_point_id, now);

    StopResult result;
    if (report.id_tag && !report.id_tag->empty()) {
        result.id_tag_info = auth_cache_.resolve(*report.id_tag, now);
    }

    const auto current = ledger_.find(charge_point_id, report.transaction_id);
    if (!current) {
        // Nothing to complete; the transaction data is kept as orphaned samples.
        try {
            storage_.insert_meter_samples(
                sample_records(charge_point_id, 0, std::nullopt, report.transaction_data));
        } catch (const StorageError& e) {
            EVLOG_error << "Failed to persist transaction data of " << report.transaction_id << " from "
                        << charge_point_id << ": " << e.what();
            result.code = ResultCode::StorageFailure;
            return result;
        }
        EVLOG_warning << "StopTransaction from " << charge_point_id << " for transaction " << report.transaction_id
                      << " with no Active session; acknowledging";
        result.code = ResultCode::NotFound;
        return result;
    }

    // Completion and transaction data are written together or not at all.
    const auto outcome =
        ledger_.end(charge_point_id, report.transaction_id, report.meter_stop, report.timestamp, report.reason,
                    sample_records(charge_point_id, current->connector_id, report.transaction_id,
                                   report.transaction_data));
    switch (outcome.status) {
    case LedgerStatus::Ok:
        result.code = ResultCode::Ok;
        break;
    case LedgerStatus::NotFound:
        EVLOG_warning << "StopTransaction from " << charge_point_id << " for transaction " << report.transaction_id
                      << " with no Active session; acknowledging";
        result.code = ResultCode::NotFound;
        break;
    case LedgerStatus::StorageFailure:
    case LedgerStatus::AlreadyActive:
        result.code = ResultCode::StorageFailure;
        break;
    }
    return result;
}

ResultCode SessionCoordinator::on_meter_values(const std::string& charge_point_id, std::int32_t connector_id,
                                               std::optional<std::int32_t> transaction_id,
                                               const std::vector<MeterSample>& samples) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    note_activity(charge_point_id, clock_());

    const auto active = connector_id > 0 ? ledger_.active(charge_point_id, connector_id) : std::nullopt;
    std::optional<std::int32_t> link;
    if (active) {
        link = active->transaction_id;
        if (transaction_id && *transaction_id != active->transaction_id) {
            EVLOG_warning << "MeterValues from " << charge_point_id << " connector " << connector_id
                          << " name transaction " << *transaction_id << " but " << active->transaction_id
                          << " is active; attributing to the active session";
        }
    } else if (transaction_id) {
        EVLOG_warning << "MeterValues from " << charge_point_id << " connector " << connector_id
                      << " name transaction " << *transaction_id << " which is not active; storing as orphaned";
    }

    try {
        storage_.insert_meter_samples(sample_records(charge_point_id, connector_id, link, samples));
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to persist meter values from " << charge_point_id << " connector " << connector_id
                    << ": " << e.what();
        return ResultCode::StorageFailure;
    }
    EVLOG_debug << "Stored " << samples.size() << " meter sample(s) from " << charge_point_id << " connector "
                << connector_id << (link ? " for transaction " + std::to_string(*link) : std::string(" (orphaned)"));
    return ResultCode::Ok;
}

void SessionCoordinator::on_data_transfer(const std::string& charge_point_id, const std::string& vendor_id,
                                          const std::optional<std::string>& message_id,
                                          const std::optional<std::string>& data) {
    auto cp_lock = registry_.lock_for(charge_point_id);
    std::lock_guard<std::mutex> lock(*cp_lock);
    const auto now = clock_();
    note_activity(charge_point_id, now);

    EVLOG_info << "DataTransfer from " << charge_point_id << " vendor=" << vendor_id
               << (message_id ? " messageId=" + *message_id : std::string{});
    DataTransferRecord record;
    record.charge_point_id = charge_point_id;
    record.vendor_id = vendor_id;
    record.message_id = message_id;
    record.data = data;
    record.timestamp = now;
    try {
        storage_.record_data_transfer(record);
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to store DataTransfer from " << charge_point_id << ": " << e.what();
    }
}

void SessionCoordinator::on_command_reply(const std::string& charge_point_id, const std::string& token,
                                          const nlohmann::json& payload) {
    {
        auto cp_lock = registry_.lock_for(charge_point_id);
        std::lock_guard<std::mutex> lock(*cp_lock);
        note_activity(charge_point_id, clock_());
    }
    CommandReply reply;
    reply.code = ResultCode::Ok;
    reply.payload = payload;
    complete_pending(charge_point_id, token, std::move(reply));
}

void SessionCoordinator::on_command_error(const std::string& charge_point_id, const std::string& token,
                                          const std::string& error_code, const std::string& description) {
    {
        auto cp_lock = registry_.lock_for(charge_point_id);
        std::lock_guard<std::mutex> lock(*cp_lock);
        note_activity(charge_point_id, clock_());
    }
    EVLOG_warning << "CALLERROR from " << charge_point_id << " for " << token << ": " << error_code << " "
                  << description;
    complete_pending(charge_point_id, token, rejected(error_code, description));
}

CommandReply SessionCoordinator::remote_start(const std::string& charge_point_id, const std::string& id_tag,
                                              std::optional<std::int32_t> connector_id) {
    if (!registry_.lookup(charge_point_id)) {
        EVLOG_warning << "RemoteStartTransaction to " << charge_point_id << " refused: not connected";
        CommandReply reply;
        reply.code = ResultCode::Unreachable;
        return reply;
    }
    if (id_tag.empty() || id_tag.size() > ID_TAG_MAX_LENGTH) {
        return rejected("Invalid", "idTag must be 1.." + std::to_string(ID_TAG_MAX_LENGTH) + " characters");
    }
    const auto verdict = auth_cache_.resolve(id_tag, clock_());
    if (!verdict.accepted()) {
        EVLOG_warning << "RemoteStartTransaction to " << charge_point_id << " refused: idTag " << id_tag << " is "
                      << verdict.status;
        return rejected(ocpp::v16::conversions::authorization_status_to_string(verdict.status),
                        "idTag not authorized");
    }

    ocpp::v16::RemoteStartTransactionRequest req;
    req.idTag = ocpp::CiString<20>(id_tag);
    req.connectorId = connector_id;
    const nlohmann::json payload = req;
    return interpret<ocpp::v16::RemoteStartTransactionResponse>(
        send_command(charge_point_id, req.get_type(), payload));
}

CommandReply SessionCoordinator::remote_stop(const std::string& charge_point_id, std::int32_t transaction_id) {
    if (!registry_.lookup(charge_point_id)) {
        EVLOG_warning << "RemoteStopTransaction to " << charge_point_id << " refused: not connected";
        CommandReply reply;
        reply.code = ResultCode::Unreachable;
        return reply;
    }
    if (!ledger_.find(charge_point_id, transaction_id)) {
        EVLOG_warning << "RemoteStopTransaction to " << charge_point_id << " refused: transaction " << transaction_id
                      << " is not active there";
        CommandReply reply;
        reply.code = ResultCode::NotFound;
        return reply;
    }

    // The session itself only closes when the device reports StopTransaction.
    ocpp::v16::RemoteStopTransactionRequest req;
    req.transactionId = transaction_id;
    const nlohmann::json payload = req;
    return interpret<ocpp::v16::RemoteStopTransactionResponse>(
        send_command(charge_point_id, req.get_type(), payload));
}

CommandReply SessionCoordinator::change_availability(const std::string& charge_point_id, std::int32_t connector_id,
                                                     ocpp::v16::AvailabilityType type) {
    if (connector_id < 0) {
        return rejected("Invalid", "connectorId must be >= 0");
    }
    ocpp::v16::ChangeAvailabilityRequest req;
    req.connectorId = connector_id;
    req.type = type;
    const nlohmann::json payload = req;
    return interpret<ocpp::v16::ChangeAvailabilityResponse>(send_command(charge_point_id, req.get_type(), payload));
}

CommandReply SessionCoordinator::reset(const std::string& charge_point_id, ocpp::v16::ResetType type) {
    ocpp::v16::ResetRequest req;
    req.type = type;
    const nlohmann::json payload = req;
    return interpret<ocpp::v16::ResetResponse>(send_command(charge_point_id, req.get_type(), payload));
}

CommandReply SessionCoordinator::change_configuration(const std::string& charge_point_id, const std::string& key,
                                                      const std::string& value) {
    if (key.empty() || key.size() > CONFIGURATION_KEY_MAX_LENGTH) {
        return rejected("Invalid", "key must be 1.." + std::to_string(CONFIGURATION_KEY_MAX_LENGTH) + " characters");
    }
    if (value.size() > CONFIGURATION_VALUE_MAX_LENGTH) {
        return rejected("Invalid",
                        "value must be at most " + std::to_string(CONFIGURATION_VALUE_MAX_LENGTH) + " characters");
    }
    ocpp::v16::ChangeConfigurationRequest req;
    req.key = ocpp::CiString<50>(key);
    req.value = ocpp::CiString<500>(value);
    const nlohmann::json payload = req;
    auto reply =
        interpret<ocpp::v16::ChangeConfigurationResponse>(send_command(charge_point_id, req.get_type(), payload));
    if (reply.code == ResultCode::Ok && (reply.status == "Accepted" || reply.status == "RebootRequired")) {
        try {
            storage_.set_configuration(charge_point_id + "." + key, value);
        } catch (const StorageError& e) {
            EVLOG_error << "Failed to record configuration " << key << " of " << charge_point_id << ": "
                        << e.what();
        }
    }
    return reply;
}

CommandReply SessionCoordinator::clear_cache(const std::optional<std::string>& charge_point_id) {
    auth_cache_.invalidate_all();
    if (!charge_point_id) {
        CommandReply reply;
        reply.code = ResultCode::Ok;
        reply.status = "Accepted";
        return reply;
    }
    ocpp::v16::ClearCacheRequest req;
    const nlohmann::json payload = req;
    return interpret<ocpp::v16::ClearCacheResponse>(send_command(*charge_point_id, req.get_type(), payload));
}

ChargePointStatusView SessionCoordinator::charge_point_status(const std::string& charge_point_id) {
    ChargePointStatusView view;
    view.id = charge_point_id;
    try {
        view.record = with_read_retry([&]() { return storage_.get_charge_point(charge_point_id); },
                                      cfg_.read_retry_backoff, "get_charge_point");
        view.connectors = with_read_retry([&]() { return storage_.list_connectors(charge_point_id); },
                                          cfg_.read_retry_backoff, "list_connectors");
    } catch (const StorageError& e) {
        EVLOG_error << "Status query for " << charge_point_id << " could not read storage: " << e.what();
    }
    view.reachability = registry_.reachability(charge_point_id);
    if (view.reachability == Reachability::Unknown && view.record) {
        view.reachability = view.record->reachability;
    }
    view.connected = registry_.lookup(charge_point_id) != nullptr;
    view.last_activity = registry_.last_activity(charge_point_id);
    if (!view.last_activity && view.record) {
        view.last_activity = view.record->last_seen;
    }
    view.active_transactions = ledger_.active_for(charge_point_id);
    return view;
}

std::vector<ChargePointStatusView> SessionCoordinator::charge_point_overview() {
    std::set<std::string> ids;
    try {
        const auto records = with_read_retry([&]() { return storage_.list_charge_points(); }, cfg_.read_retry_backoff,
                                             "list_charge_points");
        for (const auto& record : records) {
            ids.insert(record.id);
        }
    } catch (const StorageError& e) {
        EVLOG_error << "Overview could not list charge points: " << e.what();
    }
    for (const auto& id : registry_.connected_ids()) {
        ids.insert(id);
    }

    std::vector<ChargePointStatusView> views;
    views.reserve(ids.size());
    for (const auto& id : ids) {
        views.push_back(charge_point_status(id));
    }
    return views;
}

Verdict SessionCoordinator::validate_tag(const std::string& id_tag) {
    return auth_cache_.resolve(id_tag, clock_());
}

void SessionCoordinator::provision_tag(const IdTagRecord& record) {
    storage_.upsert_id_tag(record);
    auth_cache_.invalidate(record.id_tag);
    EVLOG_info << "Provisioned id tag " << record.id_tag << " as " << record.status
               << (record.parent_id_tag ? " parent=" + *record.parent_id_tag : std::string{});
}

std::size_t SessionCoordinator::pending_command_count() const {
    std::size_t count = 0;
    pending_.for_each_shard([&](const auto& entries) { count += entries.size(); });
    return count;
}

void SessionCoordinator::shutdown() {
    accepting_commands_ = false;
    std::vector<std::pair<std::string, PendingCommand>> abandoned;
    pending_.for_each_shard([&](auto& entries) {
        for (auto& kv : entries) {
            abandoned.emplace_back(kv.first, std::move(kv.second));
        }
        entries.clear();
    });
    for (auto& kv : abandoned) {
        EVLOG_warning << kv.second.action << " to " << kv.first << " (" << kv.second.token
                      << ") abandoned at shutdown";
        CommandReply reply;
        reply.code = ResultCode::Timeout;
        kv.second.reply->set_value(std::move(reply));
    }
}

void SessionCoordinator::note_activity(const std::string& charge_point_id, Timestamp now) {
    if (registry_.touch(charge_point_id, now)) {
        EVLOG_info << "Charge point " << charge_point_id << " is Online again";
        persist_reachability(charge_point_id, Reachability::Online, now);
    }
}

bool SessionCoordinator::persist_reachability(const std::string& charge_point_id, Reachability reachability,
                                              Timestamp now) {
    try {
        storage_.update_reachability(charge_point_id, reachability, now);
    } catch (const StorageError& e) {
        EVLOG_error << "Failed to persist " << reachability_to_string(reachability) << " for " << charge_point_id
                    << ": " << e.what();
        return false;
    }
    return true;
}

std::vector<MeterSampleRecord> SessionCoordinator::sample_records(const std::string& charge_point_id,
                                                                  std::int32_t connector_id,
                                                                  std::optional<std::int32_t> transaction_id,
                                                                  const std::vector<MeterSample>& samples) {
    std::vector<MeterSampleRecord> records;
    records.reserve(samples.size());
    for (const auto& sample : samples) {
        MeterSampleRecord record;
        record.transaction_id = transaction_id;
        record.charge_point_id = charge_point_id;
        record.connector_id = connector_id;
        record.timestamp = sample.timestamp;
        record.value = sample.value;
        record.measurand = sample.measurand;
        record.unit = sample.unit;
        record.context = sample.context;
        record.phase = sample.phase;
        record.location = sample.location;
        record.orphaned = !transaction_id.has_value();
        records.push_back(std::move(record));
    }
    return records;
}

void SessionCoordinator::complete_pending(const std::string& charge_point_id, const std::string& token,
                                          CommandReply reply) {
    std::shared_ptr<std::promise<CommandReply>> promise;
    std::string action;
    pending_.with_shard(charge_point_id, [&](auto& entries) {
        const auto it = entries.find(charge_point_id);
        if (it == entries.end() || it->second.token != token) {
            return;
        }
        promise = std::move(it->second.reply);
        action = it->second.action;
        entries.erase(it);
    });
    if (!promise) {
        EVLOG_warning << "Discarding reply " << token << " from " << charge_point_id
                      << ": no command with that id is pending";
        return;
    }
    EVLOG_info << action << " reply from " << charge_point_id << " (" << token << ") received";
    promise->set_value(std::move(reply));
}

CommandReply SessionCoordinator::send_command(const std::string& charge_point_id, const std::string& action,
                                              const nlohmann::json& payload) {
    CommandReply reply;
    const auto connection = registry_.lookup(charge_point_id);
    if (!connection) {
        EVLOG_warning << action << " to " << charge_point_id << " refused: not connected";
        reply.code = ResultCode::Unreachable;
        return reply;
    }

    const auto token = make_correlation_token();
    auto promise = std::make_shared<std::promise<CommandReply>>();
    auto future = promise->get_future();
    std::string busy_with;
    bool shutting_down = false;
    pending_.with_shard(charge_point_id, [&](auto& entries) {
        // Checked under the shard lock so shutdown() either sees this entry or this call sees the flag.
        if (!accepting_commands_) {
            shutting_down = true;
            return;
        }
        const auto it = entries.find(charge_point_id);
        if (it != entries.end()) {
            busy_with = it->second.action + " (" + it->second.token + ")";
            return;
        }
        entries.emplace(charge_point_id, PendingCommand{token, action, promise});
    });
    if (shutting_down) {
        EVLOG_warning << action << " to " << charge_point_id << " refused: central system is shutting down";
        reply.code = ResultCode::Unreachable;
        return reply;
    }
    if (!busy_with.empty()) {
        EVLOG_warning << action << " to " << charge_point_id << " refused: " << busy_with << " still pending";
        reply.code = ResultCode::Busy;
        return reply;
    }

    EVLOG_info << "Sending " << action << " to " << charge_point_id << " (" << token << ")";
    connection->send(make_call(token, action, payload));

    if (future.wait_for(cfg_.command_timeout) == std::future_status::ready) {
        return future.get();
    }

    bool expired = false;
    pending_.with_shard(charge_point_id, [&](auto& entries) {
        const auto it = entries.find(charge_point_id);
        if (it != entries.end() && it->second.token == token) {
            entries.erase(it);
            expired = true;
        }
    });
    if (!expired) {
        // The reply claimed the entry between the wait and the removal; its value is on the way.
        return future.get();
    }
    EVLOG_warning << action << " to " << charge_point_id << " (" << token << ") timed out after "
                  << cfg_.command_timeout.count() << "ms";
    reply.code = ResultCode::Timeout;
    return reply;
}

} // namespace csms
