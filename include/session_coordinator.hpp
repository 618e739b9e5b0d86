// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "authorization_cache.hpp"
#include "connection_registry.hpp"
#include "sharded_map.hpp"
#include "storage.hpp"
#include "transaction_ledger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <ocpp/v16/ocpp_enums.hpp>

namespace csms {

enum class ResultCode { Ok, ProtocolRejected, NotFound, Unreachable, Timeout, Busy, StorageFailure };

std::string result_code_to_string(ResultCode code);

struct BootInfo {
    std::string vendor;
    std::string model;
    std::optional<std::string> charge_point_serial_number;
    std::optional<std::string> charge_box_serial_number;
    std::optional<std::string> firmware_version;
    std::optional<std::string> iccid;
    std::optional<std::string> imsi;
    std::optional<std::string> meter_type;
    std::optional<std::string> meter_serial_number;
};

struct BootResult {
    ocpp::v16::RegistrationStatus status{ocpp::v16::RegistrationStatus::Accepted};
    Timestamp current_time{};
    std::chrono::seconds interval{0};
};

struct StatusReport {
    std::int32_t connector_id{0};
    ocpp::v16::ChargePointStatus status{ocpp::v16::ChargePointStatus::Available};
    ocpp::v16::ChargePointErrorCode error_code{ocpp::v16::ChargePointErrorCode::NoError};
    std::optional<std::string> info;
    std::optional<std::string> vendor_error_code;
    std::optional<Timestamp> timestamp;
};

/// \brief One sampled value as reported by the device, already converted to a number.
struct MeterSample {
    Timestamp timestamp{};
    double value{0.0};
    std::string measurand{"Energy.Active.Import.Register"};
    std::string unit{"Wh"};
    std::optional<std::string> context;
    std::optional<std::string> phase;
    std::optional<std::string> location;
};

struct StartResult {
    ResultCode code{ResultCode::Ok};
    Verdict id_tag_info;
    std::optional<std::int32_t> transaction_id;
};

struct StopReport {
    std::int32_t transaction_id{0};
    std::int32_t meter_stop{0};
    Timestamp timestamp{};
    std::optional<std::string> reason;
    std::optional<std::string> id_tag;
    std::vector<MeterSample> transaction_data;
};

struct StopResult {
    ResultCode code{ResultCode::Ok};
    std::optional<Verdict> id_tag_info;
};

/// \brief Outcome of a centrally initiated command. \p status carries the device's status field or, for a
/// CALLERROR, the error code.
struct CommandReply {
    ResultCode code{ResultCode::Ok};
    std::string status;
    nlohmann::json payload = nlohmann::json::object();
    std::string error_description;
};

struct ChargePointStatusView {
    std::string id;
    std::optional<ChargePointRecord> record;
    Reachability reachability{Reachability::Unknown};
    bool connected{false};
    std::optional<Timestamp> last_activity;
    std::vector<ConnectorRecord> connectors;
    std::vector<ActiveTransaction> active_transactions;
};

struct CoordinatorConfig {
    std::chrono::seconds heartbeat_interval{300};
    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds read_retry_backoff{50};
};

/// \brief Protocol-level semantics of the central system, independent of the transport.
///
/// Inbound operations for one charge point are serialized by the registry's per-identifier mutex; different charge
/// points run in parallel. Outbound commands hold no per-charge-point lock while waiting for the device's reply, so
/// inbound traffic (including the reply itself) keeps flowing.
class SessionCoordinator {
public:
    using Clock = std::function<Timestamp()>;

    SessionCoordinator(CoordinatorConfig cfg, Storage& storage, ConnectionRegistry& registry,
                       AuthorizationCache& auth_cache, TransactionLedger& ledger, Clock clock = {});

    void on_connected(const std::string& charge_point_id, std::shared_ptr<Connection> connection);
    void on_disconnected(const std::string& charge_point_id, const std::shared_ptr<Connection>& connection);

    BootResult on_boot(const std::string& charge_point_id, const BootInfo& info);
    Timestamp on_heartbeat(const std::string& charge_point_id);
    Verdict on_authorize(const std::string& charge_point_id, const std::string& id_tag);
    void on_status_notification(const std::string& charge_point_id, const StatusReport& report);
    StartResult on_start_transaction(const std::string& charge_point_id, std::int32_t connector_id,
                                     const std::string& id_tag, std::int32_t meter_start, Timestamp started_at);
    StopResult on_stop_transaction(const std::string& charge_point_id, const StopReport& report);
    ResultCode on_meter_values(const std::string& charge_point_id, std::int32_t connector_id,
                               std::optional<std::int32_t> transaction_id, const std::vector<MeterSample>& samples);
    void on_data_transfer(const std::string& charge_point_id, const std::string& vendor_id,
                          const std::optional<std::string>& message_id, const std::optional<std::string>& data);

    /// \brief Complete the pending command whose correlation token is \p token. Unknown tokens are logged and dropped.
    void on_command_reply(const std::string& charge_point_id, const std::string& token,
                          const nlohmann::json& payload);
    void on_command_error(const std::string& charge_point_id, const std::string& token, const std::string& error_code,
                          const std::string& description);

    CommandReply remote_start(const std::string& charge_point_id, const std::string& id_tag,
                              std::optional<std::int32_t> connector_id);
    CommandReply remote_stop(const std::string& charge_point_id, std::int32_t transaction_id);
    CommandReply change_availability(const std::string& charge_point_id, std::int32_t connector_id,
                                     ocpp::v16::AvailabilityType type);
    CommandReply reset(const std::string& charge_point_id, ocpp::v16::ResetType type);
    CommandReply change_configuration(const std::string& charge_point_id, const std::string& key,
                                      const std::string& value);
    CommandReply clear_cache(const std::optional<std::string>& charge_point_id);

    ChargePointStatusView charge_point_status(const std::string& charge_point_id);
    std::vector<ChargePointStatusView> charge_point_overview();
    Verdict validate_tag(const std::string& id_tag);

    /// \brief Store or replace an identity tag and drop any cached verdict for it.
    void provision_tag(const IdTagRecord& record);

    std::size_t pending_command_count() const;

    /// \brief Refuse further commands and complete every pending one with Timeout so no caller stays blocked.
    void shutdown();

private:
    struct PendingCommand {
        std::string token;
        std::string action;
        std::shared_ptr<std::promise<CommandReply>> reply;
    };

    CoordinatorConfig cfg_;
    Storage& storage_;
    ConnectionRegistry& registry_;
    AuthorizationCache& auth_cache_;
    TransactionLedger& ledger_;
    Clock clock_;

    ShardedMap<std::string, PendingCommand> pending_;
    std::atomic<bool> accepting_commands_{true};

    void note_activity(const std::string& charge_point_id, Timestamp now);
    bool persist_reachability(const std::string& charge_point_id, Reachability reachability, Timestamp now);
    static std::vector<MeterSampleRecord> sample_records(const std::string& charge_point_id, std::int32_t connector_id,
                                                         std::optional<std::int32_t> transaction_id,
                                                         const std::vector<MeterSample>& samples);
    void complete_pending(const std::string& charge_point_id, const std::string& token, CommandReply reply);

    /// \brief Send one CALL and wait for its reply or the command deadline.
    CommandReply send_command(const std::string& charge_point_id, const std::string& action,
                              const nlohmann::json& payload);
};

} // namespace csms
