// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "session_coordinator.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace csms {

/// \brief Charge-point-initiated actions the central system handles.
enum class MessageKind {
    BootNotification,
    Heartbeat,
    Authorize,
    StatusNotification,
    StartTransaction,
    StopTransaction,
    MeterValues,
    DataTransfer,
};

std::optional<MessageKind> message_kind_from_string(const std::string& action);
std::string message_kind_to_string(MessageKind kind);

/// \brief Decodes OCPP-J frames from one charge point, dispatches CALLs to the coordinator and encodes the answer.
class MessageRouter {
public:
    explicit MessageRouter(SessionCoordinator& coordinator);

    /// \brief Handle one inbound text frame.
    /// \returns the frame to send back (CALLRESULT or CALLERROR), or nullopt when nothing is owed to the device
    std::optional<std::string> handle_frame(const std::string& charge_point_id, const std::string& text);

private:
    SessionCoordinator& coordinator_;

    nlohmann::json dispatch(MessageKind kind, const std::string& charge_point_id, const nlohmann::json& payload);

    nlohmann::json handle_boot_notification(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_heartbeat(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_authorize(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_status_notification(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_start_transaction(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_stop_transaction(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_meter_values(const std::string& charge_point_id, const nlohmann::json& payload);
    nlohmann::json handle_data_transfer(const std::string& charge_point_id, const nlohmann::json& payload);
};

} // namespace csms
