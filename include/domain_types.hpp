// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <ocpp/v16/ocpp_enums.hpp>

namespace csms {

enum class Reachability { Unknown, Online, Offline };

enum class SessionStatus { Active, Completed };

std::string reachability_to_string(Reachability r);
Reachability reachability_from_string(const std::string& s);
std::string session_status_to_string(SessionStatus s);
SessionStatus session_status_from_string(const std::string& s);

struct ChargePointRecord {
    std::string id;
    std::string vendor;
    std::string model;
    std::optional<std::string> charge_point_serial_number;
    std::optional<std::string> charge_box_serial_number;
    std::optional<std::string> firmware_version;
    std::optional<std::string> iccid;
    std::optional<std::string> imsi;
    std::optional<std::string> meter_type;
    std::optional<std::string> meter_serial_number;
    std::optional<std::string> status; // last status reported for connector 0
    Reachability reachability{Reachability::Unknown};
    std::optional<Timestamp> last_seen;
};

struct ConnectorRecord {
    std::string charge_point_id;
    std::int32_t connector_id{0};
    ocpp::v16::ChargePointStatus status{ocpp::v16::ChargePointStatus::Available};
    ocpp::v16::AvailabilityType availability{ocpp::v16::AvailabilityType::Operative};
    ocpp::v16::ChargePointErrorCode error_code{ocpp::v16::ChargePointErrorCode::NoError};
    std::optional<std::string> info;
    std::optional<std::string> vendor_error_code;
    Timestamp updated_at{};
};

struct IdTagRecord {
    std::string id_tag;
    ocpp::v16::AuthorizationStatus status{ocpp::v16::AuthorizationStatus::Accepted};
    std::optional<Timestamp> expiry_date;
    std::optional<std::string> parent_id_tag;
};

struct SessionRecord {
    std::int32_t transaction_id{0};
    std::string charge_point_id;
    std::int32_t connector_id{0};
    std::string id_tag;
    std::int32_t meter_start{0};
    std::optional<std::int32_t> meter_stop;
    Timestamp start_timestamp{};
    std::optional<Timestamp> stop_timestamp;
    std::optional<std::string> stop_reason;
    SessionStatus status{SessionStatus::Active};
};

struct MeterSampleRecord {
    std::optional<std::int32_t> transaction_id; // empty for orphaned samples
    std::string charge_point_id;
    std::int32_t connector_id{0};
    Timestamp timestamp{};
    double value{0.0};
    std::string measurand{"Energy.Active.Import.Register"};
    std::string unit{"Wh"};
    std::optional<std::string> context;
    std::optional<std::string> phase;
    std::optional<std::string> location;
    bool orphaned{false};
};

struct DataTransferRecord {
    std::string charge_point_id;
    std::string vendor_id;
    std::optional<std::string> message_id;
    std::optional<std::string> data;
    Timestamp timestamp{};
};

} // namespace csms
