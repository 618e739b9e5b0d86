// SPDX-License-Identifier: Apache-2.0
#include "message_router.hpp"

#include "ocpp_frames.hpp"

#include <stdexcept>
#include <vector>

#include <everest/logging.hpp>
#include <ocpp/v16/messages/Authorize.hpp>
#include <ocpp/v16/messages/BootNotification.hpp>
#include <ocpp/v16/messages/DataTransfer.hpp>
#include <ocpp/v16/messages/Heartbeat.hpp>
#include <ocpp/v16/messages/MeterValues.hpp>
#include <ocpp/v16/messages/StartTransaction.hpp>
#include <ocpp/v16/messages/StatusNotification.hpp>
#include <ocpp/v16/messages/StopTransaction.hpp>

namespace csms {

namespace {
constexpr std::size_t ID_TAG_MAX_LENGTH = 20;

/// \brief A CALL that must be answered with a CALLERROR of the given code.
class CallErrorReply : public std::runtime_error {
public:
    CallErrorReply(std::string code, const std::string& description) :
        std::runtime_error(description), code_(std::move(code)) {
    }

    const std::string& code() const {
        return code_;
    }

private:
    std::string code_;
};

template <typename Request>
Request decode(const nlohmann::json& payload) {
    try {
        return payload.get<Request>();
    } catch (const std::exception& e) {
        throw CallErrorReply("FormationViolation", e.what());
    }
}

template <std::size_t N>
std::optional<std::string> text_of(const std::optional<ocpp::CiString<N>>& value) {
    if (!value) {
        return std::nullopt;
    }
    return value->get();
}

ocpp::v16::IdTagInfo to_id_tag_info(const Verdict& verdict) {
    ocpp::v16::IdTagInfo info;
    info.status = verdict.status;
    if (verdict.expiry_date) {
        info.expiryDate = to_ocpp(*verdict.expiry_date);
    }
    if (verdict.parent_id_tag && !verdict.parent_id_tag->empty() &&
        verdict.parent_id_tag->size() <= ID_TAG_MAX_LENGTH) {
        info.parentIdTag = ocpp::CiString<20>(*verdict.parent_id_tag);
    }
    return info;
}

// MeterValue and TransactionData share the {timestamp, sampledValue[]} shape.
template <typename Reading>
std::vector<MeterSample> to_samples(const std::string& charge_point_id, const std::vector<Reading>& readings) {
    std::vector<MeterSample> samples;
    for (const auto& reading : readings) {
        const auto timestamp = from_ocpp(reading.timestamp);
        for (const auto& sampled : reading.sampledValue) {
            if (sampled.format && *sampled.format == ocpp::v16::ValueFormat::SignedData) {
                EVLOG_warning << "Skipping signed meter value from " << charge_point_id;
                continue;
            }
            MeterSample sample;
            sample.timestamp = timestamp;
            std::size_t consumed = 0;
            try {
                sample.value = std::stod(sampled.value, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != sampled.value.size()) {
                EVLOG_warning << "Skipping non-numeric meter value '" << sampled.value << "' from "
                              << charge_point_id;
                continue;
            }
            if (sampled.measurand) {
                sample.measurand = ocpp::v16::conversions::measurand_to_string(*sampled.measurand);
            }
            if (sampled.unit) {
                sample.unit = ocpp::v16::conversions::unit_of_measure_to_string(*sampled.unit);
            }
            if (sampled.context) {
                sample.context = ocpp::v16::conversions::reading_context_to_string(*sampled.context);
            }
            if (sampled.phase) {
                sample.phase = ocpp::v16::conversions::phase_to_string(*sampled.phase);
            }
            if (sampled.location) {
                sample.location = ocpp::v16::conversions::location_to_string(*sampled.location);
            }
            samples.push_back(std::move(sample));
        }
    }
    return samples;
}
} // namespace

std::optional<MessageKind> message_kind_from_string(const std::string& action) {
    if (action == "BootNotification") {
        return MessageKind::BootNotification;
    }
    if (action == "Heartbeat") {
        return MessageKind::Heartbeat;
    }
    if (action == "Authorize") {
        return MessageKind::Authorize;
    }
    if (action == "StatusNotification") {
        return MessageKind::StatusNotification;
    }
    if (action == "StartTransaction") {
        return MessageKind::StartTransaction;
    }
    if (action == "StopTransaction") {
        return MessageKind::StopTransaction;
    }
    if (action == "MeterValues") {
        return MessageKind::MeterValues;
    }
    if (action == "DataTransfer") {
        return MessageKind::DataTransfer;
    }
    return std::nullopt;
}

std::string message_kind_to_string(MessageKind kind) {
    switch (kind) {
    case MessageKind::BootNotification:
        return "BootNotification";
    case MessageKind::Heartbeat:
        return "Heartbeat";
    case MessageKind::Authorize:
        return "Authorize";
    case MessageKind::StatusNotification:
        return "StatusNotification";
    case MessageKind::StartTransaction:
        return "StartTransaction";
    case MessageKind::StopTransaction:
        return "StopTransaction";
    case MessageKind::MeterValues:
        return "MeterValues";
    case MessageKind::DataTransfer:
        return "DataTransfer";
    }
    return "Unknown";
}

MessageRouter::MessageRouter(SessionCoordinator& coordinator) : coordinator_(coordinator) {
}

std::optional<std::string> MessageRouter::handle_frame(const std::string& charge_point_id, const std::string& text) {
    Frame frame;
    try {
        frame = parse_frame(text);
    } catch (const FrameError& e) {
        if (e.message_id()) {
            EVLOG_warning << "Malformed CALL " << *e.message_id() << " from " << charge_point_id << ": " << e.what();
            return make_call_error(*e.message_id(), "FormationViolation", e.what());
        }
        EVLOG_warning << "Dropping malformed frame from " << charge_point_id << ": " << e.what();
        return std::nullopt;
    }

    switch (frame.type) {
    case MessageTypeId::CallResult:
        coordinator_.on_command_reply(charge_point_id, frame.message_id, frame.payload);
        return std::nullopt;
    case MessageTypeId::CallError:
        coordinator_.on_command_error(charge_point_id, frame.message_id, frame.error_code, frame.error_description);
        return std::nullopt;
    case MessageTypeId::Call:
        break;
    }

    const auto kind = message_kind_from_string(frame.action);
    if (!kind) {
        EVLOG_warning << "Unsupported action " << frame.action << " from " << charge_point_id;
        return make_call_error(frame.message_id, "NotImplemented", "Action " + frame.action + " is not supported");
    }

    try {
        return make_call_result(frame.message_id, dispatch(*kind, charge_point_id, frame.payload));
    } catch (const CallErrorReply& e) {
        EVLOG_warning << frame.action << " " << frame.message_id << " from " << charge_point_id << " answered with "
                      << e.code() << ": " << e.what();
        return make_call_error(frame.message_id, e.code(), e.what());
    } catch (const std::exception& e) {
        EVLOG_error << frame.action << " " << frame.message_id << " from " << charge_point_id
                    << " failed: " << e.what();
        return make_call_error(frame.message_id, "InternalError", e.what());
    }
}

nlohmann::json MessageRouter::dispatch(MessageKind kind, const std::string& charge_point_id,
                                       const nlohmann::json& payload) {
    switch (kind) {
    case MessageKind::BootNotification:
        return handle_boot_notification(charge_point_id, payload);
    case MessageKind::Heartbeat:
        return handle_heartbeat(charge_point_id, payload);
    case MessageKind::Authorize:
        return handle_authorize(charge_point_id, payload);
    case MessageKind::StatusNotification:
        return handle_status_notification(charge_point_id, payload);
    case MessageKind::StartTransaction:
        return handle_start_transaction(charge_point_id, payload);
    case MessageKind::StopTransaction:
        return handle_stop_transaction(charge_point_id, payload);
    case MessageKind::MeterValues:
        return handle_meter_values(charge_point_id, payload);
    case MessageKind::DataTransfer:
        return handle_data_transfer(charge_point_id, payload);
    }
    throw CallErrorReply("NotImplemented", "Unhandled message kind");
}

nlohmann::json MessageRouter::handle_boot_notification(const std::string& charge_point_id,
                                                       const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::BootNotificationRequest>(payload);
    BootInfo info;
    info.vendor = req.chargePointVendor.get();
    info.model = req.chargePointModel.get();
    info.charge_point_serial_number = text_of(req.chargePointSerialNumber);
    info.charge_box_serial_number = text_of(req.chargeBoxSerialNumber);
    info.firmware_version = text_of(req.firmwareVersion);
    info.iccid = text_of(req.iccid);
    info.imsi = text_of(req.imsi);
    info.meter_type = text_of(req.meterType);
    info.meter_serial_number = text_of(req.meterSerialNumber);

    const auto result = coordinator_.on_boot(charge_point_id, info);
    ocpp::v16::BootNotificationResponse resp;
    resp.status = result.status;
    resp.currentTime = to_ocpp(result.current_time);
    resp.interval = static_cast<std::int32_t>(result.interval.count());
    return resp;
}

nlohmann::json MessageRouter::handle_heartbeat(const std::string& charge_point_id, const nlohmann::json& payload) {
    (void)decode<ocpp::v16::HeartbeatRequest>(payload);
    ocpp::v16::HeartbeatResponse resp;
    resp.currentTime = to_ocpp(coordinator_.on_heartbeat(charge_point_id));
    return resp;
}

nlohmann::json MessageRouter::handle_authorize(const std::string& charge_point_id, const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::AuthorizeRequest>(payload);
    ocpp::v16::AuthorizeResponse resp;
    resp.idTagInfo = to_id_tag_info(coordinator_.on_authorize(charge_point_id, req.idTag.get()));
    return resp;
}

nlohmann::json MessageRouter::handle_status_notification(const std::string& charge_point_id,
                                                         const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::StatusNotificationRequest>(payload);
    StatusReport report;
    report.connector_id = req.connectorId;
    report.status = req.status;
    report.error_code = req.errorCode;
    report.info = text_of(req.info);
    report.vendor_error_code = text_of(req.vendorErrorCode);
    if (req.timestamp) {
        report.timestamp = from_ocpp(*req.timestamp);
    }
    coordinator_.on_status_notification(charge_point_id, report);
    return ocpp::v16::StatusNotificationResponse{};
}

nlohmann::json MessageRouter::handle_start_transaction(const std::string& charge_point_id,
                                                       const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::StartTransactionRequest>(payload);
    const auto result = coordinator_.on_start_transaction(charge_point_id, req.connectorId, req.idTag.get(),
                                                          req.meterStart, from_ocpp(req.timestamp));
    // Every outcome, storage failure included, is a StartTransaction.conf; a rejection carries transactionId 0.
    ocpp::v16::StartTransactionResponse resp;
    resp.idTagInfo = to_id_tag_info(result.id_tag_info);
    resp.transactionId = result.transaction_id.value_or(0);
    return resp;
}

nlohmann::json MessageRouter::handle_stop_transaction(const std::string& charge_point_id,
                                                      const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::StopTransactionRequest>(payload);
    StopReport report;
    report.transaction_id = req.transactionId;
    report.meter_stop = req.meterStop;
    report.timestamp = from_ocpp(req.timestamp);
    report.id_tag = text_of(req.idTag);
    if (req.reason) {
        report.reason = ocpp::v16::conversions::reason_to_string(*req.reason);
    }
    if (req.transactionData) {
        report.transaction_data = to_samples(charge_point_id, *req.transactionData);
    }

    const auto result = coordinator_.on_stop_transaction(charge_point_id, report);
    if (result.code == ResultCode::StorageFailure) {
        throw CallErrorReply("InternalError", "Transaction " + std::to_string(req.transactionId) +
                                                  " could not be recorded; retry later");
    }
    ocpp::v16::StopTransactionResponse resp;
    if (result.id_tag_info) {
        resp.idTagInfo = to_id_tag_info(*result.id_tag_info);
    }
    return resp;
}

nlohmann::json MessageRouter::handle_meter_values(const std::string& charge_point_id, const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::MeterValuesRequest>(payload);
    const auto samples = to_samples(charge_point_id, req.meterValue);
    const auto code = coordinator_.on_meter_values(charge_point_id, req.connectorId, req.transactionId, samples);
    if (code == ResultCode::StorageFailure) {
        throw CallErrorReply("InternalError", "Meter values could not be recorded; retry later");
    }
    return ocpp::v16::MeterValuesResponse{};
}

nlohmann::json MessageRouter::handle_data_transfer(const std::string& charge_point_id,
                                                   const nlohmann::json& payload) {
    const auto req = decode<ocpp::v16::DataTransferRequest>(payload);
    coordinator_.on_data_transfer(charge_point_id, req.vendorId.get(), text_of(req.messageId), req.data);
    ocpp::v16::DataTransferResponse resp;
    resp.status = ocpp::v16::DataTransferStatus::Accepted;
    return resp;
}

} // namespace csms
