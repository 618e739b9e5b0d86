// SPDX-License-Identifier: Apache-2.0
#include "ocpp_frames.hpp"

namespace csms {

namespace {
constexpr std::size_t MAX_MESSAGE_ID_LENGTH = 36;
} // namespace

Frame parse_frame(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw FrameError(std::string("Frame is not JSON: ") + e.what(), std::nullopt);
    }
    if (!root.is_array() || root.size() < 3 || !root[0].is_number_integer()) {
        throw FrameError("Frame is not an OCPP-J array", std::nullopt);
    }
    if (!root[1].is_string()) {
        throw FrameError("Message id must be a string", std::nullopt);
    }

    Frame frame;
    frame.message_id = root[1].get<std::string>();
    if (frame.message_id.empty() || frame.message_id.size() > MAX_MESSAGE_ID_LENGTH) {
        throw FrameError("Message id length out of range", std::nullopt);
    }

    const int type = root[0].get<int>();
    switch (type) {
    case static_cast<int>(MessageTypeId::Call):
        if (root.size() != 4 || !root[2].is_string() || !root[3].is_object()) {
            throw FrameError("Malformed CALL", frame.message_id);
        }
        frame.type = MessageTypeId::Call;
        frame.action = root[2].get<std::string>();
        frame.payload = root[3];
        break;
    case static_cast<int>(MessageTypeId::CallResult):
        if (root.size() != 3 || !root[2].is_object()) {
            throw FrameError("Malformed CALLRESULT " + frame.message_id, std::nullopt);
        }
        frame.type = MessageTypeId::CallResult;
        frame.payload = root[2];
        break;
    case static_cast<int>(MessageTypeId::CallError):
        if (root.size() < 4 || !root[2].is_string() || !root[3].is_string()) {
            throw FrameError("Malformed CALLERROR " + frame.message_id, std::nullopt);
        }
        frame.type = MessageTypeId::CallError;
        frame.error_code = root[2].get<std::string>();
        frame.error_description = root[3].get<std::string>();
        if (root.size() > 4 && root[4].is_object()) {
            frame.payload = root[4];
        }
        break;
    default:
        throw FrameError("Unknown message type id " + std::to_string(type), frame.message_id);
    }
    return frame;
}

std::string make_call(const std::string& message_id, const std::string& action, const nlohmann::json& payload) {
    return nlohmann::json::array({static_cast<int>(MessageTypeId::Call), message_id, action, payload}).dump();
}

std::string make_call_result(const std::string& message_id, const nlohmann::json& payload) {
    return nlohmann::json::array({static_cast<int>(MessageTypeId::CallResult), message_id, payload}).dump();
}

std::string make_call_error(const std::string& message_id, const std::string& error_code,
                            const std::string& description) {
    return nlohmann::json::array({static_cast<int>(MessageTypeId::CallError), message_id, error_code, description,
                                  nlohmann::json::object()})
        .dump();
}

} // namespace csms
