// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace csms {

enum class MessageTypeId : int { Call = 2, CallResult = 3, CallError = 4 };

/// \brief One decoded OCPP-J frame: [2,id,action,payload] | [3,id,payload] | [4,id,code,description,details]
struct Frame {
    MessageTypeId type{MessageTypeId::Call};
    std::string message_id;
    std::string action;
    nlohmann::json payload = nlohmann::json::object();
    std::string error_code;
    std::string error_description;
};

/// \brief Thrown for frames that are not valid OCPP-J. Carries the message id only when the frame was a CALL that
/// can be answered with a CALLERROR.
class FrameError : public std::runtime_error {
public:
    FrameError(const std::string& what, std::optional<std::string> message_id) :
        std::runtime_error(what), message_id_(std::move(message_id)) {
    }

    const std::optional<std::string>& message_id() const {
        return message_id_;
    }

private:
    std::optional<std::string> message_id_;
};

Frame parse_frame(const std::string& text);

std::string make_call(const std::string& message_id, const std::string& action, const nlohmann::json& payload);
std::string make_call_result(const std::string& message_id, const nlohmann::json& payload);
std::string make_call_error(const std::string& message_id, const std::string& error_code,
                            const std::string& description);

} // namespace csms
