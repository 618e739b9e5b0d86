// SPDX-License-Identifier: Apache-2.0
#include "ocpp_frames.hpp"

#include <cassert>
#include <iostream>

using namespace csms;

namespace {
bool rejects(const std::string& text, std::optional<std::string> expected_id) {
    try {
        parse_frame(text);
    } catch (const FrameError& e) {
        return e.message_id() == expected_id;
    }
    return false;
}
} // namespace

int main() {
    const auto call = parse_frame(R"([2,"19223201","BootNotification",{"chargePointVendor":"VendorX"}])");
    assert(call.type == MessageTypeId::Call);
    assert(call.message_id == "19223201");
    assert(call.action == "BootNotification");
    assert(call.payload.at("chargePointVendor") == "VendorX");

    const auto result = parse_frame(R"([3,"abc",{"status":"Accepted"}])");
    assert(result.type == MessageTypeId::CallResult);
    assert(result.payload.at("status") == "Accepted");

    const auto error = parse_frame(R"([4,"abc","NotImplemented","nope",{}])");
    assert(error.type == MessageTypeId::CallError);
    assert(error.error_code == "NotImplemented");
    assert(error.error_description == "nope");

    // Not answerable: no usable message id
    assert(rejects("not json", std::nullopt));
    assert(rejects(R"({"a":1})", std::nullopt));
    assert(rejects(R"([2,17,"Heartbeat",{}])", std::nullopt));
    assert(rejects(R"([2,"","Heartbeat",{}])", std::nullopt));
    assert(rejects(R"([2,")" + std::string(37, 'x') + R"(","Heartbeat",{}])", std::nullopt));
    assert(rejects(R"([3,"abc","Accepted"])", std::nullopt));
    assert(rejects(R"([4,"abc",1,2])", std::nullopt));

    // Answerable with a CALLERROR
    assert(rejects(R"([2,"m1","Heartbeat",[]])", std::string("m1")));
    assert(rejects(R"([2,"m2",5,{}])", std::string("m2")));
    assert(rejects(R"([7,"m3",{}])", std::string("m3")));

    // A 36 character id is still fine
    assert(parse_frame(R"([2,")" + std::string(36, 'x') + R"(","Heartbeat",{}])").message_id.size() == 36);

    const auto encoded = nlohmann::json::parse(make_call("t1", "Reset", {{"type", "Soft"}}));
    assert(encoded == nlohmann::json::parse(R"([2,"t1","Reset",{"type":"Soft"}])"));
    assert(nlohmann::json::parse(make_call_result("t2", nlohmann::json::object())) ==
           nlohmann::json::parse(R"([3,"t2",{}])"));
    assert(nlohmann::json::parse(make_call_error("t3", "FormationViolation", "bad")) ==
           nlohmann::json::parse(R"([4,"t3","FormationViolation","bad",{}])"));

    std::cout << "ocpp_frames_tests passed\n";
    return 0;
}
