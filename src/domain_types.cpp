// SPDX-License-Identifier: Apache-2.0
#include "domain_types.hpp"

#include <stdexcept>

namespace csms {

std::string reachability_to_string(Reachability r) {
    switch (r) {
    case Reachability::Online:
        return "Online";
    case Reachability::Offline:
        return "Offline";
    case Reachability::Unknown:
        break;
    }
    return "Unknown";
}

Reachability reachability_from_string(const std::string& s) {
    if (s == "Online") {
        return Reachability::Online;
    }
    if (s == "Offline") {
        return Reachability::Offline;
    }
    return Reachability::Unknown;
}

std::string session_status_to_string(SessionStatus s) {
    return s == SessionStatus::Active ? "Active" : "Completed";
}

SessionStatus session_status_from_string(const std::string& s) {
    if (s == "Active") {
        return SessionStatus::Active;
    }
    if (s == "Completed") {
        return SessionStatus::Completed;
    }
    throw std::invalid_argument("Unknown session status: " + s);
}

} // namespace csms
