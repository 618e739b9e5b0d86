// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <ocpp/common/types.hpp>

namespace csms {

using Timestamp = std::chrono::system_clock::time_point;

/// \brief Format as RFC 3339 UTC with millisecond precision, e.g. 2024-01-01T12:00:00.000Z
std::string to_rfc3339(Timestamp t);

/// \brief Parse RFC 3339 (Z or +hh:mm offset, optional fraction). Returns nullopt on malformed input.
std::optional<Timestamp> parse_rfc3339(const std::string& text);

ocpp::DateTime to_ocpp(Timestamp t);
Timestamp from_ocpp(const ocpp::DateTime& t);

} // namespace csms
