// SPDX-License-Identifier: Apache-2.0
#include "time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace csms {

std::string to_rfc3339(Timestamp t) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(millis / 1000);
    auto frac = millis % 1000;
    if (frac < 0) {
        frac += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_rfc3339(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    std::chrono::milliseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int scale = 100;
        int millis = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        fraction = std::chrono::milliseconds(millis);
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int off_h = 0, off_m = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
                return std::nullopt;
            }
            offset = std::chrono::hours(off_h) + std::chrono::minutes(off_m);
            if (zone == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t epoch = timegm(&tm);
    return std::chrono::system_clock::from_time_t(epoch) + fraction - offset;
}

ocpp::DateTime to_ocpp(Timestamp t) {
    return ocpp::DateTime(to_rfc3339(t));
}

Timestamp from_ocpp(const ocpp::DateTime& t) {
    const auto parsed = parse_rfc3339(t.to_rfc3339());
    if (!parsed) {
        throw std::invalid_argument("Unparseable OCPP timestamp: " + t.to_rfc3339());
    }
    return *parsed;
}

} // namespace csms
