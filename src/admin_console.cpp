// SPDX-License-Identifier: Apache-2.0
#include "admin_console.hpp"

#include <cerrno>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace csms {

namespace {
constexpr std::size_t ID_TAG_MAX_LENGTH = 20;

constexpr const char* HELP_TEXT = "Commands:\n"
                                  "  help\n"
                                  "  list\n"
                                  "  status [cp]\n"
                                  "  start <cp> <idTag> [connector]\n"
                                  "  stop <cp> <transactionId>\n"
                                  "  availability <cp> <connector> <Operative|Inoperative>\n"
                                  "  reset <cp> <Hard|Soft>\n"
                                  "  config <cp> <key> <value>\n"
                                  "  clear-cache [cp]\n"
                                  "  validate <idTag>\n"
                                  "  tag <idTag> <Accepted|Blocked|Expired|Invalid> [parentIdTag]\n"
                                  "  quit\n";

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<std::int32_t> parse_int(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stol(text, &consumed);
        if (consumed != text.size() || value < std::numeric_limits<std::int32_t>::min() ||
            value > std::numeric_limits<std::int32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<std::int32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_reply(const CommandReply& reply) {
    std::ostringstream out;
    out << result_code_to_string(reply.code);
    if (!reply.status.empty()) {
        out << " " << reply.status;
    }
    if (!reply.error_description.empty()) {
        out << " (" << reply.error_description << ")";
    }
    return out.str();
}

std::string format_verdict(const std::string& id_tag, const Verdict& verdict) {
    std::ostringstream out;
    out << id_tag << ": " << ocpp::v16::conversions::authorization_status_to_string(verdict.status);
    if (verdict.expiry_date) {
        out << " expires " << to_rfc3339(*verdict.expiry_date);
    }
    if (verdict.parent_id_tag) {
        out << " parent " << *verdict.parent_id_tag;
    }
    return out.str();
}

std::string format_summary(const ChargePointStatusView& view) {
    std::ostringstream out;
    out << view.id << "  " << reachability_to_string(view.reachability)
        << (view.connected ? " (connected)" : "");
    if (view.record && view.record->status) {
        out << "  " << *view.record->status;
    }
    if (view.last_activity) {
        out << "  last seen " << to_rfc3339(*view.last_activity);
    }
    out << "  active transactions: " << view.active_transactions.size();
    return out.str();
}

std::string format_detail(const ChargePointStatusView& view) {
    std::ostringstream out;
    out << format_summary(view) << "\n";
    if (view.record) {
        out << "  vendor " << view.record->vendor << ", model " << view.record->model;
        if (view.record->firmware_version) {
            out << ", firmware " << *view.record->firmware_version;
        }
        out << "\n";
    }
    for (const auto& connector : view.connectors) {
        out << "  connector " << connector.connector_id << ": "
            << ocpp::v16::conversions::charge_point_status_to_string(connector.status) << " / "
            << ocpp::v16::conversions::availability_type_to_string(connector.availability) << " / "
            << ocpp::v16::conversions::charge_point_error_code_to_string(connector.error_code) << "\n";
    }
    for (const auto& tx : view.active_transactions) {
        out << "  transaction " << tx.transaction_id << " on connector " << tx.connector_id << " idTag " << tx.id_tag
            << " meterStart " << tx.meter_start << "Wh since " << to_rfc3339(tx.started_at) << "\n";
    }
    return out.str();
}
} // namespace

AdminConsole::AdminConsole(SessionCoordinator& coordinator) : coordinator_(coordinator) {
}

std::string AdminConsole::execute(const std::string& line) {
    const auto words = split_words(line);
    if (words.empty()) {
        return {};
    }
    const auto& command = words[0];

    if (command == "help") {
        return HELP_TEXT;
    }
    if (command == "quit" || command == "exit") {
        quit_requested_ = true;
        return "Shutting down";
    }
    if (command == "list") {
        const auto views = coordinator_.charge_point_overview();
        if (views.empty()) {
            return "No charge points known";
        }
        std::ostringstream out;
        for (const auto& view : views) {
            out << format_summary(view) << "\n";
        }
        return out.str();
    }
    if (command == "status") {
        if (words.size() == 1) {
            std::ostringstream out;
            for (const auto& view : coordinator_.charge_point_overview()) {
                out << format_detail(view);
            }
            return out.str().empty() ? "No charge points known" : out.str();
        }
        const auto view = coordinator_.charge_point_status(words[1]);
        if (!view.record && !view.connected) {
            return "Unknown charge point " + words[1];
        }
        return format_detail(view);
    }
    if (command == "start" && (words.size() == 3 || words.size() == 4)) {
        std::optional<std::int32_t> connector;
        if (words.size() == 4) {
            connector = parse_int(words[3]);
            if (!connector || *connector <= 0) {
                return "Connector must be a positive integer";
            }
        }
        return format_reply(coordinator_.remote_start(words[1], words[2], connector));
    }
    if (command == "stop" && words.size() == 3) {
        const auto transaction_id = parse_int(words[2]);
        if (!transaction_id) {
            return "Transaction id must be an integer";
        }
        return format_reply(coordinator_.remote_stop(words[1], *transaction_id));
    }
    if (command == "availability" && words.size() == 4) {
        const auto connector = parse_int(words[2]);
        if (!connector || *connector < 0) {
            return "Connector must be a non-negative integer";
        }
        if (words[3] != "Operative" && words[3] != "Inoperative") {
            return "Availability must be Operative or Inoperative";
        }
        return format_reply(coordinator_.change_availability(
            words[1], *connector, ocpp::v16::conversions::string_to_availability_type(words[3])));
    }
    if (command == "reset" && words.size() == 3) {
        if (words[2] != "Hard" && words[2] != "Soft") {
            return "Reset type must be Hard or Soft";
        }
        return format_reply(coordinator_.reset(words[1], ocpp::v16::conversions::string_to_reset_type(words[2])));
    }
    if (command == "config" && words.size() >= 4) {
        // Values may contain spaces; everything after the key is the value.
        std::istringstream iss(line);
        std::string skip;
        iss >> skip >> skip >> skip;
        std::string value;
        std::getline(iss, value);
        value.erase(0, value.find_first_not_of(" \t"));
        return format_reply(coordinator_.change_configuration(words[1], words[2], value));
    }
    if (command == "clear-cache" && words.size() <= 2) {
        std::optional<std::string> charge_point_id;
        if (words.size() == 2) {
            charge_point_id = words[1];
        }
        return format_reply(coordinator_.clear_cache(charge_point_id));
    }
    if (command == "validate" && words.size() == 2) {
        return format_verdict(words[1], coordinator_.validate_tag(words[1]));
    }
    if (command == "tag" && (words.size() == 3 || words.size() == 4)) {
        for (std::size_t i = 1; i < words.size(); i += 2) {
            if (words[i].size() > ID_TAG_MAX_LENGTH) {
                return "IdTag " + words[i] + " exceeds " + std::to_string(ID_TAG_MAX_LENGTH) + " characters";
            }
        }
        IdTagRecord record;
        record.id_tag = words[1];
        if (words[2] == "Accepted" || words[2] == "Blocked" || words[2] == "Expired" || words[2] == "Invalid") {
            record.status = ocpp::v16::conversions::string_to_authorization_status(words[2]);
        } else {
            return "Status must be Accepted, Blocked, Expired or Invalid";
        }
        if (words.size() == 4) {
            record.parent_id_tag = words[3];
        }
        try {
            coordinator_.provision_tag(record);
        } catch (const StorageError& e) {
            return "Failed to store tag: " + std::string(e.what());
        }
        return "Stored " + record.id_tag + " as " + words[2];
    }
    return "Unknown or malformed command '" + line + "'; type help";
}

void AdminConsole::run(std::istream& in, std::ostream& out, const std::atomic<bool>& keep_running) {
    std::string line;
    out << "csms> " << std::flush;
    while (keep_running && !quit_requested_ && std::getline(in, line)) {
        if (!keep_running) {
            break;
        }
        respond(line, out);
    }
}

void AdminConsole::run(int fd, std::ostream& out, const std::atomic<bool>& keep_running,
                       std::chrono::milliseconds poll_interval) {
    std::string buffered;
    char chunk[512];
    out << "csms> " << std::flush;
    while (keep_running && !quit_requested_) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            EVLOG_error << "Admin console stopped: poll failed: " << std::strerror(errno);
            return;
        }
        if (ready == 0) {
            continue;
        }
        const auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            EVLOG_error << "Admin console stopped: read failed: " << std::strerror(errno);
            return;
        }
        if (n == 0) {
            if (!buffered.empty() && keep_running) {
                respond(buffered, out);
            }
            EVLOG_info << "Admin console input closed";
            return;
        }
        buffered.append(chunk, static_cast<std::size_t>(n));
        std::size_t newline = 0;
        while (keep_running && !quit_requested_ && (newline = buffered.find('\n')) != std::string::npos) {
            const auto line = buffered.substr(0, newline);
            buffered.erase(0, newline + 1);
            respond(line, out);
        }
    }
}

void AdminConsole::respond(const std::string& line, std::ostream& out) {
    try {
        const auto result = execute(line);
        if (!result.empty()) {
            out << result << (result.back() == '\n' ? "" : "\n");
        }
    } catch (const std::exception& e) {
        EVLOG_error << "Admin command '" << line << "' failed: " << e.what();
        out << "Error: " << e.what() << "\n";
    }
    if (!quit_requested_) {
        out << "csms> " << std::flush;
    }
}

} // namespace csms
