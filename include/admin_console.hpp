// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "session_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <string>

namespace csms {

/// \brief Line-oriented operator interface over the coordinator's commands and queries.
class AdminConsole {
public:
    explicit AdminConsole(SessionCoordinator& coordinator);

    /// \brief Run one command line and return the text to show the operator.
    std::string execute(const std::string& line);

    bool quit_requested() const {
        return quit_requested_;
    }

    /// \brief Read commands from \p in until end of input, "quit", or \p keep_running turning false.
    void run(std::istream& in, std::ostream& out, const std::atomic<bool>& keep_running);

    /// \brief Same as above, reading the descriptor \p fd directly. Waits at most \p poll_interval between checks of
    /// \p keep_running, so the reading thread can be joined while no input arrives.
    void run(int fd, std::ostream& out, const std::atomic<bool>& keep_running,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

private:
    SessionCoordinator& coordinator_;

    void respond(const std::string& line, std::ostream& out);
    std::atomic<bool> quit_requested_{false};
};

} // namespace csms
