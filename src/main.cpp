// SPDX-License-Identifier: Apache-2.0
#include "central_system.hpp"
#include "csms_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

std::string parse_config_path(int argc, char* argv[]) {
    std::string path = "configs/csms.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[i + 1];
        }
    }
    return path;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto config_path = parse_config_path(argc, argv);

    csms::CsmsConfig cfg;
    try {
        cfg = csms::load_csms_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    csms::CentralSystem central_system(cfg);
    if (!central_system.start()) {
        std::cerr << "Failed to start central system" << std::endl;
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    while (keep_running && !central_system.quit_requested()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    central_system.stop();
    return 0;
}
