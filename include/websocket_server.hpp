// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "connection_registry.hpp"
#include "csms_config.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace csms {

/// \brief Charge point identifier carried by an upgrade request target: the last non-empty path segment, query
/// string ignored. Returns an empty string when there is none.
std::string charge_point_id_from_target(const std::string& target);

/// \brief True when the comma separated Sec-WebSocket-Protocol offer contains \p wanted.
bool offers_subprotocol(const std::string& offered, const std::string& wanted);

/// \brief OCPP-J endpoint on Boost.Beast. Every connection runs on its own strand, so frames from one charge point
/// are handled in arrival order while different charge points proceed on the worker threads in parallel.
class WebSocketServer {
public:
    struct Callbacks {
        std::function<void(const std::string&, std::shared_ptr<Connection>)> on_open;
        std::function<void(const std::string&, const std::shared_ptr<Connection>&)> on_close;
        /// \brief Returns the frame to send back, if any.
        std::function<std::optional<std::string>(const std::string&, const std::string&)> on_frame;
    };

    WebSocketServer(ServerConfig cfg, Callbacks callbacks);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// \brief Bind, listen and spawn the worker threads. Throws on bind failure.
    void start();
    void stop();

    /// \brief Port actually bound; differs from the configured one when that was 0.
    std::uint16_t port() const;

private:
    class Session;

    ServerConfig cfg_;
    Callbacks callbacks_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    bool running_{false};

    void do_accept();
    void run_worker();
};

} // namespace csms
