// SPDX-License-Identifier: Apache-2.0
#include "websocket_server.hpp"

#include <chrono>
#include <deque>
#include <sstream>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <everest/logging.hpp>

namespace csms {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(30);
constexpr const char* SERVER_NAME = "ocpp-csms";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}
} // namespace

std::string charge_point_id_from_target(const std::string& target) {
    auto path = target.substr(0, target.find_first_of("?#"));
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool offers_subprotocol(const std::string& offered, const std::string& wanted) {
    std::stringstream ss(offered);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item) == wanted) {
            return true;
        }
    }
    return false;
}

class WebSocketServer::Session : public Connection, public std::enable_shared_from_this<WebSocketServer::Session> {
public:
    Session(tcp::socket&& socket, const ServerConfig& cfg, const Callbacks& callbacks) :
        ws_(std::move(socket)), cfg_(cfg), callbacks_(callbacks) {
        beast::error_code ec;
        const auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        remote_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    void run() {
        net::dispatch(ws_.get_executor(), beast::bind_front_handler(&Session::read_request, shared_from_this()));
    }

    void send(const std::string& frame) override {
        net::post(ws_.get_executor(), [self = shared_from_this(), frame]() { self->enqueue(frame); });
    }

    void close() override {
        net::post(ws_.get_executor(), [self = shared_from_this()]() { self->start_close(); });
    }

    std::string identity() const override {
        return remote_;
    }

private:
    websocket::stream<beast::tcp_stream> ws_;
    const ServerConfig& cfg_;
    const Callbacks& callbacks_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> refusal_;
    std::deque<std::string> outbox_;
    std::string charge_point_id_;
    std::string remote_;
    bool open_{false};
    bool closing_{false};
    bool finished_{false};

    void read_request() {
        beast::get_lowest_layer(ws_).expires_after(HANDSHAKE_TIMEOUT);
        http::async_read(ws_.next_layer(), buffer_, request_,
                         beast::bind_front_handler(&Session::on_request, shared_from_this()));
    }

    void on_request(beast::error_code ec, std::size_t) {
        if (ec) {
            EVLOG_debug << "Handshake read from " << remote_ << " failed: " << ec.message();
            return;
        }
        if (!websocket::is_upgrade(request_)) {
            refuse(http::status::upgrade_required, "WebSocket upgrade required");
            return;
        }
        charge_point_id_ = charge_point_id_from_target(std::string(request_.target()));
        if (charge_point_id_.empty()) {
            EVLOG_warning << "Refusing connection from " << remote_ << ": no charge point id in "
                          << request_.target();
            refuse(http::status::not_found, "Charge point id missing from URL");
            return;
        }
        const auto offered = std::string(request_[http::field::sec_websocket_protocol]);
        if (!offers_subprotocol(offered, cfg_.subprotocol)) {
            EVLOG_warning << "Refusing " << charge_point_id_ << " from " << remote_ << ": subprotocol '" << offered
                          << "' does not include " << cfg_.subprotocol;
            refuse(http::status::bad_request, "Unsupported subprotocol");
            return;
        }

        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        const auto subprotocol = cfg_.subprotocol;
        ws_.set_option(websocket::stream_base::decorator([subprotocol](websocket::response_type& res) {
            res.set(http::field::sec_websocket_protocol, subprotocol);
            res.set(http::field::server, SERVER_NAME);
        }));
        ws_.async_accept(request_, beast::bind_front_handler(&Session::on_accept, shared_from_this()));
    }

    void refuse(http::status status, const std::string& reason) {
        refusal_ = http::response<http::string_body>(status, request_.version());
        refusal_.set(http::field::server, SERVER_NAME);
        refusal_.set(http::field::content_type, "text/plain");
        refusal_.keep_alive(false);
        refusal_.body() = reason;
        refusal_.prepare_payload();
        http::async_write(ws_.next_layer(), refusal_, [self = shared_from_this()](beast::error_code, std::size_t) {
            beast::error_code shutdown_ec;
            beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, shutdown_ec);
        });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            EVLOG_warning << "WebSocket handshake with " << charge_point_id_ << " (" << remote_
                          << ") failed: " << ec.message();
            return;
        }
        open_ = true;
        ws_.text(true);
        if (callbacks_.on_open) {
            callbacks_.on_open(charge_point_id_, shared_from_this());
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                EVLOG_info << "Charge point " << charge_point_id_ << " closed its connection";
            } else {
                EVLOG_warning << "Connection of " << charge_point_id_ << " (" << remote_ << ") lost: " << ec.message();
            }
            finish();
            return;
        }
        const auto text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        EVLOG_debug << charge_point_id_ << " -> " << text;

        if (callbacks_.on_frame) {
            try {
                if (auto reply = callbacks_.on_frame(charge_point_id_, text)) {
                    enqueue(*reply);
                }
            } catch (const std::exception& e) {
                EVLOG_error << "Frame handler failed for " << charge_point_id_ << ": " << e.what();
            }
        }
        do_read();
    }

    void enqueue(const std::string& frame) {
        if (!open_ || closing_) {
            EVLOG_warning << "Dropping frame to " << charge_point_id_ << ": connection is not open";
            return;
        }
        outbox_.push_back(frame);
        if (outbox_.size() == 1) {
            do_write();
        }
    }

    void do_write() {
        EVLOG_debug << charge_point_id_ << " <- " << outbox_.front();
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            EVLOG_warning << "Write to " << charge_point_id_ << " failed: " << ec.message();
            outbox_.clear();
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            do_write();
        }
    }

    void start_close() {
        if (!open_ || closing_) {
            return;
        }
        closing_ = true;
        ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                EVLOG_debug << "Close of " << self->charge_point_id_ << " finished with " << ec.message();
            }
        });
    }

    // Runs once per accepted connection, after its read loop ended.
    void finish() {
        if (finished_ || !open_) {
            return;
        }
        finished_ = true;
        open_ = false;
        outbox_.clear();
        if (callbacks_.on_close) {
            callbacks_.on_close(charge_point_id_, shared_from_this());
        }
    }
};

WebSocketServer::WebSocketServer(ServerConfig cfg, Callbacks callbacks) :
    cfg_(std::move(cfg)), callbacks_(std::move(callbacks)), ioc_(cfg_.worker_threads), acceptor_(net::make_strand(ioc_)) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    const tcp::endpoint endpoint{net::ip::make_address(cfg_.host), cfg_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    running_ = true;
    EVLOG_info << "OCPP-J endpoint listening on ws://" << cfg_.host << ":" << port() << "/<chargePointId> ("
               << cfg_.subprotocol << ", " << cfg_.worker_threads << " worker thread(s))";

    do_accept();
    for (int i = 0; i < cfg_.worker_threads; ++i) {
        threads_.emplace_back([this]() { run_worker(); });
    }
}

void WebSocketServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ioc_.stop();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    beast::error_code ec;
    acceptor_.close(ec);
    EVLOG_info << "OCPP-J endpoint stopped";
}

std::uint16_t WebSocketServer::port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? cfg_.port : endpoint.port();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            EVLOG_warning << "Accept failed: " << ec.message();
        } else {
            std::make_shared<Session>(std::move(socket), cfg_, callbacks_)->run();
        }
        do_accept();
    });
}

void WebSocketServer::run_worker() {
    while (!ioc_.stopped()) {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            EVLOG_error << "WebSocket worker error: " << e.what();
        }
    }
}

} // namespace csms
