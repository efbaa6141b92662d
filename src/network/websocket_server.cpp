#include "tandem/network/websocket_server.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace tandem::network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr std::size_t kMaxMessageBytes = 64 * 1024;
}

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& bind_address, std::uint16_t port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(bind_address), port)) {}

    void start() {
        spdlog::info("WebSocket endpoint listening on port {}", port());
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
        {
            std::lock_guard<std::mutex> lk(mu_);
            connections.swap(connections_);
        }
        for (auto& [id, c] : connections) {
            c->close();
        }
    }

    bool send(const ConnectionId& id, const std::string& msg) {
        auto c = find(id);
        if (!c) {
            return false;
        }
        c->send(msg);
        return true;
    }

    void close(const ConnectionId& id) {
        if (auto c = find(id)) {
            c->close();
        }
    }

    std::uint16_t port() const {
        beast::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(std::move(id)),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        const ConnectionId& id() const { return id_; }

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(kMaxMessageBytes);

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("handshake", ec);
                            self->server_.remove(self->id_);
                            return;
                        }

                        self->open_ = true;
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(const std::string& msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg] {
                    if (!self->open_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (!self->open_) return;
                    self->ws_.async_close(
                        websocket::close_code::normal,
                        asio::bind_executor(self->strand_, [self](beast::error_code ec) {
                            if (ec && ec != asio::error::operation_aborted) {
                                self->fail("close", ec);
                            }
                        }));
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            if (!open_) {
                return;
            }
            open_ = false;
            write_queue_.clear();

            // A normal close is an ordinary disconnect
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            server_.remove(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            spdlog::debug("[{}] {}: {}", id_, what, ec.message());
        }

        Impl& server_;
        ConnectionId id_;

        websocket::stream<beast::tcp_stream> ws_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool open_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::error("WebSocket accept error: {}", ec.message());
                    return do_accept();
                }

                auto id = "ws-" + std::to_string(next_connection_id_++);
                auto connection = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = connection;
                }

                connection->start();
                do_accept();
            });
    }

    std::shared_ptr<Connection> find(const ConnectionId& id) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        return it == connections_.end() ? nullptr : it->second;
    }

    void remove(const ConnectionId& id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<std::uint64_t> next_connection_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& bind_address, std::uint16_t port)
    : impl_(std::make_unique<Impl>(ioc, bind_address, port)) {}

WebSocketServer::~WebSocketServer() = default;

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

bool WebSocketServer::send(const ConnectionId& connection, const std::string& msg) {
    return impl_->send(connection, msg);
}

void WebSocketServer::close(const ConnectionId& connection) { impl_->close(connection); }

std::uint16_t WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

} // namespace tandem::network
