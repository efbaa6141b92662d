#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tandem::network {

/**
 * @brief WebSocket endpoint for peer connections (Boost.Beast)
 *
 * Each connection gets an opaque id ("ws-1", "ws-2", ...) that is never
 * reused within the process. Callbacks run on the connection's strand;
 * send() and close() may be called from any thread.
 */
class WebSocketServer {
public:
    using ConnectionId = std::string;
    using OnConnect    = std::function<void(const ConnectionId&)>;
    using OnDisconnect = std::function<void(const ConnectionId&)>;
    using OnMessage    = std::function<void(const ConnectionId&, const std::string&)>;

    /// Port 0 binds an ephemeral port; port() reports the real one.
    WebSocketServer(boost::asio::io_context& ioc, const std::string& bind_address, std::uint16_t port);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();
    /// Stop accepting and close every open connection.
    void stop();

    /// Queue a text frame. False if the connection is unknown or gone.
    bool send(const ConnectionId& connection, const std::string& msg);

    /// Close one connection from the server side.
    void close(const ConnectionId& connection);

    std::uint16_t port() const;
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tandem::network
