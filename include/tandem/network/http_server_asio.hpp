#pragma once

#include "tandem/network/http_parser.hpp"
#include "tandem/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace tandem::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted HTTP connection
 *
 * Reads a request, hands it to the handler, writes the response, and
 * loops while the client asks for keep-alive. Kept alive by the
 * shared_ptr captured in each pending operation.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();

    /// Feed `len` bytes starting at `offset` of buffer_ to the parser.
    void consume(std::size_t offset, std::size_t len);

    void do_write(const HttpResponse& response, bool keep_alive, std::size_t leftover_offset, std::size_t leftover_len);

    void handle_error(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP/1.1 server on a Boost.Asio io_context
 *
 * Accepting starts in the constructor. The handler may be invoked from
 * any thread running the io_context.
 *
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 8080);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /// Port 0 binds an ephemeral port; get_port() reports the real one.
    HttpServerAsio(asio::io_context& io_context, const std::string& bind_address, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; connections already open finish their exchange.
    void stop();

    uint16_t get_port() const { return port_; }

    /// JSON error body shared by the server and the control API.
    static HttpResponse error_response(HttpStatus status, const std::string& code, const std::string& message);

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace tandem::network
