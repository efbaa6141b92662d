#include "tandem/network/http_server_asio.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstring>

namespace tandem::network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_() {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                consume(0, bytes_transferred);
            } else if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                spdlog::debug("HTTP read error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::consume(std::size_t offset, std::size_t len) {
    auto parse_result = parser_.parse(buffer_.data() + offset, len);

    if (parse_result.is_error()) {
        handle_error(parser_.body_too_large() ? HttpStatus::PAYLOAD_TOO_LARGE : HttpStatus::BAD_REQUEST,
                     parse_result.error().message);
        return;
    }

    if (!parse_result.value()) {
        do_read();
        return;
    }

    HttpRequest request = parser_.get_request();
    const std::size_t used = parser_.consumed();
    parser_.reset();

    spdlog::debug("{} {} HTTP/{}",
        HttpMethodUtils::to_string(request.method),
        request.url,
        request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0");

    HttpResponse response;
    if (!handler_) {
        response = HttpServerAsio::error_response(HttpStatus::SERVICE_UNAVAILABLE, "unavailable", "No handler installed");
    } else {
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            spdlog::error("HTTP handler threw: {}", e.what());
            response = HttpServerAsio::error_response(HttpStatus::INTERNAL_SERVER_ERROR, "internal",
                                                      "Internal server error");
        }
    }

    const bool keep_alive = request.keep_alive();
    response.version = request.version;
    response.set_header("Connection", keep_alive ? "keep-alive" : "close");
    do_write(response, keep_alive, offset + used, len - used);
}

void HttpConnection::do_write(const HttpResponse& response,
                              bool keep_alive,
                              std::size_t leftover_offset,
                              std::size_t leftover_len) {
    auto self = shared_from_this();
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr, keep_alive, leftover_offset, leftover_len](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("HTTP write error: {}", ec.message());
                }
                return;
            }

            if (!keep_alive) {
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
                return;
            }

            // A pipelined request may already sit in the buffer
            if (leftover_len > 0) {
                std::memmove(buffer_.data(), buffer_.data() + leftover_offset, leftover_len);
                consume(0, leftover_len);
            } else {
                do_read();
            }
        }
    );
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Rejecting HTTP request: {}", message);
    auto response = HttpServerAsio::error_response(status, "invalid_message", message);
    response.set_header("Connection", "close");
    do_write(response, false, 0, 0);
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, const std::string& bind_address, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(bind_address), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP control API listening on {}:{}", bind_address, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing HTTP acceptor: {}", ec.message());
    }
}

HttpResponse HttpServerAsio::error_response(HttpStatus status, const std::string& code, const std::string& message) {
    HttpResponse response(status);
    nlohmann::json body = {
        {"error", {{"code", code}, {"message", message}}}
    };
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("HTTP accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

} // namespace tandem::network
