#include "scingest/network/http_server_asio.hpp"

#include "scingest/network/http_router.hpp"

#include <spdlog/spdlog.h>

namespace scingest {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                if (parser_.body_too_large()) {
                    handle_error(HttpStatus::PAYLOAD_TOO_LARGE, "PayloadTooLarge", parse_result.error());
                } else {
                    handle_error(HttpStatus::BAD_REQUEST, "BadRequest", parse_result.error());
                }
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();
            spdlog::info("{} {} ({} bytes)",
                         HttpMethodUtils::to_string(request.method), request.url, request.body.size());

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "InternalError", e.what());
            }

            do_write(response);
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();
    auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        });
}

void HttpConnection::handle_error(HttpStatus status, const std::string& code, const std::string& message) {
    spdlog::warn("Rejecting request: {}", message);
    HttpResponse response = make_error_response(status, code, message);
    response.set_header("Connection", "close");
    do_write(response);
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& host,
                               uint16_t port,
                               std::size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(host), port))
    , max_body_size_(max_body_size)
    , port_(acceptor_.local_endpoint().port()) {
    spdlog::info("HTTP server listening on {}:{}", host, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace network
} // namespace scingest
