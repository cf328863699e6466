#pragma once

#include "scingest/network/http_parser.hpp"
#include "scingest/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace scingest {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, answer it, close
 *
 * Keeps itself alive through shared_from_this() while reads and writes are
 * pending. Malformed requests get a JSON 400, oversized bodies a JSON 413.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& code, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server on Boost.Asio
 *
 * Accepts asynchronously on the given io_context; handlers run on whichever
 * thread(s) call io_context.run(). Chunk PUTs block their handler while the
 * chunk is written to staging, so run the context on several threads.
 *
 * Port 0 binds an ephemeral port; get_port() reports the bound one.
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * HttpServerAsio server(io, "0.0.0.0", 5001, 80 * 1024 * 1024);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io.run();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& host,
                   uint16_t port,
                   std::size_t max_body_size = HttpParser::kDefaultMaxBody);

    void set_handler(HttpRequestHandler handler);

    // Stops accepting; connections in flight finish normally.
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

} // namespace network
} // namespace scingest
