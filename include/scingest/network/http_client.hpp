#pragma once

#include "scingest/core/result.hpp"
#include "scingest/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace scingest {
namespace network {

struct HttpUrl {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";  // Path plus query
};

/**
 * @brief Split "http://host[:port][/target]"; https is not supported
 */
Result<HttpUrl> parse_http_url(const std::string& url);

/**
 * @brief Parse a complete HTTP/1.x response as read until EOF
 */
Result<HttpResponse> parse_http_response(const std::vector<uint8_t>& wire);

/**
 * @brief Blocking one-request-per-connection HTTP client on Boost.Asio
 *
 * Every send() owns a private io_context and gives up after `timeout`,
 * covering resolve, connect, write and read. Safe to call from several
 * threads at once.
 */
class HttpClient {
public:
    HttpClient(std::string host, uint16_t port);

    Result<HttpResponse> send(HttpRequest request, std::chrono::milliseconds timeout) const;

    Result<HttpResponse> get(const std::string& target, std::chrono::milliseconds timeout) const;
    Result<HttpResponse> post_json(const std::string& target, const std::string& body,
                                   std::chrono::milliseconds timeout) const;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

} // namespace network
} // namespace scingest
