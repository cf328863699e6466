#include "scingest/network/http_client.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>

namespace scingest {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Result<HttpUrl> parse_http_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Err("unsupported URL scheme in '" + url + "'");
    }

    HttpUrl parsed;
    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parsed.host = authority;
    } else {
        parsed.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        char* end = nullptr;
        const long value = std::strtol(port.c_str(), &end, 10);
        if (port.empty() || *end != '\0' || value <= 0 || value > 65535) {
            return Err("invalid port in '" + url + "'");
        }
        parsed.port = static_cast<uint16_t>(value);
    }
    if (parsed.host.empty()) {
        return Err("missing host in '" + url + "'");
    }
    return Ok(std::move(parsed));
}

Result<HttpResponse> parse_http_response(const std::vector<uint8_t>& wire) {
    static const std::string kBlankLine = "\r\n\r\n";
    const auto head_end = std::search(wire.begin(), wire.end(), kBlankLine.begin(), kBlankLine.end());
    if (head_end == wire.end()) {
        return Err(std::string("response ended before the end of its headers"));
    }

    std::istringstream head(std::string(wire.begin(), head_end));
    std::string status_line;
    std::getline(head, status_line);
    if (!status_line.empty() && status_line.back() == '\r') {
        status_line.pop_back();
    }

    HttpResponse response;
    std::istringstream status_stream(status_line);
    std::string version;
    status_stream >> version >> response.status_code;
    if (version.rfind("HTTP/1.", 0) != 0 || status_stream.fail()) {
        return Err("malformed status line '" + status_line + "'");
    }
    response.version = version == "HTTP/1.0" ? HttpVersion::HTTP_1_0 : HttpVersion::HTTP_1_1;
    std::getline(status_stream >> std::ws, response.reason_phrase);

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        response.headers[line.substr(0, colon)] = value;
    }

    const auto body_begin = head_end + static_cast<std::ptrdiff_t>(kBlankLine.size());
    const std::string content_length = response.get_header("Content-Length");
    if (content_length.empty()) {
        response.body.assign(body_begin, wire.end());
        return Ok(std::move(response));
    }

    const auto expected = static_cast<std::size_t>(std::strtoull(content_length.c_str(), nullptr, 10));
    const auto available = static_cast<std::size_t>(wire.end() - body_begin);
    if (available < expected) {
        return Err("response body truncated: " + std::to_string(available) + " of " +
                   std::to_string(expected) + " bytes");
    }
    response.body.assign(body_begin, body_begin + static_cast<std::ptrdiff_t>(expected));
    return Ok(std::move(response));
}

HttpClient::HttpClient(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {
}

Result<HttpResponse> HttpClient::send(HttpRequest request, std::chrono::milliseconds timeout) const {
    if (!request.has_header("Host")) {
        request.headers["Host"] = host_ + ":" + std::to_string(port_);
    }
    request.headers["Connection"] = "close";

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    const auto outgoing = std::make_shared<std::vector<uint8_t>>(request.serialize());
    std::vector<uint8_t> incoming;

    bool finished = false;
    boost::system::error_code failure;

    auto fail = [&](const boost::system::error_code& ec) {
        failure = ec;
        finished = true;
    };

    resolver.async_resolve(host_, std::to_string(port_),
        [&](const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints) {
            if (ec) {
                fail(ec);
                return;
            }
            asio::async_connect(socket, endpoints,
                [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
                    if (connect_ec) {
                        fail(connect_ec);
                        return;
                    }
                    asio::async_write(socket, asio::buffer(*outgoing),
                        [&](const boost::system::error_code& write_ec, std::size_t) {
                            if (write_ec) {
                                fail(write_ec);
                                return;
                            }
                            asio::async_read(socket, asio::dynamic_buffer(incoming),
                                [&](const boost::system::error_code& read_ec, std::size_t) {
                                    // The server closes after answering, so EOF is success.
                                    if (read_ec && read_ec != asio::error::eof) {
                                        fail(read_ec);
                                        return;
                                    }
                                    finished = true;
                                });
                        });
                });
        });

    io.run_for(timeout);

    if (!finished) {
        boost::system::error_code ignored;
        socket.close(ignored);
        return Err(HttpMethodUtils::to_string(request.method) + " " + request.url + " timed out after " +
                   std::to_string(timeout.count()) + " ms");
    }
    if (failure) {
        return Err(HttpMethodUtils::to_string(request.method) + " " + request.url + ": " + failure.message());
    }
    return parse_http_response(incoming);
}

Result<HttpResponse> HttpClient::get(const std::string& target, std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = target;
    return send(std::move(request), timeout);
}

Result<HttpResponse> HttpClient::post_json(const std::string& target, const std::string& body,
                                           std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = target;
    request.headers["Content-Type"] = "application/json";
    request.body.assign(body.begin(), body.end());
    return send(std::move(request), timeout);
}

} // namespace network
} // namespace scingest
