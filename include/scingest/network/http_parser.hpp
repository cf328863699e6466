#pragma once

#include "scingest/core/result.hpp"
#include "scingest/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace scingest {
namespace network {

/**
 * @brief Where the parser is inside the request
 *
 * METHOD SP URL SP VERSION CRLF
 * Header-Name: Header-Value CRLF   (repeated)
 * CRLF
 * [Body, Content-Length bytes]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed bytes as they arrive from the socket; parse() returns true once a
 * full request has been read. The request line and headers are parsed one
 * character at a time, the body is copied in bulk because chunk uploads put
 * tens of megabytes there.
 *
 * A Content-Length above max_body_size() fails the parse and sets
 * body_too_large(), so the server can answer 413 instead of 400.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(64 * 1024 * 1024);
 * auto result = parser.parse(buffer, n);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest request = parser.take_request(); }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kDefaultMaxBody = 8 * 1024 * 1024;
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(std::size_t max_body_size = kDefaultMaxBody);

    Result<bool> parse(const char* data, std::size_t len);

    const HttpRequest& get_request() const { return request_; }

    // Moves the request out; call reset() before parsing the next one.
    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    bool body_too_large() const { return body_too_large_; }
    std::size_t max_body_size() const { return max_body_size_; }

    void reset();

private:
    bool parse_method(char c);
    bool parse_url(char c);
    bool parse_version(char c);
    bool parse_header_name(char c);
    bool parse_header_value(char c);

    // Called at the blank line after the headers.
    bool begin_body();

    std::size_t max_body_size_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t content_length_ = 0;
    std::size_t header_bytes_ = 0;
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;
    bool body_too_large_ = false;
    std::string error_;
};

} // namespace network
} // namespace scingest
