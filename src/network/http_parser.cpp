#include "scingest/network/http_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace scingest {
namespace network {

HttpParser::HttpParser(std::size_t max_body_size)
    : max_body_size_(max_body_size) {
    reset();
}

void HttpParser::reset() {
    state_ = ParseState::METHOD;
    request_ = HttpRequest();
    buffer_.clear();
    current_header_name_.clear();
    content_length_ = 0;
    header_bytes_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
    body_too_large_ = false;
    error_.clear();
}

Result<bool> HttpParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return Err(error_.empty() ? std::string("parser in error state") : error_);
        }

        if (state_ == ParseState::BODY) {
            const std::size_t wanted = content_length_ - request_.body.size();
            const std::size_t take = std::min(wanted, len - i);
            request_.body.insert(request_.body.end(),
                                 reinterpret_cast<const uint8_t*>(data + i),
                                 reinterpret_cast<const uint8_t*>(data + i + take));
            i += take;
            if (request_.body.size() == content_length_) {
                state_ = ParseState::COMPLETE;
            }
            continue;
        }

        const char c = data[i++];
        if (c == '\n') {
            line_++;
        }
        if (++header_bytes_ > kMaxHeaderBytes) {
            state_ = ParseState::PARSE_ERROR;
            error_ = "request head exceeds " + std::to_string(kMaxHeaderBytes) + " bytes";
            return Err(error_);
        }

        bool ok = true;
        const char* what = "";
        switch (state_) {
            case ParseState::METHOD:       ok = parse_method(c);       what = "HTTP method"; break;
            case ParseState::URL:          ok = parse_url(c);          what = "URL"; break;
            case ParseState::VERSION:      ok = parse_version(c);      what = "HTTP version"; break;
            case ParseState::HEADER_NAME:  ok = parse_header_name(c);  what = "header name"; break;
            case ParseState::HEADER_VALUE: ok = parse_header_value(c); what = "header value"; break;
            default: break;
        }

        if (!ok) {
            if (error_.empty()) {
                error_ = std::string("failed to parse ") + what + " at line " + std::to_string(line_);
            }
            state_ = ParseState::PARSE_ERROR;
            return Err(error_);
        }
    }

    return Ok(state_ == ParseState::COMPLETE);
}

bool HttpParser::parse_method(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.method = HttpMethodUtils::from_string(buffer_);
        if (request_.method == HttpMethod::UNKNOWN) {
            return false;
        }
        buffer_.clear();
        state_ = ParseState::URL;
        return true;
    }
    if (!std::isupper(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_url(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.url = buffer_;
        buffer_.clear();
        state_ = ParseState::VERSION;
        return true;
    }
    if (!std::isprint(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_version(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        if (buffer_ == "HTTP/1.1") {
            request_.version = HttpVersion::HTTP_1_1;
        } else if (buffer_ == "HTTP/1.0") {
            request_.version = HttpVersion::HTTP_1_0;
        } else {
            return false;
        }
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::parse_header_name(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        return begin_body();
    }
    last_char_was_cr_ = false;

    if (c == ':') {
        if (buffer_.empty()) {
            return false;
        }
        current_header_name_ = buffer_;
        buffer_.clear();
        state_ = ParseState::HEADER_VALUE;
        return true;
    }
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_header_value(char c) {
    if (buffer_.empty() && (c == ' ' || c == '\t')) {
        return true;
    }
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
            buffer_.pop_back();
        }
        request_.headers[current_header_name_] = buffer_;
        buffer_.clear();
        current_header_name_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::begin_body() {
    const std::string content_length = request_.get_header("Content-Length");
    if (content_length.empty()) {
        state_ = ParseState::COMPLETE;
        return true;
    }

    errno = 0;
    char* end = nullptr;
    const unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
    if (end == content_length.c_str() || *end != '\0' || errno == ERANGE) {
        error_ = "invalid Content-Length '" + content_length + "'";
        return false;
    }
    if (length > max_body_size_) {
        body_too_large_ = true;
        error_ = "request body of " + content_length + " bytes exceeds the limit of " +
                 std::to_string(max_body_size_);
        return false;
    }

    content_length_ = static_cast<std::size_t>(length);
    if (content_length_ == 0) {
        state_ = ParseState::COMPLETE;
        return true;
    }
    request_.body.reserve(content_length_);
    state_ = ParseState::BODY;
    return true;
}

} // namespace network
} // namespace scingest
