#pragma once

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace scingest {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the ingest API answers with
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    PARTIAL_CONTENT = 206,        // Range reads from remote sources
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,               // Illegal state transition, chunk content conflict
    PAYLOAD_TOO_LARGE = 413,      // File or request body over the limit
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            case HttpMethod::UNKNOWN: break;
        }
        return "UNKNOWN";
    }
};

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

} // namespace detail

/**
 * @brief Parsed or outgoing HTTP request
 *
 * Bodies are bytes: chunk uploads carry raw binary payloads.
 *
 * `url` keeps the query string; path() and query_param() split it.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;  // Stored as received
    std::vector<uint8_t> body;

    // Case-insensitive per RFC 7230; empty when absent.
    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::string path() const {
        const auto query = url.find('?');
        return query == std::string::npos ? url : url.substr(0, query);
    }

    /**
     * @brief Value of `name` in the query string, or `default_value`
     *
     * No percent-decoding; the API only passes ids and numbers this way.
     */
    std::string query_param(const std::string& name, const std::string& default_value = "") const {
        const auto query = url.find('?');
        if (query == std::string::npos) {
            return default_value;
        }
        std::istringstream pairs(url.substr(query + 1));
        std::string pair;
        while (std::getline(pairs, pair, '&')) {
            const auto eq = pair.find('=');
            const std::string key = pair.substr(0, eq);
            if (key == name) {
                return eq == std::string::npos ? "" : pair.substr(eq + 1);
            }
        }
        return default_value;
    }

    /**
     * @brief Wire form, as sent by HttpClient
     *
     * Content-Length is always written from the actual body size.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << url << " " << detail::version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            if (detail::strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n\r\n";

        const std::string head = oss.str();
        std::vector<uint8_t> wire(head.begin(), head.end());
        wire.insert(wire.end(), body.begin(), body.end());
        return wire;
    }
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << detail::version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (detail::find_header(headers, "Content-Length").empty()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        const std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::PARTIAL_CONTENT: return "Partial Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }
};

} // namespace network
} // namespace scingest
