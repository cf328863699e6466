#pragma once

#include "scingest/network/http_types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace scingest {
namespace network {

/**
 * @brief Request plus the path parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // ":job_id" -> value

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before routing; return false to answer with `response` directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // "/upload/chunk/:job_id/:index"
    std::vector<std::string> param_names;  // Filled before `regex` is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path-pattern dispatch for the ingest API
 *
 * Routes match on the request path (query string stripped). The first
 * registered match wins. A path that matches some route under another
 * method answers 405; no match at all answers 404. Both are JSON error
 * bodies like every other API error.
 *
 * Example:
 * @code
 * HttpRouter router;
 * router.get("/upload/status/:job_id", [&](const HttpContext& ctx) {
 *     return status_handler(ctx.get_param("job_id"));
 * });
 * HttpResponse res = router.handle_request(request);
 * @endcode
 *
 * Handlers that throw std::exception become 500 responses.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);
    void set_not_found_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
};

/**
 * @brief Translate a route pattern into an anchored regex
 *
 *   "/upload/status/:job_id"  ->  "^/upload/status/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/**
 * @brief JSON response with the given status, body dumped with indent 2
 */
HttpResponse make_json_response(HttpStatus status, const nlohmann::json& body);

/**
 * @brief {"error": code, "message": message}
 */
HttpResponse make_error_response(HttpStatus status, const std::string& code, const std::string& message);

} // namespace network
} // namespace scingest
