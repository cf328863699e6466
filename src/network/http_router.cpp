#include "scingest/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace scingest {
namespace network {

namespace {

constexpr const char* kRegexSpecials = ".+?^$()[]{}|\\";

bool is_param_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    const std::string specials(kRegexSpecials);
    std::string out = "^";

    std::size_t pos = 0;
    while (pos < pattern.size()) {
        const char c = pattern[pos];
        if (c == ':') {
            std::size_t end = pos + 1;
            while (end < pattern.size() && is_param_char(pattern[end])) {
                ++end;
            }
            // A bare ':' is dropped.
            if (end > pos + 1) {
                param_names.push_back(pattern.substr(pos + 1, end - pos - 1));
                out += "([^/]+)";
            }
            pos = end;
            continue;
        }

        if (c == '*') {
            out += "(.*)";
        } else {
            if (specials.find(c) != std::string::npos) {
                out += '\\';
            }
            out += c;
        }
        ++pos;
    }
    return out + "$";
}

HttpResponse make_json_response(HttpStatus status, const nlohmann::json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump(2));
    return response;
}

HttpResponse make_error_response(HttpStatus status, const std::string& code, const std::string& message) {
    return make_json_response(status, nlohmann::json{{"error", code}, {"message", message}});
}

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), param_names(), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch groups;
    if (!std::regex_match(path, groups, regex)) {
        return params;
    }
    const std::size_t captured = std::min(param_names.size(), groups.size() - 1);
    for (std::size_t n = 0; n < captured; ++n) {
        params.emplace(param_names[n], groups[n + 1].str());
    }
    return params;
}

HttpRouter::HttpRouter() : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("[router] {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);

    HttpResponse rejected(HttpStatus::OK);
    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, rejected)) {
            return rejected;
        }
    }

    const std::string path = request.path();
    const Route* target = nullptr;
    bool other_method = false;
    for (const auto& route : routes_) {
        if (route.matches(request.method, path)) {
            target = &route;
            break;
        }
        if (!other_method && std::regex_match(path, route.regex)) {
            other_method = true;
        }
    }

    if (target == nullptr) {
        if (other_method) {
            return make_error_response(HttpStatus::METHOD_NOT_ALLOWED, "MethodNotAllowed",
                                       HttpMethodUtils::to_string(request.method) + " is not supported on " +
                                           path);
        }
        return not_found_handler_(ctx);
    }

    ctx.params = target->extract_params(path);
    try {
        return target->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("[router] {} {} failed: {}", HttpMethodUtils::to_string(request.method),
                      target->pattern, e.what());
        return make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "InternalError", e.what());
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> listed;
    listed.reserve(routes_.size());
    for (const auto& route : routes_) {
        listed.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return listed;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return make_error_response(HttpStatus::NOT_FOUND, "NotFound", "no route for " + ctx.request.path());
}

} // namespace network
} // namespace scingest
