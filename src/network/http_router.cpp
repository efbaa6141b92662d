#include "tandem/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace tandem::network {

// ────────────────────────────────────────────────────────────
// Pattern compilation
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && matches_path(path);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        // match[0] is the whole path
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler)
    , method_not_allowed_handler_(default_method_not_allowed_handler) {
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

void HttpRouter::patch(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PATCH, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

void HttpRouter::set_method_not_allowed_handler(RouteHandler handler) {
    method_not_allowed_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string& path = request.path.empty() ? request.url : request.path;
    const Route* route = find_route(request.method, path);

    if (!route) {
        const bool path_known = std::any_of(routes_.begin(), routes_.end(),
            [&path](const Route& r) { return r.matches_path(path); });
        return path_known ? method_not_allowed_handler_(ctx) : not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(path);

    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw: {}", route->pattern, e.what());

        response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_body("Internal Server Error");
        response.set_header("Content-Type", "text/plain");
    }

    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    route_list.reserve(routes_.size());
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_body("No route for " + ctx.request.url);
    response.set_header("Content-Type", "text/plain");
    return response;
}

HttpResponse HttpRouter::default_method_not_allowed_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::METHOD_NOT_ALLOWED);
    response.set_body(HttpMethodUtils::to_string(ctx.request.method) + " not allowed on " + ctx.request.url);
    response.set_header("Content-Type", "text/plain");
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

} // namespace tandem::network
