#pragma once

#include "tandem/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tandem::network {

/**
 * @brief Request plus the path parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // e.g. :id

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
 * @brief Runs before the route handler; return false to answer with `response` directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::vector<std::string> param_names;  // filled while compiling regex
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + pattern dispatch for the control surface
 *
 * Routes are matched against the request path (query string excluded) in
 * registration order. A path that matches some route under a different
 * method answers 405 instead of 404.
 *
 * @code
 * HttpRouter router;
 * router.get("/api/sessions/:id", [](const HttpContext& ctx) {
 *     auto id = ctx.get_param("id");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /// Middleware runs in the order added, before route lookup.
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);
    void set_method_not_allowed_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;
    RouteHandler method_not_allowed_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    static HttpResponse default_method_not_allowed_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
};

/**
 * @brief Convert "/sessions/:id/offset" into "^/sessions/([^/]+)/offset$"
 *
 * Parameter names are appended to param_names in order of appearance.
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace tandem::network
