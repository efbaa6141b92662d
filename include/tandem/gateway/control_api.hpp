#pragma once

#include "tandem/core/error.hpp"
#include "tandem/network/http_router.hpp"
#include "tandem/sync/session_manager.hpp"

#include <nlohmann/json.hpp>

namespace tandem::gateway {

/**
 * @brief REST control surface over the SessionManager
 *
 *   POST   /api/sessions              {hostUserId}         -> 201
 *   POST   /api/sessions/:id/join     {userId}             -> 200
 *   PATCH  /api/sessions/:id/offset   {userId, offsetMs}   -> 200
 *   GET    /api/sessions/:id                               -> 200
 *   DELETE /api/sessions/:id          {userId} or ?userId= -> 204
 *   POST   /api/sessions/:id/sync     {userId}             -> 200
 *   GET    /api/health                                     -> 200
 *
 * Errors come back as {"error": {"code", "message"}} with the status from
 * status_for().
 */
class ControlApi {
public:
    explicit ControlApi(sync::SessionManager& manager);

    /// Register every route on `router`.
    void install(network::HttpRouter& router);

    static network::HttpStatus status_for(ErrorCode code);
    static network::HttpResponse error_response(const Error& error);

private:
    network::HttpResponse create_session(const network::HttpContext& ctx);
    network::HttpResponse join_session(const network::HttpContext& ctx);
    network::HttpResponse update_offset(const network::HttpContext& ctx);
    network::HttpResponse get_session(const network::HttpContext& ctx);
    network::HttpResponse end_session(const network::HttpContext& ctx);
    network::HttpResponse request_sync(const network::HttpContext& ctx);
    network::HttpResponse health(const network::HttpContext& ctx);

    sync::SessionManager& manager_;
};

} // namespace tandem::gateway
