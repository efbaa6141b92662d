#include "tandem/gateway/control_api.hpp"

#include "tandem/gateway/message_codec.hpp"
#include "tandem/network/http_server_asio.hpp"

namespace tandem::gateway {
namespace {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

Result<json> parse_body(const HttpContext& ctx) {
    const auto text = ctx.request.body_as_string();
    if (text.empty()) {
        return Ok(json::object());
    }
    auto body = json::parse(text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<json>(ErrorCode::InvalidArgument, "request body must be a JSON object");
    }
    return Ok(body);
}

Result<std::string> string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, std::string("'") + key + "' is required");
    }
    return Ok(it->get<std::string>());
}

/// userId from the JSON body, falling back to the query string.
Result<std::string> user_id(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return Err<std::string>(body.error());
    }
    auto from_body = string_field(body.value(), "userId");
    if (from_body.is_ok()) {
        return from_body;
    }
    auto from_query = ctx.request.get_query("userId");
    if (!from_query.empty()) {
        return Ok(from_query);
    }
    return from_body;
}

} // namespace

ControlApi::ControlApi(sync::SessionManager& manager) : manager_(manager) {}

void ControlApi::install(network::HttpRouter& router) {
    router.post("/api/sessions", [this](const HttpContext& ctx) { return create_session(ctx); });
    router.post("/api/sessions/:id/join", [this](const HttpContext& ctx) { return join_session(ctx); });
    router.patch("/api/sessions/:id/offset", [this](const HttpContext& ctx) { return update_offset(ctx); });
    router.get("/api/sessions/:id", [this](const HttpContext& ctx) { return get_session(ctx); });
    router.delete_("/api/sessions/:id", [this](const HttpContext& ctx) { return end_session(ctx); });
    router.post("/api/sessions/:id/sync", [this](const HttpContext& ctx) { return request_sync(ctx); });
    router.get("/api/health", [this](const HttpContext& ctx) { return health(ctx); });

    router.set_not_found_handler([](const HttpContext& ctx) {
        return network::HttpServerAsio::error_response(HttpStatus::NOT_FOUND, "no_route",
                                                       "No route for " + ctx.request.path);
    });
    router.set_method_not_allowed_handler([](const HttpContext& ctx) {
        return network::HttpServerAsio::error_response(
            HttpStatus::METHOD_NOT_ALLOWED, "method_not_allowed",
            network::HttpMethodUtils::to_string(ctx.request.method) + " not allowed on " + ctx.request.path);
    });
}

network::HttpStatus ControlApi::status_for(ErrorCode code) {
    // SessionEnded is a NotFound kind, but the control surface tells it apart
    if (code == ErrorCode::SessionEnded) {
        return HttpStatus::GONE;
    }
    switch (kind_of(code)) {
        case ErrorKind::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorKind::Forbidden: return HttpStatus::FORBIDDEN;
        case ErrorKind::Conflict: return HttpStatus::CONFLICT;
        case ErrorKind::Invalid: return HttpStatus::BAD_REQUEST;
        case ErrorKind::Transient: return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorKind::Internal: break;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

network::HttpResponse ControlApi::error_response(const Error& error) {
    return network::HttpServerAsio::error_response(status_for(error.code), to_string(error.code), error.message);
}

HttpResponse ControlApi::create_session(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return error_response(body.error());
    }
    auto host = string_field(body.value(), "hostUserId");
    if (host.is_error()) {
        return error_response(host.error());
    }

    auto created = manager_.create_session(host.value());
    if (created.is_error()) {
        return error_response(created.error());
    }
    const auto& result = created.value();
    return json_response(HttpStatus::CREATED, {
        {"sessionId", result.session_id},
        {"role", sync::to_string(result.role)},
        {"expiresAtMs", result.expires_at_ms},
    });
}

HttpResponse ControlApi::join_session(const HttpContext& ctx) {
    auto user = user_id(ctx);
    if (user.is_error()) {
        return error_response(user.error());
    }

    auto joined = manager_.join_session(ctx.get_param("id"), user.value());
    if (joined.is_error()) {
        return error_response(joined.error());
    }
    return json_response(HttpStatus::OK, MessageCodec::to_json(joined.value()));
}

HttpResponse ControlApi::update_offset(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return error_response(body.error());
    }
    auto user = string_field(body.value(), "userId");
    if (user.is_error()) {
        return error_response(user.error());
    }
    auto offset = body.value().find("offsetMs");
    if (offset == body.value().end() || !offset->is_number_integer()) {
        return error_response(Error{ErrorCode::InvalidArgument, "'offsetMs' must be an integer"});
    }

    const auto session_id = ctx.get_param("id");
    auto applied = manager_.update_offset(session_id, user.value(), MessageCodec::saturated_integer(*offset));
    if (applied.is_error()) {
        return error_response(applied.error());
    }
    return json_response(HttpStatus::OK, {
        {"sessionId", session_id},
        {"offsetMs", applied.value()},
    });
}

HttpResponse ControlApi::get_session(const HttpContext& ctx) {
    auto state = manager_.get_state(ctx.get_param("id"));
    if (state.is_error()) {
        return error_response(state.error());
    }
    return json_response(HttpStatus::OK, MessageCodec::to_json(state.value()));
}

HttpResponse ControlApi::end_session(const HttpContext& ctx) {
    auto user = user_id(ctx);
    if (user.is_error()) {
        return error_response(user.error());
    }

    auto ended = manager_.end_session(ctx.get_param("id"), user.value());
    if (ended.is_error()) {
        return error_response(ended.error());
    }
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse ControlApi::request_sync(const HttpContext& ctx) {
    auto user = user_id(ctx);
    if (user.is_error()) {
        return error_response(user.error());
    }

    const auto session_id = ctx.get_param("id");
    auto synced = manager_.request_immediate_sync(session_id, user.value());
    if (synced.is_error()) {
        return error_response(synced.error());
    }

    const auto& correction = synced.value();
    return json_response(HttpStatus::OK, {
        {"sessionId", session_id},
        {"correction", correction ? MessageCodec::to_json(*correction) : json(nullptr)},
    });
}

HttpResponse ControlApi::health(const HttpContext&) {
    return json_response(HttpStatus::OK, {
        {"status", "ok"},
        {"sessions", manager_.session_count()},
    });
}

} // namespace tandem::gateway
