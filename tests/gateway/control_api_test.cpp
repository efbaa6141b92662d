#include "tandem/gateway/control_api.hpp"
#include "tandem/network/http_parser.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using nlohmann::json;
using tandem::ErrorCode;
using tandem::ManualClock;
using tandem::events::EventBus;
using tandem::gateway::ControlApi;
using tandem::network::HttpMethod;
using tandem::network::HttpRequest;
using tandem::network::HttpResponse;
using tandem::network::HttpRouter;
using tandem::network::HttpStatus;
using tandem::testing::ManualScheduler;
using tandem::testing::RecordingNotifier;

namespace {

HttpRequest request(HttpMethod method, const std::string& path, const std::string& body = "") {
    HttpRequest req;
    req.method = method;
    req.url = path;
    auto question = path.find('?');
    if (question == std::string::npos) {
        req.path = path;
    } else {
        req.path = path.substr(0, question);
        req.query = tandem::network::HttpParser::parse_query(path.substr(question + 1));
    }
    req.body.assign(body.begin(), body.end());
    if (!body.empty()) {
        req.headers["Content-Type"] = "application/json";
    }
    return req;
}

json body_of(const HttpResponse& response) {
    return json::parse(response.body_as_string());
}

} // namespace

class ControlApiTest : public ::testing::Test {
protected:
    ControlApiTest()
        : scheduler(clock),
          manager(tandem::SessionConfig{}, tandem::SyncThresholds{}, clock, scheduler, notifier, bus),
          api(manager) {
        api.install(router);
    }

    HttpResponse send(HttpMethod method, const std::string& path, const json& body = nullptr) {
        return router.handle_request(request(method, path, body.is_null() ? "" : body.dump()));
    }

    std::string create(const std::string& host = "alice") {
        auto response = send(HttpMethod::POST, "/api/sessions", {{"hostUserId", host}});
        EXPECT_EQ(response.status_code, 201);
        return body_of(response)["sessionId"].get<std::string>();
    }

    ManualClock clock{10'000};
    ManualScheduler scheduler;
    RecordingNotifier notifier;
    EventBus bus;
    tandem::sync::SessionManager manager;
    ControlApi api;
    HttpRouter router;
};

TEST_F(ControlApiTest, CreateSession) {
    auto response = send(HttpMethod::POST, "/api/sessions", {{"hostUserId", "alice"}});
    ASSERT_EQ(response.status_code, 201);
    EXPECT_EQ(response.headers["Content-Type"], "application/json");

    auto body = body_of(response);
    EXPECT_EQ(body["role"], "host");
    EXPECT_EQ(body["sessionId"].get<std::string>().size(), 6u);
    EXPECT_EQ(body["expiresAtMs"], 10'000 + 4 * 3600 * 1000);
}

TEST_F(ControlApiTest, CreateRequiresHostUserId) {
    auto missing = send(HttpMethod::POST, "/api/sessions", json::object());
    EXPECT_EQ(missing.status_code, 400);
    EXPECT_EQ(body_of(missing)["error"]["code"], "invalid_argument");

    auto garbage = router.handle_request(request(HttpMethod::POST, "/api/sessions", "{oops"));
    EXPECT_EQ(garbage.status_code, 400);
}

TEST_F(ControlApiTest, JoinThenGetState) {
    const auto id = create();

    auto joined = send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}});
    ASSERT_EQ(joined.status_code, 200);
    EXPECT_EQ(body_of(joined)["role"], "client");
    EXPECT_EQ(body_of(joined)["hostName"], "alice");

    auto state = send(HttpMethod::GET, "/api/sessions/" + id);
    ASSERT_EQ(state.status_code, 200);
    auto view = body_of(state);
    EXPECT_EQ(view["sessionId"], id);
    EXPECT_EQ(view["state"], "active");
    EXPECT_EQ(view["client"]["userId"], "bob");
    EXPECT_EQ(view["client"]["connected"], false);
    EXPECT_TRUE(view["drift"].is_null());
}

TEST_F(ControlApiTest, JoinErrorsMapToStatuses) {
    const auto id = create();
    EXPECT_EQ(send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}}).status_code, 200);

    auto full = send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "carol"}});
    EXPECT_EQ(full.status_code, 409);
    EXPECT_EQ(body_of(full)["error"]["code"], "session_full");

    auto as_host = send(HttpMethod::POST, "/api/sessions/" + create() + "/join", {{"userId", "alice"}});
    EXPECT_EQ(as_host.status_code, 403);

    auto unknown = send(HttpMethod::POST, "/api/sessions/ZZZZZZ/join", {{"userId", "bob"}});
    EXPECT_EQ(unknown.status_code, 404);
    EXPECT_EQ(body_of(unknown)["error"]["code"], "session_not_found");
}

TEST_F(ControlApiTest, OffsetIsClampedAndEchoed) {
    const auto id = create();
    send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}});

    auto response = send(HttpMethod::PATCH, "/api/sessions/" + id + "/offset",
                         {{"userId", "bob"}, {"offsetMs", -12000}});
    ASSERT_EQ(response.status_code, 200);
    EXPECT_EQ(body_of(response)["offsetMs"], -5000);

    auto huge = send(HttpMethod::PATCH, "/api/sessions/" + id + "/offset",
                     {{"userId", "bob"}, {"offsetMs", std::numeric_limits<std::uint64_t>::max()}});
    ASSERT_EQ(huge.status_code, 200);
    EXPECT_EQ(body_of(huge)["offsetMs"], 5000);

    auto not_integer = send(HttpMethod::PATCH, "/api/sessions/" + id + "/offset",
                            {{"userId", "bob"}, {"offsetMs", "soon"}});
    EXPECT_EQ(not_integer.status_code, 400);

    auto by_host = send(HttpMethod::PATCH, "/api/sessions/" + id + "/offset",
                        {{"userId", "alice"}, {"offsetMs", 10}});
    EXPECT_EQ(by_host.status_code, 403);
}

TEST_F(ControlApiTest, SyncRequestReturnsCorrection) {
    const auto id = create();
    ASSERT_TRUE(manager.attach_host(id, "alice", "ws-1").is_ok());
    ASSERT_TRUE(manager.report_host_state(id, "ws-1", {"A", 30000, true, clock.now_ms()}).is_ok());
    ASSERT_TRUE(manager.join_session(id, "bob", "ws-2").is_ok());
    ASSERT_TRUE(manager.report_client_state(id, "ws-2", {"A", 20000, true, clock.now_ms()}).is_ok());

    auto response = send(HttpMethod::POST, "/api/sessions/" + id + "/sync", {{"userId", "bob"}});
    ASSERT_EQ(response.status_code, 200);
    auto body = body_of(response);
    EXPECT_EQ(body["correction"]["action"], "seek");
    EXPECT_EQ(body["correction"]["positionMs"], 30000);
    EXPECT_EQ(body["correction"]["urgency"], "immediate");
}

TEST_F(ControlApiTest, SyncRequestWithNothingToDo) {
    const auto id = create();
    send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}});

    auto response = send(HttpMethod::POST, "/api/sessions/" + id + "/sync?userId=bob");
    ASSERT_EQ(response.status_code, 200);
    EXPECT_TRUE(body_of(response)["correction"].is_null());
}

TEST_F(ControlApiTest, EndSessionByHost) {
    const auto id = create();
    send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}});

    auto by_client = send(HttpMethod::DELETE_METHOD, "/api/sessions/" + id, {{"userId", "bob"}});
    EXPECT_EQ(by_client.status_code, 403);

    auto ended = send(HttpMethod::DELETE_METHOD, "/api/sessions/" + id + "?userId=alice");
    EXPECT_EQ(ended.status_code, 204);
    EXPECT_TRUE(ended.body.empty());

    EXPECT_EQ(send(HttpMethod::GET, "/api/sessions/" + id).status_code, 404);
    EXPECT_EQ(send(HttpMethod::POST, "/api/sessions/" + id + "/join", {{"userId", "bob"}}).status_code, 410);
}

TEST_F(ControlApiTest, HealthReportsSessionCount) {
    create();
    create("carol");

    auto response = send(HttpMethod::GET, "/api/health");
    ASSERT_EQ(response.status_code, 200);
    EXPECT_EQ(body_of(response)["status"], "ok");
    EXPECT_EQ(body_of(response)["sessions"], 2);
}

TEST_F(ControlApiTest, UnknownRoutesAndMethods) {
    auto missing = send(HttpMethod::GET, "/api/nothing");
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_EQ(body_of(missing)["error"]["code"], "no_route");

    auto wrong_method = send(HttpMethod::PUT, "/api/sessions");
    EXPECT_EQ(wrong_method.status_code, 405);
}

TEST(ControlApiStatusTest, ErrorCodesMapToHttp) {
    EXPECT_EQ(ControlApi::status_for(ErrorCode::SessionNotFound), HttpStatus::NOT_FOUND);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::SessionEnded), HttpStatus::GONE);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::SessionFull), HttpStatus::CONFLICT);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::CapacityExceeded), HttpStatus::CONFLICT);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::Forbidden), HttpStatus::FORBIDDEN);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::InvalidArgument), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::PeerUnavailable), HttpStatus::SERVICE_UNAVAILABLE);
    EXPECT_EQ(ControlApi::status_for(ErrorCode::Internal), HttpStatus::INTERNAL_SERVER_ERROR);
}
