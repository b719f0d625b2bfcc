/**
 * @file test_session_broker.cpp
 * @brief Tests for the session broker against a loopback upstream
 */

#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "rtv/core/rtv_types.h"
#include "rtv/server/rtv_session_broker.h"

using nlohmann::json;
using rtv::server::SessionBroker;
using rtv::server::SessionBrokerConfig;

namespace {

// Stands in for the realtime service's session endpoint
class FakeUpstream {
public:
    int status = 200;
    std::string body =
        R"({"id":"sess_42","object":"realtime.session","client_secret":{"value":"ek_42","expires_at":1700000999}})";

    FakeUpstream() {
        server_.Post("/v1/realtime/sessions",
                     [this](const httplib::Request& req, httplib::Response& res) {
                         {
                             std::lock_guard<std::mutex> lock(mutex_);
                             hits_++;
                             authorization_ = req.get_header_value("Authorization");
                             body_ = req.body;
                         }
                         res.status = status;
                         res.set_content(body, "application/json");
                     });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~FakeUpstream() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    int hits() {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }
    std::string authorization() {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorization_;
    }
    std::string request_body() {
        std::lock_guard<std::mutex> lock(mutex_);
        return body_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
    std::mutex mutex_;
    int hits_ = 0;
    std::string authorization_;
    std::string body_;
};

class SessionBrokerTest : public ::testing::Test {
protected:
    FakeUpstream upstream;
    SessionBroker broker;

    void SetUp() override {
        SessionBrokerConfig config;
        config.port = 0;
        config.upstream_url = upstream.url();
        config.upstream_timeout_ms = 2000;
        ASSERT_EQ(broker.start(config), RTV_SUCCESS);
        ASSERT_GT(broker.port(), 0);
    }

    void TearDown() override {
        if (broker.isRunning()) {
            broker.stop();
        }
    }

    httplib::Result post_session(const std::string& body, const std::string& key) {
        httplib::Client client("127.0.0.1", broker.port());
        client.set_read_timeout(std::chrono::seconds(5));
        if (!key.empty()) {
            client.set_bearer_token_auth(key);
        }
        return client.Post("/api/realtime-session", body, "application/json");
    }
};

}  // namespace

// =============================================================================
// SESSION CREATION
// =============================================================================

TEST_F(SessionBrokerTest, RelaysUpstreamSession) {
    auto res = post_session(R"({"model":"gpt-4o-mini-realtime-preview","voice":"sage"})", "sk-x");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    EXPECT_EQ(body["id"], "sess_42");
    EXPECT_EQ(body["client_secret"]["value"], "ek_42");
    EXPECT_EQ(body["client_secret"]["expires_at"], 1700000999);

    EXPECT_EQ(upstream.authorization(), "Bearer sk-x");
    json forwarded = json::parse(upstream.request_body());
    EXPECT_EQ(forwarded["model"], "gpt-4o-mini-realtime-preview");
    EXPECT_EQ(forwarded["voice"], "sage");
}

TEST_F(SessionBrokerTest, EmptyBodyUsesDefaults) {
    auto res = post_session("", "sk-x");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json forwarded = json::parse(upstream.request_body());
    EXPECT_EQ(forwarded["model"], rtv::kDefaultRealtimeModel);
    EXPECT_EQ(forwarded["voice"], "alloy");
}

TEST_F(SessionBrokerTest, MissingKeyIsRejectedLocally) {
    auto res = post_session(R"({"model":"gpt-4o-realtime-preview"})", "");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"], "API key is required");
    EXPECT_EQ(upstream.hits(), 0);
}

TEST_F(SessionBrokerTest, NonObjectBodyIsBadRequest) {
    auto res = post_session("[1,2,3]", "sk-x");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(upstream.hits(), 0);
}

TEST_F(SessionBrokerTest, UpstreamErrorIsRelayedWithItsStatus) {
    upstream.status = 401;
    upstream.body = R"({"error":{"message":"Incorrect API key provided","type":"invalid_request_error"}})";

    auto res = post_session("{}", "sk-bad");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
    json body = json::parse(res->body);
    EXPECT_EQ(body["error"]["message"], "Incorrect API key provided");

    rtv::server::SessionBrokerStatus status;
    broker.getStatus(status);
    EXPECT_EQ(status.upstream_failures, 1);
    EXPECT_EQ(status.sessions_created, 0);
}

TEST_F(SessionBrokerTest, UpstreamErrorWithoutDetailGetsGenericMessage) {
    upstream.status = 503;
    upstream.body = "Service Unavailable";

    auto res = post_session("{}", "sk-x");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_EQ(json::parse(res->body)["error"], "Failed to create session");
}

TEST_F(SessionBrokerTest, NonJsonUpstreamSuccessIsServerError) {
    upstream.body = "not json";
    auto res = post_session("{}", "sk-x");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
}

// =============================================================================
// HEALTH AND LIFECYCLE
// =============================================================================

TEST_F(SessionBrokerTest, HealthReportsSessionCount) {
    ASSERT_TRUE(post_session("{}", "sk-x"));

    httplib::Client client("127.0.0.1", broker.port());
    auto res = client.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["sessions_created"], 1);
}

TEST_F(SessionBrokerTest, CorsPreflight) {
    httplib::Client client("127.0.0.1", broker.port());
    auto res = client.Options("/api/realtime-session");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(SessionBrokerTest, StartTwiceIsInvalid) {
    SessionBrokerConfig config;
    config.port = 0;
    config.upstream_url = upstream.url();
    EXPECT_EQ(broker.start(config), RTV_ERROR_INVALID_STATE);
}

TEST_F(SessionBrokerTest, StopThenStopAgain) {
    EXPECT_EQ(broker.stop(), RTV_SUCCESS);
    EXPECT_FALSE(broker.isRunning());
    EXPECT_EQ(broker.stop(), RTV_ERROR_INVALID_STATE);
}

TEST(SessionBroker, UnreachableUpstreamIsServerError) {
    SessionBroker broker;
    SessionBrokerConfig config;
    config.port = 0;
    config.upstream_url = "http://127.0.0.1:1";
    config.upstream_timeout_ms = 1000;
    ASSERT_EQ(broker.start(config), RTV_SUCCESS);

    httplib::Client client("127.0.0.1", broker.port());
    client.set_bearer_token_auth("sk-x");
    auto res = client.Post("/api/realtime-session", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    std::string error = json::parse(res->body)["error"].get<std::string>();
    EXPECT_EQ(error.rfind("Upstream request failed", 0), 0u);

    EXPECT_EQ(broker.stop(), RTV_SUCCESS);
}

TEST(SessionBroker, InvalidUpstreamUrl) {
    SessionBroker broker;
    SessionBrokerConfig config;
    config.port = 0;
    config.upstream_url = "api.openai.com";
    EXPECT_EQ(broker.start(config), RTV_ERROR_INVALID_URL);
    EXPECT_FALSE(broker.isRunning());
}

// =============================================================================
// BEARER PARSING
// =============================================================================

TEST(ExtractBearerToken, Variants) {
    using rtv::server::extract_bearer_token;
    EXPECT_EQ(extract_bearer_token("Bearer sk-abc"), "sk-abc");
    EXPECT_EQ(extract_bearer_token("Bearer   sk-abc  "), "sk-abc");
    EXPECT_EQ(extract_bearer_token("Bearer "), "");
    EXPECT_EQ(extract_bearer_token("Basic dXNlcjpwYXNz"), "");
    EXPECT_EQ(extract_bearer_token(""), "");
}
