/**
 * @file test_protocol_client.cpp
 * @brief Tests for the realtime protocol client over an in-memory channel
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "rtv/protocol/rtv_protocol_client.h"
#include "test_fakes.h"

using nlohmann::json;
using rtv::ChannelState;
using rtv::ProtocolClient;
using rtv_test::ChannelTap;
using rtv_test::FakeChannel;

namespace {

class RecordingObserver : public rtv::ProtocolObserver {
public:
    int opened = 0;
    std::vector<rtv::Error> closed;
    std::vector<std::string> audio;
    std::vector<std::pair<std::string, bool>> transcripts;
    std::vector<rtv::Error> errors;
    std::vector<std::string> events;

    void on_open() override { opened++; }
    void on_closed(const rtv::Error& reason) override { closed.push_back(reason); }
    void on_audio_delta(const std::string& b64) override { audio.push_back(b64); }
    void on_transcript(const std::string& text, bool is_final) override {
        transcripts.emplace_back(text, is_final);
    }
    void on_error(const rtv::Error& error) override { errors.push_back(error); }
    void on_event(const rtv::InboundEvent& event) override { events.push_back(event.tag); }
};

rtv::SessionConfig make_config() {
    rtv::SessionConfig config;
    config.credential = "ek_scoped";
    config.model = "gpt-4o-mini-realtime-preview";
    config.voice = rtv::Voice::Verse;
    return config;
}

struct ClientFixture {
    std::shared_ptr<ChannelTap> tap = std::make_shared<ChannelTap>();
    RecordingObserver observer;
    std::unique_ptr<ProtocolClient> client;

    explicit ClientFixture(rtv::SessionConfig config = make_config()) {
        client = std::make_unique<ProtocolClient>(
            std::move(config), std::make_unique<FakeChannel>(tap), &observer,
            "wss://realtime.example/v1/realtime");
    }
};

std::string sent_type(const std::string& message) {
    return json::parse(message)["type"].get<std::string>();
}

}  // namespace

// =============================================================================
// CONNECT
// =============================================================================

TEST(ProtocolClient, ConnectAuthenticatesWithScopedCredential) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    EXPECT_EQ(f.client->state(), ChannelState::Open);
    EXPECT_EQ(f.tap->request.url,
              "wss://realtime.example/v1/realtime?model=gpt-4o-mini-realtime-preview");
    EXPECT_EQ(f.tap->header("Authorization"), "Bearer ek_scoped");
    EXPECT_EQ(f.tap->header("OpenAI-Beta"), "realtime=v1");
    EXPECT_EQ(f.observer.opened, 1);
}

TEST(ProtocolClient, SessionUpdateIsFirstMessage) {
    rtv::SessionConfig config = make_config();
    config.seed_conversation = {{"user", "Hi"}, {"assistant", "Hello!"}};
    ClientFixture f(config);
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    auto sent = f.tap->sent_messages();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent_type(sent[0]), "session.update");
    EXPECT_EQ(json::parse(sent[0])["session"]["voice"], "verse");
    EXPECT_EQ(sent_type(sent[1]), "conversation.item.create");
    EXPECT_EQ(json::parse(sent[1])["item"]["role"], "user");
    EXPECT_EQ(json::parse(sent[2])["item"]["role"], "assistant");
}

TEST(ProtocolClient, BuildChannelUrlAppendsModel) {
    EXPECT_EQ(ProtocolClient::build_channel_url("wss://h/v1/realtime", "m"),
              "wss://h/v1/realtime?model=m");
    EXPECT_EQ(ProtocolClient::build_channel_url("wss://h/v1/realtime?x=1", "m"),
              "wss://h/v1/realtime?x=1&model=m");
}

TEST(ProtocolClient, FailedOpenEndsClosedAndReportsError) {
    ClientFixture f;
    f.tap->open_result = RTV_ERROR_HANDSHAKE_FAILED;

    EXPECT_EQ(f.client->connect(), RTV_ERROR_HANDSHAKE_FAILED);
    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    ASSERT_EQ(f.observer.errors.size(), 1u);
    EXPECT_EQ(f.observer.errors[0].code, RTV_ERROR_HANDSHAKE_FAILED);
    EXPECT_EQ(f.observer.opened, 0);
    EXPECT_TRUE(f.tap->sent_messages().empty());
}

TEST(ProtocolClient, ClientIsSingleUse) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);
    f.client->disconnect();
    EXPECT_EQ(f.client->connect(), RTV_ERROR_INVALID_STATE);
}

TEST(ProtocolClient, RemoteCloseDuringOpenIsReported) {
    ClientFixture f;
    auto tap = f.tap;
    tap->during_open = [tap]() {
        tap->remote_close(RTV_ERROR_CONNECTION_CLOSED, "Server closed the connection");
    };

    EXPECT_EQ(f.client->connect(), RTV_ERROR_CONNECTION_CLOSED);
    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    ASSERT_EQ(f.observer.closed.size(), 1u);
    EXPECT_EQ(f.observer.opened, 0);
}

// =============================================================================
// SEND
// =============================================================================

TEST(ProtocolClient, SendBeforeOpenIsDropped) {
    ClientFixture f;
    EXPECT_EQ(f.client->send(rtv::outbound::audio_append("AAAA")), RTV_ERROR_NOT_CONNECTED);
    EXPECT_EQ(f.client->stats().dropped, 1u);
    EXPECT_TRUE(f.tap->sent_messages().empty());
}

TEST(ProtocolClient, SendAfterDisconnectIsDropped) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);
    f.client->disconnect();

    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    EXPECT_EQ(f.client->send(rtv::outbound::response_create()), RTV_ERROR_NOT_CONNECTED);
}

TEST(ProtocolClient, SendPreservesOrder) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);
    ASSERT_EQ(f.client->send(rtv::outbound::user_text_item("Hello")), RTV_SUCCESS);
    ASSERT_EQ(f.client->send(rtv::outbound::response_create()), RTV_SUCCESS);

    auto sent = f.tap->sent_messages();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent_type(sent[1]), "conversation.item.create");
    EXPECT_EQ(sent_type(sent[2]), "response.create");
    EXPECT_EQ(f.client->stats().sent, 3u);
}

// =============================================================================
// INBOUND DISPATCH
// =============================================================================

TEST(ProtocolClient, DispatchesTypedEvents) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    f.tap->deliver(R"({"type":"session.created","session":{}})");
    f.tap->deliver(R"({"type":"response.audio.delta","delta":"AAAA"})");
    f.tap->deliver(R"({"type":"response.audio.delta","delta":""})");
    f.tap->deliver(R"({"type":"response.audio_transcript.delta","delta":"Hel"})");
    f.tap->deliver(R"({"type":"response.audio_transcript.done","transcript":"Hello"})");
    f.tap->deliver(R"({"type":"response.done","response":{"id":"r"}})");

    EXPECT_EQ(f.observer.audio, (std::vector<std::string>{"AAAA"}));
    ASSERT_EQ(f.observer.transcripts.size(), 2u);
    EXPECT_EQ(f.observer.transcripts[0], std::make_pair(std::string("Hel"), false));
    EXPECT_EQ(f.observer.transcripts[1], std::make_pair(std::string("Hello"), true));
    EXPECT_EQ(f.observer.events, (std::vector<std::string>{"session.created", "response.done"}));
}

TEST(ProtocolClient, MalformedAndUnknownMessagesAreSkipped) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    f.tap->deliver("{broken");
    f.tap->deliver(R"({"no_type":true})");
    f.tap->deliver(R"({"type":"brand.new.event"})");
    f.tap->deliver(R"({"type":"response.audio.delta","delta":"BBBB"})");

    auto stats = f.client->stats();
    EXPECT_EQ(stats.received, 4u);
    EXPECT_EQ(stats.malformed, 2u);
    EXPECT_EQ(stats.unknown, 1u);
    EXPECT_TRUE(f.observer.events.empty());
    EXPECT_EQ(f.observer.audio, (std::vector<std::string>{"BBBB"}));
    EXPECT_EQ(f.client->state(), ChannelState::Open);
}

TEST(ProtocolClient, UpstreamErrorIsAdvisory) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    f.tap->deliver(
        R"({"type":"error","error":{"type":"invalid_request_error","code":"bad","message":"Nope"}})");

    ASSERT_EQ(f.observer.errors.size(), 1u);
    EXPECT_EQ(f.observer.errors[0].code, RTV_ERROR_UPSTREAM_ADVISORY);
    EXPECT_EQ(f.observer.errors[0].message, "Nope");
    EXPECT_EQ(f.observer.errors[0].type, "invalid_request_error");
    EXPECT_EQ(f.observer.errors[0].upstream_code, "bad");
    // The session stays up
    EXPECT_EQ(f.client->state(), ChannelState::Open);
}

// =============================================================================
// CLOSE
// =============================================================================

TEST(ProtocolClient, RemoteCloseNotifiesOnce) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    f.tap->remote_close(RTV_ERROR_CONNECTION_CLOSED, "bye");
    f.tap->remote_close(RTV_ERROR_CONNECTION_CLOSED, "again");

    ASSERT_EQ(f.observer.closed.size(), 1u);
    EXPECT_EQ(f.observer.closed[0].code, RTV_ERROR_CONNECTION_CLOSED);
    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    EXPECT_EQ(f.client->last_error().code, RTV_ERROR_CONNECTION_CLOSED);

    // The transport is still released by disconnect()
    f.client->disconnect();
    EXPECT_EQ(f.tap->close_calls, 1);
}

TEST(ProtocolClient, DisconnectIsIdempotentAndSilent) {
    ClientFixture f;
    ASSERT_EQ(f.client->connect(), RTV_SUCCESS);

    f.client->disconnect();
    f.client->disconnect();

    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    EXPECT_EQ(f.tap->close_calls, 1);
    EXPECT_TRUE(f.observer.closed.empty());
}

TEST(ProtocolClient, DisconnectBeforeConnect) {
    ClientFixture f;
    f.client->disconnect();
    EXPECT_EQ(f.client->state(), ChannelState::Closed);
    EXPECT_EQ(f.tap->close_calls, 0);
    EXPECT_EQ(f.client->connect(), RTV_ERROR_INVALID_STATE);
}
