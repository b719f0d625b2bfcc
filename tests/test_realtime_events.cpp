/**
 * @file test_realtime_events.cpp
 * @brief Tests for inbound event parsing and outbound event builders
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

#include "rtv/protocol/rtv_realtime_events.h"

using rtv::InboundEvent;
using rtv::InboundEventType;
using nlohmann::json;

// =============================================================================
// INBOUND
// =============================================================================

TEST(InboundEvents, TagTableIsBijective) {
    for (int i = 0; i < static_cast<int>(InboundEventType::Unknown); ++i) {
        auto type = static_cast<InboundEventType>(i);
        std::string tag = rtv::inbound_event_tag(type);
        ASSERT_FALSE(tag.empty());
        EXPECT_EQ(rtv::inbound_event_type_from_tag(tag), type) << tag;
    }
    EXPECT_EQ(rtv::inbound_event_type_from_tag("response.function_call_arguments.delta"),
              InboundEventType::Unknown);
}

TEST(InboundEvents, AudioDelta) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(
                  R"({"type":"response.audio.delta","event_id":"e1","response_id":"r1",)"
                  R"("item_id":"i1","delta":"AAAA"})",
                  event),
              RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::AudioDelta);
    EXPECT_EQ(event.event_id, "e1");
    EXPECT_EQ(event.response_id, "r1");
    EXPECT_EQ(event.item_id, "i1");
    EXPECT_EQ(event.delta, "AAAA");
}

TEST(InboundEvents, TranscriptDone) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(
                  R"({"type":"response.audio_transcript.done","transcript":"Hello there."})",
                  event),
              RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::TranscriptDone);
    EXPECT_EQ(event.transcript, "Hello there.");
}

TEST(InboundEvents, TextDoneUsesTextField) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(R"({"type":"response.text.done","text":"Hi"})", event),
              RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::TextDone);
    EXPECT_EQ(event.transcript, "Hi");
}

TEST(InboundEvents, ResponseCreatedCarriesResponseId) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(
                  R"({"type":"response.created","response":{"id":"resp_1","status":"in_progress"}})",
                  event),
              RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::ResponseCreated);
    EXPECT_EQ(event.response_id, "resp_1");
}

TEST(InboundEvents, ErrorFields) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(
                  R"({"type":"error","error":{"type":"invalid_request_error",)"
                  R"("code":"invalid_value","message":"Bad voice","param":"session.voice"}})",
                  event),
              RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::Error);
    EXPECT_EQ(event.error.type, "invalid_request_error");
    EXPECT_EQ(event.error.code, "invalid_value");
    EXPECT_EQ(event.error.message, "Bad voice");
    EXPECT_EQ(event.error.param, "session.voice");
}

TEST(InboundEvents, ErrorWithoutDetailsGetsDefaultMessage) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(R"({"type":"error","error":{"param":null}})", event),
              RTV_SUCCESS);
    EXPECT_EQ(event.error.message, "Unknown upstream error");
    EXPECT_TRUE(event.error.param.empty());
}

TEST(InboundEvents, UnknownTagIsNotAnError) {
    InboundEvent event;
    ASSERT_EQ(rtv::parse_inbound_event(R"({"type":"something.new","x":1})", event), RTV_SUCCESS);
    EXPECT_EQ(event.type, InboundEventType::Unknown);
    EXPECT_EQ(event.tag, "something.new");
    EXPECT_EQ(event.payload["x"], 1);
}

TEST(InboundEvents, MalformedMessages) {
    InboundEvent event;
    EXPECT_EQ(rtv::parse_inbound_event("not json", event), RTV_ERROR_PROTOCOL_MALFORMED);
    EXPECT_EQ(rtv::parse_inbound_event("[1,2]", event), RTV_ERROR_PROTOCOL_MALFORMED);
    EXPECT_EQ(rtv::parse_inbound_event(R"({"delta":"x"})", event), RTV_ERROR_PROTOCOL_MALFORMED);
    EXPECT_EQ(rtv::parse_inbound_event(R"({"type":42})", event), RTV_ERROR_PROTOCOL_MALFORMED);
}

// =============================================================================
// OUTBOUND
// =============================================================================

TEST(OutboundEvents, SessionUpdate) {
    rtv::SessionConfig config;
    config.credential = "ek_secret";
    config.voice = rtv::Voice::Coral;
    config.instructions = "Be brief.";
    config.temperature = 0.9f;

    json event = json::parse(rtv::outbound::session_update(config));
    EXPECT_EQ(event["type"], "session.update");

    const json& session = event["session"];
    EXPECT_EQ(session["modalities"], json::array({"text", "audio"}));
    EXPECT_EQ(session["voice"], "coral");
    EXPECT_EQ(session["instructions"], "Be brief.");
    EXPECT_EQ(session["input_audio_format"], "pcm16");
    EXPECT_EQ(session["output_audio_format"], "pcm16");
    EXPECT_EQ(session["turn_detection"]["type"], "server_vad");
    EXPECT_NEAR(session["turn_detection"]["threshold"].get<double>(), 0.5, 1e-6);
    EXPECT_EQ(session["turn_detection"]["prefix_padding_ms"], 300);
    EXPECT_EQ(session["turn_detection"]["silence_duration_ms"], 500);
    EXPECT_NEAR(session["temperature"].get<double>(), 0.9, 1e-6);

    // The credential authenticates the channel; it never appears in events
    EXPECT_EQ(event.dump().find("ek_secret"), std::string::npos);
}

TEST(OutboundEvents, AudioAppend) {
    json event = json::parse(rtv::outbound::audio_append("AAAA"));
    EXPECT_EQ(event["type"], "input_audio_buffer.append");
    EXPECT_EQ(event["audio"], "AAAA");
}

TEST(OutboundEvents, UserTextItem) {
    json event = json::parse(rtv::outbound::user_text_item("Hi \"there\""));
    EXPECT_EQ(event["type"], "conversation.item.create");
    EXPECT_EQ(event["item"]["type"], "message");
    EXPECT_EQ(event["item"]["role"], "user");
    ASSERT_EQ(event["item"]["content"].size(), 1u);
    EXPECT_EQ(event["item"]["content"][0]["type"], "input_text");
    EXPECT_EQ(event["item"]["content"][0]["text"], "Hi \"there\"");
}

TEST(OutboundEvents, AssistantHistoryItem) {
    json event = json::parse(rtv::outbound::conversation_item({"assistant", "Earlier reply"}));
    EXPECT_EQ(event["item"]["role"], "assistant");
    EXPECT_EQ(event["item"]["content"][0]["type"], "text");
    EXPECT_EQ(event["item"]["content"][0]["text"], "Earlier reply");
}

TEST(OutboundEvents, ResponseCreate) {
    json event = json::parse(rtv::outbound::response_create());
    EXPECT_EQ(event["type"], "response.create");
    EXPECT_EQ(event["response"]["modalities"], json::array({"text", "audio"}));
}

TEST(OutboundEvents, InvalidUtf8TextIsReplaced) {
    std::string encoded;
    ASSERT_NO_THROW(encoded = rtv::outbound::user_text_item("caf\xe9"));
    json event = json::parse(encoded);
    EXPECT_EQ(event["item"]["content"][0]["text"], "caf\xef\xbf\xbd");

    rtv::SessionConfig config;
    config.instructions = "R\xe9ponds en fran\xe7" "ais.";
    ASSERT_NO_THROW(encoded = rtv::outbound::session_update(config));
    EXPECT_TRUE(json::parse(encoded)["session"]["instructions"].is_string());
}
