/**
 * @file rtv_realtime_events.cpp
 * @brief rtv - Realtime wire event encoding and decoding
 */

#include "rtv/protocol/rtv_realtime_events.h"

#include <unordered_map>

namespace rtv {

namespace {

struct TagEntry {
    InboundEventType type;
    const char* tag;
};

const TagEntry kInboundTags[] = {
    {InboundEventType::SessionCreated, "session.created"},
    {InboundEventType::SessionUpdated, "session.updated"},
    {InboundEventType::AudioDelta, "response.audio.delta"},
    {InboundEventType::AudioDone, "response.audio.done"},
    {InboundEventType::TranscriptDelta, "response.audio_transcript.delta"},
    {InboundEventType::TranscriptDone, "response.audio_transcript.done"},
    {InboundEventType::SpeechStarted, "input_audio_buffer.speech_started"},
    {InboundEventType::SpeechStopped, "input_audio_buffer.speech_stopped"},
    {InboundEventType::InputAudioCommitted, "input_audio_buffer.committed"},
    {InboundEventType::ConversationItemCreated, "conversation.item.created"},
    {InboundEventType::ResponseCreated, "response.created"},
    {InboundEventType::ResponseDone, "response.done"},
    {InboundEventType::OutputItemAdded, "response.output_item.added"},
    {InboundEventType::OutputItemDone, "response.output_item.done"},
    {InboundEventType::TextDelta, "response.text.delta"},
    {InboundEventType::TextDone, "response.text.done"},
    {InboundEventType::ContentPartAdded, "response.content_part.added"},
    {InboundEventType::ContentPartDone, "response.content_part.done"},
    {InboundEventType::RateLimitsUpdated, "rate_limits.updated"},
    {InboundEventType::Error, "error"},
};

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// Invalid UTF-8 in user text becomes U+FFFD instead of throwing
std::string serialize(const nlohmann::json& event) {
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

const char* inbound_event_tag(InboundEventType type) {
    for (const auto& entry : kInboundTags) {
        if (entry.type == type) return entry.tag;
    }
    return "";
}

InboundEventType inbound_event_type_from_tag(const std::string& tag) {
    static const std::unordered_map<std::string, InboundEventType> lookup = [] {
        std::unordered_map<std::string, InboundEventType> map;
        for (const auto& entry : kInboundTags) {
            map.emplace(entry.tag, entry.type);
        }
        return map;
    }();

    auto it = lookup.find(tag);
    return it != lookup.end() ? it->second : InboundEventType::Unknown;
}

rtv_result_t parse_inbound_event(const std::string& message, InboundEvent& out_event) {
    auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return RTV_ERROR_PROTOCOL_MALFORMED;
    }
    auto type_it = json.find("type");
    if (type_it == json.end() || !type_it->is_string()) {
        return RTV_ERROR_PROTOCOL_MALFORMED;
    }

    InboundEvent event;
    event.tag = type_it->get<std::string>();
    event.type = inbound_event_type_from_tag(event.tag);
    event.event_id = string_field(json, "event_id");
    event.response_id = string_field(json, "response_id");
    event.item_id = string_field(json, "item_id");

    switch (event.type) {
        case InboundEventType::AudioDelta:
        case InboundEventType::TranscriptDelta:
        case InboundEventType::TextDelta:
            event.delta = string_field(json, "delta");
            break;
        case InboundEventType::TranscriptDone:
            event.transcript = string_field(json, "transcript");
            break;
        case InboundEventType::TextDone:
            event.transcript = string_field(json, "text");
            break;
        case InboundEventType::ResponseCreated:
        case InboundEventType::ResponseDone:
            if (json.contains("response") && json["response"].is_object()) {
                event.response_id = string_field(json["response"], "id");
            }
            break;
        case InboundEventType::Error: {
            auto err_it = json.find("error");
            if (err_it != json.end() && err_it->is_object()) {
                event.error.type = string_field(*err_it, "type");
                event.error.code = string_field(*err_it, "code");
                event.error.message = string_field(*err_it, "message");
                event.error.param = string_field(*err_it, "param");
            } else {
                // Bare error event: fall back to the envelope itself
                event.error.message = string_field(json, "message");
            }
            if (event.error.message.empty()) {
                event.error.message = "Unknown upstream error";
            }
            break;
        }
        default:
            break;
    }

    event.payload = std::move(json);
    out_event = std::move(event);
    return RTV_SUCCESS;
}

// =============================================================================
// OUTBOUND
// =============================================================================

namespace outbound {

std::string session_update(const SessionConfig& config) {
    nlohmann::json session = {
        {"modalities", config.modalities},
        {"voice", voice_name(config.voice)},
        {"instructions", config.instructions},
        {"input_audio_format", "pcm16"},
        {"output_audio_format", "pcm16"},
        {"turn_detection",
         {
             {"type", "server_vad"},
             {"threshold", config.turn_detection.threshold},
             {"prefix_padding_ms", config.turn_detection.prefix_padding_ms},
             {"silence_duration_ms", config.turn_detection.silence_duration_ms},
         }},
        {"temperature", config.temperature},
    };

    nlohmann::json event = {
        {"type", "session.update"},
        {"session", session},
    };
    return serialize(event);
}

std::string audio_append(const std::string& base64_audio) {
    nlohmann::json event = {
        {"type", "input_audio_buffer.append"},
        {"audio", base64_audio},
    };
    return serialize(event);
}

std::string user_text_item(const std::string& text) {
    return conversation_item({"user", text});
}

std::string conversation_item(const ConversationMessage& message) {
    // Assistant history is replayed as output text, user turns as input text
    bool is_user = message.role != "assistant";
    nlohmann::json content = nlohmann::json::array({
        {{"type", is_user ? "input_text" : "text"}, {"text", message.content}},
    });

    nlohmann::json event = {
        {"type", "conversation.item.create"},
        {"item",
         {
             {"type", "message"},
             {"role", is_user ? "user" : "assistant"},
             {"content", content},
         }},
    };
    return serialize(event);
}

std::string response_create(const std::vector<std::string>& modalities) {
    nlohmann::json event = {
        {"type", "response.create"},
        {"response", {{"modalities", modalities}}},
    };
    return serialize(event);
}

}  // namespace outbound

}  // namespace rtv
