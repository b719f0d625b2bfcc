/**
 * @file rtv_realtime_events.h
 * @brief rtv - Realtime wire event taxonomy
 *
 * Every message on the channel is a JSON object with a "type" tag. Inbound
 * messages are decoded into InboundEvent; outbound events are built as
 * serialized JSON text ready for RealtimeChannel::send_text().
 */

#ifndef RTV_REALTIME_EVENTS_H
#define RTV_REALTIME_EVENTS_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"

namespace rtv {

// =============================================================================
// INBOUND
// =============================================================================

enum class InboundEventType {
    SessionCreated,
    SessionUpdated,
    AudioDelta,
    AudioDone,
    TranscriptDelta,
    TranscriptDone,
    SpeechStarted,
    SpeechStopped,
    InputAudioCommitted,
    ConversationItemCreated,
    ResponseCreated,
    ResponseDone,
    OutputItemAdded,
    OutputItemDone,
    TextDelta,
    TextDone,
    ContentPartAdded,
    ContentPartDone,
    RateLimitsUpdated,
    Error,
    Unknown,
};

/**
 * @brief Wire tag for an event type ("" for Unknown)
 */
const char* inbound_event_tag(InboundEventType type);

InboundEventType inbound_event_type_from_tag(const std::string& tag);

/**
 * @brief Payload of an upstream `error` event
 */
struct UpstreamErrorInfo {
    std::string type;
    std::string code;
    std::string message;
    std::string param;
};

struct InboundEvent {
    InboundEventType type = InboundEventType::Unknown;
    std::string tag;          // raw "type" value, kept for unknown tags
    std::string event_id;
    std::string response_id;
    std::string item_id;

    std::string delta;        // audio (base64) or text fragment
    std::string transcript;   // final transcript / text
    UpstreamErrorInfo error;

    nlohmann::json payload;   // full message, for diagnostics
};

/**
 * @brief Decode one inbound message
 *
 * Unrecognized tags decode successfully with type Unknown.
 *
 * @return RTV_ERROR_PROTOCOL_MALFORMED if the text is not a JSON object
 *         with a string "type" field
 */
rtv_result_t parse_inbound_event(const std::string& message, InboundEvent& out_event);

// =============================================================================
// OUTBOUND
// =============================================================================

namespace outbound {

// session.update: modalities, voice, instructions, formats, VAD, temperature
std::string session_update(const SessionConfig& config);

// input_audio_buffer.append with a base64 PCM16 chunk
std::string audio_append(const std::string& base64_audio);

// conversation.item.create for a user text turn
std::string user_text_item(const std::string& text);

// conversation.item.create replaying a prior turn ("user" or "assistant")
std::string conversation_item(const ConversationMessage& message);

// response.create asking for the given output modalities
std::string response_create(const std::vector<std::string>& modalities = {"text", "audio"});

}  // namespace outbound

}  // namespace rtv

#endif  // RTV_REALTIME_EVENTS_H
