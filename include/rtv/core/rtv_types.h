/**
 * @file rtv_types.h
 * @brief rtv - Shared session and state types
 */

#ifndef RTV_TYPES_H
#define RTV_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace rtv {

// =============================================================================
// AUDIO FORMAT
// =============================================================================

// PCM16 mono in both directions
constexpr uint32_t kRealtimeSampleRate = 24000;
constexpr size_t kCaptureChunkSamples = 4096;

// =============================================================================
// MODELS AND VOICES
// =============================================================================

constexpr const char* kDefaultRealtimeModel = "gpt-4o-realtime-preview";
constexpr const char* kDefaultInstructions = "You are a helpful assistant.";
constexpr float kDefaultTemperature = 0.8f;

struct RealtimeModelInfo {
    const char* id;
    const char* display_name;
};

inline const RealtimeModelInfo REALTIME_MODELS[] = {
    {"gpt-4o-realtime-preview", "GPT-4o Realtime"},
    {"gpt-4o-mini-realtime-preview", "GPT-4o-mini Realtime"},
};

bool is_realtime_model(const std::string& model_id);

enum class Voice {
    Alloy,
    Ash,
    Ballad,
    Coral,
    Echo,
    Sage,
    Shimmer,
    Verse,
};

const char* voice_name(Voice voice);

/**
 * @brief Parse a voice identity by its wire name
 *
 * @return false if the name is not one of the supported voices
 */
bool parse_voice(const std::string& name, Voice& out_voice);

std::vector<Voice> all_voices();

// =============================================================================
// MODES AND STATES
// =============================================================================

enum class VoiceMode {
    TextToVoice,   // user types, assistant replies in voice
    VoiceToVoice,  // bidirectional audio
};

const char* voice_mode_name(VoiceMode mode);
bool parse_voice_mode(const std::string& name, VoiceMode& out_mode);

enum class PermissionState {
    Unknown,
    Granted,
    Denied,
};

const char* permission_state_name(PermissionState state);

enum class ChannelState {
    Idle,
    Connecting,
    Open,
    Closing,
    Closed,
};

const char* channel_state_name(ChannelState state);

// =============================================================================
// SESSION CONFIGURATION
// =============================================================================

struct ConversationMessage {
    std::string role;  // "user" or "assistant"
    std::string content;
};

/**
 * @brief Server-side voice activity detection parameters
 */
struct TurnDetection {
    float threshold = 0.5f;
    int32_t prefix_padding_ms = 300;
    int32_t silence_duration_ms = 500;
};

/**
 * @brief Immutable configuration of one realtime session
 *
 * credential is the short-lived scoped credential, never the long-lived key.
 */
struct SessionConfig {
    std::string credential;
    std::string model = kDefaultRealtimeModel;
    Voice voice = Voice::Alloy;
    std::string instructions = kDefaultInstructions;
    float temperature = kDefaultTemperature;
    TurnDetection turn_detection;
    std::vector<ConversationMessage> seed_conversation;
    std::vector<std::string> modalities = {"text", "audio"};
};

}  // namespace rtv

#endif  // RTV_TYPES_H
