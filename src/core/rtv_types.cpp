/**
 * @file rtv_types.cpp
 * @brief rtv - Name tables for shared enums
 */

#include "rtv/core/rtv_types.h"

namespace rtv {

namespace {

struct VoiceName {
    Voice voice;
    const char* name;
};

const VoiceName VOICE_NAMES[] = {
    {Voice::Alloy, "alloy"},     {Voice::Ash, "ash"},   {Voice::Ballad, "ballad"},
    {Voice::Coral, "coral"},     {Voice::Echo, "echo"}, {Voice::Sage, "sage"},
    {Voice::Shimmer, "shimmer"}, {Voice::Verse, "verse"},
};

}  // namespace

bool is_realtime_model(const std::string& model_id) {
    for (const auto& model : REALTIME_MODELS) {
        if (model_id == model.id) return true;
    }
    return false;
}

const char* voice_name(Voice voice) {
    for (const auto& entry : VOICE_NAMES) {
        if (entry.voice == voice) return entry.name;
    }
    return "alloy";
}

bool parse_voice(const std::string& name, Voice& out_voice) {
    for (const auto& entry : VOICE_NAMES) {
        if (name == entry.name) {
            out_voice = entry.voice;
            return true;
        }
    }
    return false;
}

std::vector<Voice> all_voices() {
    std::vector<Voice> voices;
    for (const auto& entry : VOICE_NAMES) {
        voices.push_back(entry.voice);
    }
    return voices;
}

const char* voice_mode_name(VoiceMode mode) {
    return mode == VoiceMode::VoiceToVoice ? "voice-to-voice" : "text-to-voice";
}

bool parse_voice_mode(const std::string& name, VoiceMode& out_mode) {
    if (name == "text" || name == "text-to-voice") {
        out_mode = VoiceMode::TextToVoice;
        return true;
    }
    if (name == "voice" || name == "voice-to-voice") {
        out_mode = VoiceMode::VoiceToVoice;
        return true;
    }
    return false;
}

const char* permission_state_name(PermissionState state) {
    switch (state) {
        case PermissionState::Granted:
            return "granted";
        case PermissionState::Denied:
            return "denied";
        default:
            return "unknown";
    }
}

const char* channel_state_name(ChannelState state) {
    switch (state) {
        case ChannelState::Idle:
            return "idle";
        case ChannelState::Connecting:
            return "connecting";
        case ChannelState::Open:
            return "open";
        case ChannelState::Closing:
            return "closing";
        case ChannelState::Closed:
            return "closed";
    }
    return "unknown";
}

}  // namespace rtv
