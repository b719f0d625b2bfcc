/**
 * @file rtv_app_config.h
 * @brief rtv - Application configuration for the console tools
 *
 * Values come from the environment first and are then overridden by
 * command-line flags.
 *
 * Environment Variables:
 *   RTV_API_KEY         Long-lived API key (falls back to OPENAI_API_KEY)
 *   RTV_SESSION_URL     Session broker endpoint
 *   RTV_REALTIME_URL    Realtime WebSocket endpoint
 *   RTV_MODEL           Realtime model id
 *   RTV_VOICE           Voice identity
 *   RTV_MODE            "text" or "voice"
 *   RTV_INPUT_DEVICE    ALSA capture device
 *   RTV_OUTPUT_DEVICE   ALSA playback device
 *   RTV_LOG_LEVEL       trace, debug, info, warning, error or off
 */

#ifndef RTV_APP_CONFIG_H
#define RTV_APP_CONFIG_H

#include <functional>
#include <string>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_logger.h"
#include "rtv/core/rtv_types.h"

namespace rtv {

constexpr float kMinTemperature = 0.6f;
constexpr float kMaxTemperature = 1.2f;

struct AppConfig {
    std::string api_key;
    std::string session_url;
    std::string realtime_url;
    std::string model = kDefaultRealtimeModel;
    Voice voice = Voice::Alloy;
    VoiceMode mode = VoiceMode::TextToVoice;
    std::string instructions = kDefaultInstructions;
    float temperature = kDefaultTemperature;
    std::string input_device = "default";
    std::string output_device = "default";
    rtv_log_level_t log_level = RTV_LOG_LEVEL_INFO;
    bool list_devices = false;
    bool show_help = false;

    static AppConfig defaults();
};

// Returns nullptr for unset variables
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Build the configuration from the environment and argv
 *
 * @param env  variable lookup, std::getenv when empty
 * @param out_error  set to a printable message on failure
 * @return RTV_SUCCESS or RTV_ERROR_INVALID_ARGUMENT (unknown flag, missing
 *         value, unknown voice or mode, temperature outside [0.6, 1.2])
 */
rtv_result_t load_app_config(int argc, const char* const* argv, const EnvLookup& env,
                             AppConfig& out_config, std::string& out_error);

void print_app_usage(const char* program_name);

}  // namespace rtv

#endif  // RTV_APP_CONFIG_H
