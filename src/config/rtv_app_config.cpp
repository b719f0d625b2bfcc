/**
 * @file rtv_app_config.cpp
 * @brief rtv - Environment and command-line configuration
 */

#include "rtv/config/rtv_app_config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "rtv/net/rtv_session_negotiator.h"
#include "rtv/protocol/rtv_protocol_client.h"

namespace rtv {

namespace {

rtv_result_t invalid(std::string& out_error, const std::string& message) {
    out_error = message;
    return RTV_ERROR_INVALID_ARGUMENT;
}

rtv_result_t apply_voice(const std::string& value, AppConfig& config, std::string& out_error) {
    if (!parse_voice(value, config.voice)) {
        std::string names;
        for (Voice voice : all_voices()) {
            if (!names.empty()) names += ", ";
            names += voice_name(voice);
        }
        return invalid(out_error, "Unknown voice '" + value + "' (expected one of: " + names + ")");
    }
    return RTV_SUCCESS;
}

rtv_result_t apply_mode(const std::string& value, AppConfig& config, std::string& out_error) {
    if (!parse_voice_mode(value, config.mode)) {
        return invalid(out_error, "Unknown mode '" + value + "' (expected text or voice)");
    }
    return RTV_SUCCESS;
}

rtv_result_t apply_temperature(const std::string& value, AppConfig& config,
                               std::string& out_error) {
    char* end = nullptr;
    float temperature = std::strtof(value.c_str(), &end);
    if (value.empty() || end == nullptr || *end != '\0') {
        return invalid(out_error, "Invalid temperature '" + value + "'");
    }
    if (temperature < kMinTemperature || temperature > kMaxTemperature) {
        return invalid(out_error, "Temperature must be between 0.6 and 1.2");
    }
    config.temperature = temperature;
    return RTV_SUCCESS;
}

}  // namespace

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.session_url = kDefaultSessionUrl;
    config.realtime_url = kDefaultRealtimeUrl;
    return config;
}

rtv_result_t load_app_config(int argc, const char* const* argv, const EnvLookup& env,
                             AppConfig& out_config, std::string& out_error) {
    auto lookup = [&env](const char* name) -> const char* {
        const char* value = env ? env(name) : std::getenv(name);
        return (value && *value) ? value : nullptr;
    };

    AppConfig config = AppConfig::defaults();
    rtv_result_t rc;

    // Check environment variables first
    if (const char* v = lookup("RTV_API_KEY")) {
        config.api_key = v;
    } else if (const char* fallback = lookup("OPENAI_API_KEY")) {
        config.api_key = fallback;
    }
    if (const char* v = lookup("RTV_SESSION_URL")) config.session_url = v;
    if (const char* v = lookup("RTV_REALTIME_URL")) config.realtime_url = v;
    if (const char* v = lookup("RTV_MODEL")) config.model = v;
    if (const char* v = lookup("RTV_VOICE")) {
        rc = apply_voice(v, config, out_error);
        if (RTV_FAILED(rc)) return rc;
    }
    if (const char* v = lookup("RTV_MODE")) {
        rc = apply_mode(v, config, out_error);
        if (RTV_FAILED(rc)) return rc;
    }
    if (const char* v = lookup("RTV_INPUT_DEVICE")) config.input_device = v;
    if (const char* v = lookup("RTV_OUTPUT_DEVICE")) config.output_device = v;
    if (const char* v = lookup("RTV_LOG_LEVEL")) {
        config.log_level = rtv_log_level_from_string(v, config.log_level);
    }

    // Parse command line arguments (override env vars)
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto takes_value = [&](const char* long_name, const char* short_name) {
            return std::strcmp(arg, long_name) == 0 ||
                   (short_name && std::strcmp(arg, short_name) == 0);
        };
        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string value;
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.show_help = true;
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            config.log_level = RTV_LOG_LEVEL_DEBUG;
        } else if (std::strcmp(arg, "--list-devices") == 0) {
            config.list_devices = true;
        } else if (takes_value("--api-key", "-k")) {
            if (!next_value(config.api_key)) return invalid(out_error, "--api-key needs a value");
        } else if (takes_value("--session-url", nullptr)) {
            if (!next_value(config.session_url)) {
                return invalid(out_error, "--session-url needs a value");
            }
        } else if (takes_value("--realtime-url", nullptr)) {
            if (!next_value(config.realtime_url)) {
                return invalid(out_error, "--realtime-url needs a value");
            }
        } else if (takes_value("--model", "-m")) {
            if (!next_value(config.model)) return invalid(out_error, "--model needs a value");
        } else if (takes_value("--voice", nullptr)) {
            if (!next_value(value)) return invalid(out_error, "--voice needs a value");
            rc = apply_voice(value, config, out_error);
            if (RTV_FAILED(rc)) return rc;
        } else if (takes_value("--mode", nullptr)) {
            if (!next_value(value)) return invalid(out_error, "--mode needs a value");
            rc = apply_mode(value, config, out_error);
            if (RTV_FAILED(rc)) return rc;
        } else if (takes_value("--input", "-i")) {
            if (!next_value(config.input_device)) return invalid(out_error, "--input needs a value");
        } else if (takes_value("--output", "-o")) {
            if (!next_value(config.output_device)) {
                return invalid(out_error, "--output needs a value");
            }
        } else if (takes_value("--instructions", nullptr)) {
            if (!next_value(config.instructions)) {
                return invalid(out_error, "--instructions needs a value");
            }
        } else if (takes_value("--temperature", "-t")) {
            if (!next_value(value)) return invalid(out_error, "--temperature needs a value");
            rc = apply_temperature(value, config, out_error);
            if (RTV_FAILED(rc)) return rc;
        } else {
            return invalid(out_error, std::string("Unknown option: ") + arg);
        }
    }

    if (!is_realtime_model(config.model)) {
        // Other ids are passed through; the service decides
        RTV_LOG_WARNING("Config", "'%s' is not a known realtime model", config.model.c_str());
    }

    out_config = std::move(config);
    out_error.clear();
    return RTV_SUCCESS;
}

void print_app_usage(const char* program_name) {
    printf("rtv voice chat - realtime voice conversation in the terminal\n\n");
    printf("Usage: %s [options]\n\n", program_name);
    printf("Options:\n");
    printf("  --api-key, -k <key>      Long-lived API key\n");
    printf("  --session-url <url>      Session broker endpoint (default: %s)\n", kDefaultSessionUrl);
    printf("  --realtime-url <url>     Realtime endpoint (default: %s)\n", kDefaultRealtimeUrl);
    printf("  --model, -m <id>         Realtime model (default: %s)\n", kDefaultRealtimeModel);
    printf("  --voice <name>           alloy, ash, ballad, coral, echo, sage, shimmer, verse\n");
    printf("  --mode text|voice        Text-to-voice or voice-to-voice (default: text)\n");
    printf("  --input, -i <device>     ALSA capture device (default: default)\n");
    printf("  --output, -o <device>    ALSA playback device (default: default)\n");
    printf("  --instructions <text>    System instructions\n");
    printf("  --temperature, -t <t>    Sampling temperature, 0.6 to 1.2 (default: 0.8)\n");
    printf("  --list-devices           List ALSA capture and playback devices\n");
    printf("  --verbose, -v            Enable debug logging\n");
    printf("  --help, -h               Show this help message\n\n");
    printf("Environment Variables:\n");
    printf("  RTV_API_KEY (or OPENAI_API_KEY), RTV_SESSION_URL, RTV_REALTIME_URL,\n");
    printf("  RTV_MODEL, RTV_VOICE, RTV_MODE, RTV_INPUT_DEVICE, RTV_OUTPUT_DEVICE,\n");
    printf("  RTV_LOG_LEVEL\n\n");
    printf("Commands (interactive):\n");
    printf("  /connect  /disconnect  /record  /mode text|voice  /voice <name>\n");
    printf("  /model <id>  /status  /quit\n");
    printf("  Any other line is sent as a text message.\n");
}

}  // namespace rtv
