// =============================================================================
// rtv voice chat - Main Entry Point
// =============================================================================
// Realtime voice conversation in the terminal. Typed lines are sent as text
// turns and the reply is spoken; in voice mode the microphone streams
// continuously and the service detects turns.
//
// Usage: ./rtv-voice-chat [options]   (see --help)
//
// Controls:
//   /connect /disconnect /record /mode /voice /model /status /quit
//   Ctrl+C                   Disconnect and exit
// =============================================================================

#include "rtv/audio/rtv_alsa_sink.h"
#include "rtv/audio/rtv_audio_capture.h"
#include "rtv/audio/rtv_microphone.h"
#include "rtv/config/rtv_app_config.h"
#include "rtv/core/rtv_logger.h"
#include "rtv/net/rtv_session_negotiator.h"
#include "rtv/net/rtv_websocket_channel.h"
#include "rtv/voice/rtv_voice_chat_controller.h"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// =============================================================================
// Global State
// =============================================================================

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// =============================================================================
// Console views
// =============================================================================

namespace {

std::mutex g_console_mutex;

class ConsoleMessageStore : public rtv::MessageStore {
public:
    void append_message(const std::string& text, bool is_user) override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        if (is_user) {
            std::cout << "[YOU] " << text << std::endl;
        } else {
            std::cout << "[ASSISTANT] " << text << std::endl;
        }
    }
};

class ConsoleListener : public rtv::VoiceChatListener {
public:
    void on_state_changed(const rtv::VoiceChatState& state) override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::string status = state.connecting  ? "connecting"
                             : state.connected ? "connected"
                                               : "disconnected";
        if (status != last_status_ || state.recording != last_recording_) {
            std::cout << "[" << status << (state.recording ? ", recording" : "") << "]"
                      << std::endl;
            last_status_ = status;
            last_recording_ = state.recording;
        }
    }

    void on_permission_warning(const std::string& message) override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cerr << "[PERMISSION] " << message << std::endl;
    }

    void on_connection_error(const rtv::Error& error) override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cerr << "[ERROR] " << error.message << " (" << rtv_error_category(error.code) << ")"
                  << std::endl;
    }

    void on_advisory(const rtv::Error& error) override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cerr << "[SERVICE] " << error.message;
        if (!error.upstream_code.empty()) {
            std::cerr << " [" << error.upstream_code << "]";
        }
        std::cerr << std::endl;
    }

private:
    std::string last_status_;
    bool last_recording_ = false;
};

void list_audio_devices() {
    std::cout << "Input devices (microphones):\n";
    for (const auto& dev : rtv::AudioCapture::list_devices()) {
        std::cout << "  " << dev << "\n";
    }

    std::cout << "\nOutput devices (speakers):\n";
    for (const auto& dev : rtv::AlsaAudioSink::list_devices()) {
        std::cout << "  " << dev << "\n";
    }
    std::cout << std::endl;
}

void print_status(const rtv::VoiceChatController& controller) {
    rtv::VoiceChatState state = controller.state();
    rtv::VoiceChatConfig config = controller.config();
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << "  Mode:       " << rtv::voice_mode_name(state.mode) << "\n"
              << "  Model:      " << config.model << "\n"
              << "  Voice:      " << rtv::voice_name(config.voice) << "\n"
              << "  Channel:    " << rtv::channel_state_name(controller.channel_state()) << "\n"
              << "  Recording:  " << (state.recording ? "yes" : "no") << "\n"
              << "  Microphone: " << rtv::permission_state_name(state.permission) << "\n"
              << "  Sessions:   " << controller.sessions_created() << std::endl;
    if (!state.transcript.empty()) {
        std::cout << "  Partial:    " << state.transcript << std::endl;
    }
}

void report_failure(const char* action, rtv_result_t rc) {
    if (RTV_SUCCEEDED(rc) || rc == RTV_ERROR_CANCELLED) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << action << " failed: " << rtv_error_message(rc) << std::endl;
}

// Returns false when the user asked to quit
bool handle_command(const std::string& line, rtv::VoiceChatController& controller) {
    std::istringstream in(line);
    std::string command, argument;
    in >> command;
    std::getline(in >> std::ws, argument);

    if (command == "/quit" || command == "/exit") {
        return false;
    } else if (command == "/connect") {
        report_failure("Connect", controller.connect());
    } else if (command == "/disconnect") {
        controller.disconnect();
    } else if (command == "/record") {
        report_failure("Record", controller.toggle_recording());
    } else if (command == "/mode") {
        rtv::VoiceMode mode;
        if (!rtv::parse_voice_mode(argument, mode)) {
            std::cerr << "Usage: /mode text|voice" << std::endl;
        } else {
            controller.set_mode(mode);
        }
    } else if (command == "/voice") {
        rtv::Voice voice;
        if (!rtv::parse_voice(argument, voice)) {
            std::cerr << "Unknown voice '" << argument << "'" << std::endl;
        } else {
            controller.set_voice(voice);
        }
    } else if (command == "/model") {
        if (argument.empty()) {
            std::cerr << "Usage: /model <id>" << std::endl;
        } else {
            controller.set_model(argument);
        }
    } else if (command == "/status") {
        print_status(controller);
    } else {
        std::cerr << "Unknown command " << command << std::endl;
    }
    return true;
}

}  // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    rtv::AppConfig app_config;
    std::string error;
    if (RTV_FAILED(rtv::load_app_config(argc, argv, nullptr, app_config, error))) {
        std::cerr << "Error: " << error << "\n\n";
        rtv::print_app_usage(argv[0]);
        return 1;
    }

    if (app_config.show_help) {
        rtv::print_app_usage(argv[0]);
        return 0;
    }

    if (app_config.list_devices) {
        list_audio_devices();
        return 0;
    }

    rtv_log_set_level(app_config.log_level);

    // Install signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "========================================\n"
              << "    rtv voice chat\n"
              << "========================================\n"
              << "  Mode:    " << rtv::voice_mode_name(app_config.mode) << "\n"
              << "  Model:   " << app_config.model << "\n"
              << "  Voice:   " << rtv::voice_name(app_config.voice) << "\n"
              << "  Session: " << app_config.session_url << "\n"
              << "  Input:   " << app_config.input_device << "\n"
              << "  Output:  " << app_config.output_device << "\n"
              << std::endl;

    if (app_config.api_key.empty()) {
        std::cerr << "WARNING: no API key set (RTV_API_KEY or --api-key); connecting will fail\n"
                  << std::endl;
    }

    // =============================================================================
    // Wire the controller
    // =============================================================================

    rtv::HttpNegotiatorConfig negotiator_config;
    negotiator_config.session_url = app_config.session_url;

    ConsoleMessageStore message_store;
    ConsoleListener listener;

    rtv::VoiceChatDependencies deps;
    deps.negotiator = std::make_shared<rtv::HttpSessionNegotiator>(negotiator_config);
    deps.channel_factory = rtv::websocket_channel_factory();
    deps.permission = std::make_shared<rtv::AlsaMicrophonePermission>(app_config.input_device);
    deps.message_store = &message_store;

    const std::string output_device = app_config.output_device;
    deps.playback_factory = [output_device]() {
        rtv::AlsaSinkConfig sink_config = rtv::AlsaSinkConfig::defaults();
        sink_config.device = output_device;
        return std::make_unique<rtv::PlaybackQueue>(
            std::make_unique<rtv::AlsaAudioSink>(sink_config));
    };

    const std::string input_device = app_config.input_device;
    deps.capture_factory = [input_device]() -> std::unique_ptr<rtv::CaptureSource> {
        rtv::AudioCaptureConfig capture_config = rtv::AudioCaptureConfig::defaults();
        capture_config.device = input_device;
        return std::make_unique<rtv::AudioCapture>(capture_config);
    };

    rtv::VoiceChatConfig chat_config;
    chat_config.api_key = app_config.api_key;
    chat_config.model = app_config.model;
    chat_config.voice = app_config.voice;
    chat_config.mode = app_config.mode;
    chat_config.instructions = app_config.instructions;
    chat_config.temperature = app_config.temperature;
    chat_config.realtime_url = app_config.realtime_url;

    rtv::VoiceChatController controller(chat_config, std::move(deps));
    controller.set_listener(&listener);

    std::cout << "Type a message and press Enter, or /connect, /record, /status, /quit.\n"
              << std::endl;

    // =============================================================================
    // Run Main Loop
    // =============================================================================

    while (g_running) {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            break;  // EOF
        }
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (!handle_command(line, controller)) {
                break;
            }
            continue;
        }

        rtv_result_t rc = controller.send_text_message(line, rtv::SendPolicy::AutoConnect);
        if (rc == RTV_ERROR_INVALID_STATE) {
            std::cerr << "Text messages are sent in text mode; use /mode text" << std::endl;
        } else {
            report_failure("Send", rc);
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    controller.set_listener(nullptr);
    controller.disconnect();

    return 0;
}
