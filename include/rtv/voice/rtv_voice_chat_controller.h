/**
 * @file rtv_voice_chat_controller.h
 * @brief rtv - Voice chat orchestration
 *
 * The only component the application talks to. Owns the connect/disconnect
 * lifecycle, the microphone permission check, one ProtocolClient and one
 * PlaybackQueue at a time, and forwards finished transcripts to the
 * application's message store.
 *
 * Threading: public methods may be called from any application thread.
 * Listener and message store callbacks arrive on application, receive or
 * capture threads and must not call back into connect(), disconnect() or
 * reconfigure().
 */

#ifndef RTV_VOICE_CHAT_CONTROLLER_H
#define RTV_VOICE_CHAT_CONTROLLER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rtv/audio/rtv_audio_capture.h"
#include "rtv/audio/rtv_audio_codec.h"
#include "rtv/audio/rtv_microphone.h"
#include "rtv/audio/rtv_playback_queue.h"
#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"
#include "rtv/net/rtv_realtime_channel.h"
#include "rtv/net/rtv_session_negotiator.h"
#include "rtv/protocol/rtv_protocol_client.h"

namespace rtv {

// =============================================================================
// Collaborators
// =============================================================================

/**
 * @brief Chat history owned by the application
 */
class MessageStore {
public:
    virtual ~MessageStore() = default;
    virtual void append_message(const std::string& text, bool is_user) = 0;
};

struct VoiceChatState {
    bool connected = false;
    bool connecting = false;
    bool recording = false;
    PermissionState permission = PermissionState::Unknown;
    std::string transcript;
    VoiceMode mode = VoiceMode::TextToVoice;
};

class VoiceChatListener {
public:
    virtual ~VoiceChatListener() = default;

    virtual void on_state_changed(const VoiceChatState& /*state*/) {}

    // Persistent: stays relevant until the state reports permission Granted
    virtual void on_permission_warning(const std::string& /*message*/) {}

    // One-shot: a connect attempt failed or the channel dropped
    virtual void on_connection_error(const Error& /*error*/) {}

    // Dismissible: upstream advisory, the session stays up
    virtual void on_advisory(const Error& /*error*/) {}
};

struct VoiceChatConfig {
    std::string api_key;
    std::string model = kDefaultRealtimeModel;
    Voice voice = Voice::Alloy;
    VoiceMode mode = VoiceMode::TextToVoice;
    std::string instructions = kDefaultInstructions;
    float temperature = kDefaultTemperature;
    std::string realtime_url = kDefaultRealtimeUrl;
    std::vector<ConversationMessage> seed_conversation;
};

using PlaybackFactory = std::function<std::unique_ptr<PlaybackQueue>()>;
using CaptureFactory = std::function<std::unique_ptr<CaptureSource>()>;

struct VoiceChatDependencies {
    std::shared_ptr<SessionNegotiator> negotiator;
    ChannelFactory channel_factory;
    std::shared_ptr<MicrophonePermission> permission;  // null: always granted
    MessageStore* message_store = nullptr;             // not owned
    PlaybackFactory playback_factory;                  // invoked lazily
    CaptureFactory capture_factory;                    // invoked lazily
};

enum class SendPolicy {
    NoAutoConnect,  // report RTV_ERROR_NOT_CONNECTED when there is no session
    AutoConnect,    // connect first, then send
};

// =============================================================================
// VoiceChatController
// =============================================================================

class VoiceChatController {
public:
    VoiceChatController(VoiceChatConfig config, VoiceChatDependencies deps);
    ~VoiceChatController();

    VoiceChatController(const VoiceChatController&) = delete;
    VoiceChatController& operator=(const VoiceChatController&) = delete;

    // Listener must outlive the controller or be reset to nullptr first
    void set_listener(VoiceChatListener* listener);

    /**
     * @brief Open a realtime session
     *
     * Voice-to-voice: permission check, negotiation, channel open, then
     * capture starts. Text-to-voice skips the microphone entirely. Any
     * failure leaves everything torn down.
     *
     * @return RTV_SUCCESS (also when already connected),
     *         RTV_ERROR_CONNECT_IN_PROGRESS, RTV_ERROR_CANCELLED if
     *         disconnect() interrupted it, or the failing step's code
     */
    rtv_result_t connect();

    // Idempotent; safe from any state, releases the microphone before returning
    void disconnect();

    /**
     * @brief Voice-to-voice only: connect if needed, otherwise start/stop capture
     */
    rtv_result_t toggle_recording();

    /**
     * @brief Text-to-voice: send one user turn
     *
     * The user turn reaches the message store before anything else and
     * playback of the previous reply stops. Then, if connected,
     * conversation.item.create and response.create go out in that order.
     */
    rtv_result_t send_text_message(const std::string& text,
                                   SendPolicy policy = SendPolicy::NoAutoConnect);

    /**
     * @brief Replace the configuration
     *
     * Always tears down: disconnect, release the playback and capture
     * devices. Everything is rebuilt lazily on the next connect().
     */
    void reconfigure(const VoiceChatConfig& config);

    void set_mode(VoiceMode mode);
    void set_model(const std::string& model);
    void set_voice(Voice voice);

    VoiceChatState state() const;
    VoiceChatConfig config() const;
    Error last_error() const;

    // State of the current (or most recent) channel; Idle before any connect
    ChannelState channel_state() const;

    // Number of protocol clients created so far
    uint64_t sessions_created() const;

private:
    class ClientObserver;
    struct Session {
        std::shared_ptr<ClientObserver> observer;
        std::shared_ptr<ProtocolClient> client;
        uint64_t generation = 0;
    };

    // Protocol callbacks, tagged with the generation of the issuing client
    void handle_closed(uint64_t generation, const Error& reason);
    void handle_audio_delta(uint64_t generation, const std::string& base64_audio);
    void handle_transcript(uint64_t generation, const std::string& text, bool is_final);
    void handle_error(uint64_t generation, const Error& error);
    void handle_event(uint64_t generation, const InboundEvent& event);

    void handle_captured(const float* samples, size_t num_samples);

    rtv_result_t resolve_permission();
    rtv_result_t start_capture(uint64_t generation);
    rtv_result_t fail_connect(uint64_t generation, rtv_result_t code, const std::string& message);
    void release_stale_session();
    void stop_audio();
    void release_audio();
    void notify_state();

    std::shared_ptr<ProtocolClient> open_client() const;

    VoiceChatDependencies deps_;

    // Lock order: audio_mutex_ before mutex_. Neither is held while a
    // ProtocolClient connects or disconnects.
    mutable std::mutex mutex_;
    VoiceChatConfig config_;
    VoiceChatListener* listener_ = nullptr;
    std::unique_ptr<Session> session_;
    std::unique_ptr<Session> stale_session_;  // remote-closed, released on an app thread
    uint64_t generation_ = 0;
    uint64_t sessions_created_ = 0;
    ChannelState last_channel_state_ = ChannelState::Idle;
    bool connected_ = false;
    bool connecting_ = false;
    bool recording_ = false;
    bool lost_while_connecting_ = false;
    Error lost_reason_;
    PermissionState permission_ = PermissionState::Unknown;
    std::string transcript_;
    Error last_error_;

    std::mutex audio_mutex_;
    std::unique_ptr<PlaybackQueue> playback_;
    std::unique_ptr<CaptureSource> capture_;
    AudioDecoder decoder_;

    // Capture thread only
    AudioEncoder encoder_;
};

}  // namespace rtv

#endif  // RTV_VOICE_CHAT_CONTROLLER_H
