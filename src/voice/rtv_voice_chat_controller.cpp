/**
 * @file rtv_voice_chat_controller.cpp
 * @brief rtv - Voice chat orchestration
 */

#include "rtv/voice/rtv_voice_chat_controller.h"

#include "rtv/core/rtv_logger.h"
#include "rtv/protocol/rtv_realtime_events.h"

namespace rtv {

// =============================================================================
// ClientObserver - tags protocol callbacks with the client's generation
// =============================================================================

class VoiceChatController::ClientObserver : public ProtocolObserver {
public:
    ClientObserver(VoiceChatController* owner, uint64_t generation)
        : owner_(owner), generation_(generation) {}

    void on_closed(const Error& reason) override { owner_->handle_closed(generation_, reason); }

    void on_audio_delta(const std::string& base64_audio) override {
        owner_->handle_audio_delta(generation_, base64_audio);
    }

    void on_transcript(const std::string& text, bool is_final) override {
        owner_->handle_transcript(generation_, text, is_final);
    }

    void on_error(const Error& error) override { owner_->handle_error(generation_, error); }

    void on_event(const InboundEvent& event) override { owner_->handle_event(generation_, event); }

private:
    VoiceChatController* owner_;
    uint64_t generation_;
};

// =============================================================================
// Lifecycle
// =============================================================================

VoiceChatController::VoiceChatController(VoiceChatConfig config, VoiceChatDependencies deps)
    : deps_(std::move(deps)), config_(std::move(config)) {}

VoiceChatController::~VoiceChatController() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = nullptr;
    }
    disconnect();
    release_audio();
}

void VoiceChatController::set_listener(VoiceChatListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

rtv_result_t VoiceChatController::connect() {
    VoiceChatConfig cfg;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_) {
            RTV_LOG_WARNING("VoiceChat", "connect() ignored: already connecting");
            return RTV_ERROR_CONNECT_IN_PROGRESS;
        }
        if (connected_ && session_ && session_->client->is_open()) {
            RTV_LOG_WARNING("VoiceChat", "connect() ignored: already connected");
            return RTV_SUCCESS;
        }
        connecting_ = true;
        lost_while_connecting_ = false;
        generation = ++generation_;
        cfg = config_;
    }
    notify_state();

    release_stale_session();

    RTV_LOG_INFO("VoiceChat", "Connecting (mode=%s, model=%s)", voice_mode_name(cfg.mode),
                 cfg.model.c_str());

    if (cfg.mode == VoiceMode::VoiceToVoice) {
        rtv_result_t rc = resolve_permission();
        if (RTV_FAILED(rc)) {
            return fail_connect(generation, rc, "Microphone permission denied");
        }
    }

    if (!deps_.negotiator || !deps_.channel_factory) {
        return fail_connect(generation, RTV_ERROR_INVALID_STATE, "Controller is not wired");
    }

    NegotiationRequest request;
    request.api_key = cfg.api_key;
    request.model = cfg.model;
    request.voice = cfg.voice;

    ScopedCredential credential;
    rtv_result_t rc = deps_.negotiator->negotiate(request, credential);
    if (RTV_FAILED(rc)) {
        return fail_connect(generation, rc, deps_.negotiator->last_error());
    }

    SessionConfig session_config;
    session_config.credential = credential.value;
    session_config.model = cfg.model;
    session_config.voice = cfg.voice;
    session_config.instructions = cfg.instructions;
    session_config.temperature = cfg.temperature;
    session_config.seed_conversation = cfg.seed_conversation;

    auto session = std::make_unique<Session>();
    session->generation = generation;
    session->observer = std::make_shared<ClientObserver>(this, generation);
    session->client = std::make_shared<ProtocolClient>(
        std::move(session_config), deps_.channel_factory(), session->observer.get(),
        cfg.realtime_url);
    std::shared_ptr<ProtocolClient> client = session->client;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            RTV_LOG_DEBUG("VoiceChat", "Connect cancelled before the channel opened");
            return RTV_ERROR_CANCELLED;
        }
        session_ = std::move(session);
        sessions_created_++;
        transcript_.clear();
    }

    {
        std::lock_guard<std::mutex> audio_lock(audio_mutex_);
        if (!playback_ && deps_.playback_factory) {
            playback_ = deps_.playback_factory();
        }
        if (playback_) {
            playback_->begin_session();
        }
        decoder_.reset();
    }

    rc = client->connect();
    if (rc == RTV_ERROR_CANCELLED) {
        return rc;
    }
    if (RTV_FAILED(rc)) {
        Error error = client->last_error();
        return fail_connect(generation, rc, error.message);
    }

    Error lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return RTV_ERROR_CANCELLED;
        }
        // A close that raced the handshake was held back for this check
        if (lost_while_connecting_ || !client->is_open()) {
            lost = lost_while_connecting_ ? lost_reason_ : Error();
            if (!RTV_FAILED(lost.code)) {
                lost = make_error(RTV_ERROR_CONNECTION_CLOSED, "Channel closed while opening");
            }
        } else {
            connecting_ = false;
            connected_ = true;
            last_channel_state_ = ChannelState::Open;
        }
    }
    if (RTV_FAILED(lost.code)) {
        return fail_connect(generation, lost.code, lost.message);
    }

    if (cfg.mode == VoiceMode::VoiceToVoice) {
        rc = start_capture(generation);
        if (rc == RTV_ERROR_CANCELLED) {
            return rc;
        }
        if (RTV_FAILED(rc)) {
            return fail_connect(generation, rc, "Cannot start microphone capture");
        }
    }

    RTV_LOG_INFO("VoiceChat", "Connected");
    notify_state();
    return RTV_SUCCESS;
}

rtv_result_t VoiceChatController::fail_connect(uint64_t generation, rtv_result_t code,
                                               const std::string& message) {
    Error error = make_error(code, message);
    std::unique_ptr<Session> session;
    VoiceChatListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            // disconnect() already tore everything down
            return RTV_ERROR_CANCELLED;
        }
        ++generation_;
        session = std::move(session_);
        connecting_ = false;
        connected_ = false;
        recording_ = false;
        transcript_.clear();
        last_error_ = error;
        if (session) {
            last_channel_state_ = ChannelState::Closed;
        }
        listener = listener_;
    }

    if (session) {
        session->client->disconnect();
    }
    stop_audio();

    RTV_LOG_ERROR("VoiceChat", "Connect failed: %s (%s)", error.message.c_str(),
                  rtv_error_category(code));

    if (listener) {
        if (rtv_error_kind(code) == ErrorKind::Permission) {
            listener->on_permission_warning(
                "Microphone access is required for voice-to-voice mode");
        } else {
            listener->on_connection_error(error);
        }
    }
    notify_state();
    return code;
}

void VoiceChatController::disconnect() {
    std::unique_ptr<Session> session;
    bool was_active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        session = std::move(session_);
        was_active = connected_ || connecting_ || recording_;
        connecting_ = false;
        connected_ = false;
        recording_ = false;
        transcript_.clear();
        last_channel_state_ = ChannelState::Closed;
    }

    // Joins the receive thread, so no lock may be held here
    if (session) {
        session->client->disconnect();
    }
    release_stale_session();
    stop_audio();

    if (was_active) {
        RTV_LOG_INFO("VoiceChat", "Disconnected");
        notify_state();
    }
}

void VoiceChatController::release_stale_session() {
    std::unique_ptr<Session> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = std::move(stale_session_);
    }
    if (stale) {
        stale->client->disconnect();
    }
}

void VoiceChatController::stop_audio() {
    std::lock_guard<std::mutex> audio_lock(audio_mutex_);
    if (playback_) {
        playback_->stop();
    }
    if (capture_) {
        capture_->stop();
    }
}

void VoiceChatController::release_audio() {
    std::lock_guard<std::mutex> audio_lock(audio_mutex_);
    if (capture_) {
        capture_->stop();
        capture_.reset();
    }
    if (playback_) {
        playback_->release();
        playback_.reset();
    }
    decoder_.reset();
}

void VoiceChatController::reconfigure(const VoiceChatConfig& config) {
    disconnect();
    release_audio();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }
    RTV_LOG_INFO("VoiceChat", "Reconfigured (mode=%s, model=%s, voice=%s)",
                 voice_mode_name(config.mode), config.model.c_str(), voice_name(config.voice));
    notify_state();
}

void VoiceChatController::set_mode(VoiceMode mode) {
    VoiceChatConfig cfg = config();
    if (cfg.mode == mode) return;
    cfg.mode = mode;
    reconfigure(cfg);
}

void VoiceChatController::set_model(const std::string& model) {
    VoiceChatConfig cfg = config();
    if (cfg.model == model) return;
    cfg.model = model;
    reconfigure(cfg);
}

void VoiceChatController::set_voice(Voice voice) {
    VoiceChatConfig cfg = config();
    if (cfg.voice == voice) return;
    cfg.voice = voice;
    reconfigure(cfg);
}

// =============================================================================
// Microphone
// =============================================================================

rtv_result_t VoiceChatController::resolve_permission() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (permission_ == PermissionState::Granted) {
            return RTV_SUCCESS;
        }
    }

    // Unknown or previously denied: ask again
    PermissionState result =
        deps_.permission ? deps_.permission->request() : PermissionState::Granted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        permission_ = result;
    }
    notify_state();

    return result == PermissionState::Granted ? RTV_SUCCESS : RTV_ERROR_PERMISSION_DENIED;
}

rtv_result_t VoiceChatController::start_capture(uint64_t generation) {
    std::lock_guard<std::mutex> audio_lock(audio_mutex_);
    if (!capture_ && deps_.capture_factory) {
        capture_ = deps_.capture_factory();
    }
    if (!capture_) {
        return RTV_ERROR_AUDIO_DEVICE;
    }

    capture_->set_callback(
        [this](const float* samples, size_t num_samples) { handle_captured(samples, num_samples); });
    rtv_result_t rc = capture_->start();
    if (RTV_FAILED(rc)) {
        return rc;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || !connected_) {
        // The session ended while the device was opening
        capture_->stop();
        return RTV_ERROR_CANCELLED;
    }
    recording_ = true;
    return RTV_SUCCESS;
}

rtv_result_t VoiceChatController::toggle_recording() {
    bool connected;
    bool recording;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.mode != VoiceMode::VoiceToVoice) {
            RTV_LOG_WARNING("VoiceChat", "Recording is only available in voice-to-voice mode");
            return RTV_ERROR_INVALID_STATE;
        }
        connected = connected_;
        recording = recording_;
        generation = generation_;
    }

    if (!connected) {
        return connect();
    }

    rtv_result_t rc = RTV_SUCCESS;
    if (recording) {
        {
            std::lock_guard<std::mutex> audio_lock(audio_mutex_);
            if (capture_) {
                capture_->stop();
            }
            std::lock_guard<std::mutex> lock(mutex_);
            recording_ = false;
        }
        RTV_LOG_INFO("VoiceChat", "Recording paused");
    } else {
        rc = start_capture(generation);
        if (RTV_FAILED(rc)) {
            RTV_LOG_ERROR("VoiceChat", "Cannot start capture: %s", rtv_error_message(rc));
        } else {
            RTV_LOG_INFO("VoiceChat", "Recording");
        }
    }
    notify_state();
    return rc;
}

// Capture thread: never blocks on the controller beyond a short state check
void VoiceChatController::handle_captured(const float* samples, size_t num_samples) {
    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!recording_ || !connected_ || !session_) {
            return;
        }
        client = session_->client;
    }
    if (!client->is_open()) {
        return;
    }

    std::vector<std::string> chunks;
    encoder_.encode(samples, num_samples, chunks);
    for (const auto& chunk : chunks) {
        if (RTV_FAILED(client->send(outbound::audio_append(chunk)))) {
            break;
        }
    }
}

// =============================================================================
// Text turns
// =============================================================================

std::shared_ptr<ProtocolClient> VoiceChatController::open_client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || !session_ || !session_->client->is_open()) {
        return nullptr;
    }
    return session_->client;
}

rtv_result_t VoiceChatController::send_text_message(const std::string& text, SendPolicy policy) {
    if (text.empty()) {
        return RTV_ERROR_INVALID_ARGUMENT;
    }
    if (config().mode != VoiceMode::TextToVoice) {
        RTV_LOG_WARNING("VoiceChat", "Text turns are only sent in text-to-voice mode");
        return RTV_ERROR_INVALID_STATE;
    }

    if (deps_.message_store) {
        deps_.message_store->append_message(text, true);
    }

    // A new user turn silences whatever is left of the previous reply
    {
        std::lock_guard<std::mutex> audio_lock(audio_mutex_);
        if (playback_) {
            playback_->stop();
        }
    }

    std::shared_ptr<ProtocolClient> client = open_client();
    if (!client) {
        if (policy == SendPolicy::NoAutoConnect) {
            RTV_LOG_WARNING("VoiceChat", "Cannot send message: not connected");
            return RTV_ERROR_NOT_CONNECTED;
        }
        rtv_result_t rc = connect();
        if (RTV_FAILED(rc)) {
            return rc;
        }
        client = open_client();
        if (!client) {
            return RTV_ERROR_NOT_CONNECTED;
        }
    }

    rtv_result_t rc = client->send(outbound::user_text_item(text));
    if (RTV_FAILED(rc)) {
        return rc;
    }
    return client->send(outbound::response_create());
}

// =============================================================================
// Protocol callbacks (receive thread)
// =============================================================================

void VoiceChatController::handle_closed(uint64_t generation, const Error& reason) {
    VoiceChatListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !session_) {
            return;
        }
        if (connecting_) {
            // connect() reports failures of a channel that is still opening
            lost_while_connecting_ = true;
            lost_reason_ = reason;
            return;
        }
        stale_session_ = std::move(session_);
        connected_ = false;
        recording_ = false;
        transcript_.clear();
        last_error_ = reason;
        last_channel_state_ = ChannelState::Closed;
        listener = listener_;
    }

    RTV_LOG_WARNING("VoiceChat", "Connection lost: %s", reason.message.c_str());
    stop_audio();

    if (listener) {
        listener->on_connection_error(reason);
    }
    notify_state();
}

void VoiceChatController::handle_audio_delta(uint64_t generation,
                                             const std::string& base64_audio) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
    }

    std::lock_guard<std::mutex> audio_lock(audio_mutex_);
    if (!playback_) {
        return;
    }

    AudioUnit unit;
    rtv_result_t rc = decoder_.decode(base64_audio, unit);
    if (RTV_FAILED(rc)) {
        RTV_LOG_WARNING("VoiceChat", "Skipping undecodable audio delta (%zu bytes)",
                        base64_audio.size());
        return;
    }

    rc = playback_->enqueue(std::move(unit));
    if (RTV_FAILED(rc)) {
        RTV_LOG_WARNING("VoiceChat", "Audio unit dropped: %s", rtv_error_message(rc));
    }
}

void VoiceChatController::handle_transcript(uint64_t generation, const std::string& text,
                                            bool is_final) {
    std::string completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        if (!is_final) {
            transcript_ += text;
        } else {
            completed = text.empty() ? transcript_ : text;
            transcript_.clear();
        }
    }

    if (is_final && !completed.empty() && deps_.message_store) {
        deps_.message_store->append_message(completed, false);
    }
    notify_state();
}

void VoiceChatController::handle_error(uint64_t generation, const Error& error) {
    VoiceChatListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        if (rtv_error_kind(error.code) != ErrorKind::UpstreamAdvisory) {
            // Open failures surface through connect()
            return;
        }
        last_error_ = error;
        listener = listener_;
    }
    if (listener) {
        listener->on_advisory(error);
    }
}

void VoiceChatController::handle_event(uint64_t generation, const InboundEvent& event) {
    switch (event.type) {
        case InboundEventType::ResponseCreated: {
            // New assistant turn; an unfinished transcript from the last one is dropped
            bool had_partial;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_) return;
                had_partial = !transcript_.empty();
                transcript_.clear();
            }
            if (had_partial) {
                RTV_LOG_DEBUG("VoiceChat", "Discarding unfinished transcript");
                notify_state();
            }
            break;
        }

        case InboundEventType::SpeechStarted: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_) return;
            }
            // Barge-in: the user started talking over the reply
            std::lock_guard<std::mutex> audio_lock(audio_mutex_);
            if (playback_) {
                playback_->stop();
            }
            break;
        }

        case InboundEventType::SessionCreated:
        case InboundEventType::SessionUpdated:
            RTV_LOG_DEBUG("VoiceChat", "Session event: %s", event.tag.c_str());
            break;

        default:
            break;
    }
}

// =============================================================================
// State
// =============================================================================

void VoiceChatController::notify_state() {
    VoiceChatListener* listener;
    VoiceChatState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
        snapshot.connected = connected_;
        snapshot.connecting = connecting_;
        snapshot.recording = recording_;
        snapshot.permission = permission_;
        snapshot.transcript = transcript_;
        snapshot.mode = config_.mode;
    }
    if (listener) {
        listener->on_state_changed(snapshot);
    }
}

VoiceChatState VoiceChatController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    VoiceChatState snapshot;
    snapshot.connected = connected_;
    snapshot.connecting = connecting_;
    snapshot.recording = recording_;
    snapshot.permission = permission_;
    snapshot.transcript = transcript_;
    snapshot.mode = config_.mode;
    return snapshot;
}

VoiceChatConfig VoiceChatController::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

Error VoiceChatController::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

ChannelState VoiceChatController::channel_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_) {
        return session_->client->state();
    }
    return last_channel_state_;
}

uint64_t VoiceChatController::sessions_created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_created_;
}

}  // namespace rtv
