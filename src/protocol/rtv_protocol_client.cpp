/**
 * @file rtv_protocol_client.cpp
 * @brief rtv - Realtime protocol client implementation
 */

#include "rtv/protocol/rtv_protocol_client.h"

#include "rtv/core/rtv_logger.h"

namespace rtv {

ProtocolClient::ProtocolClient(SessionConfig config, std::unique_ptr<RealtimeChannel> channel,
                               ProtocolObserver* observer, std::string realtime_url)
    : config_(std::move(config)),
      realtime_url_(std::move(realtime_url)),
      channel_(std::move(channel)),
      observer_(observer) {}

ProtocolClient::~ProtocolClient() {
    disconnect();
}

std::string ProtocolClient::build_channel_url(const std::string& realtime_url,
                                              const std::string& model) {
    char separator = realtime_url.find('?') == std::string::npos ? '?' : '&';
    return realtime_url + separator + "model=" + model;
}

rtv_result_t ProtocolClient::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::Idle) {
            RTV_LOG_WARNING("Protocol", "connect() on a client in state %s",
                            channel_state_name(state_));
            return RTV_ERROR_INVALID_STATE;
        }
        state_ = ChannelState::Connecting;
    }

    if (!channel_) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ChannelState::Closed;
        last_error_ = make_error(RTV_ERROR_CONNECTION_FAILED, "No channel");
        return RTV_ERROR_CONNECTION_FAILED;
    }

    channel_->set_message_handler([this](const std::string& message) { handle_message(message); });
    channel_->set_closed_handler([this](rtv_result_t reason, const std::string& detail) {
        handle_remote_close(reason, detail);
    });

    // Only the scoped credential is ever presented to the realtime service
    ChannelRequest request;
    request.url = build_channel_url(realtime_url_, config_.model);
    request.headers = {
        {"Authorization", "Bearer " + config_.credential},
        {"OpenAI-Beta", "realtime=v1"},
    };

    RTV_LOG_INFO("Protocol", "Connecting to realtime service (model=%s, voice=%s)",
                 config_.model.c_str(), voice_name(config_.voice));

    rtv_result_t rc = channel_->open(request);

    if (RTV_FAILED(rc)) {
        Error error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool cancelled = state_ != ChannelState::Connecting || rc == RTV_ERROR_CANCELLED;
            state_ = ChannelState::Closed;
            if (cancelled) {
                RTV_LOG_DEBUG("Protocol", "Connect cancelled");
                return RTV_ERROR_CANCELLED;
            }
            last_error_ = make_error(rc, std::string("Failed to open realtime channel: ") +
                                             rtv_error_message(rc));
            error = last_error_;
        }
        RTV_LOG_ERROR("Protocol", "%s", error.message.c_str());
        if (observer_) observer_->on_error(error);
        return rc;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::Connecting) {
            // Remote close right after the handshake already reported through on_closed()
            if (!channel_released_ && RTV_FAILED(last_error_.code)) {
                return last_error_.code;
            }
            RTV_LOG_DEBUG("Protocol", "Disconnected while opening");
            return RTV_ERROR_CANCELLED;
        }
        state_ = ChannelState::Open;
    }

    // Session configuration goes out before anything else
    rc = send(outbound::session_update(config_));
    if (RTV_FAILED(rc)) {
        RTV_LOG_WARNING("Protocol", "session.update not sent: %s", rtv_error_message(rc));
    }
    for (const auto& message : config_.seed_conversation) {
        rc = send(outbound::conversation_item(message));
        if (RTV_FAILED(rc)) {
            RTV_LOG_WARNING("Protocol", "Seed message not sent: %s", rtv_error_message(rc));
            break;
        }
    }

    RTV_LOG_INFO("Protocol", "Realtime session open");
    if (observer_) observer_->on_open();
    return RTV_SUCCESS;
}

rtv_result_t ProtocolClient::send(const std::string& event_json) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::Open) {
            stats_.dropped++;
            RTV_LOG_WARNING("Protocol", "Not connected, dropping outbound event (state %s)",
                            channel_state_name(state_));
            return RTV_ERROR_NOT_CONNECTED;
        }
    }

    rtv_result_t rc = channel_->send_text(event_json);
    std::lock_guard<std::mutex> lock(mutex_);
    if (RTV_FAILED(rc)) {
        stats_.dropped++;
        RTV_LOG_WARNING("Protocol", "Send failed: %s", rtv_error_message(rc));
        return rc;
    }
    stats_.sent++;
    return RTV_SUCCESS;
}

void ProtocolClient::disconnect() {
    bool was_active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Idle) {
            state_ = ChannelState::Closed;
            return;
        }
        if (state_ == ChannelState::Closing || channel_released_) {
            return;
        }
        // A remote close leaves the state Closed with the transport still held
        was_active = state_ != ChannelState::Closed;
        state_ = ChannelState::Closing;
        channel_released_ = true;
    }

    // Aborts a pending open and joins the receive thread
    if (channel_) {
        channel_->close();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ChannelState::Closed;
    if (was_active) {
        RTV_LOG_INFO("Protocol", "Disconnected");
    }
}

ChannelState ProtocolClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ProtocolStats ProtocolClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

Error ProtocolClient::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

// =============================================================================
// Inbound dispatch (receive thread)
// =============================================================================

void ProtocolClient::handle_message(const std::string& message) {
    InboundEvent event;
    rtv_result_t rc = parse_inbound_event(message, event);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.received++;
        if (RTV_FAILED(rc)) {
            stats_.malformed++;
        } else if (event.type == InboundEventType::Unknown) {
            stats_.unknown++;
        }
    }

    if (RTV_FAILED(rc)) {
        RTV_LOG_WARNING("Protocol", "Skipping malformed message (%zu bytes)", message.size());
        return;
    }
    if (!observer_) {
        return;
    }

    switch (event.type) {
        case InboundEventType::AudioDelta:
            if (!event.delta.empty()) {
                observer_->on_audio_delta(event.delta);
            }
            break;

        case InboundEventType::TranscriptDelta:
            if (!event.delta.empty()) {
                observer_->on_transcript(event.delta, false);
            }
            break;

        case InboundEventType::TranscriptDone:
            observer_->on_transcript(event.transcript, true);
            break;

        case InboundEventType::Error: {
            Error error = make_error(RTV_ERROR_UPSTREAM_ADVISORY, event.error.message);
            error.type = event.error.type;
            error.upstream_code = event.error.code;
            error.param = event.error.param;
            RTV_LOG_WARNING("Protocol", "Upstream error [%s/%s]: %s", error.type.c_str(),
                            error.upstream_code.c_str(), error.message.c_str());
            observer_->on_error(error);
            break;
        }

        case InboundEventType::Unknown:
            RTV_LOG_DEBUG("Protocol", "Ignoring unknown event type '%s'", event.tag.c_str());
            break;

        default:
            RTV_LOG_TRACE("Protocol", "Event: %s", event.tag.c_str());
            observer_->on_event(event);
            break;
    }
}

void ProtocolClient::handle_remote_close(rtv_result_t reason, const std::string& detail) {
    Error error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::Open && state_ != ChannelState::Connecting) {
            return;
        }
        state_ = ChannelState::Closing;
        last_error_ = make_error(reason, detail);
        error = last_error_;
        state_ = ChannelState::Closed;
    }

    RTV_LOG_WARNING("Protocol", "Channel closed: %s", detail.c_str());
    if (observer_) observer_->on_closed(error);
}

}  // namespace rtv
