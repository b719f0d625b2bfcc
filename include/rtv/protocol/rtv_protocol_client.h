/**
 * @file rtv_protocol_client.h
 * @brief rtv - Realtime protocol client
 *
 * Owns exactly one channel for its whole life and translates between wire
 * events and the ProtocolObserver interface. A client is single-use:
 * idle -> connecting -> open -> closing -> closed. Reconnecting means
 * building a new client.
 */

#ifndef RTV_PROTOCOL_CLIENT_H
#define RTV_PROTOCOL_CLIENT_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"
#include "rtv/net/rtv_realtime_channel.h"
#include "rtv/protocol/rtv_realtime_events.h"

namespace rtv {

constexpr const char* kDefaultRealtimeUrl = "wss://api.openai.com/v1/realtime";

/**
 * @brief Typed inbound dispatch, one method per event category
 *
 * Methods run on the channel's receive thread, in arrival order. They must
 * not call ProtocolClient::disconnect().
 */
class ProtocolObserver {
public:
    virtual ~ProtocolObserver() = default;

    // Channel open and session.update sent
    virtual void on_open() {}

    // Remote close or transport failure; not called for disconnect()
    virtual void on_closed(const Error& /*reason*/) {}

    // response.audio.delta payload (base64 PCM16)
    virtual void on_audio_delta(const std::string& /*base64_audio*/) {}

    // response.audio_transcript.delta / .done
    virtual void on_transcript(const std::string& /*text*/, bool /*is_final*/) {}

    // Upstream `error` events (advisory) and failures to open
    virtual void on_error(const Error& /*error*/) {}

    // Every other recognized event, for diagnostics and UI cues
    virtual void on_event(const InboundEvent& /*event*/) {}
};

struct ProtocolStats {
    uint64_t received = 0;
    uint64_t malformed = 0;
    uint64_t unknown = 0;
    uint64_t sent = 0;
    uint64_t dropped = 0;  // send() while not open
};

class ProtocolClient {
public:
    /**
     * @param config   immutable session configuration (scoped credential)
     * @param channel  transport, owned by the client
     * @param observer receives inbound events; must outlive the client
     */
    ProtocolClient(SessionConfig config, std::unique_ptr<RealtimeChannel> channel,
                   ProtocolObserver* observer, std::string realtime_url = kDefaultRealtimeUrl);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /**
     * @brief Open the channel and send the session configuration
     *
     * Blocks until the channel is open or has failed. A failed open ends in
     * Closed with the error also reported through on_error().
     *
     * @return RTV_SUCCESS, a Connection code, RTV_ERROR_CANCELLED if
     *         disconnect() ran meanwhile, or RTV_ERROR_INVALID_STATE if this
     *         client was already used
     */
    rtv_result_t connect();

    /**
     * @brief Send one serialized outbound event
     *
     * Not queued: returns RTV_ERROR_NOT_CONNECTED with a warning unless open.
     */
    rtv_result_t send(const std::string& event_json);

    // Idempotent; ends in Closed from any state
    void disconnect();

    ChannelState state() const;
    bool is_open() const { return state() == ChannelState::Open; }

    const SessionConfig& config() const { return config_; }
    ProtocolStats stats() const;
    Error last_error() const;

    // <realtime_url>?model=<model>
    static std::string build_channel_url(const std::string& realtime_url,
                                         const std::string& model);

private:
    void handle_message(const std::string& message);
    void handle_remote_close(rtv_result_t reason, const std::string& detail);

    const SessionConfig config_;
    const std::string realtime_url_;
    std::unique_ptr<RealtimeChannel> channel_;
    ProtocolObserver* observer_;

    mutable std::mutex mutex_;
    ChannelState state_ = ChannelState::Idle;
    bool channel_released_ = false;
    ProtocolStats stats_;
    Error last_error_;
};

}  // namespace rtv

#endif  // RTV_PROTOCOL_CLIENT_H
