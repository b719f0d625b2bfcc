/**
 * @file rtv_realtime_channel.h
 * @brief rtv - Bidirectional message channel to the realtime service
 *
 * The protocol client only sees whole text messages. Framing, TLS and the
 * receive thread live behind this interface so tests can substitute an
 * in-memory channel.
 */

#ifndef RTV_REALTIME_CHANNEL_H
#define RTV_REALTIME_CHANNEL_H

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rtv/core/rtv_error.h"

namespace rtv {

struct ChannelRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    int timeout_ms = 10000;
};

class RealtimeChannel {
public:
    // Invoked on the channel's receive thread, in arrival order
    using MessageHandler = std::function<void(const std::string& message)>;

    // Invoked once when the remote side closes or the transport fails.
    // Not invoked for a local close().
    using ClosedHandler = std::function<void(rtv_result_t reason, const std::string& detail)>;

    virtual ~RealtimeChannel() = default;

    // Handlers must be set before open()
    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void set_closed_handler(ClosedHandler handler) = 0;

    /**
     * @brief Open the channel; blocks until the handshake completes or fails
     *
     * A concurrent close() aborts a pending open, which then returns
     * RTV_ERROR_CANCELLED.
     */
    virtual rtv_result_t open(const ChannelRequest& request) = 0;

    virtual rtv_result_t send_text(const std::string& payload) = 0;

    /**
     * @brief Close locally and stop the receive thread; idempotent
     *
     * Must not be called from the channel's own handlers.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using ChannelFactory = std::function<std::unique_ptr<RealtimeChannel>()>;

}  // namespace rtv

#endif  // RTV_REALTIME_CHANNEL_H
