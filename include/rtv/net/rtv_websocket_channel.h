/**
 * @file rtv_websocket_channel.h
 * @brief rtv - RFC 6455 client channel over POSIX sockets and OpenSSL
 */

#ifndef RTV_WEBSOCKET_CHANNEL_H
#define RTV_WEBSOCKET_CHANNEL_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "rtv/net/rtv_realtime_channel.h"

namespace rtv {

class WebSocketChannel : public RealtimeChannel {
public:
    WebSocketChannel();
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void set_message_handler(MessageHandler handler) override;
    void set_closed_handler(ClosedHandler handler) override;

    rtv_result_t open(const ChannelRequest& request) override;
    rtv_result_t send_text(const std::string& payload) override;
    void close() override;
    bool is_open() const override;

    std::string last_error() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    MessageHandler on_message_;
    ClosedHandler on_closed_;

    std::atomic<bool> open_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> closing_{false};
    std::thread recv_thread_;

    mutable std::mutex error_mutex_;
    std::string last_error_;

    void set_error(const std::string& message);
    rtv_result_t connect_socket(const std::string& host, int port, int timeout_ms);
    rtv_result_t tls_handshake(const std::string& host, int timeout_ms);
    rtv_result_t ws_handshake(const std::string& host, int port, bool secure,
                              const ChannelRequest& request);
    rtv_result_t send_frame(uint8_t opcode, const std::string& payload);
    void run_receive_loop();
    void finish_remote(rtv_result_t reason, const std::string& detail);
};

/**
 * @brief Factory producing WebSocketChannel instances
 */
ChannelFactory websocket_channel_factory();

}  // namespace rtv

#endif  // RTV_WEBSOCKET_CHANNEL_H
