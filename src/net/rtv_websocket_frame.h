/**
 * @file rtv_websocket_frame.h
 * @brief rtv - RFC 6455 framing helpers (internal)
 *
 * Pure functions for the realtime channel: URL parsing, opening handshake
 * keys and frame encoding, plus an incremental parser that reassembles
 * fragmented messages.
 */

#ifndef RTV_WEBSOCKET_FRAME_H
#define RTV_WEBSOCKET_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rtv/core/rtv_error.h"

namespace rtv {
namespace ws {

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

// Close status codes used by the client
constexpr uint16_t kCloseNormal = 1000;
constexpr uint16_t kCloseProtocolError = 1002;
constexpr uint16_t kCloseTooBig = 1009;

// Audio deltas are base64 text; a few seconds of 24 kHz PCM16 stays well below this
constexpr size_t kMaxMessageBytes = 16 * 1024 * 1024;

struct WsUrl {
    bool secure = false;
    std::string host;
    int port = 0;
    std::string path;  // includes the query string
};

/**
 * @brief Parse ws://, wss://, http:// or https:// URLs
 *
 * Default ports are 80 and 443. An empty path becomes "/".
 */
bool parse_ws_url(const std::string& url, WsUrl& out);

// Random 16-byte nonce, base64 encoded, for Sec-WebSocket-Key
std::string make_client_key();

// Expected Sec-WebSocket-Accept for a given Sec-WebSocket-Key
std::string compute_accept_key(const std::string& client_key);

/**
 * @brief Encode one unfragmented frame
 *
 * @param mask_key 4-byte masking key, or nullptr for an unmasked frame.
 *                 Client-to-server frames must be masked.
 */
std::vector<uint8_t> encode_frame(uint8_t opcode, const std::string& payload,
                                  const uint8_t* mask_key);

// Masked frame with a fresh random key
std::vector<uint8_t> encode_client_frame(uint8_t opcode, const std::string& payload);

// Close frame payload: 2-byte status code then optional reason
std::string make_close_payload(uint16_t code, const std::string& reason = "");

struct WsFrame {
    uint8_t opcode = 0;
    std::string payload;
};

class FrameParser {
public:
    explicit FrameParser(size_t max_message_bytes = kMaxMessageBytes);

    /**
     * @brief Consume received bytes
     *
     * Appends every complete data message (fragments already joined, opcode
     * of the first fragment) and every control frame to out, in wire order.
     * Partial frames are kept for the next call.
     *
     * @return RTV_ERROR_PROTOCOL_FRAME on a framing violation; the parser
     *         must not be fed again afterwards.
     */
    rtv_result_t feed(const uint8_t* data, size_t len, std::vector<WsFrame>& out);

    void reset();

    size_t buffered() const { return buffer_.size(); }

private:
    size_t max_message_bytes_;
    std::vector<uint8_t> buffer_;
    std::string fragments_;
    uint8_t fragment_opcode_ = 0;
    bool failed_ = false;
};

}  // namespace ws
}  // namespace rtv

#endif  // RTV_WEBSOCKET_FRAME_H
