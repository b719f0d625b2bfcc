/**
 * @file rtv_websocket_frame.cpp
 * @brief rtv - RFC 6455 framing helpers
 */

#include "rtv_websocket_frame.h"

#include <openssl/evp.h>

#include <cctype>
#include <random>
#include <regex>

#include "rtv/core/rtv_logger.h"
#include "rtv/utils/rtv_base64.h"

namespace rtv {
namespace ws {

namespace {

const char* const kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC11B85";

std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

}  // namespace

// =============================================================================
// URL parsing
// =============================================================================

bool parse_ws_url(const std::string& url, WsUrl& out) {
    std::regex url_regex(R"((ws|wss|http|https)://([^:/?#]+)(?::(\d+))?([/?].*)?)",
                         std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return false;
    }

    std::string scheme = match[1].str();
    for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    out.secure = (scheme == "wss" || scheme == "https");
    out.host = match[2].str();
    out.port = out.secure ? 443 : 80;
    if (match[3].matched) {
        if (match[3].length() > 5) return false;
        int port = std::stoi(match[3].str());
        if (port <= 0 || port > 65535) return false;
        out.port = port;
    }

    out.path = match[4].matched ? match[4].str() : "";
    if (out.path.empty()) {
        out.path = "/";
    } else if (out.path[0] == '?') {
        out.path = "/" + out.path;
    }
    return true;
}

// =============================================================================
// Handshake keys
// =============================================================================

std::string make_client_key() {
    uint8_t key_bytes[16];
    for (auto& b : key_bytes) {
        b = static_cast<uint8_t>(rng()() & 0xFF);
    }
    return base64_encode(key_bytes, sizeof(key_bytes));
}

std::string compute_accept_key(const std::string& client_key) {
    std::string input = client_key + kAcceptGuid;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        RTV_LOG_ERROR("WebSocket", "SHA-1 digest failed");
        return "";
    }
    return base64_encode(digest, digest_len);
}

// =============================================================================
// Frame encoding
// =============================================================================

std::vector<uint8_t> encode_frame(uint8_t opcode, const std::string& payload,
                                  const uint8_t* mask_key) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);

    // FIN + opcode
    frame.push_back(0x80 | (opcode & 0x0F));

    uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    size_t len = payload.size();
    if (len <= 125) {
        frame.push_back(mask_bit | static_cast<uint8_t>(len));
    } else if (len <= 65535) {
        frame.push_back(mask_bit | 126);
        frame.push_back((len >> 8) & 0xFF);
        frame.push_back(len & 0xFF);
    } else {
        frame.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; i--) {
            frame.push_back((static_cast<uint64_t>(len) >> (8 * i)) & 0xFF);
        }
    }

    if (mask_key) {
        frame.insert(frame.end(), mask_key, mask_key + 4);
        for (size_t i = 0; i < len; i++) {
            frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask_key[i % 4]);
        }
    } else {
        frame.insert(frame.end(), payload.begin(), payload.end());
    }
    return frame;
}

std::vector<uint8_t> encode_client_frame(uint8_t opcode, const std::string& payload) {
    uint8_t mask[4];
    uint32_t r = rng()();
    for (int i = 0; i < 4; i++) mask[i] = (r >> (8 * i)) & 0xFF;
    return encode_frame(opcode, payload, mask);
}

std::string make_close_payload(uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason.substr(0, 123);
    return payload;
}

// =============================================================================
// FrameParser
// =============================================================================

FrameParser::FrameParser(size_t max_message_bytes) : max_message_bytes_(max_message_bytes) {}

void FrameParser::reset() {
    buffer_.clear();
    fragments_.clear();
    fragment_opcode_ = 0;
    failed_ = false;
}

rtv_result_t FrameParser::feed(const uint8_t* data, size_t len, std::vector<WsFrame>& out) {
    if (failed_) {
        return RTV_ERROR_PROTOCOL_FRAME;
    }
    buffer_.insert(buffer_.end(), data, data + len);

    auto fail = [this](const char* reason) {
        RTV_LOG_WARNING("WebSocket", "Frame error: %s", reason);
        failed_ = true;
        return RTV_ERROR_PROTOCOL_FRAME;
    };

    size_t offset = 0;
    while (true) {
        size_t avail = buffer_.size() - offset;
        if (avail < 2) break;

        const uint8_t* p = buffer_.data() + offset;
        bool fin = (p[0] & 0x80) != 0;
        uint8_t opcode = p[0] & 0x0F;
        bool masked = (p[1] & 0x80) != 0;
        uint64_t payload_len = p[1] & 0x7F;
        size_t header_len = 2;

        if (p[0] & 0x70) return fail("reserved bits set");

        if (payload_len == 126) {
            if (avail < 4) break;
            payload_len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
            header_len = 4;
        } else if (payload_len == 127) {
            if (avail < 10) break;
            payload_len = 0;
            for (int i = 0; i < 8; i++) {
                payload_len = (payload_len << 8) | p[2 + i];
            }
            header_len = 10;
        }

        bool control = (opcode & 0x08) != 0;
        if (control && (!fin || payload_len > 125)) return fail("invalid control frame");
        if (payload_len > max_message_bytes_) return fail("frame too large");

        const uint8_t* mask_key = nullptr;
        if (masked) {
            if (avail < header_len + 4) break;
            mask_key = p + header_len;
            header_len += 4;
        }
        if (avail - header_len < payload_len) break;

        std::string payload(reinterpret_cast<const char*>(p + header_len),
                            static_cast<size_t>(payload_len));
        if (mask_key) {
            for (size_t i = 0; i < payload.size(); i++) {
                payload[i] = static_cast<char>(payload[i] ^ mask_key[i % 4]);
            }
        }
        offset += header_len + static_cast<size_t>(payload_len);

        if (control) {
            if (opcode != kOpClose && opcode != kOpPing && opcode != kOpPong) {
                return fail("unknown control opcode");
            }
            out.push_back({opcode, std::move(payload)});
        } else if (opcode == kOpContinuation) {
            if (fragment_opcode_ == 0) return fail("continuation without a start frame");
            if (fragments_.size() + payload.size() > max_message_bytes_) {
                return fail("message too large");
            }
            fragments_ += payload;
            if (fin) {
                out.push_back({fragment_opcode_, std::move(fragments_)});
                fragments_.clear();
                fragment_opcode_ = 0;
            }
        } else if (opcode == kOpText || opcode == kOpBinary) {
            if (fragment_opcode_ != 0) return fail("new message inside a fragmented one");
            if (fin) {
                out.push_back({opcode, std::move(payload)});
            } else {
                fragment_opcode_ = opcode;
                fragments_ = std::move(payload);
            }
        } else {
            return fail("unknown data opcode");
        }
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return RTV_SUCCESS;
}

}  // namespace ws
}  // namespace rtv
