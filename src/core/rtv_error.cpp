/**
 * @file rtv_error.cpp
 * @brief rtv - Result code messages and categories
 */

#include "rtv/core/rtv_error.h"

namespace rtv {

Error make_error(rtv_result_t code, const std::string& message) {
    Error error;
    error.code = code;
    error.message = message.empty() ? rtv_error_message(code) : message;
    return error;
}

}  // namespace rtv

const char* rtv_error_message(rtv_result_t code) {
    switch (code) {
        case RTV_SUCCESS:
            return "Success";
        case RTV_ERROR_AUTH_MISSING_CREDENTIAL:
            return "API key is required";
        case RTV_ERROR_AUTH_REJECTED:
            return "Invalid API key";
        case RTV_ERROR_UPSTREAM_UNREACHABLE:
            return "Session service unreachable";
        case RTV_ERROR_UPSTREAM_REJECTED:
            return "Session service rejected the request";
        case RTV_ERROR_UPSTREAM_TIMEOUT:
            return "Session service timed out";
        case RTV_ERROR_UPSTREAM_BAD_RESPONSE:
            return "Session service returned an invalid response";
        case RTV_ERROR_PERMISSION_DENIED:
            return "Microphone permission denied";
        case RTV_ERROR_CONNECTION_FAILED:
            return "Failed to open realtime channel";
        case RTV_ERROR_CONNECTION_CLOSED:
            return "Realtime channel closed";
        case RTV_ERROR_HANDSHAKE_FAILED:
            return "WebSocket handshake failed";
        case RTV_ERROR_TLS_FAILED:
            return "TLS negotiation failed";
        case RTV_ERROR_NOT_CONNECTED:
            return "Not connected";
        case RTV_ERROR_INVALID_URL:
            return "Invalid URL";
        case RTV_ERROR_PROTOCOL_MALFORMED:
            return "Malformed inbound message";
        case RTV_ERROR_PROTOCOL_FRAME:
            return "Invalid WebSocket frame";
        case RTV_ERROR_UPSTREAM_ADVISORY:
            return "Upstream reported an error";
        case RTV_ERROR_AUDIO_DEVICE:
            return "Audio device error";
        case RTV_ERROR_AUDIO_DECODE:
            return "Audio payload could not be decoded";
        case RTV_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case RTV_ERROR_INVALID_STATE:
            return "Invalid state";
        case RTV_ERROR_CONNECT_IN_PROGRESS:
            return "Connect already in progress";
        case RTV_ERROR_CANCELLED:
            return "Cancelled";
        default:
            return "Unknown error";
    }
}

const char* rtv_error_category(rtv_result_t code) {
    if (code >= -119 && code <= -100) return "Authentication";
    if (code >= -139 && code <= -120) return "Upstream";
    if (code >= -149 && code <= -140) return "Permission";
    if (code >= -179 && code <= -150) return "Connection";
    if (code >= -199 && code <= -180) return "Protocol";
    if (code >= -209 && code <= -200) return "Advisory";
    if (code >= -239 && code <= -220) return "Audio";
    if (code >= -269 && code <= -250) return "State";

    if (code == RTV_SUCCESS) return "Success";

    return "Unknown";
}

rtv::ErrorKind rtv_error_kind(rtv_result_t code) {
    if (code >= -119 && code <= -100) return rtv::ErrorKind::Auth;
    if (code >= -139 && code <= -120) return rtv::ErrorKind::Upstream;
    if (code >= -149 && code <= -140) return rtv::ErrorKind::Permission;
    if (code >= -179 && code <= -150) return rtv::ErrorKind::Connection;
    if (code >= -199 && code <= -180) return rtv::ErrorKind::Protocol;
    if (code >= -209 && code <= -200) return rtv::ErrorKind::UpstreamAdvisory;
    if (code >= -239 && code <= -220) return rtv::ErrorKind::Audio;
    if (code >= -269 && code <= -250) return rtv::ErrorKind::State;
    return rtv::ErrorKind::None;
}
