/**
 * @file rtv_error.h
 * @brief rtv - Result codes and structured error model
 *
 * All fallible operations return an rtv_result_t. Zero is success, negative
 * values are errors grouped in ranges by category.
 */

#ifndef RTV_ERROR_H
#define RTV_ERROR_H

#include <cstdint>
#include <string>

typedef int32_t rtv_result_t;

#define RTV_SUCCESS ((rtv_result_t)0)

#define RTV_SUCCEEDED(rc) ((rc) >= 0)
#define RTV_FAILED(rc) ((rc) < 0)

// =============================================================================
// AUTHENTICATION (-100 to -119)
// =============================================================================

#define RTV_ERROR_AUTH_MISSING_CREDENTIAL ((rtv_result_t)-100)
#define RTV_ERROR_AUTH_REJECTED ((rtv_result_t)-101)

// =============================================================================
// UPSTREAM / NEGOTIATION (-120 to -139)
// =============================================================================

#define RTV_ERROR_UPSTREAM_UNREACHABLE ((rtv_result_t)-120)
#define RTV_ERROR_UPSTREAM_REJECTED ((rtv_result_t)-121)
#define RTV_ERROR_UPSTREAM_TIMEOUT ((rtv_result_t)-122)
#define RTV_ERROR_UPSTREAM_BAD_RESPONSE ((rtv_result_t)-123)

// =============================================================================
// PERMISSION (-140 to -149)
// =============================================================================

#define RTV_ERROR_PERMISSION_DENIED ((rtv_result_t)-140)

// =============================================================================
// CONNECTION (-150 to -179)
// =============================================================================

#define RTV_ERROR_CONNECTION_FAILED ((rtv_result_t)-150)
#define RTV_ERROR_CONNECTION_CLOSED ((rtv_result_t)-151)
#define RTV_ERROR_HANDSHAKE_FAILED ((rtv_result_t)-152)
#define RTV_ERROR_TLS_FAILED ((rtv_result_t)-153)
#define RTV_ERROR_NOT_CONNECTED ((rtv_result_t)-154)
#define RTV_ERROR_INVALID_URL ((rtv_result_t)-155)

// =============================================================================
// PROTOCOL (-180 to -199)
// =============================================================================

#define RTV_ERROR_PROTOCOL_MALFORMED ((rtv_result_t)-180)
#define RTV_ERROR_PROTOCOL_FRAME ((rtv_result_t)-181)

// =============================================================================
// ADVISORY (-200 to -209)
// =============================================================================

#define RTV_ERROR_UPSTREAM_ADVISORY ((rtv_result_t)-200)

// =============================================================================
// AUDIO (-220 to -239)
// =============================================================================

#define RTV_ERROR_AUDIO_DEVICE ((rtv_result_t)-220)
#define RTV_ERROR_AUDIO_DECODE ((rtv_result_t)-221)

// =============================================================================
// STATE / VALIDATION (-250 to -269)
// =============================================================================

#define RTV_ERROR_INVALID_ARGUMENT ((rtv_result_t)-250)
#define RTV_ERROR_INVALID_STATE ((rtv_result_t)-251)
#define RTV_ERROR_CONNECT_IN_PROGRESS ((rtv_result_t)-252)
#define RTV_ERROR_CANCELLED ((rtv_result_t)-253)

namespace rtv {

/**
 * @brief Error taxonomy the rest of the application reacts to
 */
enum class ErrorKind {
    None,
    Auth,
    Upstream,
    Permission,
    Connection,
    Protocol,
    UpstreamAdvisory,
    Audio,
    State,
};

/**
 * @brief Structured error delivered to callbacks
 *
 * type, upstream_code and param are only populated for errors reported by
 * the upstream service in an `error` event.
 */
struct Error {
    rtv_result_t code = RTV_SUCCESS;
    std::string message;
    std::string type;
    std::string upstream_code;
    std::string param;
};

Error make_error(rtv_result_t code, const std::string& message = "");

}  // namespace rtv

/**
 * @brief Get a static human-readable message for a result code
 */
const char* rtv_error_message(rtv_result_t code);

/**
 * @brief Get the category name for a result code (by range)
 */
const char* rtv_error_category(rtv_result_t code);

/**
 * @brief Map a result code onto the error taxonomy
 */
rtv::ErrorKind rtv_error_kind(rtv_result_t code);

#endif  // RTV_ERROR_H
