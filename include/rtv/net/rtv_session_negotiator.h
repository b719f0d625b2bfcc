/**
 * @file rtv_session_negotiator.h
 * @brief rtv - Exchange of the long-lived key for a scoped session credential
 *
 * The long-lived key only ever travels to the negotiation endpoint (the
 * session broker). The realtime channel is authenticated with the scoped
 * credential returned here. A fresh credential is requested on every
 * connect; nothing is cached.
 */

#ifndef RTV_SESSION_NEGOTIATOR_H
#define RTV_SESSION_NEGOTIATOR_H

#include <cstdint>
#include <string>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"

namespace rtv {

struct NegotiationRequest {
    std::string api_key;
    std::string model = kDefaultRealtimeModel;
    Voice voice = Voice::Alloy;
};

struct ScopedCredential {
    std::string value;
    int64_t expires_at = 0;  // unix seconds, 0 if not reported
};

class SessionNegotiator {
public:
    virtual ~SessionNegotiator() = default;

    /**
     * @brief Obtain a scoped credential
     *
     * @return RTV_SUCCESS, an Authentication code (missing or rejected key)
     *         or an Upstream code (unreachable, rejected, timed out, bad body)
     */
    virtual rtv_result_t negotiate(const NegotiationRequest& request,
                                   ScopedCredential& out_credential) = 0;

    // Human-readable detail of the last failure
    virtual std::string last_error() const = 0;
};

// =============================================================================
// HTTP implementation (cpp-httplib)
// =============================================================================

constexpr const char* kDefaultSessionUrl = "http://127.0.0.1:8090/api/realtime-session";
constexpr int kNegotiationTimeoutMs = 15000;

struct HttpNegotiatorConfig {
    std::string session_url = kDefaultSessionUrl;
    int timeout_ms = kNegotiationTimeoutMs;
};

class HttpSessionNegotiator : public SessionNegotiator {
public:
    HttpSessionNegotiator();
    explicit HttpSessionNegotiator(const HttpNegotiatorConfig& config);

    rtv_result_t negotiate(const NegotiationRequest& request,
                           ScopedCredential& out_credential) override;

    std::string last_error() const override { return last_error_; }

    const HttpNegotiatorConfig& config() const { return config_; }

private:
    HttpNegotiatorConfig config_;
    std::string last_error_;

    rtv_result_t fail(rtv_result_t code, const std::string& message);
};

/**
 * @brief Split "scheme://host[:port]/path" into the origin and the path
 *
 * @return false if the URL is not http:// or https://
 */
bool split_http_url(const std::string& url, std::string& out_origin, std::string& out_path);

}  // namespace rtv

#endif  // RTV_SESSION_NEGOTIATOR_H
