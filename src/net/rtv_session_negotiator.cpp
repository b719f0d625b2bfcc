/**
 * @file rtv_session_negotiator.cpp
 * @brief rtv - Scoped credential negotiation over HTTP
 */

#include "rtv/net/rtv_session_negotiator.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <regex>

#include "rtv/core/rtv_logger.h"

namespace rtv {

namespace {

// Error text from {"error": "..."} or {"error": {"message": "..."}}
std::string extract_error_message(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("error")) {
        return body.substr(0, 200);
    }
    const auto& error = json["error"];
    if (error.is_string()) {
        return error.get<std::string>();
    }
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump();
}

}  // namespace

bool split_http_url(const std::string& url, std::string& out_origin, std::string& out_path) {
    std::regex url_regex(R"(^(https?://[^/?#]+)([/?].*)?$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return false;
    }
    out_origin = match[1].str();
    out_path = match[2].matched ? match[2].str() : "/";
    if (out_path.empty()) out_path = "/";
    return true;
}

HttpSessionNegotiator::HttpSessionNegotiator() : HttpSessionNegotiator(HttpNegotiatorConfig{}) {}

HttpSessionNegotiator::HttpSessionNegotiator(const HttpNegotiatorConfig& config)
    : config_(config) {}

rtv_result_t HttpSessionNegotiator::fail(rtv_result_t code, const std::string& message) {
    last_error_ = message;
    RTV_LOG_ERROR("Negotiator", "%s (%s)", message.c_str(), rtv_error_message(code));
    return code;
}

rtv_result_t HttpSessionNegotiator::negotiate(const NegotiationRequest& request,
                                              ScopedCredential& out_credential) {
    last_error_.clear();

    if (request.api_key.empty()) {
        return fail(RTV_ERROR_AUTH_MISSING_CREDENTIAL, "API key is required");
    }

    std::string origin, path;
    if (!split_http_url(config_.session_url, origin, path)) {
        return fail(RTV_ERROR_INVALID_URL, "Invalid session URL: " + config_.session_url);
    }

    httplib::Client client(origin);
    auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_bearer_token_auth(request.api_key);

    nlohmann::json body = {
        {"model", request.model},
        {"voice", voice_name(request.voice)},
    };

    RTV_LOG_DEBUG("Negotiator", "Requesting session credential from %s%s", origin.c_str(),
                  path.c_str());

    auto started = std::chrono::steady_clock::now();
    auto res = client.Post(path, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                           "application/json");

    if (!res) {
        auto err = res.error();
        auto elapsed = std::chrono::steady_clock::now() - started;
        if (err == httplib::Error::ConnectionTimeout ||
            (err == httplib::Error::Read && elapsed >= timeout)) {
            return fail(RTV_ERROR_UPSTREAM_TIMEOUT,
                        "Session endpoint did not respond within " +
                            std::to_string(config_.timeout_ms / 1000) + "s");
        }
        return fail(RTV_ERROR_UPSTREAM_UNREACHABLE,
                    "Session endpoint unreachable: " + httplib::to_string(err));
    }

    if (res->status == 400 || res->status == 401 || res->status == 403) {
        return fail(RTV_ERROR_AUTH_REJECTED, "Session request rejected (" +
                                                 std::to_string(res->status) +
                                                 "): " + extract_error_message(res->body));
    }
    if (res->status < 200 || res->status >= 300) {
        return fail(RTV_ERROR_UPSTREAM_REJECTED, "Session request failed (" +
                                                     std::to_string(res->status) +
                                                     "): " + extract_error_message(res->body));
    }

    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return fail(RTV_ERROR_UPSTREAM_BAD_RESPONSE, "Session response is not a JSON object");
    }

    const auto secret = json.find("client_secret");
    if (secret == json.end() || !secret->is_object() || !secret->contains("value") ||
        !(*secret)["value"].is_string() || (*secret)["value"].get<std::string>().empty()) {
        return fail(RTV_ERROR_UPSTREAM_BAD_RESPONSE, "Session response has no client_secret");
    }

    out_credential.value = (*secret)["value"].get<std::string>();
    out_credential.expires_at = 0;
    if (secret->contains("expires_at") && (*secret)["expires_at"].is_number_integer()) {
        out_credential.expires_at = (*secret)["expires_at"].get<int64_t>();
    }

    RTV_LOG_INFO("Negotiator", "Scoped credential obtained (expires_at=%lld)",
                 static_cast<long long>(out_credential.expires_at));
    return RTV_SUCCESS;
}

}  // namespace rtv
