/**
 * @file rtv_session_broker.cpp
 * @brief rtv - Session broker HTTP server implementation
 */

#include "rtv/server/rtv_session_broker.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "rtv/core/rtv_logger.h"
#include "rtv/core/rtv_types.h"
#include "rtv/net/rtv_session_negotiator.h"

namespace rtv {
namespace server {

namespace {

void sendError(httplib::Response& res, int status, const nlohmann::json& error) {
    nlohmann::json body = {{"error", error}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}  // namespace

std::string extract_bearer_token(const std::string& authorization) {
    static const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    std::string token = authorization.substr(prefix.size());
    size_t start = token.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = token.find_last_not_of(' ');
    return token.substr(start, end - start + 1);
}

// =============================================================================
// SESSION BROKER
// =============================================================================

SessionBroker::SessionBroker() = default;

SessionBroker::~SessionBroker() {
    if (running_) {
        stop();
    }
}

rtv_result_t SessionBroker::start(const SessionBrokerConfig& config) {
    static constexpr int SERVER_START_POLL_ITERATIONS = 100;
    static constexpr int SERVER_START_POLL_MS = 20;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (running_ || serverThread_.joinable()) {
            return RTV_ERROR_INVALID_STATE;
        }

        std::string origin, path;
        if (!split_http_url(config.upstream_url, origin, path)) {
            RTV_LOG_ERROR("Broker", "Invalid upstream URL: %s", config.upstream_url.c_str());
            return RTV_ERROR_INVALID_URL;
        }
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }

        config_ = config;
        upstreamOrigin_ = origin;
        upstreamPrefix_ = path;

        server_ = std::make_unique<httplib::Server>();

        if (config_.enable_cors) {
            setupCors();
        }

        setupRoutes();

        shouldStop_ = false;
        bindFailed_ = false;
        boundPort_ = 0;
        totalRequests_ = 0;
        sessionsCreated_ = 0;
        upstreamFailures_ = 0;
        startTime_ = std::chrono::steady_clock::now();

        serverThread_ = std::thread(&SessionBroker::serverThread, this);
    }

    for (int i = 0; i < SERVER_START_POLL_ITERATIONS; ++i) {
        if (running_) {
            RTV_LOG_INFO("Broker", "Session broker listening on http://%s:%d",
                         config_.host.c_str(), boundPort_.load());
            RTV_LOG_INFO("Broker", "Upstream: %s%s%s", upstreamOrigin_.c_str(),
                         upstreamPrefix_.c_str(), kUpstreamSessionsPath);
            return RTV_SUCCESS;
        }
        if (bindFailed_) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(SERVER_START_POLL_MS));
    }

    shouldStop_ = true;
    if (server_) {
        server_->stop();
    }
    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    server_.reset();

    RTV_LOG_ERROR("Broker", "Failed to start session broker on %s:%d", config.host.c_str(),
                  config.port);
    return RTV_ERROR_CONNECTION_FAILED;
}

rtv_result_t SessionBroker::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!running_ && !serverThread_.joinable()) {
        return RTV_ERROR_INVALID_STATE;
    }

    RTV_LOG_INFO("Broker", "Stopping session broker...");

    shouldStop_ = true;

    if (server_) {
        server_->stop();
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    server_.reset();
    running_ = false;

    RTV_LOG_INFO("Broker", "Session broker stopped");
    return RTV_SUCCESS;
}

bool SessionBroker::isRunning() const {
    return running_;
}

void SessionBroker::getStatus(SessionBrokerStatus& status) const {
    std::lock_guard<std::mutex> lock(mutex_);

    status.is_running = running_;
    status.host = config_.host;
    status.port = boundPort_;
    status.total_requests = totalRequests_;
    status.sessions_created = sessionsCreated_;
    status.upstream_failures = upstreamFailures_;

    if (running_) {
        auto now = std::chrono::steady_clock::now();
        status.uptime_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    } else {
        status.uptime_seconds = 0;
    }
}

int SessionBroker::wait() {
    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    return 0;
}

void SessionBroker::setupRoutes() {
    // POST /api/realtime-session
    server_->Post("/api/realtime-session",
                  [this](const httplib::Request& req, httplib::Response& res) {
                      totalRequests_++;
                      try {
                          handleRealtimeSession(req, res);
                      } catch (const std::exception& e) {
                          RTV_LOG_ERROR("Broker", "Error creating session: %s", e.what());
                          upstreamFailures_++;
                          sendError(res, 500, "An error occurred while creating session");
                      }
                  });

    // GET /health
    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        totalRequests_++;
        handleHealth(req, res);
    });
}

void SessionBroker::setupCors() {
    std::string origins = config_.cors_origins.empty() ? "*" : config_.cors_origins;

    server_->set_pre_routing_handler([origins](const httplib::Request& req,
                                               httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", origins);
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");

        // Handle preflight
        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }

        return httplib::Server::HandlerResponse::Unhandled;
    });
}

void SessionBroker::handleRealtimeSession(const httplib::Request& req, httplib::Response& res) {
    std::string model = kDefaultRealtimeModel;
    std::string voice = voice_name(Voice::Alloy);

    if (!req.body.empty()) {
        auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            sendError(res, 400, "Request body must be a JSON object");
            return;
        }
        if (body.contains("model") && body["model"].is_string()) {
            model = body["model"].get<std::string>();
        }
        if (body.contains("voice") && body["voice"].is_string()) {
            voice = body["voice"].get<std::string>();
        }
    }

    // The key is forwarded upstream and never logged
    std::string apiKey = extract_bearer_token(req.get_header_value("Authorization"));
    if (apiKey.empty()) {
        RTV_LOG_WARNING("Broker", "Session request without an API key");
        sendError(res, 400, "API key is required");
        return;
    }

    httplib::Client client(upstreamOrigin_);
    auto timeout = std::chrono::milliseconds(config_.upstream_timeout_ms);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_bearer_token_auth(apiKey);

    nlohmann::json upstreamBody = {
        {"model", model},
        {"voice", voice},
    };

    RTV_LOG_DEBUG("Broker", "Creating upstream session (model=%s, voice=%s)", model.c_str(),
                  voice.c_str());

    auto upstream = client.Post(upstreamPrefix_ + kUpstreamSessionsPath, upstreamBody.dump(),
                                "application/json");
    if (!upstream) {
        upstreamFailures_++;
        std::string detail = httplib::to_string(upstream.error());
        RTV_LOG_ERROR("Broker", "Upstream request failed: %s", detail.c_str());
        sendError(res, 500, "Upstream request failed: " + detail);
        return;
    }

    auto data = nlohmann::json::parse(upstream->body, nullptr, false);

    if (upstream->status < 200 || upstream->status >= 300) {
        upstreamFailures_++;
        RTV_LOG_WARNING("Broker", "Upstream rejected session request (%d)", upstream->status);
        if (!data.is_discarded() && data.is_object() && data.contains("error") &&
            !data["error"].is_null()) {
            sendError(res, upstream->status, data["error"]);
        } else {
            sendError(res, upstream->status, "Failed to create session");
        }
        return;
    }

    if (data.is_discarded() || !data.is_object()) {
        upstreamFailures_++;
        RTV_LOG_ERROR("Broker", "Upstream returned a non-JSON session body");
        sendError(res, 500, "Upstream returned an invalid session response");
        return;
    }

    sessionsCreated_++;
    RTV_LOG_INFO("Broker", "Session created (model=%s, voice=%s)", model.c_str(), voice.c_str());
    res.status = 200;
    res.set_content(data.dump(), "application/json");
}

void SessionBroker::handleHealth(const httplib::Request& /*req*/, httplib::Response& res) {
    nlohmann::json health = {
        {"status", "ok"},
        {"sessions_created", sessionsCreated_.load()},
    };
    res.set_content(health.dump(), "application/json");
}

void SessionBroker::serverThread() {
    RTV_LOG_DEBUG("Broker", "Server thread starting on %s:%d", config_.host.c_str(),
                  config_.port);

    // Bind first, then signal running, then start accepting
    int port = config_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(config_.host);
        if (port < 0) {
            RTV_LOG_ERROR("Broker", "Failed to bind to %s (any port)", config_.host.c_str());
            bindFailed_ = true;
            return;
        }
    } else if (!server_->bind_to_port(config_.host, port)) {
        RTV_LOG_ERROR("Broker", "Failed to bind to %s:%d", config_.host.c_str(), port);
        bindFailed_ = true;
        return;
    }

    boundPort_ = port;
    running_ = true;

    // Listen (blocking) - port is already bound
    if (!server_->listen_after_bind()) {
        if (!shouldStop_) {
            RTV_LOG_ERROR("Broker", "Listen failed on %s:%d", config_.host.c_str(), port);
        }
    }

    running_ = false;
    RTV_LOG_DEBUG("Broker", "Server thread exiting");
}

}  // namespace server
}  // namespace rtv
