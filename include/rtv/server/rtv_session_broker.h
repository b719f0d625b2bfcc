/**
 * @file rtv_session_broker.h
 * @brief rtv - Session broker HTTP server
 *
 * The trusted intermediary that holds no state of its own: it takes the
 * caller's long-lived key from the Authorization header, creates a realtime
 * session upstream and hands back the upstream response, which carries the
 * scoped credential. Wraps cpp-httplib and manages the server lifecycle.
 */

#ifndef RTV_SESSION_BROKER_H
#define RTV_SESSION_BROKER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "rtv/core/rtv_error.h"

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace rtv {
namespace server {

constexpr const char* kDefaultUpstreamUrl = "https://api.openai.com";
constexpr const char* kUpstreamSessionsPath = "/v1/realtime/sessions";

struct SessionBrokerConfig {
    std::string host = "127.0.0.1";
    int port = 8090;  // 0 picks a free port, see SessionBroker::port()
    std::string upstream_url = kDefaultUpstreamUrl;
    int upstream_timeout_ms = 15000;
    bool enable_cors = true;
    std::string cors_origins = "*";

    static SessionBrokerConfig defaults() { return SessionBrokerConfig{}; }
};

struct SessionBrokerStatus {
    bool is_running = false;
    std::string host;
    int port = 0;
    int64_t total_requests = 0;
    int64_t sessions_created = 0;
    int64_t upstream_failures = 0;
    int64_t uptime_seconds = 0;
};

class SessionBroker {
public:
    SessionBroker();
    ~SessionBroker();

    SessionBroker(const SessionBroker&) = delete;
    SessionBroker& operator=(const SessionBroker&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     *
     * @return RTV_SUCCESS, RTV_ERROR_INVALID_STATE if already running,
     *         RTV_ERROR_INVALID_URL for a bad upstream URL or
     *         RTV_ERROR_CONNECTION_FAILED if the port cannot be bound
     */
    rtv_result_t start(const SessionBrokerConfig& config);

    /**
     * @brief Stop the server
     *
     * @return RTV_SUCCESS, or RTV_ERROR_INVALID_STATE if not running
     */
    rtv_result_t stop();

    bool isRunning() const;

    // Port actually bound; differs from the configured one when that was 0
    int port() const { return boundPort_; }

    void getStatus(SessionBrokerStatus& status) const;

    /**
     * @brief Block until the server stops
     */
    int wait();

private:
    void setupRoutes();
    void setupCors();
    void serverThread();

    void handleRealtimeSession(const httplib::Request& req, httplib::Response& res);
    void handleHealth(const httplib::Request& req, httplib::Response& res);

    std::unique_ptr<httplib::Server> server_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shouldStop_{false};
    std::atomic<bool> bindFailed_{false};
    mutable std::mutex mutex_;

    // Configuration (copied on start)
    SessionBrokerConfig config_;
    std::string upstreamOrigin_;
    std::string upstreamPrefix_;
    std::atomic<int> boundPort_{0};

    // Statistics
    std::atomic<int64_t> totalRequests_{0};
    std::atomic<int64_t> sessionsCreated_{0};
    std::atomic<int64_t> upstreamFailures_{0};
    std::chrono::steady_clock::time_point startTime_;
};

/**
 * @brief Take the key out of "Bearer <key>"
 *
 * @return empty string if the header is missing or carries no key
 */
std::string extract_bearer_token(const std::string& authorization);

}  // namespace server
}  // namespace rtv

#endif  // RTV_SESSION_BROKER_H
