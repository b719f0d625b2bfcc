/**
 * @file rtv-session-broker.cpp
 * @brief rtv session broker - exchanges API keys for scoped realtime credentials
 *
 * Usage:
 *   rtv-session-broker [options]
 *
 * Options:
 *   --host, -H <host>      Host to bind to (default: 127.0.0.1)
 *   --port, -p <port>      Port to listen on (default: 8090)
 *   --upstream <url>       Upstream API origin (default: https://api.openai.com)
 *   --timeout <ms>         Upstream timeout (default: 15000)
 *   --cors                 Enable CORS (default: enabled)
 *   --no-cors              Disable CORS
 *   --verbose, -v          Enable verbose logging
 *   --help, -h             Show this help message
 *
 * Environment Variables:
 *   RTV_BROKER_HOST        Server host
 *   RTV_BROKER_PORT        Server port
 *   RTV_UPSTREAM_URL       Upstream API origin
 *   RTV_LOG_LEVEL          Log level
 */

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_logger.h"
#include "rtv/server/rtv_session_broker.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <string>

// =============================================================================
// SIGNAL HANDLING
// =============================================================================

static volatile sig_atomic_t g_shouldStop = 0;

static void signalHandler(int signum) {
    (void)signum;
    g_shouldStop = 1;
}

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

struct BrokerOptions {
    rtv::server::SessionBrokerConfig config;
    bool verbose = false;
    bool showHelp = false;
    bool badArgs = false;
};

static void printUsage(const char* programName) {
    printf("rtv session broker - exchanges API keys for scoped realtime credentials\n\n");
    printf("Usage: %s [options]\n\n", programName);
    printf("Options:\n");
    printf("  --host, -H <host>      Host to bind to (default: 127.0.0.1)\n");
    printf("  --port, -p <port>      Port to listen on (default: 8090)\n");
    printf("  --upstream <url>       Upstream API origin (default: %s)\n",
           rtv::server::kDefaultUpstreamUrl);
    printf("  --timeout <ms>         Upstream timeout (default: 15000)\n");
    printf("  --cors                 Enable CORS (default)\n");
    printf("  --no-cors              Disable CORS\n");
    printf("  --verbose, -v          Enable verbose logging\n");
    printf("  --help, -h             Show this help message\n\n");
    printf("Environment Variables:\n");
    printf("  RTV_BROKER_HOST        Server host\n");
    printf("  RTV_BROKER_PORT        Server port\n");
    printf("  RTV_UPSTREAM_URL       Upstream API origin\n");
    printf("  RTV_LOG_LEVEL          trace, debug, info, warning, error, off\n\n");
    printf("Endpoints:\n");
    printf("  POST /api/realtime-session  Create a realtime session (Authorization: Bearer <key>)\n");
    printf("  GET  /health                Health check\n");
}

static BrokerOptions parseArgs(int argc, char* argv[]) {
    BrokerOptions opts;

    // Check environment variables first
    const char* envHost = std::getenv("RTV_BROKER_HOST");
    if (envHost) opts.config.host = envHost;

    const char* envPort = std::getenv("RTV_BROKER_PORT");
    if (envPort) opts.config.port = std::atoi(envPort);

    const char* envUpstream = std::getenv("RTV_UPSTREAM_URL");
    if (envUpstream) opts.config.upstream_url = envUpstream;

    const char* envLevel = std::getenv("RTV_LOG_LEVEL");
    if (envLevel) rtv_log_set_level(rtv_log_level_from_string(envLevel, rtv_log_get_level()));

    // Parse command line arguments (override env vars)
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            opts.verbose = true;
        }
        else if (std::strcmp(arg, "--cors") == 0) {
            opts.config.enable_cors = true;
        }
        else if (std::strcmp(arg, "--no-cors") == 0) {
            opts.config.enable_cors = false;
        }
        else if ((std::strcmp(arg, "--host") == 0 || std::strcmp(arg, "-H") == 0) && i + 1 < argc) {
            opts.config.host = argv[++i];
        }
        else if ((std::strcmp(arg, "--port") == 0 || std::strcmp(arg, "-p") == 0) && i + 1 < argc) {
            opts.config.port = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--upstream") == 0 && i + 1 < argc) {
            opts.config.upstream_url = argv[++i];
        }
        else if (std::strcmp(arg, "--timeout") == 0 && i + 1 < argc) {
            opts.config.upstream_timeout_ms = std::atoi(argv[++i]);
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", arg);
            opts.badArgs = true;
        }
    }

    return opts;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    BrokerOptions opts = parseArgs(argc, argv);

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.badArgs) {
        printUsage(argv[0]);
        return 1;
    }
    if (opts.config.port < 0 || opts.config.port > 65535) {
        fprintf(stderr, "Error: invalid port %d\n", opts.config.port);
        return 1;
    }

    if (opts.verbose) {
        rtv_log_set_level(RTV_LOG_LEVEL_DEBUG);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    printf("Configuration:\n");
    printf("  Host:     %s\n", opts.config.host.c_str());
    printf("  Port:     %d\n", opts.config.port);
    printf("  Upstream: %s\n", opts.config.upstream_url.c_str());
    printf("  CORS:     %s\n", opts.config.enable_cors ? "enabled" : "disabled");
    printf("\n");

    rtv::server::SessionBroker broker;
    rtv_result_t result = broker.start(opts.config);
    if (RTV_FAILED(result)) {
        fprintf(stderr, "Error: Failed to start session broker: %s\n", rtv_error_message(result));
        return 1;
    }

    printf("Session broker is running!\n");
    printf("Endpoint: http://%s:%d/api/realtime-session\n", opts.config.host.c_str(),
           broker.port());
    printf("Press Ctrl+C to stop\n\n");

    // The signal handler only sets a flag; stop() runs here
    while (!g_shouldStop && broker.isRunning()) {
        usleep(100 * 1000);
    }

    rtv::server::SessionBrokerStatus status;
    broker.getStatus(status);
    if (broker.isRunning()) {
        broker.stop();
    }

    printf("\nBroker Statistics:\n");
    printf("  Total requests:    %lld\n", (long long)status.total_requests);
    printf("  Sessions created:  %lld\n", (long long)status.sessions_created);
    printf("  Upstream failures: %lld\n", (long long)status.upstream_failures);
    printf("  Uptime: %lld seconds\n", (long long)status.uptime_seconds);

    return 0;
}
