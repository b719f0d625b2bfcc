/**
 * @file rtv_logger.cpp
 * @brief rtv - Category logger implementation
 */

#include "rtv/core/rtv_logger.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <strings.h>

// =============================================================================
// INTERNAL STATE
// =============================================================================

namespace {

struct LoggerState {
    rtv_log_callback_fn callback = nullptr;
    void* user_data = nullptr;
    std::mutex mutex;
    std::atomic<int> level{RTV_LOG_LEVEL_INFO};
};

LoggerState& get_logger_state() {
    static LoggerState state;
    return state;
}

void stderr_sink(rtv_log_level_t level, const char* category, const char* message) {
    fprintf(stderr, "[%s] [%s] %s\n", rtv_log_level_name(level), category ? category : "rtv",
            message);
}

}  // namespace

// =============================================================================
// PUBLIC API
// =============================================================================

void rtv_log_set_callback(rtv_log_callback_fn callback, void* user_data) {
    auto& state = get_logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = callback;
    state.user_data = user_data;
}

void rtv_log_set_level(rtv_log_level_t level) {
    get_logger_state().level.store(level);
}

rtv_log_level_t rtv_log_get_level(void) {
    return static_cast<rtv_log_level_t>(get_logger_state().level.load());
}

rtv_log_level_t rtv_log_level_from_string(const char* name, rtv_log_level_t fallback) {
    if (!name) return fallback;
    if (strcasecmp(name, "trace") == 0) return RTV_LOG_LEVEL_TRACE;
    if (strcasecmp(name, "debug") == 0) return RTV_LOG_LEVEL_DEBUG;
    if (strcasecmp(name, "info") == 0) return RTV_LOG_LEVEL_INFO;
    if (strcasecmp(name, "warning") == 0 || strcasecmp(name, "warn") == 0) {
        return RTV_LOG_LEVEL_WARNING;
    }
    if (strcasecmp(name, "error") == 0) return RTV_LOG_LEVEL_ERROR;
    if (strcasecmp(name, "off") == 0) return RTV_LOG_LEVEL_OFF;
    return fallback;
}

const char* rtv_log_level_name(rtv_log_level_t level) {
    switch (level) {
        case RTV_LOG_LEVEL_TRACE:
            return "TRACE";
        case RTV_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case RTV_LOG_LEVEL_INFO:
            return "INFO";
        case RTV_LOG_LEVEL_WARNING:
            return "WARN";
        case RTV_LOG_LEVEL_ERROR:
            return "ERROR";
        default:
            return "OFF";
    }
}

void rtv_log(rtv_log_level_t level, const char* category, const char* format, ...) {
    auto& state = get_logger_state();
    if (level < state.level.load() || level >= RTV_LOG_LEVEL_OFF) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.callback != nullptr) {
        state.callback(level, category, buffer, state.user_data);
    } else {
        stderr_sink(level, category, buffer);
    }
}
