/**
 * @file rtv_logger.h
 * @brief rtv - Category logger
 *
 * Printf-style logging with a global minimum level and a pluggable sink.
 * The default sink writes "[LEVEL] [Category] message" to stderr.
 */

#ifndef RTV_LOGGER_H
#define RTV_LOGGER_H

typedef enum {
    RTV_LOG_LEVEL_TRACE = 0,
    RTV_LOG_LEVEL_DEBUG = 1,
    RTV_LOG_LEVEL_INFO = 2,
    RTV_LOG_LEVEL_WARNING = 3,
    RTV_LOG_LEVEL_ERROR = 4,
    RTV_LOG_LEVEL_OFF = 5,
} rtv_log_level_t;

/**
 * @brief Log sink callback
 *
 * @param level Message level
 * @param category Component name (e.g. "Protocol")
 * @param message Formatted message, without trailing newline
 * @param user_data Opaque pointer passed to rtv_log_set_callback
 */
typedef void (*rtv_log_callback_fn)(rtv_log_level_t level, const char* category,
                                    const char* message, void* user_data);

/**
 * @brief Replace the log sink. Passing nullptr restores the stderr sink.
 */
void rtv_log_set_callback(rtv_log_callback_fn callback, void* user_data);

void rtv_log_set_level(rtv_log_level_t level);
rtv_log_level_t rtv_log_get_level(void);

/**
 * @brief Parse "trace", "debug", "info", "warning", "error" or "off"
 *
 * @return fallback if the name is not recognised
 */
rtv_log_level_t rtv_log_level_from_string(const char* name, rtv_log_level_t fallback);

const char* rtv_log_level_name(rtv_log_level_t level);

void rtv_log(rtv_log_level_t level, const char* category, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

#define RTV_LOG_TRACE(category, ...) rtv_log(RTV_LOG_LEVEL_TRACE, category, __VA_ARGS__)
#define RTV_LOG_DEBUG(category, ...) rtv_log(RTV_LOG_LEVEL_DEBUG, category, __VA_ARGS__)
#define RTV_LOG_INFO(category, ...) rtv_log(RTV_LOG_LEVEL_INFO, category, __VA_ARGS__)
#define RTV_LOG_WARNING(category, ...) rtv_log(RTV_LOG_LEVEL_WARNING, category, __VA_ARGS__)
#define RTV_LOG_ERROR(category, ...) rtv_log(RTV_LOG_LEVEL_ERROR, category, __VA_ARGS__)

#endif  // RTV_LOGGER_H
