/*
 * log.h — Leveled, tagged stderr logging
 *
 * Format: [2026-10-17T12:00:00] INFO  [SCHED] message
 */

#ifndef WIFI_RANGER_LOG_H
#define WIFI_RANGER_LOG_H

#include <cstdint>

namespace wifi_ranger {

enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
};

const char *log_level_name(LogLevel level);

// Lowercase form accepted by the log_level option ("debug", "info", ...).
const char *log_level_option_name(LogLevel level);

// Accepts "debug", "info", "warn"/"warning", "error" (any case).
bool parse_log_level(const char *text, LogLevel *out);

void set_log_level(LogLevel level);
LogLevel get_log_level();

void log_line(LogLevel level, const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace wifi_ranger

#define WR_LOG_DEBUG(tag, ...)                                                 \
  ::wifi_ranger::log_line(::wifi_ranger::LogLevel::DEBUG, tag, __VA_ARGS__)
#define WR_LOG_INFO(tag, ...)                                                  \
  ::wifi_ranger::log_line(::wifi_ranger::LogLevel::INFO, tag, __VA_ARGS__)
#define WR_LOG_WARN(tag, ...)                                                  \
  ::wifi_ranger::log_line(::wifi_ranger::LogLevel::WARN, tag, __VA_ARGS__)
#define WR_LOG_ERROR(tag, ...)                                                 \
  ::wifi_ranger::log_line(::wifi_ranger::LogLevel::ERROR, tag, __VA_ARGS__)

#endif // WIFI_RANGER_LOG_H
