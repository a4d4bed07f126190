/*
 * log.cpp — Leveled, tagged stderr logging
 *
 * One mutex serializes lines from the scheduler, hint collector and daemon
 * threads. Colors are only emitted when stderr is a terminal.
 */

#include "common/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <strings.h>
#include <unistd.h>

namespace wifi_ranger {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mutex;

static const char *level_color(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "\033[94m";
  case LogLevel::INFO:
    return "\033[92m";
  case LogLevel::WARN:
    return "\033[93m";
  case LogLevel::ERROR:
    return "\033[91m";
  default:
    return "\033[0m";
  }
}

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

const char *log_level_option_name(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "debug";
  case LogLevel::INFO:
    return "info";
  case LogLevel::WARN:
    return "warn";
  case LogLevel::ERROR:
    return "error";
  default:
    return "info";
  }
}

bool parse_log_level(const char *text, LogLevel *out) {
  if (!text || !out)
    return false;
  if (strcasecmp(text, "debug") == 0) {
    *out = LogLevel::DEBUG;
  } else if (strcasecmp(text, "info") == 0) {
    *out = LogLevel::INFO;
  } else if (strcasecmp(text, "warn") == 0 ||
             strcasecmp(text, "warning") == 0) {
    *out = LogLevel::WARN;
  } else if (strcasecmp(text, "error") == 0) {
    *out = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel get_log_level() { return static_cast<LogLevel>(g_level.load()); }

void log_line(LogLevel level, const char *tag, const char *fmt, ...) {
  if (static_cast<int>(level) < g_level.load())
    return;

  char message[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);

  std::time_t now = std::time(nullptr);
  std::tm local_tm;
  localtime_r(&now, &local_tm);
  char timebuf[32];
  std::strftime(timebuf, sizeof(timebuf), "%Y-%m-%dT%H:%M:%S", &local_tm);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  static const bool use_color = isatty(fileno(stderr)) != 0;
  if (use_color) {
    std::fprintf(stderr, "[%s] %s%-5s\033[0m [%s] %s\n", timebuf,
                 level_color(level), log_level_name(level), tag ? tag : "-",
                 message);
  } else {
    std::fprintf(stderr, "[%s] %-5s [%s] %s\n", timebuf, log_level_name(level),
                 tag ? tag : "-", message);
  }
  std::fflush(stderr);
}

} // namespace wifi_ranger
