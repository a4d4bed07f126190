/*
 * monitor_config.cpp — Monitor configuration, validation and store
 */

#include "monitor_config/monitor_config.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "common/atomic_file.h"

namespace wifi_ranger {

static const char *TAG = "CONFIG";

// =========================================================================
// RANGES
// =========================================================================

static constexpr int SCAN_INTERVAL_MIN = 1;
static constexpr int SCAN_INTERVAL_MAX = 60;
static constexpr int STALENESS_MIN = 5;
static constexpr int STALENESS_MAX = 3600;
static constexpr double REFERENCE_POWER_MIN = -100.0;
static constexpr double REFERENCE_POWER_MAX = 0.0;
static constexpr double PATH_LOSS_MIN = 1.0;
static constexpr double PATH_LOSS_MAX = 6.0;
static constexpr int HISTORY_CAPACITY_MIN = 1;
static constexpr int HISTORY_CAPACITY_MAX = 100;
static constexpr int REAP_INTERVAL_MIN = 1;
static constexpr int REAP_INTERVAL_MAX = 3600;
static constexpr double DISTANCE_THRESHOLD_MIN = 1.0;
static constexpr double DISTANCE_THRESHOLD_MAX = 100.0;
static constexpr int SCAN_TIMEOUT_MIN = 1;
static constexpr int SCAN_TIMEOUT_MAX = 60;

const char *config_status_name(ConfigStatus s) {
  switch (s) {
  case ConfigStatus::OK:
    return "OK";
  case ConfigStatus::UNKNOWN_OPTION:
    return "UNKNOWN_OPTION";
  case ConfigStatus::BAD_VALUE:
    return "BAD_VALUE";
  case ConfigStatus::OUT_OF_RANGE:
    return "OUT_OF_RANGE";
  case ConfigStatus::INCONSISTENT:
    return "INCONSISTENT";
  case ConfigStatus::FILE_ERROR:
    return "FILE_ERROR";
  default:
    return "UNKNOWN";
  }
}

bool operator==(const MonitorConfig &a, const MonitorConfig &b) {
  return a.scan_interval_seconds == b.scan_interval_seconds &&
         a.staleness_threshold_seconds == b.staleness_threshold_seconds &&
         a.reference_power_dbm == b.reference_power_dbm &&
         a.path_loss_exponent == b.path_loss_exponent &&
         a.rssi_history_capacity == b.rssi_history_capacity &&
         a.reap_interval_seconds == b.reap_interval_seconds &&
         a.distance_threshold_m == b.distance_threshold_m &&
         a.scan_timeout_seconds == b.scan_timeout_seconds &&
         a.log_level == b.log_level;
}

bool operator!=(const MonitorConfig &a, const MonitorConfig &b) {
  return !(a == b);
}

static void set_reason(std::string *reason, const char *fmt, const char *key,
                       double lo, double hi) {
  if (!reason)
    return;
  char buf[256];
  std::snprintf(buf, sizeof(buf), fmt, key, lo, hi);
  *reason = buf;
}

static bool int_in_range(int v, int lo, int hi) { return v >= lo && v <= hi; }

static bool double_in_range(double v, double lo, double hi) {
  return std::isfinite(v) && v >= lo && v <= hi;
}

// =========================================================================
// VALIDATION
// =========================================================================

ConfigStatus validate_config(const MonitorConfig &c, std::string *reason) {
  static const char *RANGE_FMT = "%s must be within [%g, %g]";

  if (!int_in_range(c.scan_interval_seconds, SCAN_INTERVAL_MIN,
                    SCAN_INTERVAL_MAX)) {
    set_reason(reason, RANGE_FMT, "scan_interval_seconds", SCAN_INTERVAL_MIN,
               SCAN_INTERVAL_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!int_in_range(c.staleness_threshold_seconds, STALENESS_MIN,
                    STALENESS_MAX)) {
    set_reason(reason, RANGE_FMT, "staleness_threshold_seconds", STALENESS_MIN,
               STALENESS_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!double_in_range(c.reference_power_dbm, REFERENCE_POWER_MIN,
                       REFERENCE_POWER_MAX)) {
    set_reason(reason, RANGE_FMT, "reference_power_dbm", REFERENCE_POWER_MIN,
               REFERENCE_POWER_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!double_in_range(c.path_loss_exponent, PATH_LOSS_MIN, PATH_LOSS_MAX)) {
    set_reason(reason, RANGE_FMT, "path_loss_exponent", PATH_LOSS_MIN,
               PATH_LOSS_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!int_in_range(c.rssi_history_capacity, HISTORY_CAPACITY_MIN,
                    HISTORY_CAPACITY_MAX)) {
    set_reason(reason, RANGE_FMT, "rssi_history_capacity",
               HISTORY_CAPACITY_MIN, HISTORY_CAPACITY_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!int_in_range(c.reap_interval_seconds, REAP_INTERVAL_MIN,
                    REAP_INTERVAL_MAX)) {
    set_reason(reason, RANGE_FMT, "reap_interval_seconds", REAP_INTERVAL_MIN,
               REAP_INTERVAL_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!double_in_range(c.distance_threshold_m, DISTANCE_THRESHOLD_MIN,
                       DISTANCE_THRESHOLD_MAX)) {
    set_reason(reason, RANGE_FMT, "distance_threshold_m",
               DISTANCE_THRESHOLD_MIN, DISTANCE_THRESHOLD_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }
  if (!int_in_range(c.scan_timeout_seconds, SCAN_TIMEOUT_MIN,
                    SCAN_TIMEOUT_MAX)) {
    set_reason(reason, RANGE_FMT, "scan_timeout_seconds", SCAN_TIMEOUT_MIN,
               SCAN_TIMEOUT_MAX);
    return ConfigStatus::OUT_OF_RANGE;
  }

  // A single missed cycle must never evict a live device.
  if (c.staleness_threshold_seconds <= c.scan_interval_seconds) {
    if (reason)
      *reason = "staleness_threshold_seconds must exceed scan_interval_seconds";
    return ConfigStatus::INCONSISTENT;
  }

  if (reason)
    reason->clear();
  return ConfigStatus::OK;
}

// =========================================================================
// OPTION PARSING
// =========================================================================

static bool parse_int_strict(const std::string &text, int *out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  if (v < -1000000 || v > 1000000)
    return false;
  *out = static_cast<int>(v);
  return true;
}

static bool parse_double_strict(const std::string &text, double *out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(v))
    return false;
  *out = v;
  return true;
}

ConfigStatus apply_option(MonitorConfig *config, const std::string &key,
                          const std::string &value, std::string *reason) {
  MonitorConfig next = *config;
  bool parsed = false;

  if (key == "scan_interval_seconds") {
    parsed = parse_int_strict(value, &next.scan_interval_seconds);
  } else if (key == "staleness_threshold_seconds") {
    parsed = parse_int_strict(value, &next.staleness_threshold_seconds);
  } else if (key == "reference_power_dbm") {
    parsed = parse_double_strict(value, &next.reference_power_dbm);
  } else if (key == "path_loss_exponent") {
    parsed = parse_double_strict(value, &next.path_loss_exponent);
  } else if (key == "rssi_history_capacity") {
    parsed = parse_int_strict(value, &next.rssi_history_capacity);
  } else if (key == "reap_interval_seconds") {
    parsed = parse_int_strict(value, &next.reap_interval_seconds);
  } else if (key == "distance_threshold_m") {
    parsed = parse_double_strict(value, &next.distance_threshold_m);
  } else if (key == "scan_timeout_seconds") {
    parsed = parse_int_strict(value, &next.scan_timeout_seconds);
  } else if (key == "log_level") {
    parsed = parse_log_level(value.c_str(), &next.log_level);
  } else {
    if (reason)
      *reason = "unknown option: " + key;
    return ConfigStatus::UNKNOWN_OPTION;
  }

  if (!parsed) {
    if (reason)
      *reason = "bad value for " + key + ": '" + value + "'";
    return ConfigStatus::BAD_VALUE;
  }

  *config = next;
  return ConfigStatus::OK;
}

// =========================================================================
// FLAT JSON CONFIG FILE
// =========================================================================

namespace {

class FlatJsonReader {
public:
  explicit FlatJsonReader(const std::string &text) : text_(text), pos_(0) {}

  void skip_ws() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_])))
      ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool peek(char c) {
    skip_ws();
    return pos_ < text_.size() && text_[pos_] == c;
  }

  bool at_end() {
    skip_ws();
    return pos_ >= text_.size();
  }

  bool read_string(std::string *out) {
    if (!consume('"'))
      return false;
    std::string s;
    while (pos_ < text_.size() && text_[pos_] != '"') {
      char c = text_[pos_++];
      if (c == '\\') {
        if (pos_ >= text_.size())
          return false;
        char esc = text_[pos_++];
        switch (esc) {
        case 'n':
          s += '\n';
          break;
        case 't':
          s += '\t';
          break;
        default:
          s += esc;
          break;
        }
      } else {
        s += c;
      }
    }
    if (pos_ >= text_.size())
      return false;
    ++pos_; // closing quote
    *out = s;
    return true;
  }

  // Scalar value: string, number, true/false. Returned as text.
  bool read_scalar(std::string *out) {
    skip_ws();
    if (peek('"'))
      return read_string(out);
    size_t start = pos_;
    while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}' &&
           !std::isspace(static_cast<unsigned char>(text_[pos_])))
      ++pos_;
    if (pos_ == start)
      return false;
    *out = text_.substr(start, pos_ - start);
    return true;
  }

  size_t position() const { return pos_; }

private:
  const std::string &text_;
  size_t pos_;
};

} // namespace

ConfigStatus parse_config_json(const std::string &text, MonitorConfig *config,
                               std::string *reason) {
  MonitorConfig next = *config;
  FlatJsonReader reader(text);

  if (!reader.consume('{')) {
    if (reason)
      *reason = "config must be a JSON object";
    return ConfigStatus::BAD_VALUE;
  }

  if (!reader.consume('}')) {
    while (true) {
      std::string key;
      std::string value;
      if (!reader.read_string(&key) || !reader.consume(':') ||
          !reader.read_scalar(&value)) {
        if (reason) {
          char buf[96];
          std::snprintf(buf, sizeof(buf), "malformed config near offset %zu",
                        reader.position());
          *reason = buf;
        }
        return ConfigStatus::BAD_VALUE;
      }

      ConfigStatus s = apply_option(&next, key, value, reason);
      if (s == ConfigStatus::UNKNOWN_OPTION) {
        WR_LOG_WARN(TAG, "ignoring unknown config key '%s'", key.c_str());
      } else if (s != ConfigStatus::OK) {
        return s;
      }

      if (reader.consume(','))
        continue;
      if (reader.consume('}'))
        break;
      if (reason)
        *reason = "expected ',' or '}' in config object";
      return ConfigStatus::BAD_VALUE;
    }
  }

  if (!reader.at_end()) {
    if (reason)
      *reason = "trailing data after config object";
    return ConfigStatus::BAD_VALUE;
  }

  ConfigStatus s = validate_config(next, reason);
  if (s != ConfigStatus::OK)
    return s;

  *config = next;
  return ConfigStatus::OK;
}

ConfigStatus load_config_file(const std::string &path, MonitorConfig *config,
                              std::string *reason) {
  std::string text;
  if (!read_file(path, &text)) {
    if (reason)
      *reason = "cannot read " + path;
    return ConfigStatus::FILE_ERROR;
  }
  return parse_config_json(text, config, reason);
}

// =========================================================================
// CONFIG STORE
// =========================================================================

ConfigStore::ConfigStore() : generation_(0) {}

ConfigStore::ConfigStore(const MonitorConfig &initial)
    : config_(initial), generation_(0) {}

MonitorConfig ConfigStore::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

ConfigStatus ConfigStore::update(const MonitorConfig &proposed,
                                 std::string *reason) {
  std::string why;
  ConfigStatus s = validate_config(proposed, &why);
  if (s != ConfigStatus::OK) {
    WR_LOG_WARN(TAG, "rejected config update (%s): %s", config_status_name(s),
                why.c_str());
    if (reason)
      *reason = why;
    return s;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (proposed == config_)
      return ConfigStatus::OK;
    config_ = proposed;
    ++generation_;
  }

  set_log_level(proposed.log_level);
  WR_LOG_INFO(TAG,
              "settings updated: interval=%ds staleness=%ds ref=%.1fdBm "
              "n=%.2f history=%d threshold=%.1fm",
              proposed.scan_interval_seconds,
              proposed.staleness_threshold_seconds,
              proposed.reference_power_dbm, proposed.path_loss_exponent,
              proposed.rssi_history_capacity, proposed.distance_threshold_m);
  if (reason)
    reason->clear();
  return ConfigStatus::OK;
}

ConfigStatus ConfigStore::update_option(const std::string &key,
                                        const std::string &value,
                                        std::string *reason) {
  MonitorConfig next = get();
  ConfigStatus s = apply_option(&next, key, value, reason);
  if (s != ConfigStatus::OK)
    return s;
  return update(next, reason);
}

unsigned long ConfigStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

} // namespace wifi_ranger
