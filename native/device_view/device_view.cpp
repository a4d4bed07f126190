/*
 * device_view.cpp — JSON views of registry, settings and scheduler status
 */

#include "device_view/device_view.h"

#include <cstdio>
#include <ctime>

#include "distance_estimator/distance_estimator.h"

namespace wifi_ranger {

// =========================================================================
// HELPERS
// =========================================================================

std::string json_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

static std::string json_string_or_null(const std::string &s) {
  if (s.empty())
    return "null";
  return "\"" + json_escape(s) + "\"";
}

std::string format_iso8601_utc(TimePoint t) {
  std::time_t secs = Clock::to_time_t(t);
  std::tm tm_utc;
  if (!gmtime_r(&secs, &tm_utc))
    return "1970-01-01T00:00:00Z";
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buf;
}

// =========================================================================
// DEVICES
// =========================================================================

std::string render_devices_json(const std::map<std::string, DeviceState> &devices,
                                double distance_threshold_m) {
  std::string out = "{\n  \"devices\": {";
  bool first = true;
  char num[64];

  for (const auto &kv : devices) {
    const DeviceState &d = kv.second;
    if (d.distance_m > distance_threshold_m)
      continue;

    out += first ? "\n" : ",\n";
    first = false;

    out += "    \"" + json_escape(d.mac_address) + "\": {\n";
    out += "      \"mac_address\": \"" + json_escape(d.mac_address) + "\",\n";
    std::snprintf(num, sizeof(num), "%.2f", round_distance(d.distance_m));
    out += std::string("      \"distance\": ") + num + ",\n";
    out += "      \"device_type\": " +
           json_string_or_null(d.identity.device_type) + ",\n";
    out += "      \"manufacturer\": " +
           json_string_or_null(d.identity.manufacturer) + ",\n";
    out += "      \"hostname\": " + json_string_or_null(d.identity.hostname) +
           ",\n";
    out += "      \"ip_address\": " +
           json_string_or_null(d.identity.ip_address) + ",\n";
    out += "      \"ssid\": " + json_string_or_null(d.ssid) + ",\n";
    if (d.rssi_history.empty())
      out += "      \"rssi\": null,\n";
    else
      out += "      \"rssi\": " + std::to_string(d.rssi_history.back()) + ",\n";
    out += "      \"last_seen\": \"" + format_iso8601_utc(d.last_seen) + "\"\n";
    out += "    }";
  }

  out += first ? "}\n}\n" : "\n  }\n}\n";
  return out;
}

// =========================================================================
// SETTINGS / STATUS
// =========================================================================

std::string render_settings_json(const MonitorConfig &config) {
  char buf[1024];
  std::snprintf(buf, sizeof(buf),
                "{\n"
                "  \"scan_interval_seconds\": %d,\n"
                "  \"staleness_threshold_seconds\": %d,\n"
                "  \"reference_power_dbm\": %.17g,\n"
                "  \"path_loss_exponent\": %.17g,\n"
                "  \"rssi_history_capacity\": %d,\n"
                "  \"reap_interval_seconds\": %d,\n"
                "  \"distance_threshold_m\": %.17g,\n"
                "  \"scan_timeout_seconds\": %d,\n"
                "  \"log_level\": \"%s\"\n"
                "}\n",
                config.scan_interval_seconds,
                config.staleness_threshold_seconds, config.reference_power_dbm,
                config.path_loss_exponent, config.rssi_history_capacity,
                config.reap_interval_seconds, config.distance_threshold_m,
                config.scan_timeout_seconds,
                log_level_option_name(config.log_level));
  return buf;
}

std::string render_status_json(const SchedulerStats &sched,
                               const CycleReport &last_cycle,
                               const RegistryStats &registry,
                               size_t device_count, TimePoint now) {
  char buf[1024];
  std::snprintf(buf, sizeof(buf),
                "{\n"
                "  \"generated_at\": \"%s\",\n"
                "  \"devices\": %zu,\n"
                "  \"cycles\": %lu,\n"
                "  \"cycles_ok\": %lu,\n"
                "  \"cycles_failed\": %lu,\n"
                "  \"records\": %lu,\n"
                "  \"rejected_lines\": %lu,\n"
                "  \"devices_created\": %lu,\n"
                "  \"devices_evicted\": %lu,\n",
                format_iso8601_utc(now).c_str(), device_count, sched.cycles,
                sched.cycles_ok, sched.cycles_failed, sched.records,
                sched.rejected_lines, registry.created, registry.evicted);

  std::string out = buf;
  out += "  \"last_cycle\": {\n";
  out += std::string("    \"status\": \"") +
         cycle_status_name(last_cycle.status) + "\",\n";
  out += "    \"records\": " + std::to_string(last_cycle.records) + ",\n";
  out += "    \"rejected_lines\": " +
         std::to_string(last_cycle.rejected_lines) + ",\n";
  out += "    \"reason\": " + json_string_or_null(last_cycle.reason) + "\n";
  out += "  }\n}\n";
  return out;
}

} // namespace wifi_ranger
