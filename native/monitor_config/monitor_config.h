/*
 * monitor_config.h — Monitor configuration, validation and store
 *
 * Options (default, accepted range):
 *   scan_interval_seconds        2      [1, 60]
 *   staleness_threshold_seconds  60     [5, 3600], > scan interval
 *   reference_power_dbm          -50    [-100, 0]
 *   path_loss_exponent           3.0    [1.0, 6.0]
 *   rssi_history_capacity        5      [1, 100]
 *   reap_interval_seconds        10     [1, 3600]
 *   distance_threshold_m         30     [1, 100]
 *   scan_timeout_seconds         5      [1, 60]
 *   log_level                    info   debug|info|warn|error
 *
 * Invalid values are rejected at the boundary; the prior valid configuration
 * stays in effect.
 */

#ifndef WIFI_RANGER_MONITOR_CONFIG_H
#define WIFI_RANGER_MONITOR_CONFIG_H

#include <mutex>
#include <string>

#include "common/log.h"

namespace wifi_ranger {

enum class ConfigStatus {
  OK,
  UNKNOWN_OPTION,
  BAD_VALUE,
  OUT_OF_RANGE,
  INCONSISTENT,
  FILE_ERROR,
};

const char *config_status_name(ConfigStatus s);

struct MonitorConfig {
  int scan_interval_seconds = 2;
  int staleness_threshold_seconds = 60;
  double reference_power_dbm = -50.0;
  double path_loss_exponent = 3.0;
  int rssi_history_capacity = 5;
  int reap_interval_seconds = 10;
  double distance_threshold_m = 30.0;
  int scan_timeout_seconds = 5;
  LogLevel log_level = LogLevel::INFO;
};

bool operator==(const MonitorConfig &a, const MonitorConfig &b);
bool operator!=(const MonitorConfig &a, const MonitorConfig &b);

// Check every range and cross-field constraint.
ConfigStatus validate_config(const MonitorConfig &config, std::string *reason);

// Parse one textual option into *config (no cross-field validation).
// Leaves *config untouched on failure.
ConfigStatus apply_option(MonitorConfig *config, const std::string &key,
                          const std::string &value, std::string *reason);

// Read a flat JSON object of options, e.g.
//   { "scan_interval_seconds": 3, "log_level": "debug" }
// Keys not listed above are skipped with a warning. The result is validated;
// *config is only replaced when the whole file is valid.
ConfigStatus load_config_file(const std::string &path, MonitorConfig *config,
                             std::string *reason);

// Same, from text already in memory.
ConfigStatus parse_config_json(const std::string &text, MonitorConfig *config,
                               std::string *reason);

// =========================================================================
// CONFIG STORE
// =========================================================================

// Holder of the live configuration. Read by the scheduler every cycle and
// updated from the settings surface or on reload.
class ConfigStore {
public:
  ConfigStore();
  explicit ConfigStore(const MonitorConfig &initial);

  MonitorConfig get() const;

  // Validate and swap in. On failure nothing changes and *reason says why.
  ConfigStatus update(const MonitorConfig &proposed, std::string *reason);

  // Apply one textual option on top of the current config, then update().
  ConfigStatus update_option(const std::string &key, const std::string &value,
                             std::string *reason);

  unsigned long generation() const;

private:
  mutable std::mutex mutex_;
  MonitorConfig config_;
  unsigned long generation_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_MONITOR_CONFIG_H
