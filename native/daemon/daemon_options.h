/*
 * daemon_options.h — Command line and configuration assembly for the daemon
 *
 * Precedence, lowest first: built-in defaults, --config file, --key=value
 * overrides. The merged result is validated as a whole.
 */

#ifndef WIFI_RANGER_DAEMON_OPTIONS_H
#define WIFI_RANGER_DAEMON_OPTIONS_H

#include <string>
#include <utility>
#include <vector>

#include "monitor_config/monitor_config.h"
#include "scan_source/scan_source.h"

namespace wifi_ranger {

struct DaemonOptions {
  std::string config_path;
  ScanBackend backend;
  std::string interface;
  std::string scan_file;
  std::string output_dir;
  std::string manuf_path;
  bool arp_hints;
  std::vector<std::pair<std::string, std::string>> overrides;
};

enum class ArgsStatus {
  OK,
  HELP,
  BAD_ARGUMENT,
};

// airport on macOS, wpa_cli elsewhere
ScanBackend default_scan_backend();

// Parse argv[1..argc). Unrecognized --key=value pairs become monitor option
// overrides; they are checked by build_config(), not here.
ArgsStatus parse_daemon_args(int argc, const char *const *argv,
                             DaemonOptions *opts, std::string *error);

ConfigStatus build_config(const DaemonOptions &opts, MonitorConfig *out,
                          std::string *reason);

} // namespace wifi_ranger

#endif // WIFI_RANGER_DAEMON_OPTIONS_H
