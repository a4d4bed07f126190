/*
 * daemon_options.cpp — Command line and configuration assembly for the daemon
 */

#include "daemon/daemon_options.h"

#include <cstring>

namespace wifi_ranger {

ScanBackend default_scan_backend() {
#if defined(__APPLE__)
  return ScanBackend::AIRPORT;
#else
  return ScanBackend::WPA_CLI;
#endif
}

ArgsStatus parse_daemon_args(int argc, const char *const *argv,
                             DaemonOptions *opts, std::string *error) {
  opts->config_path.clear();
  opts->backend = default_scan_backend();
  opts->interface.clear();
  opts->scan_file.clear();
  opts->output_dir = ".";
  opts->manuf_path.clear();
  opts->arp_hints = true;
  opts->overrides.clear();

  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
      return ArgsStatus::HELP;
    if (std::strcmp(arg, "--no-arp") == 0) {
      opts->arp_hints = false;
      continue;
    }
    const char *eq = std::strchr(arg, '=');
    if (std::strncmp(arg, "--", 2) != 0 || !eq || eq == arg + 2) {
      *error = std::string("unrecognized argument: ") + arg;
      return ArgsStatus::BAD_ARGUMENT;
    }

    std::string key(arg + 2, eq);
    std::string value(eq + 1);

    if (key == "config") {
      opts->config_path = value;
    } else if (key == "backend") {
      if (!parse_scan_backend(value, &opts->backend)) {
        *error = "unknown backend: " + value;
        return ArgsStatus::BAD_ARGUMENT;
      }
    } else if (key == "interface") {
      opts->interface = value;
    } else if (key == "scan-file") {
      opts->scan_file = value;
    } else if (key == "output-dir") {
      opts->output_dir = value;
    } else if (key == "manuf") {
      opts->manuf_path = value;
    } else {
      opts->overrides.emplace_back(key, value);
    }
  }
  return ArgsStatus::OK;
}

ConfigStatus build_config(const DaemonOptions &opts, MonitorConfig *out,
                          std::string *reason) {
  MonitorConfig cfg;
  if (!opts.config_path.empty()) {
    ConfigStatus st = load_config_file(opts.config_path, &cfg, reason);
    if (st != ConfigStatus::OK)
      return st;
  }
  for (const auto &kv : opts.overrides) {
    ConfigStatus st = apply_option(&cfg, kv.first, kv.second, reason);
    if (st != ConfigStatus::OK)
      return st;
  }
  ConfigStatus st = validate_config(cfg, reason);
  if (st != ConfigStatus::OK)
    return st;
  *out = cfg;
  return ConfigStatus::OK;
}

} // namespace wifi_ranger
