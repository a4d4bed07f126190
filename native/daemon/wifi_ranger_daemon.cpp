/*
 * wifi_ranger_daemon.cpp — WiFi device discovery and distance daemon
 *
 * Usage:
 *   wifi_ranger_daemon [--config=FILE] [--backend=airport|wpa_cli|file]
 *                      [--interface=IF] [--scan-file=FILE] [--output-dir=DIR]
 *                      [--manuf=FILE] [--no-arp] [--<option>=<value>...]
 *
 * Publishes devices.json, settings.json and status.json to the output
 * directory once per second.
 *   SIGHUP         reload --config (an invalid file keeps the current config)
 *   SIGINT/SIGTERM graceful stop
 */

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

#include "common/atomic_file.h"
#include "common/log.h"
#include "daemon/daemon_options.h"
#include "device_registry/device_registry.h"
#include "device_view/device_view.h"
#include "host_hints/host_hints.h"
#include "identity_resolver/identity_resolver.h"
#include "identity_resolver/oui_table.h"
#include "monitor_config/monitor_config.h"
#include "scan_scheduler/scan_scheduler.h"
#include "scan_source/scan_source.h"

using namespace wifi_ranger;

static const char *TAG = "DAEMON";

static constexpr char DEFAULT_ARP_PATH[] = "/proc/net/arp";

static volatile std::sig_atomic_t g_stop = 0;
static volatile std::sig_atomic_t g_reload = 0;

static void on_stop_signal(int) { g_stop = 1; }
static void on_reload_signal(int) { g_reload = 1; }

// =========================================================================
// COMMAND LINE
// =========================================================================

static void print_usage(const char *prog) {
  std::fprintf(stderr,
               "usage: %s [--config=FILE] [--backend=airport|wpa_cli|file]\n"
               "          [--interface=IF] [--scan-file=FILE] "
               "[--output-dir=DIR]\n"
               "          [--manuf=FILE] [--no-arp] [--<option>=<value>...]\n",
               prog);
}

// =========================================================================
// PUBLISH
// =========================================================================

// A failed write is retried on the next tick.
static void publish(const std::string &dir, const char *name,
                    const std::string &json) {
  const std::string path = dir + "/" + name;
  if (!write_file_atomic(path, json))
    WR_LOG_WARN(TAG, "cannot write %s: %s", path.c_str(),
                std::strerror(errno));
}

static void publish_all(const DaemonOptions &opts, const DeviceRegistry &registry,
                        const ConfigStore &config,
                        const ScanScheduler &scheduler) {
  const MonitorConfig cfg = config.get();
  const auto devices = registry.snapshot();
  publish(opts.output_dir, "devices.json",
          render_devices_json(devices, cfg.distance_threshold_m));
  publish(opts.output_dir, "settings.json", render_settings_json(cfg));
  publish(opts.output_dir, "status.json",
          render_status_json(scheduler.stats(), scheduler.last_report(),
                             registry.stats(), devices.size(), Clock::now()));
}

// =========================================================================
// MAIN
// =========================================================================

int main(int argc, char **argv) {
  DaemonOptions opts;
  std::string reason;
  ArgsStatus ast = parse_daemon_args(argc, argv, &opts, &reason);
  if (ast != ArgsStatus::OK) {
    if (ast == ArgsStatus::BAD_ARGUMENT)
      std::fprintf(stderr, "%s\n", reason.c_str());
    print_usage(argv[0]);
    return ast == ArgsStatus::HELP ? 0 : 2;
  }

  MonitorConfig initial;
  ConfigStatus cst = build_config(opts, &initial, &reason);
  if (cst != ConfigStatus::OK) {
    WR_LOG_ERROR(TAG, "invalid configuration (%s): %s",
                 config_status_name(cst), reason.c_str());
    return 2;
  }
  set_log_level(initial.log_level);
  ConfigStore config(initial);

  std::unique_ptr<ScanSource> source = make_scan_source(
      opts.backend, opts.interface, opts.scan_file,
      std::chrono::seconds(initial.scan_timeout_seconds), &reason);
  if (!source) {
    WR_LOG_ERROR(TAG, "cannot create scan source: %s", reason.c_str());
    return 2;
  }
  if (!source->verify(&reason))
    WR_LOG_WARN(TAG, "%s; cycles will fail until it is available",
                reason.c_str());
  if (opts.backend != ScanBackend::CAPTURE_FILE && geteuid() != 0)
    WR_LOG_WARN(TAG, "not running as root; scan results may be incomplete");

  OuiTable oui;
  if (!opts.manuf_path.empty()) {
    size_t added = 0;
    if (!oui.load_manuf_file(opts.manuf_path, &added, &reason))
      WR_LOG_WARN(TAG, "manufacturer file ignored: %s", reason.c_str());
  }

  HintCache hints;
  std::unique_ptr<ArpHintCollector> collector;
  if (opts.arp_hints) {
    collector.reset(
        new ArpHintCollector(hints, DEFAULT_ARP_PATH, reverse_dns_lookup));
    if (!collector->start())
      WR_LOG_WARN(TAG, "hint collector already running");
  }

  IdentityResolver resolver(
      [&oui](const std::string &prefix) { return oui.lookup(prefix); },
      &hints);
  DeviceRegistry registry;
  ScanScheduler scheduler(*source, registry, resolver, config);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_stop_signal;
  if (sigaction(SIGINT, &sa, nullptr) != 0 ||
      sigaction(SIGTERM, &sa, nullptr) != 0) {
    WR_LOG_ERROR(TAG, "cannot install stop handlers: %s",
                 std::strerror(errno));
    return 1;
  }
  sa.sa_handler = on_reload_signal;
  if (sigaction(SIGHUP, &sa, nullptr) != 0)
    WR_LOG_WARN(TAG, "SIGHUP reload unavailable: %s", std::strerror(errno));

  WR_LOG_INFO(TAG, "starting: backend=%s source='%s' output=%s",
              scan_backend_name(opts.backend), source->name().c_str(),
              opts.output_dir.c_str());
  if (!scheduler.start()) {
    WR_LOG_ERROR(TAG, "scheduler failed to start");
    return 1;
  }

  while (!g_stop) {
    if (g_reload) {
      g_reload = 0;
      MonitorConfig reloaded;
      cst = build_config(opts, &reloaded, &reason);
      if (cst == ConfigStatus::OK)
        cst = config.update(reloaded, &reason);
      if (cst != ConfigStatus::OK)
        WR_LOG_WARN(TAG, "reload rejected (%s): %s; keeping current config",
                    config_status_name(cst), reason.c_str());
    }
    publish_all(opts, registry, config, scheduler);
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }

  WR_LOG_INFO(TAG, "shutting down");
  scheduler.stop();
  if (collector)
    collector->stop();
  publish_all(opts, registry, config, scheduler);
  return 0;
}
