/*
 * test_daemon.cpp — Tests for daemon argument parsing and config assembly
 */

#include <cmath>
#include <cstdio>
#include <string>

#include <unistd.h>

#include "common/atomic_file.h"
#include "daemon/daemon_options.h"

using namespace wifi_ranger;

// =========================================================================
// TESTS
// =========================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define ASSERT_TRUE(expr, msg)                                                 \
  do {                                                                         \
    if (!(expr)) {                                                             \
      printf("FAIL: %s\n", msg);                                               \
      tests_failed++;                                                          \
    } else {                                                                   \
      printf("PASS: %s\n", msg);                                               \
      tests_passed++;                                                          \
    }                                                                          \
  } while (0)

#define ASSERT_FALSE(expr, msg) ASSERT_TRUE(!(expr), msg)
#define ASSERT_EQ(a, b, msg) ASSERT_TRUE((a) == (b), msg)
#define ASSERT_NEAR(a, b, eps, msg) ASSERT_TRUE(std::fabs((a) - (b)) <= (eps), msg)

static void test_defaults_without_arguments() {
  const char *argv[] = {"wifi_ranger_daemon"};
  DaemonOptions opts;
  std::string err;
  ASSERT_TRUE(parse_daemon_args(1, argv, &opts, &err) == ArgsStatus::OK,
              "No arguments is valid");
  ASSERT_TRUE(opts.backend == default_scan_backend(), "Platform backend");
  ASSERT_EQ(opts.output_dir, std::string("."), "Output to cwd");
  ASSERT_TRUE(opts.arp_hints, "ARP hints on by default");
  ASSERT_TRUE(opts.config_path.empty(), "No config file");
  ASSERT_TRUE(opts.overrides.empty(), "No overrides");
}

static void test_all_flags() {
  const char *argv[] = {"wifi_ranger_daemon",   "--backend=FILE",
                        "--scan-file=/tmp/cap", "--interface=wlan1",
                        "--output-dir=/run/wr", "--manuf=/usr/share/manuf",
                        "--no-arp",             "--config=/etc/wr.json",
                        "--path_loss_exponent=2.5"};
  DaemonOptions opts;
  std::string err;
  ASSERT_TRUE(parse_daemon_args(9, argv, &opts, &err) == ArgsStatus::OK,
              "Full command line parses");
  ASSERT_TRUE(opts.backend == ScanBackend::CAPTURE_FILE,
              "Backend name is case-insensitive");
  ASSERT_EQ(opts.scan_file, std::string("/tmp/cap"), "Scan file");
  ASSERT_EQ(opts.interface, std::string("wlan1"), "Interface");
  ASSERT_EQ(opts.output_dir, std::string("/run/wr"), "Output dir");
  ASSERT_EQ(opts.manuf_path, std::string("/usr/share/manuf"), "Manuf path");
  ASSERT_FALSE(opts.arp_hints, "--no-arp");
  ASSERT_EQ(opts.config_path, std::string("/etc/wr.json"), "Config path");
  ASSERT_EQ(opts.overrides.size(), (size_t)1, "One override");
  if (opts.overrides.size() == 1) {
    ASSERT_EQ(opts.overrides[0].first, std::string("path_loss_exponent"),
              "Override key");
    ASSERT_EQ(opts.overrides[0].second, std::string("2.5"), "Override value");
  }
}

static void test_bad_arguments() {
  DaemonOptions opts;
  std::string err;

  const char *positional[] = {"wifi_ranger_daemon", "scan"};
  ASSERT_TRUE(parse_daemon_args(2, positional, &opts, &err) ==
                  ArgsStatus::BAD_ARGUMENT,
              "Positional argument rejected");

  const char *no_value[] = {"wifi_ranger_daemon", "--config"};
  ASSERT_TRUE(parse_daemon_args(2, no_value, &opts, &err) ==
                  ArgsStatus::BAD_ARGUMENT,
              "Flag without value rejected");

  const char *empty_key[] = {"wifi_ranger_daemon", "--=3"};
  ASSERT_TRUE(parse_daemon_args(2, empty_key, &opts, &err) ==
                  ArgsStatus::BAD_ARGUMENT,
              "Empty key rejected");

  const char *backend[] = {"wifi_ranger_daemon", "--backend=zigbee"};
  err.clear();
  ASSERT_TRUE(parse_daemon_args(2, backend, &opts, &err) ==
                  ArgsStatus::BAD_ARGUMENT,
              "Unknown backend rejected");
  ASSERT_EQ(err, std::string("unknown backend: zigbee"), "Backend reason");

  const char *help[] = {"wifi_ranger_daemon", "--backend=file", "-h"};
  ASSERT_TRUE(parse_daemon_args(3, help, &opts, &err) == ArgsStatus::HELP,
              "Help requested");
}

static bool write_temp_config(char *path, const std::string &json) {
  int fd = mkstemp(path);
  if (fd < 0)
    return false;
  close(fd);
  return write_file_atomic(path, json);
}

static void test_overrides_take_precedence_over_file() {
  char path[] = "/tmp/wifi_ranger_cfg_XXXXXX";
  ASSERT_TRUE(write_temp_config(path, "{ \"path_loss_exponent\": 4.0,\n"
                                      "  \"scan_interval_seconds\": 5 }\n"),
              "Config file written");

  DaemonOptions opts;
  std::string err;
  std::string flag = std::string("--config=") + path;
  const char *argv[] = {"wifi_ranger_daemon", flag.c_str(),
                        "--path_loss_exponent=2.5"};
  ASSERT_TRUE(parse_daemon_args(3, argv, &opts, &err) == ArgsStatus::OK,
              "Arguments parse");

  MonitorConfig cfg;
  std::string why;
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::OK,
              "Config builds");
  ASSERT_NEAR(cfg.path_loss_exponent, 2.5, 1e-12,
              "Command line beats config file");
  ASSERT_EQ(cfg.scan_interval_seconds, 5, "File value kept when not overridden");
  ASSERT_EQ(cfg.rssi_history_capacity, 5, "Default kept when set nowhere");

  // The override makes the merged config inconsistent with the file's interval.
  opts.overrides.emplace_back("staleness_threshold_seconds", "5");
  MonitorConfig untouched = cfg;
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::INCONSISTENT,
              "Merged config validated as a whole");
  ASSERT_TRUE(cfg == untouched, "Output untouched on failure");

  std::remove(path);
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::FILE_ERROR,
              "Missing config file reported");
}

static void test_override_errors() {
  DaemonOptions opts;
  std::string err;
  const char *argv[] = {"wifi_ranger_daemon"};
  ASSERT_TRUE(parse_daemon_args(1, argv, &opts, &err) == ArgsStatus::OK,
              "Arguments parse");

  MonitorConfig cfg;
  std::string why;
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::OK,
              "Defaults alone are valid");

  opts.overrides.emplace_back("scan_interval", "3");
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::UNKNOWN_OPTION,
              "Unknown override key rejected");

  opts.overrides.clear();
  opts.overrides.emplace_back("path_loss_exponent", "steep");
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::BAD_VALUE,
              "Unparseable override rejected");

  opts.overrides.clear();
  opts.overrides.emplace_back("path_loss_exponent", "9");
  ASSERT_TRUE(build_config(opts, &cfg, &why) == ConfigStatus::OUT_OF_RANGE,
              "Out-of-range override rejected");
}

extern "C" bool test_daemon() {
  tests_passed = 0;
  tests_failed = 0;

  test_defaults_without_arguments();
  test_all_flags();
  test_bad_arguments();
  test_overrides_take_precedence_over_file();
  test_override_errors();

  printf("  daemon: %d passed, %d failed\n", tests_passed, tests_failed);
  return tests_failed == 0;
}
