/**
 * run_cpp_tests.cpp — Unified C++ Self-Test Harness
 *
 * Each module directory carries a test_<module>.cpp that exports a
 * test_<module>() free function. This runner calls all of them, or only the
 * suite named on the command line:
 *
 *   wifi_ranger_tests                 # every suite
 *   wifi_ranger_tests scan_parser     # one suite (used by CTest)
 */

#include <cstdio>
#include <cstring>

#include "common/log.h"

extern "C" {
bool test_common();
bool test_monitor_config();
bool test_scan_parser();
bool test_signal_smoother();
bool test_distance_estimator();
bool test_identity_resolver();
bool test_host_hints();
bool test_device_registry();
bool test_staleness_reaper();
bool test_scan_source();
bool test_scan_scheduler();
bool test_device_view();
bool test_daemon();
}

struct TestResult {
  const char *name;
  bool (*fn)();
};

int main(int argc, char **argv) {
  const char *only = argc > 1 ? argv[1] : nullptr;

  // Keep module logging out of the PASS/FAIL listing.
  wifi_ranger::set_log_level(wifi_ranger::LogLevel::ERROR);

  std::printf("============================================\n");
  std::printf("   wifi_ranger C++ Self-Test Suite\n");
  std::printf("============================================\n\n");

  TestResult tests[] = {
      {"common", test_common},
      {"monitor_config", test_monitor_config},
      {"scan_parser", test_scan_parser},
      {"signal_smoother", test_signal_smoother},
      {"distance_estimator", test_distance_estimator},
      {"identity_resolver", test_identity_resolver},
      {"host_hints", test_host_hints},
      {"device_registry", test_device_registry},
      {"staleness_reaper", test_staleness_reaper},
      {"scan_source", test_scan_source},
      {"scan_scheduler", test_scan_scheduler},
      {"device_view", test_device_view},
      {"daemon", test_daemon},
  };

  int total = sizeof(tests) / sizeof(tests[0]);
  int ran = 0;
  int passed = 0;
  int failed = 0;

  for (int i = 0; i < total; i++) {
    if (only && std::strcmp(only, tests[i].name) != 0)
      continue;
    bool ok = tests[i].fn();
    const char *status = ok ? "PASS" : "FAIL";
    std::printf("[%s] %s\n", status, tests[i].name);
    ran++;
    if (ok)
      passed++;
    else
      failed++;
  }

  if (ran == 0) {
    std::fprintf(stderr, "unknown test suite: %s\n", only ? only : "");
    return 2;
  }

  std::printf("\n============================================\n");
  std::printf("  Results: %d/%d passed", passed, ran);
  if (failed > 0)
    std::printf(", %d FAILED", failed);
  std::printf("\n============================================\n");

  return failed > 0 ? 1 : 0;
}
