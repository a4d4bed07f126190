/*
 * test_staleness_reaper.cpp — Tests for staleness eviction and its cadence
 */

#include <cmath>
#include <cstdio>
#include <string>

#include "device_registry/device_registry.h"
#include "staleness_reaper/staleness_reaper.h"

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

static void seen_at(DeviceRegistry &reg, const std::string &mac, TimePoint t) {
  ScanRecord r;
  r.mac = mac;
  r.rssi = -60;
  r.observed_at = t;
  SmoothedSignal s;
  s.history = {-60};
  s.smoothed_rssi = -60.0;
  reg.upsert(r, IdentityFields(), s, 2.15);
}

static void test_sweep_evicts_unseen() {
  DeviceRegistry reg;
  StalenessReaper reaper(reg);
  const TimePoint now = Clock::now();
  seen_at(reg, "02:00:00:00:00:01", now - std::chrono::seconds(120));
  seen_at(reg, "02:00:00:00:00:02", now - std::chrono::seconds(10));

  size_t n = reaper.sweep(now, std::chrono::seconds(60));
  ASSERT_EQ(n, (size_t)1, "One stale device evicted");
  ASSERT_FALSE(reg.get("02:00:00:00:00:01", nullptr), "Unseen device gone");
  ASSERT_TRUE(reg.get("02:00:00:00:00:02", nullptr),
              "Device within threshold survives");
  ASSERT_EQ(reaper.total_evicted(), 1UL, "Total evicted tracked");
}

static void test_maybe_sweep_cadence() {
  DeviceRegistry reg;
  StalenessReaper reaper(reg);
  const TimePoint t0 = Clock::now();
  const std::chrono::seconds threshold(60);
  const std::chrono::seconds interval(10);

  reaper.maybe_sweep(t0, threshold, interval);
  ASSERT_EQ(reaper.sweeps(), 1UL, "First call sweeps");

  seen_at(reg, "02:00:00:00:00:03", t0 - std::chrono::seconds(100));
  ASSERT_EQ(reaper.maybe_sweep(t0 + std::chrono::seconds(5), threshold,
                               interval),
            (size_t)0, "Inside reap interval: skipped");
  ASSERT_EQ(reaper.sweeps(), 1UL, "No sweep counted");
  ASSERT_TRUE(reg.get("02:00:00:00:00:03", nullptr), "Stale device still there");

  ASSERT_EQ(reaper.maybe_sweep(t0 + std::chrono::seconds(10), threshold,
                               interval),
            (size_t)1, "Interval elapsed: swept");
  ASSERT_EQ(reaper.sweeps(), 2UL, "Second sweep counted");
}

extern "C" bool test_staleness_reaper() {
  tests_passed = 0;
  tests_failed = 0;

  test_sweep_evicts_unseen();
  test_maybe_sweep_cadence();

  printf("  staleness_reaper: %d passed, %d failed\n", tests_passed,
         tests_failed);
  return tests_failed == 0;
}
