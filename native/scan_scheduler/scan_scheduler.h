/*
 * scan_scheduler.h — Scan Scheduler
 *
 * Drives the pipeline on a fixed interval:
 *   scan source -> parse -> resolve -> smooth -> estimate -> registry.upsert
 * then, whatever the cycle outcome, lets the reaper sweep on its own cadence.
 *
 * Cycles never overlap: the loop is a single worker thread that waits for
 * the scan to finish (or time out) before scheduling the next one.
 */

#ifndef WIFI_RANGER_SCAN_SCHEDULER_H
#define WIFI_RANGER_SCAN_SCHEDULER_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "common/device_model.h"
#include "device_registry/device_registry.h"
#include "identity_resolver/identity_resolver.h"
#include "monitor_config/monitor_config.h"
#include "scan_source/scan_source.h"
#include "staleness_reaper/staleness_reaper.h"

namespace wifi_ranger {

enum class CycleStatus {
  OK,
  SCAN_FAILED,
  EMPTY_OUTPUT,
  HEADER_NOT_FOUND,
  EXCEPTION,
  CANCELLED,
};

const char *cycle_status_name(CycleStatus s);

struct CycleReport {
  CycleStatus status;
  TimePoint started_at;
  size_t records;      // accepted by the parser
  int rejected_lines;
  size_t upserted;
  size_t created;      // subset of upserted that were new devices
  size_t evicted;      // by the reaper after this cycle
  std::string reason;  // empty on OK
};

struct SchedulerStats {
  unsigned long cycles;
  unsigned long cycles_ok;
  unsigned long cycles_failed;
  unsigned long records;
  unsigned long rejected_lines;
};

using NowFn = std::function<TimePoint()>;

class ScanScheduler {
public:
  ScanScheduler(ScanSource &source, DeviceRegistry &registry,
                const IdentityResolver &resolver, const ConfigStore &config,
                NowFn now = Clock::now);
  ~ScanScheduler();

  ScanScheduler(const ScanScheduler &) = delete;
  ScanScheduler &operator=(const ScanScheduler &) = delete;

  // One synchronous cycle, reaper included.
  CycleReport run_cycle();

  // Launch the loop on a worker thread. False if already running.
  bool start();

  // Wake the interval wait, cancel an outstanding scan, join.
  void stop();

  bool running() const { return running_.load(); }

  SchedulerStats stats() const;
  CycleReport last_report() const;

private:
  void loop();
  CycleReport scan_and_update(const MonitorConfig &cfg, TimePoint started_at);
  void record(const CycleReport &report);

  ScanSource &source_;
  DeviceRegistry &registry_;
  const IdentityResolver &resolver_;
  const ConfigStore &config_;
  NowFn now_;
  StalenessReaper reaper_;

  mutable std::mutex stats_mutex_;
  SchedulerStats stats_;
  CycleReport last_report_;

  std::thread worker_;
  std::mutex wait_mutex_;
  std::condition_variable wake_;
  bool stop_requested_;
  std::atomic<bool> running_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_SCAN_SCHEDULER_H
