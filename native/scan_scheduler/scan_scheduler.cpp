/*
 * scan_scheduler.cpp — Scan Scheduler
 */

#include "scan_scheduler/scan_scheduler.h"

#include <exception>
#include <utility>
#include <vector>

#include "common/log.h"
#include "distance_estimator/distance_estimator.h"
#include "scan_parser/scan_parser.h"
#include "signal_smoother/signal_smoother.h"

namespace wifi_ranger {

static const char *TAG = "SCHED";

const char *cycle_status_name(CycleStatus s) {
  switch (s) {
  case CycleStatus::OK:
    return "OK";
  case CycleStatus::SCAN_FAILED:
    return "SCAN_FAILED";
  case CycleStatus::EMPTY_OUTPUT:
    return "EMPTY_OUTPUT";
  case CycleStatus::HEADER_NOT_FOUND:
    return "HEADER_NOT_FOUND";
  case CycleStatus::EXCEPTION:
    return "EXCEPTION";
  case CycleStatus::CANCELLED:
    return "CANCELLED";
  default:
    return "UNKNOWN";
  }
}

static CycleReport empty_report(TimePoint started_at) {
  CycleReport r;
  r.status = CycleStatus::OK;
  r.started_at = started_at;
  r.records = 0;
  r.rejected_lines = 0;
  r.upserted = 0;
  r.created = 0;
  r.evicted = 0;
  return r;
}

ScanScheduler::ScanScheduler(ScanSource &source, DeviceRegistry &registry,
                             const IdentityResolver &resolver,
                             const ConfigStore &config, NowFn now)
    : source_(source), registry_(registry), resolver_(resolver),
      config_(config), now_(std::move(now)), reaper_(registry),
      stats_{0, 0, 0, 0, 0}, last_report_(empty_report(TimePoint())),
      stop_requested_(false), running_(false) {}

ScanScheduler::~ScanScheduler() { stop(); }

// =========================================================================
// ONE CYCLE
// =========================================================================

CycleReport ScanScheduler::scan_and_update(const MonitorConfig &cfg,
                                           TimePoint started_at) {
  CycleReport report = empty_report(started_at);

  std::string raw;
  std::string why;
  source_.set_timeout(std::chrono::seconds(cfg.scan_timeout_seconds));
  ScanStatus ss = source_.scan(&raw, &why);
  if (ss != ScanStatus::OK) {
    report.status = ss == ScanStatus::CANCELLED ? CycleStatus::CANCELLED
                                                : CycleStatus::SCAN_FAILED;
    report.reason = std::string(scan_status_name(ss)) + ": " + why;
    return report;
  }

  ParseResult parsed = parse_scan_output(raw, now_());
  report.rejected_lines = parsed.rejected_lines;
  if (parsed.status != ParseStatus::OK) {
    report.status = parsed.status == ParseStatus::EMPTY_INPUT
                        ? CycleStatus::EMPTY_OUTPUT
                        : CycleStatus::HEADER_NOT_FOUND;
    report.reason = parsed.reason;
    return report;
  }
  report.records = parsed.records.size();

  // Everything is derived before the first upsert so a throw part way
  // through leaves the registry as it was.
  struct Pending {
    const ScanRecord *record;
    IdentityFields identity;
    SmoothedSignal signal;
    double distance;
  };
  std::vector<Pending> pending;
  pending.reserve(parsed.records.size());

  const SignalSmoother smoother(
      static_cast<size_t>(cfg.rssi_history_capacity));
  for (const ScanRecord &rec : parsed.records) {
    DeviceState prior;
    const bool known = registry_.get(rec.mac, &prior);

    Pending p;
    p.record = &rec;
    p.identity = resolver_.resolve(rec, known ? &prior : nullptr);
    p.signal = smoother.update(
        known ? prior.rssi_history : std::vector<int>(), rec.rssi);
    p.distance = estimate_distance(p.signal.smoothed_rssi,
                                   cfg.reference_power_dbm,
                                   cfg.path_loss_exponent);
    pending.push_back(std::move(p));
  }

  for (const Pending &p : pending) {
    if (registry_.upsert(*p.record, p.identity, p.signal, p.distance))
      ++report.created;
    ++report.upserted;
  }
  return report;
}

CycleReport ScanScheduler::run_cycle() {
  const MonitorConfig cfg = config_.get();
  const TimePoint started_at = now_();

  CycleReport report = empty_report(started_at);
  try {
    report = scan_and_update(cfg, started_at);
  } catch (const std::exception &e) {
    report = empty_report(started_at);
    report.status = CycleStatus::EXCEPTION;
    report.reason = e.what();
  }

  if (report.status == CycleStatus::OK) {
    WR_LOG_DEBUG(TAG, "cycle ok: %zu records (%zu new), %d rejected lines",
                 report.records, report.created, report.rejected_lines);
  } else if (report.status == CycleStatus::CANCELLED) {
    WR_LOG_INFO(TAG, "cycle cancelled");
  } else if (report.status == CycleStatus::EXCEPTION) {
    WR_LOG_ERROR(TAG, "cycle aborted by exception: %s",
                 report.reason.c_str());
  } else {
    WR_LOG_WARN(TAG, "cycle skipped (%s): %s",
                cycle_status_name(report.status), report.reason.c_str());
  }

  // The reaper runs on its own cadence, also after a failed cycle.
  report.evicted = reaper_.maybe_sweep(
      now_(), std::chrono::seconds(cfg.staleness_threshold_seconds),
      std::chrono::seconds(cfg.reap_interval_seconds));

  record(report);
  return report;
}

void ScanScheduler::record(const CycleReport &report) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.cycles;
  if (report.status == CycleStatus::OK)
    ++stats_.cycles_ok;
  else
    ++stats_.cycles_failed;
  stats_.records += report.records;
  stats_.rejected_lines += static_cast<unsigned long>(report.rejected_lines);
  last_report_ = report;
}

SchedulerStats ScanScheduler::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

CycleReport ScanScheduler::last_report() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return last_report_;
}

// =========================================================================
// LOOP
// =========================================================================

bool ScanScheduler::start() {
  if (running_.load())
    return false;
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  source_.resume();
  running_.store(true);
  worker_ = std::thread(&ScanScheduler::loop, this);
  WR_LOG_INFO(TAG, "scheduler started (source: %s)", source_.name().c_str());
  return true;
}

void ScanScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  source_.cancel();
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();
  if (running_.exchange(false))
    WR_LOG_INFO(TAG, "scheduler stopped");
}

void ScanScheduler::loop() {
  while (true) {
    const auto cycle_start = std::chrono::steady_clock::now();
    run_cycle();

    const auto interval =
        std::chrono::seconds(config_.get().scan_interval_seconds);
    std::unique_lock<std::mutex> lock(wait_mutex_);
    if (wake_.wait_until(lock, cycle_start + interval,
                         [this] { return stop_requested_; }))
      break;
  }
}

} // namespace wifi_ranger
