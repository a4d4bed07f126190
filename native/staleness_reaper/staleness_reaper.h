/*
 * staleness_reaper.h — Staleness Reaper
 *
 * Evicts devices not reported for longer than the staleness threshold.
 * maybe_sweep() gives the reaper its own cadence, independent of whether
 * scan cycles succeed.
 */

#ifndef WIFI_RANGER_STALENESS_REAPER_H
#define WIFI_RANGER_STALENESS_REAPER_H

#include <chrono>

#include "common/device_model.h"
#include "device_registry/device_registry.h"

namespace wifi_ranger {

class StalenessReaper {
public:
  explicit StalenessReaper(DeviceRegistry &registry);

  // Evict every entry with now - last_seen > threshold.
  size_t sweep(TimePoint now, std::chrono::seconds threshold);

  // Sweep only if reap_interval has elapsed since the previous sweep.
  // The first call always sweeps. Returns the evicted count (0 if skipped).
  size_t maybe_sweep(TimePoint now, std::chrono::seconds threshold,
                     std::chrono::seconds reap_interval);

  unsigned long sweeps() const { return sweeps_; }
  unsigned long total_evicted() const { return total_evicted_; }

private:
  DeviceRegistry &registry_;
  bool swept_once_;
  TimePoint last_sweep_;
  unsigned long sweeps_;
  unsigned long total_evicted_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_STALENESS_REAPER_H
