/*
 * staleness_reaper.cpp — Staleness Reaper
 */

#include "staleness_reaper/staleness_reaper.h"

#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "REAPER";

StalenessReaper::StalenessReaper(DeviceRegistry &registry)
    : registry_(registry), swept_once_(false), sweeps_(0), total_evicted_(0) {}

size_t StalenessReaper::sweep(TimePoint now, std::chrono::seconds threshold) {
  size_t evicted = registry_.evict_stale(now, threshold);
  last_sweep_ = now;
  swept_once_ = true;
  ++sweeps_;
  total_evicted_ += evicted;

  if (evicted > 0)
    WR_LOG_INFO(TAG, "evicted %zu stale device(s), %zu remain", evicted,
                registry_.size());
  return evicted;
}

size_t StalenessReaper::maybe_sweep(TimePoint now,
                                    std::chrono::seconds threshold,
                                    std::chrono::seconds reap_interval) {
  if (swept_once_ && now - last_sweep_ < reap_interval)
    return 0;
  return sweep(now, threshold);
}

} // namespace wifi_ranger
