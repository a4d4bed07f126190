/*
 * device_registry.cpp — Device Registry
 *
 * Features:
 *   - one entry per canonical MAC, created on first sighting
 *   - identity fields follow the never-downgrade policy
 *   - last_seen only moves forward
 *   - eviction primitive for the staleness reaper
 */

#include "device_registry/device_registry.h"

#include <mutex>

#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "REGISTRY";

DeviceRegistry::DeviceRegistry() : stats_{0, 0, 0} {}

// =========================================================================
// WRITES
// =========================================================================

bool DeviceRegistry::upsert(const ScanRecord &record,
                            const IdentityFields &identity,
                            const SmoothedSignal &signal, double distance_m) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = devices_.find(record.mac);
  if (it == devices_.end()) {
    DeviceState d;
    d.mac_address = record.mac;
    d.rssi_history = signal.history;
    d.smoothed_rssi = signal.smoothed_rssi;
    d.distance_m = distance_m;
    d.ssid = record.ssid;
    d.identity = identity;
    d.first_seen = record.observed_at;
    d.last_seen = record.observed_at;
    devices_.emplace(record.mac, d);
    ++stats_.created;

    WR_LOG_INFO(TAG, "new device %s (%s) rssi=%d distance=%.2fm",
                record.mac.c_str(), identity.device_type.c_str(), record.rssi,
                distance_m);
    return true;
  }

  DeviceState &d = it->second;
  d.rssi_history = signal.history;
  d.smoothed_rssi = signal.smoothed_rssi;
  d.distance_m = distance_m;
  if (!record.ssid.empty())
    d.ssid = record.ssid;
  if (upgrade_identity(&d.identity, identity))
    WR_LOG_DEBUG(TAG, "identity of %s now %s / %s", record.mac.c_str(),
                 d.identity.manufacturer.c_str(),
                 d.identity.device_type.c_str());
  if (record.observed_at > d.last_seen)
    d.last_seen = record.observed_at;
  ++stats_.updated;
  return false;
}

size_t DeviceRegistry::evict_stale(TimePoint now,
                                   std::chrono::seconds threshold) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  size_t evicted = 0;
  for (auto it = devices_.begin(); it != devices_.end();) {
    if (now - it->second.last_seen > threshold) {
      WR_LOG_DEBUG(TAG, "evicting %s", it->first.c_str());
      it = devices_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  stats_.evicted += evicted;
  return evicted;
}

void DeviceRegistry::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  devices_.clear();
}

// =========================================================================
// READS
// =========================================================================

std::map<std::string, DeviceState> DeviceRegistry::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return devices_;
}

bool DeviceRegistry::get(const std::string &mac, DeviceState *out) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = devices_.find(mac);
  if (it == devices_.end())
    return false;
  if (out)
    *out = it->second;
  return true;
}

size_t DeviceRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return devices_.size();
}

RegistryStats DeviceRegistry::stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return stats_;
}

} // namespace wifi_ranger
