/*
 * device_registry.h — Device Registry
 *
 * Authoritative MAC -> DeviceState table. One writer (the scheduler), any
 * number of readers. Readers get copies and never observe a half-updated
 * entry.
 */

#ifndef WIFI_RANGER_DEVICE_REGISTRY_H
#define WIFI_RANGER_DEVICE_REGISTRY_H

#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>

#include "common/device_model.h"
#include "signal_smoother/signal_smoother.h"

namespace wifi_ranger {

struct RegistryStats {
  unsigned long created;
  unsigned long updated;
  unsigned long evicted;
};

class DeviceRegistry {
public:
  DeviceRegistry();

  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  // Create or update the entry for record.mac. Returns true if created.
  bool upsert(const ScanRecord &record, const IdentityFields &identity,
              const SmoothedSignal &signal, double distance_m);

  std::map<std::string, DeviceState> snapshot() const;

  bool get(const std::string &mac, DeviceState *out) const;

  // Remove every entry with now - last_seen > threshold. Returns the count.
  size_t evict_stale(TimePoint now, std::chrono::seconds threshold);

  size_t size() const;
  RegistryStats stats() const;
  void clear();

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, DeviceState> devices_;
  RegistryStats stats_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_DEVICE_REGISTRY_H
