/*
 * identity_resolver.cpp — Identity Resolver
 */

#include "identity_resolver/identity_resolver.h"

#include <utility>

#include "identity_resolver/device_type_rules.h"

namespace wifi_ranger {

IdentityResolver::IdentityResolver(ManufacturerLookup lookup,
                                   const HintSource *hints)
    : lookup_(std::move(lookup)), hints_(hints), stats_{0, 0, 0} {}

std::string IdentityResolver::manufacturer_for(const std::string &mac) const {
  const std::string prefix = oui_prefix(mac);

  std::lock_guard<std::mutex> lock(cache_mutex_);
  auto it = prefix_cache_.find(prefix);
  if (it != prefix_cache_.end()) {
    ++stats_.cache_hits;
    return it->second;
  }

  // Misses are cached too; the lookup is in-memory so holding the lock is ok.
  std::string name = lookup_ ? lookup_(prefix) : std::string();
  ++stats_.lookups;
  prefix_cache_.emplace(prefix, name);
  return name;
}

// True when the hostname alone places the device in a rule category.
static bool hostname_is_descriptive(const std::string &hostname) {
  return !hostname.empty() &&
         is_known_device_category(infer_device_type(hostname, std::string()));
}

IdentityFields IdentityResolver::resolve(const ScanRecord &record,
                                         const DeviceState *prior) const {
  IdentityFields derived;
  derived.manufacturer = manufacturer_for(record.mac);

  HostHint hint;
  if (hints_ && hints_->lookup(record.mac, &hint)) {
    derived.hostname = hint.hostname;
    derived.ip_address = hint.ip_address;
    std::lock_guard<std::mutex> lock(cache_mutex_);
    ++stats_.hint_hits;
  }

  if (!prior) {
    derived.device_type =
        infer_device_type(derived.hostname, derived.manufacturer);
    return derived;
  }

  // A descriptive name ("Johns-iPhone") is not traded for a generic one
  // ("host-23.lan"); a generic name may still change with the lease.
  const std::string &known_host = prior->identity.hostname;
  if (!derived.hostname.empty() && derived.hostname != known_host &&
      hostname_is_descriptive(known_host) &&
      !hostname_is_descriptive(derived.hostname))
    derived.hostname.clear();

  // Infer from the best inputs known so far, then merge.
  IdentityFields merged = prior->identity;
  upgrade_identity(&merged, derived);
  derived.device_type = infer_device_type(merged.hostname, merged.manufacturer);
  upgrade_identity(&merged, derived);
  return merged;
}

ResolverStats IdentityResolver::stats() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return stats_;
}

} // namespace wifi_ranger
