/*
 * identity_resolver.h — Identity Resolver
 *
 * Derives manufacturer, device type, hostname and IP for a scan record.
 * Never touches the network: manufacturer comes from an injected prefix
 * lookup (cached per prefix), hostname/IP from an injected HintSource.
 */

#ifndef WIFI_RANGER_IDENTITY_RESOLVER_H
#define WIFI_RANGER_IDENTITY_RESOLVER_H

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/device_model.h"
#include "host_hints/host_hints.h"

namespace wifi_ranger {

// "AA:BB:CC" -> manufacturer name, "" when unknown.
using ManufacturerLookup = std::function<std::string(const std::string &)>;

struct ResolverStats {
  unsigned long lookups;      // calls into the injected lookup
  unsigned long cache_hits;
  unsigned long hint_hits;
};

class IdentityResolver {
public:
  // hints may be null (no hostname/IP source).
  IdentityResolver(ManufacturerLookup lookup, const HintSource *hints);

  IdentityResolver(const IdentityResolver &) = delete;
  IdentityResolver &operator=(const IdentityResolver &) = delete;

  // Identity for record. When prior is given the result is prior's identity
  // upgraded by what was derived now, so no field is ever less specific
  // than before.
  IdentityFields resolve(const ScanRecord &record,
                         const DeviceState *prior) const;

  // Cached manufacturer for a canonical MAC.
  std::string manufacturer_for(const std::string &mac) const;

  ResolverStats stats() const;

private:
  ManufacturerLookup lookup_;
  const HintSource *hints_;

  mutable std::mutex cache_mutex_;
  mutable std::unordered_map<std::string, std::string> prefix_cache_;
  mutable ResolverStats stats_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_IDENTITY_RESOLVER_H
