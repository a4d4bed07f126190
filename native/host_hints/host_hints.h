/*
 * host_hints.h — Out-of-band hostname / IP hints
 *
 * The scan path never touches the network. ARP table reads and reverse DNS
 * happen on the collector thread and land in a HintCache; the identity
 * resolver only reads the cache.
 */

#ifndef WIFI_RANGER_HOST_HINTS_H
#define WIFI_RANGER_HOST_HINTS_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wifi_ranger {

struct HostHint {
  std::string hostname;
  std::string ip_address;
};

// mac -> {hostname?, ip?}. Best effort: false means "nothing known".
class HintSource {
public:
  virtual ~HintSource() = default;
  virtual bool lookup(const std::string &mac, HostHint *out) const = 0;
};

class HintCache : public HintSource {
public:
  // Merge non-empty fields of hint into the entry for mac (canonical MAC).
  void put(const std::string &mac, const HostHint &hint);

  bool lookup(const std::string &mac, HostHint *out) const override;

  size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::map<std::string, HostHint> hints_;
};

// =========================================================================
// ARP TABLE
// =========================================================================

struct ArpEntry {
  std::string ip_address;
  std::string mac; // canonical
  std::string device;
};

// Parse Linux /proc/net/arp. Skips the header, incomplete entries
// (flags 0x0) and all-zero MACs.
std::vector<ArpEntry> parse_proc_net_arp(const std::string &text);

// Reverse DNS via getnameinfo(NI_NAMEREQD). Empty string on failure.
std::string reverse_dns_lookup(const std::string &ip_address);

using ReverseDnsFn = std::function<std::string(const std::string &)>;

// Periodically refreshes a HintCache from the ARP table and reverse DNS.
class ArpHintCollector {
public:
  ArpHintCollector(HintCache &cache, const std::string &arp_path,
                   ReverseDnsFn reverse_dns,
                   std::chrono::seconds interval = std::chrono::seconds(30));
  ~ArpHintCollector();

  ArpHintCollector(const ArpHintCollector &) = delete;
  ArpHintCollector &operator=(const ArpHintCollector &) = delete;

  bool start();
  void stop();

  // One synchronous refresh. Returns entries published, -1 if the ARP table
  // could not be read. Stops early once stop() has been requested. Not to be
  // called while the worker is running.
  int refresh_once();

  unsigned long dns_failures() const { return dns_failures_.load(); }

private:
  void run();
  bool stop_requested();

  HintCache &cache_;
  std::string arp_path_;
  ReverseDnsFn reverse_dns_;
  std::chrono::seconds interval_;

  // ip -> resolved name, so a stable lease is resolved once
  std::map<std::string, std::string> resolved_names_;
  // ip -> refreshes left before a failed reverse lookup is retried
  std::map<std::string, int> dns_miss_backoff_;

  std::thread worker_;
  std::mutex wait_mutex_;
  std::condition_variable wake_;
  bool stop_requested_;
  std::atomic<bool> running_;
  std::atomic<unsigned long> dns_failures_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_HOST_HINTS_H
