/*
 * host_hints.cpp — Out-of-band hostname / IP hints
 */

#include "host_hints/host_hints.h"

#include <cctype>
#include <cstring>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "common/atomic_file.h"
#include "common/device_model.h"
#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "HINTS";

// Refreshes skipped before a name that failed to resolve is looked up again.
static constexpr int DNS_MISS_BACKOFF_REFRESHES = 3;

// =========================================================================
// HINT CACHE
// =========================================================================

void HintCache::put(const std::string &mac, const HostHint &hint) {
  std::lock_guard<std::mutex> lock(mutex_);
  HostHint &entry = hints_[mac];
  if (!hint.hostname.empty())
    entry.hostname = hint.hostname;
  if (!hint.ip_address.empty())
    entry.ip_address = hint.ip_address;
}

bool HintCache::lookup(const std::string &mac, HostHint *out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hints_.find(mac);
  if (it == hints_.end())
    return false;
  if (out)
    *out = it->second;
  return true;
}

size_t HintCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hints_.size();
}

void HintCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  hints_.clear();
}

// =========================================================================
// ARP TABLE
// =========================================================================

std::vector<ArpEntry> parse_proc_net_arp(const std::string &text) {
  std::vector<ArpEntry> entries;
  std::istringstream in(text);
  std::string line;
  bool header_seen = false;

  while (std::getline(in, line)) {
    if (!header_seen) {
      header_seen = true;
      if (line.find("IP address") != std::string::npos)
        continue;
    }

    // IP address  HW type  Flags  HW address  Mask  Device
    std::istringstream fields(line);
    std::string ip, hw_type, flags, hw_addr, mask, device;
    if (!(fields >> ip >> hw_type >> flags >> hw_addr))
      continue;
    fields >> mask >> device;

    if (flags == "0x0")
      continue;

    ArpEntry e;
    if (!parse_mac(hw_addr, &e.mac) || e.mac == "00:00:00:00:00:00")
      continue;

    in_addr addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
      continue;

    e.ip_address = ip;
    e.device = device;
    entries.push_back(e);
  }
  return entries;
}

std::string reverse_dns_lookup(const std::string &ip_address) {
  sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family = AF_INET;
  if (inet_pton(AF_INET, ip_address.c_str(), &sa.sin_addr) != 1)
    return "";

  char host[NI_MAXHOST];
  int rc = getnameinfo(reinterpret_cast<const sockaddr *>(&sa), sizeof(sa),
                       host, sizeof(host), nullptr, 0, NI_NAMEREQD);
  if (rc != 0)
    return "";
  return host;
}

// =========================================================================
// COLLECTOR
// =========================================================================

ArpHintCollector::ArpHintCollector(HintCache &cache,
                                   const std::string &arp_path,
                                   ReverseDnsFn reverse_dns,
                                   std::chrono::seconds interval)
    : cache_(cache), arp_path_(arp_path), reverse_dns_(std::move(reverse_dns)),
      interval_(interval), stop_requested_(false), running_(false),
      dns_failures_(0) {}

ArpHintCollector::~ArpHintCollector() { stop(); }

int ArpHintCollector::refresh_once() {
  std::string text;
  if (!read_file(arp_path_, &text)) {
    WR_LOG_WARN(TAG, "cannot read ARP table %s", arp_path_.c_str());
    return -1;
  }

  std::vector<ArpEntry> entries = parse_proc_net_arp(text);
  int published = 0;
  for (const ArpEntry &e : entries) {
    // Each reverse lookup may block for the resolver timeout.
    if (stop_requested()) {
      WR_LOG_DEBUG(TAG, "ARP refresh interrupted after %d entries", published);
      return published;
    }

    HostHint hint;
    hint.ip_address = e.ip_address;

    auto it = resolved_names_.find(e.ip_address);
    auto miss = dns_miss_backoff_.find(e.ip_address);
    if (it != resolved_names_.end()) {
      hint.hostname = it->second;
    } else if (miss != dns_miss_backoff_.end() && miss->second > 0) {
      --miss->second;
    } else if (reverse_dns_) {
      hint.hostname = reverse_dns_(e.ip_address);
      if (hint.hostname.empty()) {
        dns_failures_.fetch_add(1);
        dns_miss_backoff_[e.ip_address] = DNS_MISS_BACKOFF_REFRESHES;
      } else {
        resolved_names_[e.ip_address] = hint.hostname;
        if (miss != dns_miss_backoff_.end())
          dns_miss_backoff_.erase(miss);
      }
    }
    cache_.put(e.mac, hint);
    ++published;
  }

  WR_LOG_DEBUG(TAG, "ARP refresh: %d entries", published);
  return published;
}

bool ArpHintCollector::stop_requested() {
  std::lock_guard<std::mutex> lock(wait_mutex_);
  return stop_requested_;
}

bool ArpHintCollector::start() {
  if (running_.load())
    return false;
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  running_.store(true);
  worker_ = std::thread(&ArpHintCollector::run, this);
  WR_LOG_INFO(TAG, "hint collector started (%s, every %llds)",
              arp_path_.c_str(), static_cast<long long>(interval_.count()));
  return true;
}

void ArpHintCollector::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();
  if (running_.exchange(false))
    WR_LOG_INFO(TAG, "hint collector stopped");
}

void ArpHintCollector::run() {
  while (true) {
    if (refresh_once() < 0)
      WR_LOG_DEBUG(TAG, "retrying ARP read in %llds",
                   static_cast<long long>(interval_.count()));

    std::unique_lock<std::mutex> lock(wait_mutex_);
    if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      break;
  }
}

} // namespace wifi_ranger
