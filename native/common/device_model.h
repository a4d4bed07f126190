/*
 * device_model.h — Shared device data model
 *
 * ScanRecord   : one observation of one MAC in one scan cycle
 * IdentityFields: best-known identity attributes of a device
 * DeviceState  : long-lived registry entry (one per MAC)
 *
 * MAC addresses are always stored canonical: uppercase, colon-separated,
 * 17 characters ("AA:BB:CC:DD:EE:FF").
 */

#ifndef WIFI_RANGER_DEVICE_MODEL_H
#define WIFI_RANGER_DEVICE_MODEL_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace wifi_ranger {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// =========================================================================
// CONSTANTS
// =========================================================================

static constexpr int RSSI_MIN_DBM = -100;
static constexpr int RSSI_MAX_DBM = 0;
static constexpr size_t MAC_STRING_LEN = 17;
static constexpr size_t OUI_STRING_LEN = 8; // "AA:BB:CC"

static constexpr char UNKNOWN_DEVICE_TYPE[] = "Unknown Device";
static constexpr char GENERIC_DEVICE_SUFFIX[] = " Device";

// =========================================================================
// RECORDS
// =========================================================================

struct ScanRecord {
  std::string mac;
  int rssi;
  std::string ssid; // empty = not reported
  TimePoint observed_at;
};

struct IdentityFields {
  std::string hostname;
  std::string ip_address;
  std::string manufacturer;
  std::string device_type;
};

struct DeviceState {
  std::string mac_address;
  std::vector<int> rssi_history; // oldest first
  double smoothed_rssi;
  double distance_m;
  std::string ssid;
  IdentityFields identity;
  TimePoint first_seen;
  TimePoint last_seen;
};

// =========================================================================
// MAC HELPERS
// =========================================================================

// Parse a strict "XX:XX:XX:XX:XX:XX" token (hex pairs, colons only, either
// case). Writes the uppercase form to *out. Returns false on any deviation.
bool parse_mac(const std::string &token, std::string *out);

// "AA:BB:CC:DD:EE:FF" -> "AA:BB:CC". Input must be canonical.
std::string oui_prefix(const std::string &mac);

// =========================================================================
// IDENTITY RANKING
// =========================================================================

// 0 = empty or "Unknown Device"
// 1 = generic "<manufacturer> Device"
// 2 = a category from the device-type rule table
int device_type_rank(const std::string &device_type);

// Registered by the rule table so ranking knows the specific categories.
bool is_known_device_category(const std::string &device_type);

// Apply the never-downgrade policy: copy each incoming field over the stored
// one only when the incoming value is at least as specific.
// Returns true if any stored field changed.
bool upgrade_identity(IdentityFields *stored, const IdentityFields &incoming);

} // namespace wifi_ranger

#endif // WIFI_RANGER_DEVICE_MODEL_H
