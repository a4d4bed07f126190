/*
 * oui_table.cpp — OUI prefix -> manufacturer table
 */

#include "identity_resolver/oui_table.h"

#include <sstream>

#include "common/atomic_file.h"
#include "common/device_model.h"
#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "OUI";

struct VendorPrefixes {
  const char *vendor;
  const char *const *prefixes;
};

// =========================================================================
// BUILT-IN PREFIXES
// =========================================================================

static const char *const APPLE_PREFIXES[] = {
    // phones
    "A8:5C:2C", "AC:BC:32", "AC:88:FD", "24:F6:77", "F0:D1:A9", "F8:27:93",
    "04:4B:ED", "04:52:F3", "28:5A:EB", "34:08:BC", "34:C7:59", "58:B1:0F",
    "60:F4:45", "70:DE:E2", "80:B0:3D", "88:66:A5", "88:E8:7F", "90:B0:ED",
    "90:B2:1F", "90:FD:61", "9C:F3:87", "A4:B8:05", "AC:61:EA", "AC:7F:3E",
    // tablets
    "A4:67:06", "AC:FD:EC", "C8:3C:85", "34:EE:16", "00:88:65", "04:15:52",
    "04:48:9A", "08:66:98", "08:6D:41", "08:E6:89", "0C:3E:9F", "0C:74:C2",
    "10:DD:B1", "14:99:E2", "18:AF:61", "1C:91:48", "20:A2:E4", "28:6A:BA",
    "2C:1F:23", "2C:BE:08", "34:C0:59", "38:B5:4D",
    // laptops
    "8C:85:90", "A4:83:E7", "A8:86:DD", "F0:18:98", "00:3E:E1", "00:50:E4",
    "00:A0:40", "00:C0:CE", "04:0C:CE", "04:26:65", "04:54:53", "08:00:07",
    "0C:4D:E9", "10:40:F3", "10:93:E9", "14:10:9F", "14:98:77", "18:65:90",
    nullptr};

static const char *const ANDROID_PREFIXES[] = {
    "40:4E:36", "44:80:EB", "70:BB:E9", "A8:9F:BA", "F8:A3:4F", "00:08:22",
    "00:18:82", "00:1C:B3", "00:21:B0", "00:24:54", "00:26:E8", "00:37:6D",
    "00:E0:91", "04:4F:4C", "04:B1:67", "08:00:1F", "0C:96:E6", "10:2C:6B",
    "10:3D:1C", "10:62:EB", "10:A5:1D", "14:A3:64", nullptr};

static const char *const SAMSUNG_PREFIXES[] = {
    "94:76:B7", "A0:82:1F", "B4:7C:9C", "CC:07:AB", "F4:42:8F", "00:07:AB",
    "00:12:47", "00:15:99", "00:17:C9", "00:1C:43", "00:21:19", "00:23:39",
    "00:26:37", "00:E0:64", "04:18:0F", "08:08:C2", "08:37:3D", "08:D4:2B",
    "0C:14:20", "0C:71:5D", "0C:89:10", "10:1D:C0", nullptr};

static const char *const GOOGLE_PREFIXES[] = {
    "00:1A:11", "3C:5A:B4", "54:60:09", "F4:F5:E8", "08:9E:08", "0C:F0:19",
    "10:C2:5A", "20:DF:B9", "28:BC:18", "2C:A1:91", "34:6A:C2", "38:8B:59",
    "48:D6:D5", "58:6D:8F", "5C:E8:83", "60:45:BD", "64:16:66", "70:1A:04",
    "70:CA:9B", nullptr};

static const char *const AMAZON_PREFIXES[] = {
    "00:FC:8B", "34:D2:70", "40:B4:CD", "44:65:0D", "50:F5:DA", "68:37:E9",
    "74:C2:46", "0C:47:C9", "18:74:2E", "38:F7:3D", "4C:EF:C0", "6C:56:97",
    "78:E1:03", "84:D6:D0", "88:71:E5", "A0:02:DC", "AC:63:BE", "F0:27:2D",
    nullptr};

static const char *const SONOS_PREFIXES[] = {
    "00:0E:58", "34:7E:5C", "48:A6:B8", "54:2A:1B", "5C:AA:FD", "78:28:CA",
    "94:9F:3E", "04:C2:9E", "08:DF:CA", "0C:43:28", "0C:49:ED", "10:02:B5",
    "10:08:C1", "14:6B:45", "1C:12:B0", "20:03:D7", "24:28:B2", "28:8F:C2",
    "2C:7E:81", "30:0E:D5", "38:42:0B", "3C:12:AA", "40:14:7F", nullptr};

static const char *const NEST_PREFIXES[] = {
    "18:B4:30", "00:12:CA", "00:13:6C", "00:17:3F", "00:1E:06", "00:24:6C",
    "04:CF:8C", "08:3A:2F", "0C:62:A6", "10:2C:83", "10:4A:7D", "10:9A:DD",
    "14:58:D0", "1C:BA:8C", "20:3C:AE", "24:A5:2C", "2C:AA:8E", nullptr};

static const char *const RING_PREFIXES[] = {
    "00:62:6E", "30:91:8F", "5C:41:E6", "7C:64:56", "04:5C:06", "10:9C:70",
    "1C:1B:68", "20:39:56", "24:6F:28", "28:6C:07", "34:3E:A4", "38:6B:1C",
    "3C:62:00", "40:01:7A", "44:21:CA", "48:6D:BB", "4C:55:CC", nullptr};

// First listed vendor wins when a prefix appears twice.
static const VendorPrefixes BUILTIN_VENDORS[] = {
    {"Apple", APPLE_PREFIXES},     {"Android", ANDROID_PREFIXES},
    {"Samsung", SAMSUNG_PREFIXES}, {"Google", GOOGLE_PREFIXES},
    {"Amazon", AMAZON_PREFIXES},   {"Sonos", SONOS_PREFIXES},
    {"Nest", NEST_PREFIXES},       {"Ring", RING_PREFIXES},
};

// =========================================================================
// TABLE
// =========================================================================

OuiTable::OuiTable() {
  for (const VendorPrefixes &v : BUILTIN_VENDORS) {
    for (int i = 0; v.prefixes[i] != nullptr; ++i)
      vendors_.emplace(v.prefixes[i], v.vendor);
  }
}

std::string OuiTable::lookup(const std::string &prefix) const {
  auto it = vendors_.find(prefix);
  return it == vendors_.end() ? std::string() : it->second;
}

size_t OuiTable::load_manuf_text(const std::string &text) {
  std::istringstream in(text);
  std::string line;
  size_t added = 0;

  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#')
      continue;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    size_t tab = line.find('\t');
    if (tab == std::string::npos)
      continue;
    std::string prefix = line.substr(0, tab);
    if (prefix.find('/') != std::string::npos)
      continue; // 28/36-bit ranges

    // "00-00-0C" is also seen in older files
    for (char &c : prefix) {
      if (c == '-')
        c = ':';
    }
    std::string canon;
    if (!parse_mac(prefix + ":00:00:00", &canon))
      continue;

    size_t name_end = line.find('\t', tab + 1);
    std::string vendor = line.substr(
        tab + 1, name_end == std::string::npos ? std::string::npos
                                               : name_end - tab - 1);
    if (vendor.empty())
      continue;

    if (vendors_.emplace(oui_prefix(canon), vendor).second)
      ++added;
  }
  return added;
}

bool OuiTable::load_manuf_file(const std::string &path, size_t *added,
                               std::string *reason) {
  std::string text;
  if (!read_file(path, &text)) {
    if (reason)
      *reason = "cannot read " + path;
    return false;
  }
  size_t n = load_manuf_text(text);
  if (added)
    *added = n;
  WR_LOG_INFO(TAG, "loaded %zu prefixes from %s (%zu total)", n, path.c_str(),
              vendors_.size());
  return true;
}

} // namespace wifi_ranger
