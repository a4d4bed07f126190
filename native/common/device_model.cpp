/*
 * device_model.cpp — MAC canonicalization and identity ranking
 */

#include "common/device_model.h"

#include <cctype>
#include <cstring>

namespace wifi_ranger {

// =========================================================================
// DEVICE CATEGORIES
// =========================================================================

// Every category the device-type rule table can emit. Keep in sync with
// identity_resolver/device_type_rules.cpp (test_identity_resolver checks it).
static const char *const DEVICE_CATEGORIES[] = {
    "iPhone",         "iPad",           "MacBook",        "iMac",
    "Apple Watch",    "Apple TV",       "Android Phone",  "Android Tablet",
    "Smart TV",       "Gaming Console", "Smart Speaker",  "Smart Display",
    "Security Camera", "Laptop",        "Desktop",        "Network Device",
    "Smart Home Hub", "Printer",        "Media Device",
    nullptr /* sentinel */
};

// =========================================================================
// MAC HELPERS
// =========================================================================

static bool is_hex(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool parse_mac(const std::string &token, std::string *out) {
  if (token.size() != MAC_STRING_LEN)
    return false;

  std::string canon(MAC_STRING_LEN, ':');
  for (size_t i = 0; i < MAC_STRING_LEN; ++i) {
    const char c = token[i];
    if (i % 3 == 2) {
      if (c != ':')
        return false;
      continue;
    }
    if (!is_hex(c))
      return false;
    canon[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  if (out)
    *out = canon;
  return true;
}

std::string oui_prefix(const std::string &mac) {
  return mac.substr(0, OUI_STRING_LEN);
}

// =========================================================================
// IDENTITY RANKING
// =========================================================================

bool is_known_device_category(const std::string &device_type) {
  for (int i = 0; DEVICE_CATEGORIES[i] != nullptr; ++i) {
    if (device_type == DEVICE_CATEGORIES[i])
      return true;
  }
  return false;
}

int device_type_rank(const std::string &device_type) {
  if (device_type.empty() || device_type == UNKNOWN_DEVICE_TYPE)
    return 0;
  if (is_known_device_category(device_type))
    return 2;
  return 1;
}

static bool upgrade_text(std::string *stored, const std::string &incoming) {
  if (incoming.empty() || *stored == incoming)
    return false;
  *stored = incoming;
  return true;
}

bool upgrade_identity(IdentityFields *stored, const IdentityFields &incoming) {
  bool changed = false;
  changed |= upgrade_text(&stored->hostname, incoming.hostname);
  changed |= upgrade_text(&stored->ip_address, incoming.ip_address);
  changed |= upgrade_text(&stored->manufacturer, incoming.manufacturer);

  if (!incoming.device_type.empty() &&
      incoming.device_type != stored->device_type &&
      device_type_rank(incoming.device_type) >=
          device_type_rank(stored->device_type)) {
    stored->device_type = incoming.device_type;
    changed = true;
  }
  return changed;
}

} // namespace wifi_ranger
