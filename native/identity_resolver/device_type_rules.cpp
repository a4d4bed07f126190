/*
 * device_type_rules.cpp — Ordered device-type inference table
 */

#include "identity_resolver/device_type_rules.h"

#include <cctype>

#include "common/device_model.h"

namespace wifi_ranger {

// =========================================================================
// KEYWORDS
// =========================================================================

static const char *const ANDROID_TABLET_KW[] = {
    "galaxy-tab", "nexus-tablet", "pixel-tablet", nullptr};
static const char *const SMART_DISPLAY_KW[] = {
    "echo-show", "nest-hub",     "portal",      "smart-display",
    "home-hub",  "smart-screen", nullptr};
static const char *const APPLE_TV_KW[] = {"appletv", "apple-tv", nullptr};
static const char *const APPLE_WATCH_KW[] = {"apple-watch", "watch", nullptr};
static const char *const IPHONE_KW[] = {"iphone", nullptr};
static const char *const IPAD_KW[] = {"ipad", nullptr};
static const char *const MACBOOK_KW[] = {"macbook", "mac-book", "mbp", "mba",
                                         nullptr};
static const char *const IMAC_KW[] = {"imac", nullptr};
static const char *const CAMERA_KW[] = {"nest-cam", "camera",       "arlo",
                                        "wyze",     "doorbell",     "surveillance",
                                        "ring-",    "cam",          nullptr};
static const char *const CAMERA_VENDOR_KW[] = {"ring", nullptr};
static const char *const SPEAKER_KW[] = {"echo",       "alexa", "homepod",
                                         "google-home", "nest-audio",
                                         "sonos",      "speaker", nullptr};
static const char *const MEDIA_KW[] = {"roku",    "firetv",       "fire-tv",
                                       "shield",  "media-player", "streaming",
                                       "dvr",     "tivo",         nullptr};
static const char *const SMART_TV_KW[] = {
    "smart-tv", "samsung-tv", "lg-tv",      "chromecast", "bravia",
    "vizio",    "hisense",    "television", "tv",         nullptr};
static const char *const CONSOLE_KW[] = {"playstation", "ps4",    "ps5",
                                         "xbox",        "nintendo", "switch",
                                         "gaming",      nullptr};
static const char *const ANDROID_PHONE_KW[] = {
    "android", "samsung", "galaxy", "pixel", "oneplus", "huawei",
    "xiaomi",  "redmi",   "oppo",   "vivo",  "realme",  nullptr};
static const char *const HUB_KW[] = {"smartthings", "home-assistant", "homekit",
                                     "zigbee",      "z-wave",
                                     "smart-hub",   "hub",            nullptr};
static const char *const PRINTER_KW[] = {"printer",   "print",     "scanner",
                                         "mfp",       "officejet", "laserjet",
                                         "epson",     "canon",     nullptr};
static const char *const LAPTOP_KW[] = {"laptop", "notebook", "thinkpad",
                                        "chromebook", "surface", "lenovo",
                                        "dell",   "acer",     "asus",
                                        "hp",     nullptr};
static const char *const DESKTOP_KW[] = {"desktop", "workstation", "computer",
                                         "pc", nullptr};
static const char *const NETWORK_KW[] = {"router",   "access-point", "gateway",
                                         "bridge",   "modem",        "network",
                                         "wireless", "wifi",         "ap",
                                         nullptr};

// =========================================================================
// RULE TABLE
// =========================================================================

static const DeviceTypeRule RULES[] = {
    {"Android Tablet", MatchField::EITHER, ANDROID_TABLET_KW},
    {"Smart Display", MatchField::EITHER, SMART_DISPLAY_KW},
    {"Apple TV", MatchField::EITHER, APPLE_TV_KW},
    {"Apple Watch", MatchField::HOSTNAME, APPLE_WATCH_KW},
    {"iPhone", MatchField::EITHER, IPHONE_KW},
    {"iPad", MatchField::EITHER, IPAD_KW},
    {"MacBook", MatchField::EITHER, MACBOOK_KW},
    {"iMac", MatchField::EITHER, IMAC_KW},
    {"Security Camera", MatchField::HOSTNAME, CAMERA_KW},
    {"Security Camera", MatchField::MANUFACTURER, CAMERA_VENDOR_KW},
    {"Smart Speaker", MatchField::EITHER, SPEAKER_KW},
    {"Media Device", MatchField::HOSTNAME, MEDIA_KW},
    {"Smart TV", MatchField::HOSTNAME, SMART_TV_KW},
    {"Gaming Console", MatchField::EITHER, CONSOLE_KW},
    {"Android Phone", MatchField::EITHER, ANDROID_PHONE_KW},
    {"Smart Home Hub", MatchField::HOSTNAME, HUB_KW},
    {"Printer", MatchField::EITHER, PRINTER_KW},
    {"Laptop", MatchField::HOSTNAME, LAPTOP_KW},
    {"Desktop", MatchField::HOSTNAME, DESKTOP_KW},
    {"Network Device", MatchField::HOSTNAME, NETWORK_KW},
};

const DeviceTypeRule *device_type_rules(size_t *count) {
  if (count)
    *count = sizeof(RULES) / sizeof(RULES[0]);
  return RULES;
}

// =========================================================================
// MATCHING
// =========================================================================

static std::string to_lower(const std::string &s) {
  std::string out(s);
  for (char &c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static bool contains_any(const std::string &lowered,
                         const char *const *keywords) {
  if (lowered.empty())
    return false;
  for (int i = 0; keywords[i] != nullptr; ++i) {
    if (lowered.find(keywords[i]) != std::string::npos)
      return true;
  }
  return false;
}

bool rule_matches(const DeviceTypeRule &rule, const std::string &hostname,
                  const std::string &manufacturer) {
  const bool use_host = rule.field != MatchField::MANUFACTURER;
  const bool use_vendor = rule.field != MatchField::HOSTNAME;
  if (use_host && contains_any(to_lower(hostname), rule.keywords))
    return true;
  if (use_vendor && contains_any(to_lower(manufacturer), rule.keywords))
    return true;
  return false;
}

std::string infer_device_type(const std::string &hostname,
                              const std::string &manufacturer) {
  size_t count = 0;
  const DeviceTypeRule *rules = device_type_rules(&count);
  for (size_t i = 0; i < count; ++i) {
    if (rule_matches(rules[i], hostname, manufacturer))
      return rules[i].category;
  }

  if (!manufacturer.empty())
    return manufacturer + GENERIC_DEVICE_SUFFIX;
  return UNKNOWN_DEVICE_TYPE;
}

} // namespace wifi_ranger
