/*
 * test_common.cpp — Tests for MAC handling, identity ranking, logging levels
 * and atomic file writes
 */

#include <cmath>
#include <cstdio>
#include <string>

#include <unistd.h>

#include "common/atomic_file.h"
#include "common/device_model.h"
#include "common/log.h"

using namespace wifi_ranger;

// =========================================================================
// TESTS
// =========================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define ASSERT_TRUE(expr, msg)                                                 \
  do {                                                                         \
    if (!(expr)) {                                                             \
      printf("FAIL: %s\n", msg);                                               \
      tests_failed++;                                                          \
    } else {                                                                   \
      printf("PASS: %s\n", msg);                                               \
      tests_passed++;                                                          \
    }                                                                          \
  } while (0)

#define ASSERT_FALSE(expr, msg) ASSERT_TRUE(!(expr), msg)
#define ASSERT_EQ(a, b, msg) ASSERT_TRUE((a) == (b), msg)
#define ASSERT_NEAR(a, b, eps, msg) ASSERT_TRUE(std::fabs((a) - (b)) <= (eps), msg)

static void test_parse_mac_canonicalizes() {
  std::string mac;
  ASSERT_TRUE(parse_mac("aa:bb:cc:0d:ee:ff", &mac), "Lowercase MAC accepted");
  ASSERT_EQ(mac, std::string("AA:BB:CC:0D:EE:FF"), "MAC uppercased");
}

static void test_parse_mac_rejects_malformed() {
  ASSERT_FALSE(parse_mac("AA-BB-CC-DD-EE-FF", nullptr), "Dashes rejected");
  ASSERT_FALSE(parse_mac("AA:BB:CC:DD:EE", nullptr), "Short MAC rejected");
  ASSERT_FALSE(parse_mac("AA:BB:CC:DD:EE:FG", nullptr), "Non-hex rejected");
  ASSERT_FALSE(parse_mac("AABB:CC:DD:EE:FF0", nullptr),
               "Misplaced colon rejected");
  ASSERT_FALSE(parse_mac("", nullptr), "Empty rejected");
}

static void test_oui_prefix() {
  ASSERT_EQ(oui_prefix("A8:5C:2C:01:02:03"), std::string("A8:5C:2C"),
            "OUI is first three octets");
}

static void test_device_type_rank() {
  ASSERT_EQ(device_type_rank(""), 0, "Empty type rank 0");
  ASSERT_EQ(device_type_rank(UNKNOWN_DEVICE_TYPE), 0, "Unknown Device rank 0");
  ASSERT_EQ(device_type_rank("Acme Device"), 1, "Generic type rank 1");
  ASSERT_EQ(device_type_rank("iPhone"), 2, "Rule category rank 2");
  ASSERT_EQ(device_type_rank("Smart Speaker"), 2, "Smart Speaker rank 2");
}

static void test_upgrade_identity_never_downgrades() {
  IdentityFields stored;
  stored.hostname = "johns-iphone";
  stored.ip_address = "192.168.1.20";
  stored.manufacturer = "Apple";
  stored.device_type = "iPhone";

  IdentityFields incoming;
  incoming.device_type = "Apple Device";
  ASSERT_FALSE(upgrade_identity(&stored, incoming),
               "Empty fields and weaker type change nothing");
  ASSERT_EQ(stored.hostname, std::string("johns-iphone"), "Hostname kept");
  ASSERT_EQ(stored.ip_address, std::string("192.168.1.20"), "IP kept");
  ASSERT_EQ(stored.device_type, std::string("iPhone"), "Category kept");

  incoming.device_type = UNKNOWN_DEVICE_TYPE;
  upgrade_identity(&stored, incoming);
  ASSERT_EQ(stored.device_type, std::string("iPhone"),
            "Unknown never replaces category");
}

static void test_upgrade_identity_upgrades() {
  IdentityFields stored;
  stored.device_type = UNKNOWN_DEVICE_TYPE;

  IdentityFields incoming;
  incoming.manufacturer = "Sonos";
  incoming.device_type = "Sonos Device";
  ASSERT_TRUE(upgrade_identity(&stored, incoming), "Generic beats unknown");
  ASSERT_EQ(stored.device_type, std::string("Sonos Device"), "Generic stored");
  ASSERT_EQ(stored.manufacturer, std::string("Sonos"), "Manufacturer filled");

  incoming.device_type = "Smart Speaker";
  ASSERT_TRUE(upgrade_identity(&stored, incoming), "Category beats generic");
  ASSERT_EQ(stored.device_type, std::string("Smart Speaker"), "Category stored");

  incoming.ip_address = "10.0.0.7";
  upgrade_identity(&stored, incoming);
  incoming.ip_address = "10.0.0.8";
  upgrade_identity(&stored, incoming);
  ASSERT_EQ(stored.ip_address, std::string("10.0.0.8"),
            "New non-empty IP replaces old lease");
}

static void test_parse_log_level() {
  LogLevel lvl = LogLevel::INFO;
  ASSERT_TRUE(parse_log_level("DEBUG", &lvl), "DEBUG parses");
  ASSERT_TRUE(lvl == LogLevel::DEBUG, "DEBUG value");
  ASSERT_TRUE(parse_log_level("warning", &lvl), "warning alias parses");
  ASSERT_TRUE(lvl == LogLevel::WARN, "warning maps to WARN");
  ASSERT_FALSE(parse_log_level("verbose", &lvl), "Unknown level rejected");
  ASSERT_TRUE(lvl == LogLevel::WARN, "Rejected level leaves value");

  const LogLevel all[] = {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                          LogLevel::ERROR};
  for (LogLevel l : all) {
    LogLevel parsed = LogLevel::INFO;
    ASSERT_TRUE(parse_log_level(log_level_option_name(l), &parsed) &&
                    parsed == l,
                "Option name parses back to the same level");
  }
  ASSERT_EQ(std::string(log_level_option_name(LogLevel::INFO)),
            std::string("info"), "Option name is lowercase");
}

static void test_atomic_write_and_read() {
  char path[] = "/tmp/wifi_ranger_test_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_TRUE(fd >= 0, "Temp file created");
  if (fd < 0)
    return;
  close(fd);

  ASSERT_TRUE(write_file_atomic(path, "{\"devices\": {}}\n"),
              "Atomic write succeeds");
  std::string back;
  ASSERT_TRUE(read_file(path, &back), "File reads back");
  ASSERT_EQ(back, std::string("{\"devices\": {}}\n"), "Contents match");
  ASSERT_TRUE(access((std::string(path) + ".tmp").c_str(), F_OK) != 0,
              "No temp file left behind");
  std::remove(path);

  ASSERT_FALSE(write_file_atomic("/nonexistent-dir/x.json", "x"),
               "Write into missing directory fails");
  ASSERT_FALSE(read_file("/nonexistent-dir/x.json", &back),
               "Read of missing file fails");
}

extern "C" bool test_common() {
  tests_passed = 0;
  tests_failed = 0;

  test_parse_mac_canonicalizes();
  test_parse_mac_rejects_malformed();
  test_oui_prefix();
  test_device_type_rank();
  test_upgrade_identity_never_downgrades();
  test_upgrade_identity_upgrades();
  test_parse_log_level();
  test_atomic_write_and_read();

  printf("  common: %d passed, %d failed\n", tests_passed, tests_failed);
  return tests_failed == 0;
}
