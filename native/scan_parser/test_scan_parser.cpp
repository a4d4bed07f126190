/*
 * test_scan_parser.cpp — Tests for header detection and scan line parsing
 */

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include "scan_parser/scan_parser.h"

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

// macOS `airport -s`: right-aligned SSID column, BSSID at offset 33
static const char AIRPORT_HEADER[] =
    "                            SSID BSSID             RSSI CHANNEL HT CC "
    "SECURITY (auth/unicast/group)\n";

static const char AIRPORT_HOME[] =
    "                         HomeNet aa:bb:cc:dd:ee:ff -56  6       Y  US "
    "WPA2(PSK/AES/AES)\n";

static const char AIRPORT_SPACED[] =
    "                     My Home Net 11:22:33:44:55:66 -70  11      Y  US "
    "WPA2(PSK/AES/AES)\n";

static const char AIRPORT_BAD_MAC[] =
    "                         BadLine zz:bb:cc:dd:ee:ff -60  6       Y  US "
    "NONE\n";

static const ScanRecord *find_record(const ParseResult &r,
                                     const std::string &mac) {
  for (const ScanRecord &rec : r.records) {
    if (rec.mac == mac)
      return &rec;
  }
  return nullptr;
}

static void test_airport_fixed_width() {
  const TimePoint t = Clock::now();
  std::string text = std::string(AIRPORT_HEADER) + AIRPORT_HOME + AIRPORT_SPACED;
  ParseResult r = parse_scan_output(text, t);

  ASSERT_TRUE(r.status == ParseStatus::OK, "airport output parses");
  ASSERT_EQ(r.records.size(), (size_t)2, "Two records");
  ASSERT_EQ(r.rejected_lines, 0, "No rejected lines");

  const ScanRecord *home = find_record(r, "AA:BB:CC:DD:EE:FF");
  ASSERT_TRUE(home != nullptr, "MAC canonicalized to uppercase");
  if (home) {
    ASSERT_EQ(home->rssi, -56, "RSSI from RSSI column");
    ASSERT_EQ(home->ssid, std::string("HomeNet"), "SSID from SSID column");
    ASSERT_TRUE(home->observed_at == t, "Record stamped with observed_at");
  }

  const ScanRecord *spaced = find_record(r, "11:22:33:44:55:66");
  ASSERT_TRUE(spaced != nullptr, "SSID with spaces does not break the line");
  if (spaced) {
    ASSERT_EQ(spaced->ssid, std::string("My Home Net"), "Spaced SSID whole");
    ASSERT_EQ(spaced->rssi, -70, "Spaced SSID line RSSI");
  }
}

static void test_invalid_mac_line_rejected() {
  std::string text = std::string(AIRPORT_HEADER) + AIRPORT_HOME + AIRPORT_BAD_MAC;
  ParseResult r = parse_scan_output(text, Clock::now());
  ASSERT_TRUE(r.status == ParseStatus::OK, "Cycle survives a bad line");
  ASSERT_EQ(r.records.size(), (size_t)1, "One valid record");
  ASSERT_EQ(r.rejected_lines, 1, "One rejected line");
}

static void test_wpa_cli_delimited() {
  const char *text =
      "Selected interface 'wlan0'\n"
      "bssid / frequency / signal level / flags / ssid\n"
      "aa:bb:cc:dd:ee:01\t2437\t-48\t[WPA2-PSK-CCMP][ESS]\tOffice Net\n"
      "aa:bb:cc:dd:ee:02\t5180\t-77\t[ESS]\t\n";
  ParseResult r = parse_scan_output(text, Clock::now());
  ASSERT_TRUE(r.status == ParseStatus::OK, "wpa_cli output parses");
  ASSERT_EQ(r.records.size(), (size_t)2, "Preamble skipped, two records");
  const ScanRecord *a = find_record(r, "AA:BB:CC:DD:EE:01");
  ASSERT_TRUE(a && a->rssi == -48, "Signal level column used");
  ASSERT_TRUE(a && a->ssid == "Office Net", "Tab-separated SSID");
  const ScanRecord *b = find_record(r, "AA:BB:CC:DD:EE:02");
  ASSERT_TRUE(b && b->ssid.empty(), "Hidden SSID is empty");
}

static void test_csv_without_ssid() {
  const char *text = "wlan.sa,radiotap.dbm_antsignal\n"
                     "de:ad:be:ef:00:01,-61\n"
                     "de:ad:be:ef:00:02,-30 dBm\n";
  ParseResult r = parse_scan_output(text, Clock::now());
  ASSERT_TRUE(r.status == ParseStatus::OK, "CSV output parses");
  ASSERT_EQ(r.records.size(), (size_t)2, "Two CSV records");
  const ScanRecord *b = find_record(r, "DE:AD:BE:EF:00:02");
  ASSERT_TRUE(b && b->rssi == -30, "dBm unit tolerated");
}

static void test_duplicates_keep_strongest() {
  const char *text = "MAC,RSSI\n"
                     "aa:aa:aa:aa:aa:aa,-80\n"
                     "AA:AA:AA:AA:AA:AA,-55\n"
                     "aa:aa:aa:aa:aa:aa,-70\n";
  ParseResult r = parse_scan_output(text, Clock::now());
  ASSERT_EQ(r.records.size(), (size_t)1, "Duplicate MACs collapsed");
  ASSERT_TRUE(!r.records.empty() && r.records[0].rssi == -55,
              "Strongest RSSI kept");
}

static void test_cycle_level_failures() {
  ParseResult empty = parse_scan_output("  \n\n", Clock::now());
  ASSERT_TRUE(empty.status == ParseStatus::EMPTY_INPUT, "Blank -> EMPTY_INPUT");

  ParseResult nohdr =
      parse_scan_output("No networks found\nTry again later\n", Clock::now());
  ASSERT_TRUE(nohdr.status == ParseStatus::HEADER_NOT_FOUND,
              "No header -> HEADER_NOT_FOUND");
  ASSERT_TRUE(nohdr.records.empty(), "No records without header");

  ParseResult only_header = parse_scan_output(AIRPORT_HEADER, Clock::now());
  ASSERT_TRUE(only_header.status == ParseStatus::OK, "Header only is OK");
  ASSERT_TRUE(only_header.records.empty(), "Header only -> zero records");
}

static void test_find_header_skips_preamble() {
  std::vector<std::string> lines = {"", "scan started", "BSSID RSSI SSID",
                                    "aa:bb:cc:dd:ee:ff -40 x"};
  HeaderLayout layout;
  ASSERT_TRUE(find_header(lines, &layout), "Header found after preamble");
  ASSERT_EQ(layout.header_line, (size_t)2, "Header line index");
  ASSERT_TRUE(layout.layout == ColumnLayout::FIXED_WIDTH, "Fixed-width layout");
  ASSERT_EQ(layout.mac_column, 0, "MAC column index");
  ASSERT_EQ(layout.rssi_column, 1, "RSSI column index");
  ASSERT_EQ(layout.ssid_column, 2, "SSID column index");
}

static void test_rssi_field() {
  int v = 0;
  ASSERT_TRUE(parse_rssi_field("-56", &v) && v == -56, "Plain integer");
  ASSERT_TRUE(parse_rssi_field("-56.0", &v) && v == -56, "Zero fraction");
  ASSERT_TRUE(parse_rssi_field("-56dBm", &v) && v == -56, "Unit suffix");
  ASSERT_TRUE(parse_rssi_field("0", &v) && v == 0, "Upper bound 0 accepted");
  ASSERT_TRUE(parse_rssi_field("-100", &v) && v == -100, "Lower bound accepted");
  ASSERT_FALSE(parse_rssi_field("-56.5", &v), "Non-zero fraction rejected");
  ASSERT_FALSE(parse_rssi_field("-101", &v), "Below range rejected");
  ASSERT_FALSE(parse_rssi_field("12", &v), "Positive rejected");
  ASSERT_FALSE(parse_rssi_field("strong", &v), "Text rejected");
  ASSERT_FALSE(parse_rssi_field("", &v), "Empty rejected");
}

extern "C" bool test_scan_parser() {
  tests_passed = 0;
  tests_failed = 0;

  test_airport_fixed_width();
  test_invalid_mac_line_rejected();
  test_wpa_cli_delimited();
  test_csv_without_ssid();
  test_duplicates_keep_strongest();
  test_cycle_level_failures();
  test_find_header_skips_preamble();
  test_rssi_field();

  printf("  scan_parser: %d passed, %d failed\n", tests_passed, tests_failed);
  return tests_failed == 0;
}
