/*
 * scan_parser.h — Scan Record Parser
 *
 * Turns the raw text of one scan invocation into normalized ScanRecords.
 *
 * Supported layouts (derived from the header line, never hard-coded):
 *   - fixed-width columns, e.g. macOS `airport -s`
 *         SSID BSSID             RSSI CHANNEL HT CC SECURITY
 *      HomeNet aa:bb:cc:dd:ee:ff -56  6       Y  US WPA2(PSK/AES/AES)
 *   - delimited columns, e.g. `wpa_cli scan_results` (header " / ", data tab)
 *     or tshark `-T fields -E header=y -E separator=,`
 *
 * A malformed line is skipped and counted. Only empty input or a missing
 * header fails the whole cycle.
 */

#ifndef WIFI_RANGER_SCAN_PARSER_H
#define WIFI_RANGER_SCAN_PARSER_H

#include <string>
#include <vector>

#include "common/device_model.h"

namespace wifi_ranger {

enum class ParseStatus {
  OK,
  EMPTY_INPUT,
  HEADER_NOT_FOUND,
};

const char *parse_status_name(ParseStatus s);

enum class ColumnLayout {
  FIXED_WIDTH,
  DELIMITED,
};

// Column positions learned from the header line.
struct HeaderLayout {
  ColumnLayout layout;
  char delimiter;           // DELIMITED only
  size_t header_line;       // 0-based line index of the header
  int mac_column;           // index into column_starts / fields
  int rssi_column;
  int ssid_column;          // -1 when the tool has no SSID column
  std::vector<size_t> column_starts; // FIXED_WIDTH only
  size_t column_count;
};

struct ParseResult {
  ParseStatus status;
  std::vector<ScanRecord> records; // at most one per MAC
  int rejected_lines;
  std::string reason;
};

// Locate and decode the header. Returns false if no line qualifies.
bool find_header(const std::vector<std::string> &lines, HeaderLayout *out);

// Parse one cycle's output. Every record is stamped with observed_at.
ParseResult parse_scan_output(const std::string &text, TimePoint observed_at);

// Strict integer dBm parse with range check [-100, 0]. Tolerates a trailing
// "dBm" unit and a zero fraction ("-56.0").
bool parse_rssi_field(const std::string &field, int *out);

} // namespace wifi_ranger

#endif // WIFI_RANGER_SCAN_PARSER_H
