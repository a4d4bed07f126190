/*
 * scan_parser.cpp — Scan Record Parser
 *
 * Header first: column offsets (fixed-width) or field indexes (delimited)
 * come from the header line. Data lines are then matched against them.
 * Fixed-width lines are tokenized and tokens are assigned to columns by
 * nearest header offset, so a one-character drift between tool versions or
 * an SSID longer than its column does not break the line.
 */

#include "scan_parser/scan_parser.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>

#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "PARSER";

// =========================================================================
// COLUMN NAMES
// =========================================================================

static const char *const MAC_COLUMN_NAMES[] = {
    "BSSID", "MAC", "ADDRESS", "WLAN.SA", "WLAN.BSSID", "WLAN.TA", nullptr};

static const char *const RSSI_COLUMN_NAMES[] = {
    "RSSI", "SIGNAL", "SIGNAL LEVEL", "DBM", "RADIOTAP.DBM_ANTSIGNAL", nullptr};

static const char *const SSID_COLUMN_NAMES[] = {"SSID", "ESSID", "WLAN.SSID",
                                                nullptr};

static bool name_in(const std::string &name, const char *const *names) {
  for (int i = 0; names[i] != nullptr; ++i) {
    if (name == names[i])
      return true;
  }
  return false;
}

const char *parse_status_name(ParseStatus s) {
  switch (s) {
  case ParseStatus::OK:
    return "OK";
  case ParseStatus::EMPTY_INPUT:
    return "EMPTY_INPUT";
  case ParseStatus::HEADER_NOT_FOUND:
    return "HEADER_NOT_FOUND";
  default:
    return "UNKNOWN";
  }
}

// =========================================================================
// TEXT HELPERS
// =========================================================================

static std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

static std::string to_upper(const std::string &s) {
  std::string out(s);
  for (char &c : out)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

static bool is_blank(const std::string &s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

static std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos)
      nl = text.size();
    std::string line = text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(line);
    start = nl + 1;
  }
  return lines;
}

static std::vector<std::string> split_on(const std::string &s,
                                         const std::string &sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + sep.size();
  }
  return out;
}

struct Token {
  size_t start;
  size_t end;
  std::string text;
};

static std::vector<Token> tokenize(const std::string &line) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
      ++i;
    if (i >= line.size())
      break;
    size_t start = i;
    while (i < line.size() &&
           !std::isspace(static_cast<unsigned char>(line[i])))
      ++i;
    tokens.push_back({start, i, line.substr(start, i - start)});
  }
  return tokens;
}

static size_t distance_between(size_t a, size_t b) {
  return a > b ? a - b : b - a;
}

// =========================================================================
// RSSI FIELD
// =========================================================================

bool parse_rssi_field(const std::string &field, int *out) {
  std::string s = trim(field);
  if (s.size() >= 3) {
    std::string unit = to_upper(s.substr(s.size() - 3));
    if (unit == "DBM")
      s = trim(s.substr(0, s.size() - 3));
  }
  if (s.empty())
    return false;

  errno = 0;
  char *end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str())
    return false;

  if (*end == '.') {
    ++end;
    if (*end == '\0')
      return false;
    while (*end == '0')
      ++end;
  }
  if (*end != '\0')
    return false;

  if (v < RSSI_MIN_DBM || v > RSSI_MAX_DBM)
    return false;

  *out = static_cast<int>(v);
  return true;
}

// =========================================================================
// HEADER
// =========================================================================

static bool classify_columns(const std::vector<std::string> &names,
                             HeaderLayout *layout) {
  layout->mac_column = -1;
  layout->rssi_column = -1;
  layout->ssid_column = -1;
  for (size_t i = 0; i < names.size(); ++i) {
    const std::string name = to_upper(trim(names[i]));
    const int idx = static_cast<int>(i);
    if (layout->mac_column < 0 && name_in(name, MAC_COLUMN_NAMES))
      layout->mac_column = idx;
    else if (layout->rssi_column < 0 && name_in(name, RSSI_COLUMN_NAMES))
      layout->rssi_column = idx;
    else if (layout->ssid_column < 0 && name_in(name, SSID_COLUMN_NAMES))
      layout->ssid_column = idx;
  }
  layout->column_count = names.size();
  return layout->mac_column >= 0 && layout->rssi_column >= 0;
}

static bool decode_header(const std::string &line, HeaderLayout *layout) {
  layout->column_starts.clear();
  layout->delimiter = '\0';

  // wpa_cli: "bssid / frequency / signal level / flags / ssid", data tabbed
  if (line.find(" / ") != std::string::npos) {
    layout->layout = ColumnLayout::DELIMITED;
    layout->delimiter = '\t';
    return classify_columns(split_on(line, " / "), layout);
  }
  if (line.find('\t') != std::string::npos ||
      line.find(',') != std::string::npos) {
    layout->layout = ColumnLayout::DELIMITED;
    layout->delimiter = line.find('\t') != std::string::npos ? '\t' : ',';
    return classify_columns(split_on(line, std::string(1, layout->delimiter)),
                            layout);
  }

  layout->layout = ColumnLayout::FIXED_WIDTH;
  std::vector<Token> tokens = tokenize(line);
  std::vector<std::string> names;
  for (const Token &t : tokens) {
    names.push_back(t.text);
    layout->column_starts.push_back(t.start);
  }
  return classify_columns(names, layout);
}

bool find_header(const std::vector<std::string> &lines, HeaderLayout *out) {
  for (size_t i = 0; i < lines.size(); ++i) {
    if (is_blank(lines[i]))
      continue;
    HeaderLayout layout;
    if (decode_header(lines[i], &layout)) {
      layout.header_line = i;
      *out = layout;
      return true;
    }
  }
  return false;
}

// =========================================================================
// DATA LINES
// =========================================================================

static bool parse_delimited_line(const std::string &line,
                                 const HeaderLayout &layout, ScanRecord *rec) {
  std::vector<std::string> fields =
      split_on(line, std::string(1, layout.delimiter));
  const size_t needed =
      static_cast<size_t>(std::max(layout.mac_column, layout.rssi_column)) + 1;
  if (fields.size() < needed)
    return false;

  if (!parse_mac(trim(fields[layout.mac_column]), &rec->mac))
    return false;
  if (!parse_rssi_field(fields[layout.rssi_column], &rec->rssi))
    return false;

  rec->ssid.clear();
  if (layout.ssid_column >= 0 &&
      static_cast<size_t>(layout.ssid_column) < fields.size())
    rec->ssid = trim(fields[layout.ssid_column]);
  return true;
}

static bool parse_fixed_width_line(const std::string &line,
                                   const HeaderLayout &layout,
                                   ScanRecord *rec) {
  std::vector<Token> tokens = tokenize(line);
  if (tokens.empty())
    return false;

  const size_t mac_start = layout.column_starts[layout.mac_column];
  const size_t rssi_start = layout.column_starts[layout.rssi_column];

  // MAC: the strict-pattern token nearest the header's address offset.
  int mac_idx = -1;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (!parse_mac(tokens[i].text, nullptr))
      continue;
    if (mac_idx < 0 ||
        distance_between(tokens[i].start, mac_start) <
            distance_between(tokens[mac_idx].start, mac_start))
      mac_idx = static_cast<int>(i);
  }
  if (mac_idx < 0 || !parse_mac(tokens[mac_idx].text, &rec->mac))
    return false;

  // RSSI: the token nearest the header's signal offset, on the same side of
  // the MAC as in the header.
  const bool rssi_after_mac = layout.rssi_column > layout.mac_column;
  int rssi_idx = -1;
  for (size_t i = 0; i < tokens.size(); ++i) {
    const int idx = static_cast<int>(i);
    if (idx == mac_idx)
      continue;
    if (rssi_after_mac ? idx < mac_idx : idx > mac_idx)
      continue;
    if (rssi_idx < 0 ||
        distance_between(tokens[i].start, rssi_start) <
            distance_between(tokens[rssi_idx].start, rssi_start))
      rssi_idx = idx;
  }
  if (rssi_idx < 0 || !parse_rssi_field(tokens[rssi_idx].text, &rec->rssi))
    return false;

  rec->ssid.clear();
  if (layout.ssid_column >= 0) {
    const size_t col = static_cast<size_t>(layout.ssid_column);
    size_t begin = col == 0 ? 0 : layout.column_starts[col];
    size_t end = std::string::npos;
    if (layout.ssid_column + 1 == layout.mac_column)
      end = tokens[mac_idx].start;
    else if (col + 1 < layout.column_starts.size())
      end = layout.column_starts[col + 1];
    if (begin < line.size()) {
      if (end != std::string::npos && end < begin)
        end = begin;
      rec->ssid = trim(line.substr(begin, end == std::string::npos
                                              ? std::string::npos
                                              : end - begin));
    }
  }
  return true;
}

// =========================================================================
// ENTRY POINT
// =========================================================================

ParseResult parse_scan_output(const std::string &text, TimePoint observed_at) {
  ParseResult result;
  result.status = ParseStatus::OK;
  result.rejected_lines = 0;

  if (is_blank(text)) {
    result.status = ParseStatus::EMPTY_INPUT;
    result.reason = "scan produced no output";
    return result;
  }

  std::vector<std::string> lines = split_lines(text);
  HeaderLayout layout;
  if (!find_header(lines, &layout)) {
    result.status = ParseStatus::HEADER_NOT_FOUND;
    result.reason = "no header line naming address and signal columns";
    return result;
  }

  std::map<std::string, size_t> index_by_mac;
  for (size_t i = layout.header_line + 1; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (is_blank(line))
      continue;

    ScanRecord rec;
    rec.observed_at = observed_at;
    const bool ok = layout.layout == ColumnLayout::DELIMITED
                        ? parse_delimited_line(line, layout, &rec)
                        : parse_fixed_width_line(line, layout, &rec);
    if (!ok) {
      ++result.rejected_lines;
      WR_LOG_DEBUG(TAG, "rejected line %zu: '%s'", i + 1, line.c_str());
      continue;
    }

    auto it = index_by_mac.find(rec.mac);
    if (it == index_by_mac.end()) {
      index_by_mac[rec.mac] = result.records.size();
      result.records.push_back(rec);
    } else if (rec.rssi > result.records[it->second].rssi) {
      result.records[it->second] = rec;
    }
  }

  return result;
}

} // namespace wifi_ranger
