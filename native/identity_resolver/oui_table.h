/*
 * oui_table.h — OUI prefix -> manufacturer table
 *
 * Built-in entries cover common consumer devices. A Wireshark `manuf` file
 * can extend the table at startup; built-in names are kept on conflict.
 */

#ifndef WIFI_RANGER_OUI_TABLE_H
#define WIFI_RANGER_OUI_TABLE_H

#include <string>
#include <unordered_map>

namespace wifi_ranger {

class OuiTable {
public:
  OuiTable();

  // "AA:BB:CC" -> manufacturer, "" on miss.
  std::string lookup(const std::string &prefix) const;

  // Parse `manuf` text ("00:00:0C<TAB>Cisco<TAB>Cisco Systems, Inc").
  // Only 24-bit prefixes are taken. Returns the number of entries added.
  size_t load_manuf_text(const std::string &text);

  bool load_manuf_file(const std::string &path, size_t *added,
                       std::string *reason);

  size_t size() const { return vendors_.size(); }

private:
  std::unordered_map<std::string, std::string> vendors_;
};

} // namespace wifi_ranger

#endif // WIFI_RANGER_OUI_TABLE_H
