/*
 * device_type_rules.h — Ordered device-type inference table
 *
 * Rules are evaluated top-down and the first match wins, so specific
 * categories sit above general ones ("Android Tablet" above
 * "Android Phone", "Smart Display" above "Smart Speaker").
 */

#ifndef WIFI_RANGER_DEVICE_TYPE_RULES_H
#define WIFI_RANGER_DEVICE_TYPE_RULES_H

#include <cstddef>
#include <string>

namespace wifi_ranger {

enum class MatchField {
  HOSTNAME,
  MANUFACTURER,
  EITHER,
};

struct DeviceTypeRule {
  const char *category;
  MatchField field;
  const char *const *keywords; // lowercase, nullptr-terminated
};

// The rule table, in evaluation order.
const DeviceTypeRule *device_type_rules(size_t *count);

// Case-insensitive substring match of the rule against the inputs.
bool rule_matches(const DeviceTypeRule &rule, const std::string &hostname,
                  const std::string &manufacturer);

// First matching category; otherwise "<manufacturer> Device" when the
// manufacturer is known, else "Unknown Device".
std::string infer_device_type(const std::string &hostname,
                              const std::string &manufacturer);

} // namespace wifi_ranger

#endif // WIFI_RANGER_DEVICE_TYPE_RULES_H
