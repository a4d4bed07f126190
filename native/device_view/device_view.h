/*
 * device_view.h — JSON views of registry, settings and scheduler status
 *
 * Device list:
 *   {"devices": {"AA:BB:CC:DD:EE:FF": {"mac_address": ..., "distance": 3.16,
 *     "device_type": ..., "manufacturer": ..., "hostname": null,
 *     "ip_address": null, "ssid": ..., "rssi": -65,
 *     "last_seen": "2026-10-17T12:00:00Z"}}}
 *
 * Distances are rounded to 2 decimals; devices farther than the threshold
 * are left out; empty identity fields render as null.
 */

#ifndef WIFI_RANGER_DEVICE_VIEW_H
#define WIFI_RANGER_DEVICE_VIEW_H

#include <map>
#include <string>

#include "common/device_model.h"
#include "device_registry/device_registry.h"
#include "monitor_config/monitor_config.h"
#include "scan_scheduler/scan_scheduler.h"

namespace wifi_ranger {

std::string json_escape(const std::string &s);

// "2026-10-17T12:00:00Z"
std::string format_iso8601_utc(TimePoint t);

std::string render_devices_json(const std::map<std::string, DeviceState> &devices,
                                double distance_threshold_m);

std::string render_settings_json(const MonitorConfig &config);

std::string render_status_json(const SchedulerStats &sched,
                               const CycleReport &last_cycle,
                               const RegistryStats &registry,
                               size_t device_count, TimePoint now);

} // namespace wifi_ranger

#endif // WIFI_RANGER_DEVICE_VIEW_H
