/*
 * distance_estimator.h — Log-distance path-loss model
 *
 *   distance = 10 ^ ((reference_power - rssi) / (10 * n))
 *
 * reference_power: expected RSSI at 1 m (default -50 dBm)
 * n              : path-loss exponent (free space ~2.0, indoor ~3-4)
 *
 * Coarse by nature (about +/-2-3 m). No upper clamp.
 */

#ifndef WIFI_RANGER_DISTANCE_ESTIMATOR_H
#define WIFI_RANGER_DISTANCE_ESTIMATOR_H

namespace wifi_ranger {

static constexpr double DEFAULT_REFERENCE_POWER_DBM = -50.0;
static constexpr double DEFAULT_PATH_LOSS_EXPONENT = 3.0;

// Returns 0.0 if path_loss_exponent is not positive.
double estimate_distance(double smoothed_rssi, double reference_power,
                         double path_loss_exponent);

// Round to centimetres for presentation.
double round_distance(double distance_m);

} // namespace wifi_ranger

#endif // WIFI_RANGER_DISTANCE_ESTIMATOR_H
