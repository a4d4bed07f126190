/*
 * distance_estimator.cpp — Log-distance path-loss model
 */

#include "distance_estimator/distance_estimator.h"

#include <cmath>

namespace wifi_ranger {

double estimate_distance(double smoothed_rssi, double reference_power,
                         double path_loss_exponent) {
  if (!(path_loss_exponent > 0.0))
    return 0.0;
  // Exact 1.0 at the reference point, independent of pow() rounding.
  if (smoothed_rssi == reference_power)
    return 1.0;
  return std::pow(10.0, (reference_power - smoothed_rssi) /
                            (10.0 * path_loss_exponent));
}

double round_distance(double distance_m) {
  return std::round(distance_m * 100.0) / 100.0;
}

} // namespace wifi_ranger
