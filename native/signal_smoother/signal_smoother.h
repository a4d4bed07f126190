/*
 * signal_smoother.h — Trailing moving average over a bounded RSSI history
 */

#ifndef WIFI_RANGER_SIGNAL_SMOOTHER_H
#define WIFI_RANGER_SIGNAL_SMOOTHER_H

#include <cstddef>
#include <vector>

namespace wifi_ranger {

struct SmoothedSignal {
  std::vector<int> history; // oldest first, size <= capacity
  double smoothed_rssi;
};

class SignalSmoother {
public:
  // capacity < 1 is treated as 1
  explicit SignalSmoother(size_t capacity);

  // Append new_rssi, drop the oldest samples beyond capacity, and return the
  // new history with its arithmetic mean. The input history is not modified.
  SmoothedSignal update(const std::vector<int> &history, int new_rssi) const;

  size_t capacity() const { return capacity_; }

private:
  size_t capacity_;
};

// Mean of the samples; 0.0 for an empty history.
double mean_rssi(const std::vector<int> &history);

} // namespace wifi_ranger

#endif // WIFI_RANGER_SIGNAL_SMOOTHER_H
