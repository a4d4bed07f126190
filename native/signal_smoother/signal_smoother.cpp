/*
 * signal_smoother.cpp — Trailing moving average over a bounded RSSI history
 */

#include "signal_smoother/signal_smoother.h"

namespace wifi_ranger {

SignalSmoother::SignalSmoother(size_t capacity)
    : capacity_(capacity < 1 ? 1 : capacity) {}

SmoothedSignal SignalSmoother::update(const std::vector<int> &history,
                                      int new_rssi) const {
  SmoothedSignal out;

  // Keep at most capacity-1 of the newest old samples, then append.
  size_t keep = history.size();
  if (keep > capacity_ - 1)
    keep = capacity_ - 1;
  out.history.reserve(keep + 1);
  out.history.assign(history.end() - static_cast<std::ptrdiff_t>(keep),
                     history.end());
  out.history.push_back(new_rssi);

  out.smoothed_rssi = mean_rssi(out.history);
  return out;
}

double mean_rssi(const std::vector<int> &history) {
  if (history.empty())
    return 0.0;
  long long sum = 0;
  for (int v : history)
    sum += v;
  return static_cast<double>(sum) / static_cast<double>(history.size());
}

} // namespace wifi_ranger
