#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include "sample.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace detection {

/**
 * Fixed-capacity window of recent samples for one signal.
 *
 * Mean and population variance are maintained incrementally (Welford) over
 * exactly the samples currently in the window, including the newest one.
 * The EWMA is seeded to the first value ever added and is never reset by
 * eviction. Not thread-safe; the owning detector serializes access.
 */
class RollingWindow {
public:
  /**
   * @param capacity Number of samples kept (> 0)
   * @param alpha EWMA smoothing factor in [0, 1]
   */
  RollingWindow(size_t capacity, double alpha);

  // Appends a sample, evicting the oldest when full. Returns true if a
  // sample was evicted.
  bool add(const Sample &sample);

  size_t size() const { return samples_.size(); }
  size_t capacity() const { return capacity_; }
  bool full() const { return samples_.size() >= capacity_; }
  bool empty() const { return samples_.empty(); }

  double mean() const;
  double variance() const;
  double standard_deviation() const;

  double ewma() const { return ewma_; }
  bool ewma_initialized() const { return ewma_initialized_; }

  const Sample &latest() const;

  /**
   * Percentile by linear interpolation between closest ranks.
   * @param percentile Value between 0.0 and 1.0
   * @param exclude_latest Compute over every sample but the newest
   */
  double get_percentile(double percentile, bool exclude_latest = false) const;

  std::vector<Sample> samples() const;
  uint64_t total_sample_count() const { return total_sample_count_; }

  void reset();

private:
  void push_stats(double value);
  void pop_stats(double value);
  void resync();

  size_t capacity_;
  double alpha_;
  std::deque<Sample> samples_;

  // Welford accumulators over the window contents
  double mean_ = 0.0;
  double m2_ = 0.0;

  double ewma_ = 0.0;
  bool ewma_initialized_ = false;

  size_t evictions_since_resync_ = 0;
  uint64_t total_sample_count_ = 0;
};

} // namespace detection

#endif // ROLLING_WINDOW_HPP
