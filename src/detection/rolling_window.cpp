#include "rolling_window.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace detection {

RollingWindow::RollingWindow(size_t capacity, double alpha)
    : capacity_(capacity), alpha_(alpha) {
  if (capacity == 0) {
    throw std::invalid_argument("Window capacity must be greater than 0");
  }
  if (!(alpha >= 0.0 && alpha <= 1.0)) {
    throw std::invalid_argument("Alpha must be between 0.0 and 1.0");
  }
}

bool RollingWindow::add(const Sample &sample) {
  bool evicted = false;
  if (samples_.size() >= capacity_) {
    double oldest = samples_.front().value;
    samples_.pop_front();
    pop_stats(oldest);
    evicted = true;
  }

  samples_.push_back(sample);
  push_stats(sample.value);

  if (!ewma_initialized_) {
    ewma_ = sample.value;
    ewma_initialized_ = true;
  } else {
    // Incremental form keeps a constant signal exactly at its seed
    ewma_ += alpha_ * (sample.value - ewma_);
  }

  if (evicted && ++evictions_since_resync_ >= capacity_) {
    resync();
  }

  total_sample_count_++;
  return evicted;
}

void RollingWindow::push_stats(double value) {
  const double n = static_cast<double>(samples_.size());
  const double delta = value - mean_;
  mean_ += delta / n;
  m2_ += delta * (value - mean_);
}

void RollingWindow::pop_stats(double value) {
  // samples_ already excludes `value` here
  const size_t remaining = samples_.size();
  if (remaining == 0) {
    mean_ = 0.0;
    m2_ = 0.0;
    return;
  }

  const double old_mean = mean_;
  mean_ = old_mean - (value - old_mean) / static_cast<double>(remaining);
  m2_ -= (value - old_mean) * (value - mean_);
  if (m2_ < 0.0)
    m2_ = 0.0;
}

// Recomputes the accumulators from scratch to bound floating point drift
// from repeated removals.
void RollingWindow::resync() {
  evictions_since_resync_ = 0;
  if (samples_.empty()) {
    mean_ = 0.0;
    m2_ = 0.0;
    return;
  }

  double sum = 0.0;
  for (const auto &s : samples_)
    sum += s.value;
  const double mean = sum / static_cast<double>(samples_.size());

  double m2 = 0.0;
  for (const auto &s : samples_) {
    const double d = s.value - mean;
    m2 += d * d;
  }
  mean_ = mean;
  m2_ = m2;
}

double RollingWindow::mean() const { return mean_; }

double RollingWindow::variance() const {
  if (samples_.empty())
    return 0.0;
  return std::max(0.0, m2_ / static_cast<double>(samples_.size()));
}

double RollingWindow::standard_deviation() const {
  return std::sqrt(variance());
}

const Sample &RollingWindow::latest() const {
  if (samples_.empty()) {
    throw std::out_of_range("Rolling window is empty");
  }
  return samples_.back();
}

double RollingWindow::get_percentile(double percentile,
                                     bool exclude_latest) const {
  if (percentile < 0.0 || percentile > 1.0) {
    throw std::invalid_argument("Percentile must be between 0.0 and 1.0");
  }

  std::vector<double> sorted_values;
  sorted_values.reserve(samples_.size());
  auto end = samples_.end();
  if (exclude_latest && !samples_.empty())
    --end;
  for (auto it = samples_.begin(); it != end; ++it)
    sorted_values.push_back(it->value);

  if (sorted_values.empty()) {
    throw std::out_of_range("No samples available for percentile");
  }
  std::sort(sorted_values.begin(), sorted_values.end());
  if (sorted_values.size() == 1) {
    return sorted_values[0];
  }

  // Linear interpolation for percentile calculation
  double index = percentile * static_cast<double>(sorted_values.size() - 1);
  size_t lower_index = static_cast<size_t>(std::floor(index));
  size_t upper_index = static_cast<size_t>(std::ceil(index));

  if (lower_index == upper_index) {
    return sorted_values[lower_index];
  }

  double weight = index - static_cast<double>(lower_index);
  return sorted_values[lower_index] * (1.0 - weight) +
         sorted_values[upper_index] * weight;
}

std::vector<Sample> RollingWindow::samples() const {
  return std::vector<Sample>(samples_.begin(), samples_.end());
}

void RollingWindow::reset() {
  samples_.clear();
  mean_ = 0.0;
  m2_ = 0.0;
  ewma_ = 0.0;
  ewma_initialized_ = false;
  evictions_since_resync_ = 0;
  total_sample_count_ = 0;
}

} // namespace detection
