#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "anomaly_event.hpp"
#include "core/config.hpp"
#include "rolling_window.hpp"
#include "sample.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

class MetricsRegistry;

namespace detection {

// Copy of a detector's statistics at one moment.
struct DetectorState {
  size_t window_count = 0;
  size_t window_size = 0;
  double mean = 0.0;
  double variance = 0.0;
  double ewma = 0.0;
  bool ewma_initialized = false;
};

/**
 * Spike detector for one signal.
 *
 * A full window fires only when both the z-score and the relative EWMA
 * deviation exceed their thresholds. Until the window fills, an optional
 * percentile fallback decides with capped confidence. Every public method
 * takes the detector's own lock, so one signal is never read and written
 * concurrently while different signals proceed in parallel.
 */
class AnomalyDetector {
public:
  AnomalyDetector(std::string signal, const Config::DetectionConfig &config,
                  MetricsRegistry *metrics = nullptr);

  AnomalyDetector(const AnomalyDetector &) = delete;
  AnomalyDetector &operator=(const AnomalyDetector &) = delete;

  // Returns false if the sample was rejected (non-finite value). A rejected
  // sample leaves the state untouched.
  bool ingest(const Sample &sample);

  AnomalyEvent evaluate() const;

  // Ingest and evaluate under one lock so the event describes this sample.
  AnomalyEvent ingest_and_evaluate(const Sample &sample);

  // Restores persisted history, oldest first. Returns the number accepted.
  size_t seed_history(const std::vector<Sample> &history);

  DetectorState state() const;
  const std::string &signal() const { return signal_; }

private:
  bool ingest_locked(const Sample &sample);
  AnomalyEvent evaluate_locked() const;
  AnomalyEvent evaluate_statistical(const Sample &current) const;
  AnomalyEvent evaluate_fallback(const Sample &current) const;
  AnomalyEvent make_event(const Sample &current) const;
  double ewma_deviation(double current) const;

  std::string signal_;
  Config::DetectionConfig config_;
  MetricsRegistry *metrics_;

  mutable std::mutex mutex_;
  RollingWindow window_;
};

} // namespace detection

#endif // ANOMALY_DETECTOR_HPP
