#include "anomaly_detector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace detection {

namespace {
// Relative tolerance under which a window is considered flat
constexpr double kFlatTolerance = 1e-9;

double clamp01(double value) { return std::min(1.0, std::max(0.0, value)); }
} // namespace

AnomalyDetector::AnomalyDetector(std::string signal,
                                 const Config::DetectionConfig &config,
                                 MetricsRegistry *metrics)
    : signal_(std::move(signal)), config_(config), metrics_(metrics),
      window_(static_cast<size_t>(std::max(config.window_size, 0)),
              config.ewma_alpha) {}

bool AnomalyDetector::ingest(const Sample &sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ingest_locked(sample);
}

AnomalyEvent AnomalyDetector::evaluate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evaluate_locked();
}

AnomalyEvent AnomalyDetector::ingest_and_evaluate(const Sample &sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ingest_locked(sample)) {
    AnomalyEvent rejected = make_event(sample);
    rejected.decision = Decision::Normal;
    rejected.confidence = {0.0, DetectionBasis::Degraded};
    return rejected;
  }
  return evaluate_locked();
}

size_t AnomalyDetector::seed_history(const std::vector<Sample> &history) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t accepted = 0;
  for (const auto &sample : history) {
    if (ingest_locked(sample))
      accepted++;
  }
  LOG(LogLevel::INFO, LogComponent::DETECTION_WINDOW,
      "Seeded '" << signal_ << "' with " << accepted << " historical samples ("
                 << window_.size() << "/" << window_.capacity()
                 << " window)");
  return accepted;
}

DetectorState AnomalyDetector::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  DetectorState st;
  st.window_count = window_.size();
  st.window_size = window_.capacity();
  st.mean = window_.mean();
  st.variance = window_.variance();
  st.ewma = window_.ewma();
  st.ewma_initialized = window_.ewma_initialized();
  return st;
}

bool AnomalyDetector::ingest_locked(const Sample &sample) {
  if (!std::isfinite(sample.value)) {
    LOG(LogLevel::WARN, LogComponent::DETECTION_WINDOW,
        "Rejected non-finite sample for '" << signal_ << "' at "
                                           << sample.timestamp_ms);
    if (metrics_)
      metrics_->increment(MetricNames::SAMPLES_REJECTED, {{"signal", signal_}});
    return false;
  }

  window_.add(sample);
  if (metrics_)
    metrics_->increment(MetricNames::SAMPLES_INGESTED, {{"signal", signal_}});

  LOG(LogLevel::TRACE, LogComponent::DETECTION_WINDOW,
      "'" << signal_ << "' value=" << sample.value << " mean=" << window_.mean()
          << " ewma=" << window_.ewma() << " n=" << window_.size());
  return true;
}

AnomalyEvent AnomalyDetector::make_event(const Sample &current) const {
  AnomalyEvent event;
  event.timestamp_ms = current.timestamp_ms;
  event.signal = signal_;
  event.value = current.value;
  event.source_tag = current.source_tag;
  return event;
}

double AnomalyDetector::ewma_deviation(double current) const {
  const double ewma = window_.ewma();
  return std::abs(current - ewma) / std::max(ewma, config_.ewma_epsilon);
}

AnomalyEvent AnomalyDetector::evaluate_locked() const {
  if (window_.empty()) {
    AnomalyEvent event;
    event.signal = signal_;
    event.decision = Decision::Insufficient;
    return event;
  }

  const Sample &current = window_.latest();
  try {
    if (window_.full())
      return evaluate_statistical(current);
    return evaluate_fallback(current);
  } catch (const DetectionError &e) {
    LOG(LogLevel::WARN, LogComponent::DETECTION_EVAL,
        "Detection degraded for '" << signal_ << "': " << e.what());
    if (metrics_)
      metrics_->increment(MetricNames::DETECTION_ERRORS, {{"signal", signal_}});

    AnomalyEvent event = make_event(current);
    event.decision = Decision::Normal;
    event.confidence = {0.0, DetectionBasis::Degraded};
    return event;
  }
}

AnomalyEvent
AnomalyDetector::evaluate_statistical(const Sample &current) const {
  AnomalyEvent event = make_event(current);
  event.confidence.basis = DetectionBasis::Statistical;

  const double mean = window_.mean();
  const double stddev = window_.standard_deviation();
  if (!std::isfinite(mean) || !std::isfinite(stddev) ||
      !std::isfinite(window_.ewma())) {
    throw DetectionError("non-finite window statistics");
  }

  event.ewma_deviation = ewma_deviation(current.value);

  if (stddev <= kFlatTolerance * std::max(1.0, std::abs(mean))) {
    // Flat window: nothing to compare against
    event.z_score = 0.0;
    event.decision = Decision::Normal;
    event.confidence.score = 0.0;
    return event;
  }

  event.z_score = (current.value - mean) / stddev;
  if (!std::isfinite(event.z_score) || !std::isfinite(event.ewma_deviation)) {
    throw DetectionError("non-finite score");
  }

  const bool z_exceeded = event.z_score > config_.z_threshold;
  const bool ewma_exceeded =
      event.ewma_deviation > config_.ewma_deviation_threshold;

  event.decision =
      (z_exceeded && ewma_exceeded) ? Decision::Anomaly : Decision::Normal;
  event.confidence.score =
      clamp01(event.z_score / (2.0 * config_.z_threshold));

  LOG(LogLevel::DEBUG, LogComponent::DETECTION_EVAL,
      "'" << signal_ << "' z=" << event.z_score
          << " ewma_dev=" << event.ewma_deviation << " -> "
          << decision_to_string(event.decision));
  return event;
}

// Cold start: compares the newest value with a percentile of the samples
// before it. Still requires the EWMA deviation so early jitter doesn't fire.
AnomalyEvent AnomalyDetector::evaluate_fallback(const Sample &current) const {
  AnomalyEvent event = make_event(current);
  const size_t prior = window_.size() - 1;

  if (!config_.percentile_fallback_enabled ||
      prior < config_.fallback_min_samples) {
    event.decision = Decision::Insufficient;
    event.confidence = {0.0, DetectionBasis::WarmUp};
    return event;
  }

  event.confidence.basis = DetectionBasis::PercentileFallback;

  const double threshold =
      window_.get_percentile(config_.fallback_percentile, true);
  if (!std::isfinite(threshold)) {
    throw DetectionError("non-finite percentile threshold");
  }

  event.ewma_deviation = ewma_deviation(current.value);
  const double mean = window_.mean();
  const double stddev = window_.standard_deviation();
  if (stddev > kFlatTolerance * std::max(1.0, std::abs(mean)))
    event.z_score = (current.value - mean) / stddev;

  if (!std::isfinite(event.z_score) || !std::isfinite(event.ewma_deviation)) {
    throw DetectionError("non-finite score");
  }

  const bool above_percentile = current.value > threshold;
  const bool ewma_exceeded =
      event.ewma_deviation > config_.ewma_deviation_threshold;
  event.decision = (above_percentile && ewma_exceeded) ? Decision::Anomaly
                                                       : Decision::Normal;

  if (above_percentile) {
    const double excess =
        (current.value - threshold) /
        std::max(std::abs(threshold), config_.ewma_epsilon);
    event.confidence.score = std::min(0.5, 0.25 + 0.25 * clamp01(excess));
  }

  LOG(LogLevel::DEBUG, LogComponent::DETECTION_EVAL,
      "'" << signal_ << "' fallback p" << config_.fallback_percentile * 100
          << "=" << threshold << " value=" << current.value << " -> "
          << decision_to_string(event.decision));
  return event;
}

} // namespace detection
