#ifndef ANOMALY_EVENT_HPP
#define ANOMALY_EVENT_HPP

#include <cstdint>
#include <string>

enum class Decision { Anomaly, Normal, Insufficient };

// Which path produced a decision.
enum class DetectionBasis {
  WarmUp,             // not enough history for any decision
  Statistical,        // full window, z-score AND EWMA deviation
  PercentileFallback, // partial window, percentile threshold
  Degraded            // numeric failure, forced to Normal
};

struct Confidence {
  double score = 0.0; // [0, 1]; fallback decisions never exceed 0.5
  DetectionBasis basis = DetectionBasis::WarmUp;
};

struct AnomalyEvent {
  uint64_t timestamp_ms = 0;
  std::string signal;
  double value = 0.0;
  double z_score = 0.0;
  double ewma_deviation = 0.0;
  Decision decision = Decision::Insufficient;
  Confidence confidence;
  // Source tag of the sample that was evaluated
  std::string source_tag;
};

inline const char *decision_to_string(Decision decision) {
  switch (decision) {
  case Decision::Anomaly:
    return "Anomaly";
  case Decision::Normal:
    return "Normal";
  case Decision::Insufficient:
    return "Insufficient";
  }
  return "Unknown";
}

inline const char *detection_basis_to_string(DetectionBasis basis) {
  switch (basis) {
  case DetectionBasis::WarmUp:
    return "warm_up";
  case DetectionBasis::Statistical:
    return "statistical";
  case DetectionBasis::PercentileFallback:
    return "percentile_fallback";
  case DetectionBasis::Degraded:
    return "degraded";
  }
  return "unknown";
}

#endif // ANOMALY_EVENT_HPP
