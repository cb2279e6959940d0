#ifndef ALERT_HPP
#define ALERT_HPP

#include "detection/anomaly_event.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class AlertStatus { Pending, Dispatched, FailedDispatch, Suppressed };

enum class AlertSeverity { Moderate, Major, Severe };

std::string alert_status_to_string(AlertStatus status);
std::optional<AlertStatus> alert_status_from_string(const std::string &str);
std::string alert_severity_to_string(AlertSeverity severity);
std::optional<AlertSeverity> alert_severity_from_string(const std::string &str);

// severe at 2x the z threshold, major at 1.5x. Fallback events are always
// moderate.
AlertSeverity classify_severity(const AnomalyEvent &event, double z_threshold);

// "<type>|<normalized location>|<cooldown bucket>"
std::string make_dedup_key(const std::string &disaster_type,
                           const std::string &normalized_location,
                           uint64_t created_at_ms, uint64_t cooldown_ms);

struct Alert {
  std::string id;
  std::string disaster_type;
  std::string location;            // as resolved, for display
  std::string normalized_location; // dedup identity
  AlertSeverity severity = AlertSeverity::Moderate;
  std::string dedup_key;
  uint64_t created_at_ms = 0;

  AlertStatus status = AlertStatus::Pending;
  uint32_t dispatch_attempts = 0;
  uint64_t last_attempt_ms = 0;
  uint64_t next_attempt_ms = 0; // FailedDispatch only; 0 once exhausted
  std::string last_error;

  // Id of the alert that caused this one to be suppressed
  std::string suppressed_by;

  // Evidence from the triggering anomaly
  double value = 0.0;
  double z_score = 0.0;
  double ewma_deviation = 0.0;
  double confidence = 0.0;
  DetectionBasis basis = DetectionBasis::Statistical;
  std::string source_tag;
};

#endif // ALERT_HPP
