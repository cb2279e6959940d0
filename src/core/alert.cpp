#include "alert.hpp"

#include <string>

std::string alert_status_to_string(AlertStatus status) {
  switch (status) {
  case AlertStatus::Pending:
    return "pending";
  case AlertStatus::Dispatched:
    return "dispatched";
  case AlertStatus::FailedDispatch:
    return "failed_dispatch";
  case AlertStatus::Suppressed:
    return "suppressed";
  }
  return "unknown";
}

std::optional<AlertStatus> alert_status_from_string(const std::string &str) {
  if (str == "pending")
    return AlertStatus::Pending;
  if (str == "dispatched")
    return AlertStatus::Dispatched;
  if (str == "failed_dispatch")
    return AlertStatus::FailedDispatch;
  if (str == "suppressed")
    return AlertStatus::Suppressed;
  return std::nullopt;
}

std::string alert_severity_to_string(AlertSeverity severity) {
  switch (severity) {
  case AlertSeverity::Moderate:
    return "moderate";
  case AlertSeverity::Major:
    return "major";
  case AlertSeverity::Severe:
    return "severe";
  }
  return "unknown";
}

std::optional<AlertSeverity> alert_severity_from_string(const std::string &str) {
  if (str == "moderate")
    return AlertSeverity::Moderate;
  if (str == "major")
    return AlertSeverity::Major;
  if (str == "severe")
    return AlertSeverity::Severe;
  return std::nullopt;
}

AlertSeverity classify_severity(const AnomalyEvent &event, double z_threshold) {
  if (event.confidence.basis != DetectionBasis::Statistical)
    return AlertSeverity::Moderate;
  if (event.z_score >= 2.0 * z_threshold)
    return AlertSeverity::Severe;
  if (event.z_score >= 1.5 * z_threshold)
    return AlertSeverity::Major;
  return AlertSeverity::Moderate;
}

std::string make_dedup_key(const std::string &disaster_type,
                           const std::string &normalized_location,
                           uint64_t created_at_ms, uint64_t cooldown_ms) {
  const uint64_t bucket = cooldown_ms > 0 ? created_at_ms / cooldown_ms : 0;
  return disaster_type + "|" + normalized_location + "|" +
         std::to_string(bucket);
}
