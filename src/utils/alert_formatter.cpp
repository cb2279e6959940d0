#include "alert_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

namespace {

std::string to_upper_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  return s;
}

std::string format_count(double value) {
  std::ostringstream out;
  if (std::floor(value) == value && std::abs(value) < 1e15)
    out << static_cast<long long>(value);
  else
    out << std::fixed << std::setprecision(1) << value;
  return out.str();
}

DetectionBasis basis_from_string(const std::string &str) {
  if (str == "warm_up")
    return DetectionBasis::WarmUp;
  if (str == "percentile_fallback")
    return DetectionBasis::PercentileFallback;
  if (str == "degraded")
    return DetectionBasis::Degraded;
  return DetectionBasis::Statistical;
}

} // namespace

nlohmann::json AlertFormatter::alert_to_json_object(const Alert &alert_data) {
  nlohmann::json j;

  // === Identity ===
  j["id"] = alert_data.id;
  j["type"] = alert_data.disaster_type;
  j["location"] = alert_data.location;
  j["normalized_location"] = alert_data.normalized_location;
  j["severity"] = alert_severity_to_string(alert_data.severity);
  j["dedup_key"] = alert_data.dedup_key;
  j["created_at_ms"] = alert_data.created_at_ms;

  // === Delivery ===
  j["status"] = alert_status_to_string(alert_data.status);
  j["attempts"] = alert_data.dispatch_attempts;
  j["last_attempt_ms"] = alert_data.last_attempt_ms;
  j["next_attempt_ms"] = alert_data.next_attempt_ms;
  if (!alert_data.last_error.empty())
    j["last_error"] = alert_data.last_error;
  if (!alert_data.suppressed_by.empty())
    j["suppressed_by"] = alert_data.suppressed_by;

  // === Evidence ===
  nlohmann::json evidence;
  evidence["value"] = alert_data.value;
  evidence["z_score"] = alert_data.z_score;
  evidence["ewma_deviation"] = alert_data.ewma_deviation;
  evidence["confidence"] = alert_data.confidence;
  evidence["basis"] = detection_basis_to_string(alert_data.basis);
  evidence["source"] = alert_data.source_tag;
  j["evidence"] = evidence;

  j["message"] = format_alert_message(alert_data);
  return j;
}

std::string AlertFormatter::format_alert_to_json(const Alert &alert_data) {
  return alert_to_json_object(alert_data).dump();
}

std::optional<Alert>
AlertFormatter::alert_from_json_object(const nlohmann::json &j) {
  try {
    Alert alert;
    alert.id = j.at("id").get<std::string>();
    alert.disaster_type = j.at("type").get<std::string>();
    alert.location = j.value("location", std::string("Unknown"));
    alert.normalized_location =
        j.value("normalized_location", std::string("unknown"));
    alert.dedup_key = j.value("dedup_key", std::string());
    alert.created_at_ms = j.at("created_at_ms").get<uint64_t>();

    auto severity =
        alert_severity_from_string(j.value("severity", std::string()));
    auto status = alert_status_from_string(j.value("status", std::string()));
    if (!severity || !status)
      return std::nullopt;
    alert.severity = *severity;
    alert.status = *status;

    alert.dispatch_attempts = j.value("attempts", 0u);
    alert.last_attempt_ms = j.value("last_attempt_ms", uint64_t{0});
    alert.next_attempt_ms = j.value("next_attempt_ms", uint64_t{0});
    alert.last_error = j.value("last_error", std::string());
    alert.suppressed_by = j.value("suppressed_by", std::string());

    if (j.contains("evidence")) {
      const auto &evidence = j.at("evidence");
      alert.value = evidence.value("value", 0.0);
      alert.z_score = evidence.value("z_score", 0.0);
      alert.ewma_deviation = evidence.value("ewma_deviation", 0.0);
      alert.confidence = evidence.value("confidence", 0.0);
      alert.basis = basis_from_string(evidence.value("basis", std::string()));
      alert.source_tag = evidence.value("source", std::string());
    }
    return alert;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

std::string AlertFormatter::format_alert_message(const Alert &alert_data) {
  std::ostringstream out;
  out << to_upper_copy(alert_data.disaster_type) << " - " << alert_data.location
      << "\n\nSeverity: " << alert_severity_to_string(alert_data.severity)
      << " | z=" << std::fixed << std::setprecision(2) << alert_data.z_score
      << " | count=" << format_count(alert_data.value);

  std::string message = out.str();
  if (message.size() > MAX_MESSAGE_LENGTH)
    message = message.substr(0, MAX_MESSAGE_LENGTH - 3) + "...";
  return message;
}
