#ifndef BASE_ALERT_STORE_HPP
#define BASE_ALERT_STORE_HPP

#include "core/alert.hpp"
#include "detection/sample.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AlertFilter {
  std::optional<std::string> disaster_type;
  std::optional<std::string> normalized_location;
  std::optional<AlertStatus> status;
  uint64_t since_ms = 0;
  size_t limit = 50;
};

struct RetentionPolicy {
  uint64_t now_ms = 0;
  uint64_t alert_max_age_ms = 0;
  uint64_t metric_max_age_ms = 0;
  uint64_t sample_max_age_ms = 0;
};

struct CleanupResult {
  size_t alerts_removed = 0;
  size_t metrics_removed = 0;
  size_t samples_removed = 0;
};

// Durable storage for alerts, metric values and raw samples. Every method
// may throw PersistenceError; callers treat storage as best-effort.
class IAlertStore {
public:
  virtual ~IAlertStore() = default;

  // Inserts or replaces the alert with the same id.
  virtual void store_alert(const Alert &alert) = 0;
  virtual void store_metric(const std::string &name, double value,
                            uint64_t timestamp_ms) = 0;
  virtual void store_sample(const std::string &signal, const Sample &sample) = 0;

  // Newest first.
  virtual std::vector<Alert> query_recent_alerts(const AlertFilter &filter) = 0;
  // The `limit` most recent samples, oldest first.
  virtual std::vector<Sample> query_signal_history(const std::string &signal,
                                                   size_t limit) = 0;

  virtual CleanupResult cleanup(const RetentionPolicy &policy) = 0;

  virtual const char *get_name() const = 0;
};

#endif // BASE_ALERT_STORE_HPP
