#ifndef ALERT_MANAGER_HPP
#define ALERT_MANAGER_HPP

#include "alert.hpp"
#include "config.hpp"
#include "detection/anomaly_event.hpp"
#include "scheduling/retry_policy.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class INotifier;
class IAlertStore;
class MetricsRegistry;

/**
 * Turns anomaly events into alerts and drives their delivery.
 *
 * Dedup is a sliding cooldown per (disaster type, normalized location): an
 * event within cooldown of any non-suppressed alert for the same pair, on
 * either side in event time, is recorded as Suppressed and never sent.
 * Alerts stay matchable until the pair has seen an event two cooldowns
 * past them, so out-of-order events up to one cooldown late are handled. The check and the creation of
 * the new alert happen under one lock; notifier and store calls happen
 * outside it. Failed deliveries are retried by retry_failed_dispatches()
 * with the dispatch retry policy, then left in FailedDispatch for good.
 */
class AlertManager {
public:
  AlertManager(const Config::AppConfig &config,
               std::shared_ptr<INotifier> notifier,
               std::shared_ptr<IAlertStore> store = nullptr,
               MetricsRegistry *metrics = nullptr);

  AlertManager(const AlertManager &) = delete;
  AlertManager &operator=(const AlertManager &) = delete;

  /**
   * Records an anomaly and dispatches an alert unless it is a duplicate.
   * @param event Must carry Decision::Anomaly; anything else is ignored
   * @param resolved_location Location found for the event, if any
   * @return The alert as it stands after the dispatch attempt
   */
  std::optional<Alert>
  consider(const AnomalyEvent &event,
           const std::optional<std::string> &resolved_location);

  // Re-sends every FailedDispatch alert whose backoff has elapsed. Returns
  // the number of attempts made.
  size_t retry_failed_dispatches(uint64_t now_ms);

  // Newest first.
  std::vector<Alert> get_recent_alerts(size_t limit) const;
  std::vector<Alert> get_alerts_by_status(AlertStatus status) const;
  std::optional<Alert> find_alert(const std::string &id) const;
  size_t pending_retry_count() const;

  uint64_t cooldown_ms() const { return cooldown_ms_; }

private:
  // Non-suppressed alerts of one (type, location) scope that can still
  // suppress an event, keyed by event time. Only events of the same scope
  // advance newest_seen_ms, so events elsewhere never expire entries.
  struct ScopeState {
    std::map<uint64_t, std::string> active;
    uint64_t newest_seen_ms = 0;
  };

  Alert build_alert(const AnomalyEvent &event,
                    const std::optional<std::string> &resolved_location) const;
  bool attempt_dispatch(const Alert &alert, std::string &error);
  void apply_dispatch_result(Alert &alert, bool ok, const std::string &error,
                             uint64_t now_ms);
  Alert *find_locked(const std::string &id);
  void remember_locked(Alert alert);
  void prune_active_locked(uint64_t wall_now_ms);
  void persist(const Alert &alert);
  void update_pending_gauge_locked();

  uint64_t cooldown_ms_;
  double z_threshold_;
  size_t max_recent_alerts_;
  scheduling::RetryPolicy retry_policy_;

  std::shared_ptr<INotifier> notifier_;
  std::shared_ptr<IAlertStore> store_;
  MetricsRegistry *metrics_;

  mutable std::mutex mutex_;
  std::deque<Alert> alerts_;
  // "<type>|<location>" to its active alerts
  std::unordered_map<std::string, ScopeState> scopes_;
  std::unordered_set<std::string> in_flight_;
  mutable std::atomic<uint64_t> next_sequence_{1};
};

#endif // ALERT_MANAGER_HPP
