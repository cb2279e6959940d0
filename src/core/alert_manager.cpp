#include "alert_manager.hpp"
#include "io/alert_dispatch/base_notifier.hpp"
#include "io/db/base_alert_store.hpp"
#include "logger.hpp"
#include "metric_names.hpp"
#include "metrics_registry.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

AlertManager::AlertManager(const Config::AppConfig &config,
                           std::shared_ptr<INotifier> notifier,
                           std::shared_ptr<IAlertStore> store,
                           MetricsRegistry *metrics)
    : cooldown_ms_(config.alerting.cooldown_period_seconds * 1000),
      z_threshold_(config.detection.z_threshold),
      max_recent_alerts_(std::max<size_t>(1, config.alerting.max_recent_alerts)),
      retry_policy_(scheduling::RetryPolicy::from_config(config.dispatch_retry)),
      notifier_(std::move(notifier)), store_(std::move(store)),
      metrics_(metrics) {
  if (!notifier_)
    throw std::invalid_argument("AlertManager requires a notifier");
}

Alert AlertManager::build_alert(
    const AnomalyEvent &event,
    const std::optional<std::string> &resolved_location) const {
  Alert alert;
  alert.created_at_ms =
      event.timestamp_ms != 0 ? event.timestamp_ms : Utils::get_current_time_ms();
  alert.disaster_type = Utils::normalize_label(event.signal);

  std::string location =
      resolved_location ? Utils::trim_copy(*resolved_location) : "";
  alert.normalized_location = Utils::normalize_label(location);
  if (alert.normalized_location.empty()) {
    alert.normalized_location = "unknown";
    location = "Unknown";
  }
  alert.location = location;

  alert.id = "alert-" + std::to_string(alert.created_at_ms) + "-" +
             std::to_string(next_sequence_++);
  alert.severity = classify_severity(event, z_threshold_);
  alert.dedup_key = make_dedup_key(alert.disaster_type,
                                   alert.normalized_location,
                                   alert.created_at_ms, cooldown_ms_);

  alert.value = event.value;
  alert.z_score = event.z_score;
  alert.ewma_deviation = event.ewma_deviation;
  alert.confidence = event.confidence.score;
  alert.basis = event.confidence.basis;
  alert.source_tag = event.source_tag;
  return alert;
}

std::optional<Alert>
AlertManager::consider(const AnomalyEvent &event,
                       const std::optional<std::string> &resolved_location) {
  if (event.decision != Decision::Anomaly) {
    LOG(LogLevel::DEBUG, LogComponent::ALERT_DEDUP,
        "Ignoring " << decision_to_string(event.decision) << " event for '"
                    << event.signal << "'");
    return std::nullopt;
  }

  Alert alert = build_alert(event, resolved_location);
  const std::string scope = alert.disaster_type + "|" + alert.normalized_location;
  bool suppressed = false;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_active_locked(Utils::get_current_time_ms());
    ScopeState &state = scopes_[scope];
    state.newest_seen_ms = std::max(state.newest_seen_ms, alert.created_at_ms);

    // Nearest active alert on either side of this event's time
    auto later = state.active.lower_bound(alert.created_at_ms);
    if (later != state.active.end() &&
        later->first - alert.created_at_ms < cooldown_ms_) {
      alert.suppressed_by = later->second;
      suppressed = true;
    } else if (later != state.active.begin() &&
               alert.created_at_ms - std::prev(later)->first < cooldown_ms_) {
      alert.suppressed_by = std::prev(later)->second;
      suppressed = true;
    }

    if (suppressed) {
      alert.status = AlertStatus::Suppressed;
    } else {
      state.active.emplace(alert.created_at_ms, alert.id);
      alert.dispatch_attempts = 1;
      in_flight_.insert(alert.id);
    }
    remember_locked(alert);
  }

  if (suppressed) {
    LOG(LogLevel::INFO, LogComponent::ALERT_DEDUP,
        "Suppressed duplicate " << alert.disaster_type << " alert for '"
                                << alert.location << "' (active: "
                                << alert.suppressed_by << ")");
    if (metrics_)
      metrics_->increment(MetricNames::ALERTS_SUPPRESSED,
                          {{"type", alert.disaster_type}});
    persist(alert);
    return alert;
  }

  LOG(LogLevel::INFO, LogComponent::ALERT_DEDUP,
      "Created " << alert_severity_to_string(alert.severity) << " "
                 << alert.disaster_type << " alert " << alert.id << " for '"
                 << alert.location << "' (z=" << alert.z_score << ")");
  if (metrics_)
    metrics_->increment(MetricNames::ALERTS_CREATED,
                        {{"type", alert.disaster_type}});
  persist(alert);

  std::string error;
  const bool ok = attempt_dispatch(alert, error);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_dispatch_result(alert, ok, error, Utils::get_current_time_ms());
    if (Alert *stored = find_locked(alert.id))
      *stored = alert;
    in_flight_.erase(alert.id);
    update_pending_gauge_locked();
  }
  persist(alert);
  return alert;
}

size_t AlertManager::retry_failed_dispatches(uint64_t now_ms) {
  std::vector<Alert> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &alert : alerts_) {
      if (alert.status != AlertStatus::FailedDispatch ||
          alert.next_attempt_ms == 0 || alert.next_attempt_ms > now_ms ||
          in_flight_.count(alert.id))
        continue;
      alert.dispatch_attempts++;
      in_flight_.insert(alert.id);
      due.push_back(alert);
    }
  }

  for (auto &alert : due) {
    LOG(LogLevel::DEBUG, LogComponent::ALERT_DISPATCH,
        "Retrying dispatch of " << alert.id << " (attempt "
                                << alert.dispatch_attempts << ")");
    std::string error;
    const bool ok = attempt_dispatch(alert, error);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      apply_dispatch_result(alert, ok, error, now_ms);
      if (Alert *stored = find_locked(alert.id))
        *stored = alert;
      in_flight_.erase(alert.id);
      update_pending_gauge_locked();
    }
    persist(alert);
  }
  return due.size();
}

bool AlertManager::attempt_dispatch(const Alert &alert, std::string &error) {
  try {
    if (notifier_->send(alert))
      return true;
    error = std::string(notifier_->get_name()) + " reported failure";
  } catch (const std::exception &e) {
    error = e.what();
  }
  return false;
}

void AlertManager::apply_dispatch_result(Alert &alert, bool ok,
                                         const std::string &error,
                                         uint64_t now_ms) {
  alert.last_attempt_ms = now_ms;

  if (ok) {
    alert.status = AlertStatus::Dispatched;
    alert.next_attempt_ms = 0;
    alert.last_error.clear();
    LOG(LogLevel::INFO, LogComponent::ALERT_DISPATCH,
        "Dispatched alert " << alert.id << " via " << notifier_->get_name()
                            << " (attempt " << alert.dispatch_attempts << ")");
    if (metrics_)
      metrics_->increment(MetricNames::ALERTS_SENT,
                          {{"type", alert.disaster_type}});
    return;
  }

  alert.status = AlertStatus::FailedDispatch;
  alert.last_error = error;
  if (metrics_)
    metrics_->increment(MetricNames::ALERTS_DISPATCH_FAILED,
                        {{"type", alert.disaster_type}});

  const uint32_t retries_used = alert.dispatch_attempts - 1;
  if (retries_used < retry_policy_.max_retries) {
    alert.next_attempt_ms =
        now_ms + static_cast<uint64_t>(
                     retry_policy_.delay_for(retries_used).count());
    LOG(LogLevel::WARN, LogComponent::ALERT_DISPATCH,
        "Dispatch of " << alert.id << " failed (" << error << "); retry "
                       << retries_used + 1 << "/" << retry_policy_.max_retries
                       << " at " << alert.next_attempt_ms);
    return;
  }

  alert.next_attempt_ms = 0;
  LOG(LogLevel::ERROR, LogComponent::ALERT_DISPATCH,
      "Giving up on alert " << alert.id << " after " << alert.dispatch_attempts
                            << " attempts: " << error);
  if (metrics_) {
    metrics_->increment(MetricNames::ALERTS_DISPATCH_EXHAUSTED,
                        {{"type", alert.disaster_type}});
    metrics_->increment(MetricNames::ERRORS, {{"component", "alerting"}});
  }
}

Alert *AlertManager::find_locked(const std::string &id) {
  for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
    if (it->id == id)
      return &*it;
  }
  return nullptr;
}

void AlertManager::remember_locked(Alert alert) {
  alerts_.push_back(std::move(alert));

  // Alerts still owed a retry are never evicted
  while (alerts_.size() > max_recent_alerts_) {
    auto victim = std::find_if(alerts_.begin(), alerts_.end(),
                               [this](const Alert &a) {
                                 const bool retrying =
                                     a.status == AlertStatus::FailedDispatch &&
                                     a.next_attempt_ms != 0;
                                 return !retrying && !in_flight_.count(a.id);
                               });
    if (victim == alerts_.end())
      break;
    alerts_.erase(victim);
  }
}

void AlertManager::prune_active_locked(uint64_t wall_now_ms) {
  for (auto scope_it = scopes_.begin(); scope_it != scopes_.end();) {
    auto &state = scope_it->second;
    // Entries outlive their cooldown by one more cooldown so events arriving
    // up to that late are still matched.
    const uint64_t horizon = std::min(wall_now_ms, state.newest_seen_ms);
    while (!state.active.empty() &&
           state.active.begin()->first + 2 * cooldown_ms_ <= horizon)
      state.active.erase(state.active.begin());
    if (state.active.empty())
      scope_it = scopes_.erase(scope_it);
    else
      ++scope_it;
  }
}

void AlertManager::persist(const Alert &alert) {
  if (!store_)
    return;
  try {
    store_->store_alert(alert);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "Could not persist alert " << alert.id << ": " << e.what());
    if (metrics_)
      metrics_->increment(MetricNames::PERSISTENCE_ERRORS);
  }
}

void AlertManager::update_pending_gauge_locked() {
  if (!metrics_)
    return;
  const auto pending = std::count_if(
      alerts_.begin(), alerts_.end(), [](const Alert &a) {
        return a.status == AlertStatus::FailedDispatch && a.next_attempt_ms != 0;
      });
  metrics_->set_gauge(MetricNames::ALERTS_PENDING_RETRY,
                      static_cast<double>(pending));
}

std::vector<Alert> AlertManager::get_recent_alerts(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Alert> result;
  for (auto it = alerts_.rbegin(); it != alerts_.rend() && result.size() < limit;
       ++it)
    result.push_back(*it);
  return result;
}

std::vector<Alert> AlertManager::get_alerts_by_status(AlertStatus status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Alert> result;
  for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
    if (it->status == status)
      result.push_back(*it);
  }
  return result;
}

std::optional<Alert> AlertManager::find_alert(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &alert : alerts_) {
    if (alert.id == id)
      return alert;
  }
  return std::nullopt;
}

size_t AlertManager::pending_retry_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(
      alerts_.begin(), alerts_.end(), [](const Alert &a) {
        return a.status == AlertStatus::FailedDispatch && a.next_attempt_ms != 0;
      }));
}
