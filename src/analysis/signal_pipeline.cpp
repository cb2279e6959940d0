#include "signal_pipeline.hpp"
#include "core/alert_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"
#include "detection/detector_registry.hpp"
#include "io/collectors/base_collector.hpp"
#include "io/db/base_alert_store.hpp"
#include "io/location/base_location_resolver.hpp"
#include "scheduling/scheduler.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

SignalPipeline::SignalPipeline(const Config::AppConfig &config,
                               detection::DetectorRegistry &detectors,
                               AlertManager &alert_manager,
                               ICollector &collector,
                               ILocationResolver *location_resolver,
                               IAlertStore *store, MetricsRegistry &metrics)
    : config_(config), detectors_(detectors), alert_manager_(alert_manager),
      collector_(collector), location_resolver_(location_resolver),
      store_(store), metrics_(metrics) {}

CycleReport SignalPipeline::collect(const std::string &signal) {
  const std::string key = Utils::normalize_label(signal);
  const uint64_t now = Utils::get_current_time_ms();

  TimeWindow window;
  window.end_ms = now;
  {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    auto it = collected_until_ms_.find(key);
    const uint64_t lookback = config_.collector.lookback_seconds * 1000;
    window.start_ms = it != collected_until_ms_.end()
                          ? it->second
                          : (now > lookback ? now - lookback : 0);
  }

  std::vector<Sample> samples;
  try {
    samples = collector_.fetch(key, window);
  } catch (const CollectionError &e) {
    LOG(LogLevel::WARN, LogComponent::IO_COLLECTOR,
        collector_.get_name() << " failed for '" << key << "': " << e.what());
    metrics_.increment(MetricNames::COLLECTION_ERRORS, {{"signal", key}});
    metrics_.increment(MetricNames::ERRORS, {{"component", "collector"}});
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    collected_until_ms_[key] = window.end_ms;
  }
  return process(key, samples);
}

CycleReport SignalPipeline::inject(const std::string &signal,
                                   const std::vector<Sample> &samples) {
  const std::string key = Utils::normalize_label(signal);
  LOG(LogLevel::INFO, LogComponent::SIMULATION,
      "Injecting " << samples.size() << " samples into '" << key << "'");
  return process(key, samples);
}

CycleReport SignalPipeline::process(const std::string &signal,
                                    const std::vector<Sample> &samples) {
  CycleReport report;
  auto &detector = detectors_.get_or_create(signal);

  for (const auto &sample : samples) {
    AnomalyEvent event = detector.ingest_and_evaluate(sample);
    report.samples++;

    if (event.confidence.basis == DetectionBasis::Degraded &&
        !std::isfinite(sample.value)) {
      report.rejected++;
      continue;
    }
    if (sample.value > 0)
      metrics_.increment(MetricNames::TWEETS_PROCESSED, sample.value);
    persist_sample(signal, sample);

    if (event.decision != Decision::Anomaly)
      continue;

    report.anomalies++;
    metrics_.increment(MetricNames::ANOMALIES_DETECTED,
                       {{"signal", signal},
                        {"basis", detection_basis_to_string(
                                      event.confidence.basis)}});
    metrics_.set_gauge(MetricNames::LAST_ANOMALY_SCORE, event.z_score,
                       {{"signal", signal}});
    LOG(LogLevel::INFO, LogComponent::DETECTION_EVAL,
        "Anomaly on '" << signal << "': value=" << event.value
                       << " z=" << event.z_score
                       << " ewma_dev=" << event.ewma_deviation << " ("
                       << detection_basis_to_string(event.confidence.basis)
                       << ")");

    auto alert = alert_manager_.consider(event, resolve_location(sample));
    if (alert) {
      if (alert->status == AlertStatus::Suppressed)
        report.alerts_suppressed++;
      else
        report.alerts_created++;
    }
  }
  return report;
}

std::optional<std::string>
SignalPipeline::resolve_location(const Sample &sample) {
  if (!location_resolver_ || sample.source_tag.empty())
    return std::nullopt;
  try {
    return location_resolver_->resolve(sample.source_tag);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_LOCATION,
        "Location resolution failed: " << e.what());
    return std::nullopt;
  }
}

void SignalPipeline::persist_sample(const std::string &signal,
                                    const Sample &sample) {
  if (!store_)
    return;
  try {
    store_->store_sample(signal, sample);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "Could not persist sample for '" << signal << "': " << e.what());
    metrics_.increment(MetricNames::PERSISTENCE_ERRORS);
  }
}

size_t SignalPipeline::restore_history() {
  const auto &dt = config_.detection;
  const size_t limit = dt.history_seed_samples > 0
                           ? dt.history_seed_samples
                           : static_cast<size_t>(dt.window_size);
  size_t restored = 0;

  for (const auto &signal : config_.signals) {
    auto &detector = detectors_.get_or_create(signal);
    if (!store_)
      continue;
    try {
      auto history = store_->query_signal_history(detector.signal(), limit);
      if (!history.empty())
        restored += detector.seed_history(history);
    } catch (const std::exception &e) {
      LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
          "Could not restore history for '" << signal << "': " << e.what());
      metrics_.increment(MetricNames::PERSISTENCE_ERRORS);
    }
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Restored " << restored << " samples across " << config_.signals.size()
                  << " signals");
  return restored;
}

void SignalPipeline::report_metrics() {
  const auto snapshot = metrics_.snapshot();
  const uint64_t now = Utils::get_current_time_ms();

  LOG(LogLevel::INFO, LogComponent::METRICS,
      "Metrics snapshot (" << snapshot.size() << " series)");
  bool store_failed = false;
  for (const auto &[name, value] : snapshot) {
    LOG(LogLevel::INFO, LogComponent::METRICS, "  " << name << " = " << value);
    if (!store_ || store_failed)
      continue;
    try {
      store_->store_metric(name, value, now);
    } catch (const std::exception &e) {
      store_failed = true;
      LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
          "Could not persist metrics snapshot: " << e.what());
      metrics_.increment(MetricNames::PERSISTENCE_ERRORS);
    }
  }
}

void SignalPipeline::run_cleanup() {
  if (!store_)
    return;
  constexpr uint64_t DAY_MS = 24ULL * 60 * 60 * 1000;
  RetentionPolicy policy;
  policy.now_ms = Utils::get_current_time_ms();
  policy.alert_max_age_ms = config_.persistence.alert_retention_days * DAY_MS;
  policy.metric_max_age_ms = config_.persistence.metric_retention_days * DAY_MS;
  policy.sample_max_age_ms = policy.metric_max_age_ms;

  try {
    store_->cleanup(policy);
  } catch (const PersistenceError &e) {
    metrics_.increment(MetricNames::PERSISTENCE_ERRORS);
    throw;
  }
}

void SignalPipeline::register_tasks(scheduling::Scheduler &scheduler,
                                    std::shared_ptr<const void> owner) {
  using std::chrono::seconds;
  const auto &sc = config_.scheduler;

  for (const auto &signal : config_.signals) {
    scheduling::TaskSpec spec;
    spec.name = "collect:" + signal;
    spec.interval = seconds(sc.collection_interval_seconds);
    spec.run_immediately = true;
    spec.retry = scheduling::RetryPolicy::from_config(config_.collection_retry);
    spec.body = [this, owner, signal](const scheduling::CancellationToken &token) {
      if (token.is_cancelled())
        return;
      collect(signal);
    };
    scheduler.add_task(std::move(spec));
  }

  scheduling::TaskSpec dispatch_retry;
  dispatch_retry.name = "dispatch-retry";
  dispatch_retry.interval = seconds(sc.dispatch_retry_interval_seconds);
  dispatch_retry.retry =
      scheduling::RetryPolicy::from_config(config_.dispatch_retry);
  dispatch_retry.body = [this, owner](const scheduling::CancellationToken &token) {
    if (token.is_cancelled())
      return;
    alert_manager_.retry_failed_dispatches(Utils::get_current_time_ms());
  };
  scheduler.add_task(std::move(dispatch_retry));

  if (store_) {
    scheduling::TaskSpec cleanup;
    cleanup.name = "cleanup";
    cleanup.interval = seconds(sc.cleanup_interval_seconds);
    cleanup.retry = scheduling::RetryPolicy::from_config(config_.collection_retry);
    cleanup.body = [this, owner](const scheduling::CancellationToken &token) {
      if (token.is_cancelled())
        return;
      run_cleanup();
    };
    scheduler.add_task(std::move(cleanup));
  }

  scheduling::TaskSpec report;
  report.name = "metrics-report";
  report.interval = seconds(sc.metrics_report_interval_seconds);
  report.retry.max_retries = 0;
  report.body = [this, owner](const scheduling::CancellationToken &) {
    report_metrics();
  };
  scheduler.add_task(std::move(report));
}
