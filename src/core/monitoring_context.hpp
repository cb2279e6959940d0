#ifndef MONITORING_CONTEXT_HPP
#define MONITORING_CONTEXT_HPP

#include "analysis/signal_pipeline.hpp"
#include "config.hpp"
#include "core/alert_manager.hpp"
#include "core/metrics_registry.hpp"
#include "detection/detector_registry.hpp"
#include "scheduling/scheduler.hpp"

#include <chrono>
#include <memory>

class ICollector;
class ILocationResolver;
class INotifier;
class IAlertStore;

/**
 * Everything one monitoring process runs on, wired together and passed
 * around explicitly. The pipeline and its collaborators live in a shared
 * bundle that every task body also holds, so a task abandoned at shutdown
 * keeps them alive until it returns. The scheduler sits outside the bundle.
 */
class MonitoringContext {
public:
  // `config`, `collector` and `notifier` must be non-null. A null `metrics`
  // gets a registry of its own.
  MonitoringContext(std::shared_ptr<const Config::AppConfig> config,
                    std::shared_ptr<ICollector> collector,
                    std::shared_ptr<ILocationResolver> location_resolver,
                    std::shared_ptr<INotifier> notifier,
                    std::shared_ptr<IAlertStore> store,
                    std::shared_ptr<MetricsRegistry> metrics = nullptr);
  ~MonitoringContext();

  MonitoringContext(const MonitoringContext &) = delete;
  MonitoringContext &operator=(const MonitoringContext &) = delete;

  // Restores history, registers the periodic tasks and starts them.
  void start();
  bool shutdown(std::chrono::milliseconds timeout);

  const Config::AppConfig &config() const { return *components_->config; }
  MetricsRegistry &metrics() { return *components_->metrics; }
  detection::DetectorRegistry &detectors() { return components_->detectors; }
  AlertManager &alerts() { return components_->alert_manager; }
  SignalPipeline &pipeline() { return components_->pipeline; }
  scheduling::Scheduler &scheduler() { return scheduler_; }
  ICollector &collector() { return *components_->collector; }

private:
  struct Components {
    Components(std::shared_ptr<const Config::AppConfig> config,
               std::shared_ptr<ICollector> collector,
               std::shared_ptr<ILocationResolver> location_resolver,
               std::shared_ptr<INotifier> notifier,
               std::shared_ptr<IAlertStore> store,
               std::shared_ptr<MetricsRegistry> metrics);

    std::shared_ptr<const Config::AppConfig> config;
    std::shared_ptr<ICollector> collector;
    std::shared_ptr<ILocationResolver> location_resolver;
    std::shared_ptr<IAlertStore> store;
    std::shared_ptr<MetricsRegistry> metrics;

    detection::DetectorRegistry detectors;
    AlertManager alert_manager;
    SignalPipeline pipeline;
  };

  std::shared_ptr<Components> components_;
  scheduling::Scheduler scheduler_;
};

#endif // MONITORING_CONTEXT_HPP
