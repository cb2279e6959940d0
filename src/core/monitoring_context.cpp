#include "monitoring_context.hpp"
#include "io/alert_dispatch/base_notifier.hpp"
#include "io/collectors/base_collector.hpp"
#include "io/db/base_alert_store.hpp"
#include "io/location/base_location_resolver.hpp"
#include "logger.hpp"

#include <utility>

MonitoringContext::Components::Components(
    std::shared_ptr<const Config::AppConfig> config_in,
    std::shared_ptr<ICollector> collector_in,
    std::shared_ptr<ILocationResolver> location_resolver_in,
    std::shared_ptr<INotifier> notifier, std::shared_ptr<IAlertStore> store_in,
    std::shared_ptr<MetricsRegistry> metrics_in)
    : config(std::move(config_in)), collector(std::move(collector_in)),
      location_resolver(std::move(location_resolver_in)),
      store(std::move(store_in)),
      metrics(metrics_in ? std::move(metrics_in)
                         : std::make_shared<MetricsRegistry>()),
      detectors(config->detection, metrics.get()),
      alert_manager(*config, std::move(notifier), store, metrics.get()),
      pipeline(*config, detectors, alert_manager, *collector,
               location_resolver.get(), store.get(), *metrics) {}

MonitoringContext::MonitoringContext(
    std::shared_ptr<const Config::AppConfig> config,
    std::shared_ptr<ICollector> collector,
    std::shared_ptr<ILocationResolver> location_resolver,
    std::shared_ptr<INotifier> notifier, std::shared_ptr<IAlertStore> store,
    std::shared_ptr<MetricsRegistry> metrics)
    : components_(std::make_shared<Components>(
          std::move(config), std::move(collector), std::move(location_resolver),
          std::move(notifier), std::move(store), std::move(metrics))),
      scheduler_(components_->metrics.get()) {}

MonitoringContext::~MonitoringContext() {
  shutdown(std::chrono::seconds(
      components_->config->scheduler.shutdown_timeout_seconds));
}

void MonitoringContext::start() {
  auto &pipeline = components_->pipeline;
  pipeline.restore_history();
  pipeline.register_tasks(scheduler_, components_);
  scheduler_.start();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Monitoring " << components_->config->signals.size() << " signals");
}

bool MonitoringContext::shutdown(std::chrono::milliseconds timeout) {
  return scheduler_.shutdown(timeout);
}
