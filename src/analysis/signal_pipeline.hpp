#ifndef SIGNAL_PIPELINE_HPP
#define SIGNAL_PIPELINE_HPP

#include "core/config.hpp"
#include "detection/sample.hpp"
#include "scheduling/scheduled_task.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class AlertManager;
class ICollector;
class ILocationResolver;
class IAlertStore;
class MetricsRegistry;

namespace detection {
class DetectorRegistry;
}
namespace scheduling {
class Scheduler;
}

// Outcome of one batch of samples for one signal.
struct CycleReport {
  size_t samples = 0;
  size_t rejected = 0;
  size_t anomalies = 0;
  size_t alerts_created = 0;
  size_t alerts_suppressed = 0;
};

/**
 * Moves samples from a collector (or a manual injection) through the
 * signal's detector and hands anomalies to the alert manager. Both entry
 * points share the same ingest, evaluate and alert path.
 */
class SignalPipeline {
public:
  SignalPipeline(const Config::AppConfig &config,
                 detection::DetectorRegistry &detectors,
                 AlertManager &alert_manager, ICollector &collector,
                 ILocationResolver *location_resolver, IAlertStore *store,
                 MetricsRegistry &metrics);

  // One collection cycle. Throws CollectionError; nothing is ingested then.
  CycleReport collect(const std::string &signal);

  // Manual trigger hook: bypasses the collector.
  CycleReport inject(const std::string &signal,
                     const std::vector<Sample> &samples);

  // Seeds every configured signal's detector from the store. Returns the
  // number of samples restored.
  size_t restore_history();

  // Every task body holds `owner` so that a body abandoned by the scheduler
  // never outlives the pipeline or what it references.
  void register_tasks(scheduling::Scheduler &scheduler,
                      std::shared_ptr<const void> owner = nullptr);

  void report_metrics();
  void run_cleanup();

private:
  CycleReport process(const std::string &signal,
                      const std::vector<Sample> &samples);
  std::optional<std::string> resolve_location(const Sample &sample);
  void persist_sample(const std::string &signal, const Sample &sample);

  const Config::AppConfig &config_;
  detection::DetectorRegistry &detectors_;
  AlertManager &alert_manager_;
  ICollector &collector_;
  ILocationResolver *location_resolver_;
  IAlertStore *store_;
  MetricsRegistry &metrics_;

  std::mutex cursor_mutex_;
  // End of the last successfully collected range, per signal
  std::unordered_map<std::string, uint64_t> collected_until_ms_;
};

#endif // SIGNAL_PIPELINE_HPP
