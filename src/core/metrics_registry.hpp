#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

/**
 * Process-wide counters and gauges backed by a prometheus::Registry.
 *
 * Series are created on first use. Every operation succeeds; a name the
 * Prometheus client rejects is logged and ignored. All mutations and
 * snapshot() are serialized so a snapshot is a consistent cut.
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;
  // Series key ("name" or "name{k=\"v\"}") to current value.
  using Snapshot = std::map<std::string, double>;

  MetricsRegistry();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  void increment(const std::string &name, double value = 1.0);
  void increment(const std::string &name, const Labels &labels,
                 double value = 1.0);
  void set_gauge(const std::string &name, double value,
                 const Labels &labels = {});

  Snapshot snapshot() const;

  // Current value of one series, 0 if it was never touched.
  double value(const std::string &name, const Labels &labels = {}) const;

  // Prometheus text exposition of every registered family.
  std::string serialize() const;

  std::shared_ptr<prometheus::Registry> get_registry() { return registry_; }

  static std::string series_key(const std::string &name, const Labels &labels);

private:
  prometheus::Counter *counter_locked(const std::string &name,
                                      const Labels &labels);
  prometheus::Gauge *gauge_locked(const std::string &name,
                                  const Labels &labels);

  mutable std::mutex mutex_;
  std::shared_ptr<prometheus::Registry> registry_;

  std::map<std::string, prometheus::Family<prometheus::Counter> *>
      counter_families_;
  std::map<std::string, prometheus::Family<prometheus::Gauge> *>
      gauge_families_;
  std::map<std::string, prometheus::Counter *> counters_;
  std::map<std::string, prometheus::Gauge *> gauges_;
};

#endif // METRICS_REGISTRY_HPP
