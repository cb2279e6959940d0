#include "metrics_registry.hpp"
#include "logger.hpp"

#include <exception>
#include <prometheus/text_serializer.h>
#include <sstream>
#include <string>

namespace {
std::string help_for(const std::string &name) {
  return "CrowdSense metric " + name;
}
} // namespace

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::string MetricsRegistry::series_key(const std::string &name,
                                        const Labels &labels) {
  if (labels.empty())
    return name;

  std::string key = name + "{";
  bool first = true;
  for (const auto &[label, value] : labels) {
    if (!first)
      key += ",";
    key += label + "=\"" + value + "\"";
    first = false;
  }
  key += "}";
  return key;
}

prometheus::Counter *MetricsRegistry::counter_locked(const std::string &name,
                                                     const Labels &labels) {
  const std::string key = series_key(name, labels);
  auto it = counters_.find(key);
  if (it != counters_.end())
    return it->second;

  try {
    auto fam_it = counter_families_.find(name);
    if (fam_it == counter_families_.end()) {
      auto &family = prometheus::BuildCounter()
                         .Name(name)
                         .Help(help_for(name))
                         .Register(*registry_);
      fam_it = counter_families_.emplace(name, &family).first;
    }
    prometheus::Counter *counter = &fam_it->second->Add(labels);
    counters_.emplace(key, counter);
    return counter;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::METRICS,
        "Rejected counter '" << key << "': " << e.what());
    return nullptr;
  }
}

prometheus::Gauge *MetricsRegistry::gauge_locked(const std::string &name,
                                                 const Labels &labels) {
  const std::string key = series_key(name, labels);
  auto it = gauges_.find(key);
  if (it != gauges_.end())
    return it->second;

  try {
    auto fam_it = gauge_families_.find(name);
    if (fam_it == gauge_families_.end()) {
      auto &family = prometheus::BuildGauge()
                         .Name(name)
                         .Help(help_for(name))
                         .Register(*registry_);
      fam_it = gauge_families_.emplace(name, &family).first;
    }
    prometheus::Gauge *gauge = &fam_it->second->Add(labels);
    gauges_.emplace(key, gauge);
    return gauge;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::METRICS,
        "Rejected gauge '" << key << "': " << e.what());
    return nullptr;
  }
}

void MetricsRegistry::increment(const std::string &name, double value) {
  increment(name, {}, value);
}

void MetricsRegistry::increment(const std::string &name, const Labels &labels,
                                double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto *counter = counter_locked(name, labels))
    counter->Increment(value);
}

void MetricsRegistry::set_gauge(const std::string &name, double value,
                                const Labels &labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto *gauge = gauge_locked(name, labels))
    gauge->Set(value);
}

MetricsRegistry::Snapshot MetricsRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  for (const auto &[key, counter] : counters_)
    snap[key] = counter->Value();
  for (const auto &[key, gauge] : gauges_)
    snap[key] = gauge->Value();
  return snap;
}

double MetricsRegistry::value(const std::string &name,
                              const Labels &labels) const {
  const std::string key = series_key(name, labels);
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = counters_.find(key); it != counters_.end())
    return it->second->Value();
  if (auto it = gauges_.find(key); it != gauges_.end())
    return it->second->Value();
  return 0.0;
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  std::ostringstream out;
  serializer.Serialize(out, registry_->Collect());
  return out.str();
}
