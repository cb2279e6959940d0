#include "simulated_collector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

SimulatedCollector::SimulatedCollector(const Config::SimulationConfig &config,
                                       std::vector<std::string> locations)
    : config_(config), locations_(std::move(locations)), rng_(config.seed) {}

double SimulatedCollector::severity_multiplier(AlertSeverity severity) {
  switch (severity) {
  case AlertSeverity::Moderate:
    return 4.0;
  case AlertSeverity::Major:
    return 8.0;
  case AlertSeverity::Severe:
    return 12.0;
  }
  return 1.0;
}

void SimulatedCollector::trigger_disaster(const std::string &signal,
                                          AlertSeverity severity,
                                          uint32_t ticks,
                                          const std::string &location) {
  std::lock_guard<std::mutex> lock(mutex_);
  ActiveDisaster disaster;
  disaster.multiplier = severity_multiplier(severity);
  disaster.remaining_ticks = ticks;
  disaster.location = location;
  if (disaster.location.empty() && !locations_.empty()) {
    std::uniform_int_distribution<size_t> pick(0, locations_.size() - 1);
    disaster.location = locations_[pick(rng_)];
  }

  const std::string key = Utils::normalize_label(signal);
  LOG(LogLevel::INFO, LogComponent::SIMULATION,
      "Simulating " << alert_severity_to_string(severity) << " " << key
                    << " near '" << disaster.location << "' for " << ticks
                    << " ticks");
  disasters_[key] = std::move(disaster);
}

void SimulatedCollector::fail_next(const std::string &signal, uint32_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_failures_[Utils::normalize_label(signal)] = count;
}

std::vector<Sample> SimulatedCollector::fetch(const std::string &signal,
                                              const TimeWindow &window) {
  const std::string key = Utils::normalize_label(signal);
  std::lock_guard<std::mutex> lock(mutex_);

  auto failure = pending_failures_.find(key);
  if (failure != pending_failures_.end() && failure->second > 0) {
    failure->second--;
    throw CollectionError("Simulated feed outage for '" + key + "'");
  }

  std::uniform_real_distribution<double> jitter(-config_.baseline_jitter,
                                                config_.baseline_jitter);
  double value = std::max(0.0, std::round(config_.baseline_mean + jitter(rng_)));
  std::string source = "routine " + key + " chatter";

  auto it = disasters_.find(key);
  if (it != disasters_.end() && it->second.remaining_ticks > 0) {
    value = std::round(std::max(value, 1.0) * it->second.multiplier);
    source = "Reports of " + key;
    if (!it->second.location.empty())
      source += " near " + it->second.location;
    if (--it->second.remaining_ticks == 0)
      disasters_.erase(it);
  }

  LOG(LogLevel::TRACE, LogComponent::SIMULATION,
      "Simulated '" << key << "' = " << value);
  return {Sample(window.end_ms, value, source)};
}
