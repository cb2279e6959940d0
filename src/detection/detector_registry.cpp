#include "detector_registry.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <mutex>

namespace detection {

DetectorRegistry::DetectorRegistry(const Config::DetectionConfig &config,
                                   MetricsRegistry *metrics)
    : config_(config), metrics_(metrics) {}

AnomalyDetector &DetectorRegistry::get_or_create(const std::string &signal) {
  const std::string key = Utils::normalize_label(signal);
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = detectors_.find(key);
    if (it != detectors_.end())
      return *it->second;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = detectors_.find(key);
  if (it != detectors_.end())
    return *it->second;

  auto detector = std::make_unique<AnomalyDetector>(key, config_, metrics_);
  auto &ref = *detector;
  detectors_.emplace(key, std::move(detector));
  LOG(LogLevel::DEBUG, LogComponent::DETECTION_WINDOW,
      "Created detector for signal '" << key << "'");
  return ref;
}

AnomalyDetector *DetectorRegistry::find(const std::string &signal) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = detectors_.find(Utils::normalize_label(signal));
  return it == detectors_.end() ? nullptr : it->second.get();
}

std::vector<std::string> DetectorRegistry::signals() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(detectors_.size());
  for (const auto &entry : detectors_)
    names.push_back(entry.first);
  std::sort(names.begin(), names.end());
  return names;
}

size_t DetectorRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return detectors_.size();
}

} // namespace detection
