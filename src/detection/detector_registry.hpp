#ifndef DETECTOR_REGISTRY_HPP
#define DETECTOR_REGISTRY_HPP

#include "anomaly_detector.hpp"
#include "core/config.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class MetricsRegistry;

namespace detection {

// Owns exactly one AnomalyDetector per signal. Detectors live as long as the
// registry, so returned references stay valid.
class DetectorRegistry {
public:
  DetectorRegistry(const Config::DetectionConfig &config,
                   MetricsRegistry *metrics = nullptr);

  AnomalyDetector &get_or_create(const std::string &signal);
  AnomalyDetector *find(const std::string &signal) const;

  std::vector<std::string> signals() const;
  size_t size() const;

private:
  Config::DetectionConfig config_;
  MetricsRegistry *metrics_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<AnomalyDetector>> detectors_;
};

} // namespace detection

#endif // DETECTOR_REGISTRY_HPP
