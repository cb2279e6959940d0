#ifndef SIMULATED_COLLECTOR_HPP
#define SIMULATED_COLLECTOR_HPP

#include "base_collector.hpp"
#include "core/alert.hpp"
#include "core/config.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Deterministic stand-in for a live feed. Each fetch yields one sample per
 * signal drawn around the configured baseline. A triggered disaster scales
 * the next few samples and tags them with a location mention.
 */
class SimulatedCollector : public ICollector {
public:
  SimulatedCollector(const Config::SimulationConfig &config,
                     std::vector<std::string> locations = {});

  std::vector<Sample> fetch(const std::string &signal,
                            const TimeWindow &window) override;
  const char *get_name() const override { return "SimulatedCollector"; }

  // Inflates the next `ticks` samples of `signal`. An empty location picks
  // one of the known locations.
  void trigger_disaster(const std::string &signal, AlertSeverity severity,
                        uint32_t ticks, const std::string &location = "");

  // The next `count` fetches for `signal` throw CollectionError.
  void fail_next(const std::string &signal, uint32_t count);

  static double severity_multiplier(AlertSeverity severity);

private:
  struct ActiveDisaster {
    double multiplier = 1.0;
    uint32_t remaining_ticks = 0;
    std::string location;
  };

  Config::SimulationConfig config_;
  std::vector<std::string> locations_;

  std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<std::string, ActiveDisaster> disasters_;
  std::unordered_map<std::string, uint32_t> pending_failures_;
};

#endif // SIMULATED_COLLECTOR_HPP
