#ifndef METRICS_SERVER_HPP
#define METRICS_SERVER_HPP

#include "core/alert_manager.hpp"
#include "core/metrics_registry.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "scheduling/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Serves /metrics (Prometheus text), /health and /api/v1/alerts.
class MetricsServer {
public:
  MetricsServer(const std::string &host, int port,
                MetricsRegistry &metrics_registry,
                const scheduling::Scheduler &scheduler,
                const AlertManager &alert_manager);
  ~MetricsServer();

  // Binds synchronously; returns false if the port is unavailable.
  bool start();
  void stop();

  // "ok" unless some task is Failed, then "degraded".
  static nlohmann::json
  health_to_json(const std::vector<scheduling::TaskHealth> &tasks,
                 uint64_t uptime_ms);

private:
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::string host_;
  int port_;
  uint64_t started_at_ms_;
  MetricsRegistry &metrics_registry_;
  const scheduling::Scheduler &scheduler_;
  const AlertManager &alert_manager_;
};

#endif // METRICS_SERVER_HPP
