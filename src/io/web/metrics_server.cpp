#include "metrics_server.hpp"
#include "core/logger.hpp"
#include "utils/alert_formatter.hpp"
#include "utils/utils.hpp"

MetricsServer::MetricsServer(const std::string &host, int port,
                             MetricsRegistry &metrics_registry,
                             const scheduling::Scheduler &scheduler,
                             const AlertManager &alert_manager)
    : host_(host), port_(port), started_at_ms_(Utils::get_current_time_ms()),
      metrics_registry_(metrics_registry), scheduler_(scheduler),
      alert_manager_(alert_manager) {
  server_ = std::make_unique<httplib::Server>();

  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    res.set_content(metrics_registry_.serialize(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
    const uint64_t uptime = Utils::get_current_time_ms() - started_at_ms_;
    nlohmann::json j = health_to_json(scheduler_.health(), uptime);
    res.status = j["status"] == "ok" ? 200 : 503;
    res.set_content(j.dump(2), "application/json");
  });

  server_->Get("/api/v1/alerts",
               [this](const httplib::Request &req, httplib::Response &res) {
                 size_t limit = 50;
                 if (req.has_param("limit"))
                   limit = Utils::string_to_number<size_t>(
                               req.get_param_value("limit"))
                               .value_or(limit);
                 nlohmann::json j = nlohmann::json::array();
                 for (const auto &alert : alert_manager_.get_recent_alerts(limit))
                   j.push_back(AlertFormatter::alert_to_json_object(alert));
                 res.set_content(j.dump(2), "application/json");
               });

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Metrics server initialized for " << host_ << ":" << port_);
}

MetricsServer::~MetricsServer() { stop(); }

nlohmann::json
MetricsServer::health_to_json(const std::vector<scheduling::TaskHealth> &tasks,
                              uint64_t uptime_ms) {
  nlohmann::json j;
  bool healthy = true;
  nlohmann::json j_tasks = nlohmann::json::array();
  for (const auto &task : tasks) {
    if (task.state == scheduling::TaskState::Failed)
      healthy = false;
    j_tasks.push_back(
        {{"name", task.name},
         {"state", scheduling::task_state_to_string(task.state)},
         {"last_status", scheduling::task_status_to_string(task.last_status)},
         {"last_run_ms", task.last_run_ms},
         {"retry_count", task.retry_count},
         {"max_retries", task.max_retries},
         {"run_count", task.run_count},
         {"last_error", task.last_error}});
  }
  j["status"] = healthy ? "ok" : "degraded";
  j["uptime_ms"] = uptime_ms;
  j["tasks"] = j_tasks;
  return j;
}

bool MetricsServer::start() {
  if (server_thread_.joinable())
    return true; // Already running

  if (!server_->bind_to_port(host_, port_)) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Metrics server failed to bind " << host_ << ":" << port_);
    return false;
  }
  server_thread_ = std::thread(&MetricsServer::run, this);
  server_->wait_until_ready();
  return true;
}

void MetricsServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Metrics server stopped");
  }
}

void MetricsServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Metrics server listening on " << host_ << ":" << port_);
  if (!server_->listen_after_bind()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Metrics server stopped listening on " << host_ << ":" << port_);
  }
}
