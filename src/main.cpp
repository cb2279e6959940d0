#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/monitoring_context.hpp"
#include "io/alert_dispatch/composite_notifier.hpp"
#include "io/collectors/http_collector.hpp"
#include "io/collectors/simulated_collector.hpp"
#include "io/db/mongo_alert_store.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/db/write_behind_store.hpp"
#include "io/location/gazetteer_location_resolver.hpp"
#include "io/web/metrics_server.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reset_failed_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGUSR1)
    g_reset_failed_requested = true;
}

namespace {

struct CommandLine {
  std::string config_path = "config.ini";
  bool config_given = false;
  bool simulate = false;
  // signal, severity, location
  std::vector<std::tuple<std::string, AlertSeverity, std::string>> triggers;
  std::vector<std::pair<std::string, std::vector<double>>> injections;
};

void print_usage(const char *program) {
  std::cout << "Usage: " << program
            << " [--config <path>] [--simulate]\n"
               "       [--trigger <signal>:<severity>[:<location>]]\n"
               "       [--inject <signal>:<v1,v2,...>]\n";
}

// Throws std::invalid_argument on malformed arguments.
CommandLine parse_command_line(int argc, char *argv[]) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next_value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw std::invalid_argument(arg + " requires a value");
      return argv[++i];
    };

    if (arg == "--config") {
      cli.config_path = next_value();
      cli.config_given = true;
    } else if (arg == "--simulate") {
      cli.simulate = true;
    } else if (arg == "--trigger") {
      auto parts = Utils::split_and_trim(next_value(), ':');
      if (parts.size() < 2)
        throw std::invalid_argument("--trigger expects <signal>:<severity>");
      auto severity = alert_severity_from_string(Utils::to_lower_copy(parts[1]));
      if (!severity)
        throw std::invalid_argument("Unknown severity: " + parts[1]);
      cli.triggers.emplace_back(Utils::normalize_label(parts[0]), *severity,
                                parts.size() > 2 ? parts[2] : "");
    } else if (arg == "--inject") {
      const std::string value = next_value();
      const auto colon = value.find(':');
      if (colon == std::string::npos)
        throw std::invalid_argument("--inject expects <signal>:<v1,v2,...>");
      std::vector<double> values;
      for (const auto &token : Utils::split_and_trim(value.substr(colon + 1), ',')) {
        auto number = Utils::string_to_number<double>(token);
        if (!number)
          throw std::invalid_argument("Not a number: " + token);
        values.push_back(*number);
      }
      cli.injections.emplace_back(
          Utils::normalize_label(value.substr(0, colon)), std::move(values));
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  return cli;
}

std::shared_ptr<IAlertStore> make_store(const Config::AppConfig &config,
                                        MetricsRegistry *metrics) {
  if (!config.persistence.enabled)
    return nullptr;
  try {
    auto manager = std::make_shared<MongoManager>(config.persistence);
    if (!manager->ping())
      LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
          "MongoDB not reachable yet; writes will be retried per request");
    auto mongo_store = std::make_shared<MongoAlertStore>(manager);
    return std::make_shared<WriteBehindStore>(
        mongo_store, config.persistence.write_queue_capacity, metrics);
  } catch (const PersistenceError &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Persistence disabled: " << e.what());
    return nullptr;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cli;
  try {
    cli = parse_command_line(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGUSR1, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (cli.simulate)
    config_manager.set_overrides(
        [](Config::AppConfig &config) { config.simulation_mode = true; });

  // Without --config a missing default file means built-in defaults.
  const bool loaded =
      (cli.config_given || std::filesystem::exists(cli.config_path))
          ? config_manager.load_configuration(cli.config_path)
          : config_manager.load_defaults();
  if (!loaded) {
    std::cerr << "Invalid configuration:\n";
    for (const auto &error : config_manager.last_errors())
      std::cerr << "  - " << error << "\n";
    return 1;
  }
  auto config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "CrowdSense starting up (PID " << getpid() << ", "
                                     << (config->simulation_mode ? "simulated"
                                                                 : "live")
                                     << " feed)");

  // --- Build Collaborators ---
  std::shared_ptr<ICollector> collector;
  std::shared_ptr<SimulatedCollector> simulator;
  try {
    if (config->simulation_mode) {
      simulator = std::make_shared<SimulatedCollector>(
          config->simulation, config->alerting.known_locations);
      collector = simulator;
    } else {
      collector = std::make_shared<HttpCollector>(
          config->collector.endpoint_url, config->collector.timeout_ms,
          config->collector.verify_tls);
    }
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, e.what());
    return 1;
  }

  auto resolver = std::make_shared<GazetteerLocationResolver>(
      config->alerting.known_locations);
  std::shared_ptr<INotifier> notifier =
      CompositeNotifier::from_config(config->alerting);

  auto metrics = std::make_shared<MetricsRegistry>();
  auto store = make_store(*config, metrics.get());

  MonitoringContext context(config, collector, resolver, notifier, store,
                            metrics);
  context.start();

  std::unique_ptr<MetricsServer> metrics_server;
  if (config->monitoring.enabled) {
    metrics_server = std::make_unique<MetricsServer>(
        config->monitoring.host, config->monitoring.port, context.metrics(),
        context.scheduler(), context.alerts());
    if (!metrics_server->start())
      metrics_server.reset();
  }

  // --- Manual Triggers ---
  for (const auto &[signal, severity, location] : cli.triggers) {
    if (!simulator) {
      LOG(LogLevel::WARN, LogComponent::SIMULATION,
          "--trigger needs --simulate; ignoring trigger for " << signal);
      continue;
    }
    simulator->trigger_disaster(signal, severity, 3, location);
  }

  for (const auto &[signal, values] : cli.injections) {
    const uint64_t now = Utils::get_current_time_ms();
    std::vector<Sample> samples;
    for (size_t i = 0; i < values.size(); ++i)
      samples.emplace_back(now - (values.size() - 1 - i), values[i],
                           "manual injection");
    auto report = context.pipeline().inject(signal, samples);
    LOG(LogLevel::INFO, LogComponent::SIMULATION,
        "Injected " << report.samples << " samples into '" << signal << "': "
                    << report.anomalies << " anomalies, "
                    << report.alerts_created << " alerts");
  }

  // --- Main Loop ---
  while (!g_shutdown_requested) {
    if (g_reset_failed_requested.exchange(false)) {
      const size_t reset = context.scheduler().reset_failed();
      LOG(LogLevel::WARN, LogComponent::CORE,
          "SIGUSR1 received; reset " << reset << " failed tasks");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested...");
  if (metrics_server)
    metrics_server->stop();
  const bool clean = context.shutdown(
      std::chrono::seconds(config->scheduler.shutdown_timeout_seconds));
  if (auto write_behind = std::dynamic_pointer_cast<WriteBehindStore>(store))
    write_behind->stop();

  if (!clean) {
    // Abandoned workers may still be running; skip static destructors.
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "CrowdSense stopped with tasks still running; exiting immediately");
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(EXIT_FAILURE);
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "CrowdSense stopped");
  return 0;
}
