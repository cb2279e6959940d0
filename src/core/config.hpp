#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *SIGNALS = "signals";
constexpr const char *SIMULATION_MODE = "simulation_mode";

// Detection Settings
constexpr const char *DT_WINDOW_SIZE = "window_size";
constexpr const char *DT_EWMA_ALPHA = "ewma_alpha";
constexpr const char *DT_Z_THRESHOLD = "z_threshold";
constexpr const char *DT_EWMA_DEVIATION_THRESHOLD = "ewma_deviation_threshold";
constexpr const char *DT_EWMA_EPSILON = "ewma_epsilon";
constexpr const char *DT_PERCENTILE_FALLBACK_ENABLED =
    "percentile_fallback_enabled";
constexpr const char *DT_FALLBACK_PERCENTILE = "fallback_percentile";
constexpr const char *DT_FALLBACK_MIN_SAMPLES = "fallback_min_samples";
constexpr const char *DT_HISTORY_SEED_SAMPLES = "history_seed_samples";

// Alerting Settings
constexpr const char *AL_COOLDOWN_PERIOD_SECONDS = "cooldown_period_seconds";
constexpr const char *AL_DISPATCH_TIMEOUT_MS = "dispatch_timeout_ms";
constexpr const char *AL_STDOUT_ENABLED = "stdout_enabled";
constexpr const char *AL_FILE_ENABLED = "file_enabled";
constexpr const char *AL_ALERT_OUTPUT_PATH = "alert_output_path";
constexpr const char *AL_SYSLOG_ENABLED = "syslog_enabled";
constexpr const char *AL_HTTP_ENABLED = "http_enabled";
constexpr const char *AL_HTTP_WEBHOOK_URL = "http_webhook_url";
constexpr const char *AL_MAX_RECENT_ALERTS = "max_recent_alerts";
constexpr const char *AL_KNOWN_LOCATIONS = "known_locations";

// Scheduler Settings
constexpr const char *SC_COLLECTION_INTERVAL_SECONDS =
    "collection_interval_seconds";
constexpr const char *SC_DISPATCH_RETRY_INTERVAL_SECONDS =
    "dispatch_retry_interval_seconds";
constexpr const char *SC_CLEANUP_INTERVAL_SECONDS = "cleanup_interval_seconds";
constexpr const char *SC_METRICS_REPORT_INTERVAL_SECONDS =
    "metrics_report_interval_seconds";
constexpr const char *SC_SHUTDOWN_TIMEOUT_SECONDS = "shutdown_timeout_seconds";

// Retry Policy Settings ([CollectionRetry], [DispatchRetry])
constexpr const char *RP_MAX_RETRIES = "max_retries";
constexpr const char *RP_BACKOFF_BASE_MS = "backoff_base_ms";
constexpr const char *RP_BACKOFF_CAP_MS = "backoff_cap_ms";

// Collector Settings
constexpr const char *CO_ENDPOINT_URL = "endpoint_url";
constexpr const char *CO_TIMEOUT_MS = "timeout_ms";
constexpr const char *CO_LOOKBACK_SECONDS = "lookback_seconds";
constexpr const char *CO_VERIFY_TLS = "verify_tls";

// Persistence Settings
constexpr const char *PE_ENABLED = "enabled";
constexpr const char *PE_URI = "uri";
constexpr const char *PE_DATABASE = "database";
constexpr const char *PE_ALERT_RETENTION_DAYS = "alert_retention_days";
constexpr const char *PE_METRIC_RETENTION_DAYS = "metric_retention_days";
constexpr const char *PE_WRITE_QUEUE_CAPACITY = "write_queue_capacity";

// Monitoring Settings
constexpr const char *MO_ENABLED = "enabled";
constexpr const char *MO_HOST = "host";
constexpr const char *MO_PORT = "port";

// Simulation Settings
constexpr const char *SI_BASELINE_MEAN = "baseline_mean";
constexpr const char *SI_BASELINE_JITTER = "baseline_jitter";
constexpr const char *SI_SEED = "seed";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct DetectionConfig {
  int window_size = 15;
  double ewma_alpha = 0.3;
  double z_threshold = 2.5;
  double ewma_deviation_threshold = 0.5;
  double ewma_epsilon = 1e-6;

  // Cold-start path used until the window fills
  bool percentile_fallback_enabled = true;
  double fallback_percentile = 0.95;
  size_t fallback_min_samples = 5;

  // 0 means "use window_size"
  size_t history_seed_samples = 0;
};

struct AlertingConfig {
  uint64_t cooldown_period_seconds = 900; // 15 minutes
  uint32_t dispatch_timeout_ms = 5000;

  bool stdout_enabled = true;
  bool file_enabled = false;
  std::string alert_output_path = "data/alerts.jsonl";
  bool syslog_enabled = false;
  bool http_enabled = false;
  std::string http_webhook_url;

  size_t max_recent_alerts = 200;
  std::vector<std::string> known_locations;
};

struct RetryPolicyConfig {
  uint32_t max_retries = 3;
  uint64_t backoff_base_ms = 1000;
  uint64_t backoff_cap_ms = 60000;
};

struct SchedulerConfig {
  uint64_t collection_interval_seconds = 60;
  uint64_t dispatch_retry_interval_seconds = 30;
  uint64_t cleanup_interval_seconds = 86400; // daily
  uint64_t metrics_report_interval_seconds = 900;
  uint64_t shutdown_timeout_seconds = 10;
};

struct CollectorConfig {
  std::string endpoint_url;
  uint32_t timeout_ms = 10000;
  uint64_t lookback_seconds = 300;
  bool verify_tls = true;
};

struct PersistenceConfig {
  bool enabled = false;
  std::string uri = "mongodb://localhost:27017";
  std::string database = "crowdsense";
  uint32_t alert_retention_days = 7;
  uint32_t metric_retention_days = 30;
  size_t write_queue_capacity = 10000;
};

struct MonitoringConfig {
  bool enabled = false;
  std::string host = "0.0.0.0";
  int port = 9090;
};

struct SimulationConfig {
  double baseline_mean = 5.0;
  double baseline_jitter = 1.0;
  uint32_t seed = 42;
};

struct AppConfig {
  std::vector<std::string> signals = {"earthquake", "flood",     "cyclone",
                                      "tsunami",    "landslide", "fire",
                                      "storm",      "hurricane", "tornado"};
  bool simulation_mode = false;

  DetectionConfig detection;
  AlertingConfig alerting;
  SchedulerConfig scheduler;
  RetryPolicyConfig collection_retry;
  RetryPolicyConfig dispatch_retry{3, 2000, 60000};
  CollectorConfig collector;
  PersistenceConfig persistence;
  MonitoringConfig monitoring;
  SimulationConfig simulation;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

LoggingConfig default_logging_config();

bool validate_detection_config(const DetectionConfig &config,
                               std::vector<std::string> &errors);
bool validate_retry_policy_config(const std::string &section,
                                  const RetryPolicyConfig &config,
                                  std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Parses an INI file into `config`. Returns false if the file can't be read.
bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;

  // Applied after parsing and before validation, e.g. command line flags.
  void set_overrides(std::function<void(AppConfig &)> overrides) {
    overrides_ = std::move(overrides);
  }

  bool load_configuration(const std::string &filepath);
  bool load_defaults();
  std::shared_ptr<const AppConfig> get_config() const;
  const std::vector<std::string> &last_errors() const { return last_errors_; }

private:
  bool validate_and_swap(std::shared_ptr<AppConfig> new_config);

  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  std::vector<std::string> last_errors_;
  std::function<void(AppConfig &)> overrides_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
