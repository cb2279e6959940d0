#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"metrics", LogComponent::METRICS},
    {"io.collector", LogComponent::IO_COLLECTOR},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"io.database", LogComponent::IO_DATABASE},
    {"io.web", LogComponent::IO_WEB},
    {"io.location", LogComponent::IO_LOCATION},
    {"detection.window", LogComponent::DETECTION_WINDOW},
    {"detection.eval", LogComponent::DETECTION_EVAL},
    {"alert.dedup", LogComponent::ALERT_DEDUP},
    {"alert.dispatch", LogComponent::ALERT_DISPATCH},
    {"scheduler.task", LogComponent::SCHEDULER_TASK},
    {"scheduler.lifecycle", LogComponent::SCHEDULER_LIFECYCLE},
    {"simulation", LogComponent::SIMULATION}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

LoggingConfig default_logging_config() {
  LoggingConfig logging;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  return logging;
}

bool validate_detection_config(const DetectionConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (config.window_size <= 0) {
    errors.push_back("Detection window_size must be greater than 0");
    valid = false;
  }

  if (!(config.ewma_alpha >= 0.0 && config.ewma_alpha <= 1.0)) {
    errors.push_back("Detection ewma_alpha must be between 0 and 1");
    valid = false;
  }

  if (!(config.z_threshold > 0.0) || !std::isfinite(config.z_threshold)) {
    errors.push_back("Detection z_threshold must be a positive number");
    valid = false;
  }

  // The window includes the sample being scored, so |z| is bounded by
  // sqrt(window_size - 1). A threshold at or above that bound never fires.
  if (config.window_size > 0 && config.z_threshold > 0.0) {
    const double max_z = std::sqrt(static_cast<double>(config.window_size - 1));
    if (config.z_threshold >= max_z) {
      std::ostringstream oss;
      oss << "Detection z_threshold " << config.z_threshold
          << " is unreachable with window_size " << config.window_size
          << " (z never exceeds " << max_z << ")";
      errors.push_back(oss.str());
      valid = false;
    }
  }

  if (!(config.ewma_deviation_threshold >= 0.0) ||
      !std::isfinite(config.ewma_deviation_threshold)) {
    errors.push_back(
        "Detection ewma_deviation_threshold must be a non-negative number");
    valid = false;
  }

  if (!(config.ewma_epsilon > 0.0)) {
    errors.push_back("Detection ewma_epsilon must be greater than 0");
    valid = false;
  }

  if (!(config.fallback_percentile > 0.0 && config.fallback_percentile < 1.0)) {
    errors.push_back(
        "Detection fallback_percentile must be strictly between 0 and 1");
    valid = false;
  }

  if (config.fallback_min_samples < 1) {
    errors.push_back("Detection fallback_min_samples must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_retry_policy_config(const std::string &section,
                                  const RetryPolicyConfig &config,
                                  std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_retries > 100) {
    errors.push_back(section + " max_retries must be at most 100");
    valid = false;
  }

  if (config.backoff_base_ms < 1) {
    errors.push_back(section + " backoff_base_ms must be at least 1");
    valid = false;
  }

  if (config.backoff_cap_ms < config.backoff_base_ms) {
    errors.push_back(section +
                     " backoff_cap_ms must not be lower than backoff_base_ms");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.signals.empty()) {
    errors.push_back("At least one signal must be configured");
    valid = false;
  }

  valid &= validate_detection_config(config.detection, errors);
  valid &= validate_retry_policy_config("CollectionRetry",
                                        config.collection_retry, errors);
  valid &= validate_retry_policy_config("DispatchRetry", config.dispatch_retry,
                                        errors);

  if (config.alerting.cooldown_period_seconds == 0) {
    errors.push_back("Alerting cooldown_period_seconds must be greater than 0");
    valid = false;
  }

  if (config.alerting.http_enabled &&
      config.alerting.http_webhook_url.empty()) {
    errors.push_back("Alerting http_enabled requires http_webhook_url");
    valid = false;
  }

  const auto &sched = config.scheduler;
  if (sched.collection_interval_seconds == 0 ||
      sched.dispatch_retry_interval_seconds == 0 ||
      sched.cleanup_interval_seconds == 0 ||
      sched.metrics_report_interval_seconds == 0) {
    errors.push_back("Scheduler task intervals must be greater than 0");
    valid = false;
  }

  if (!config.simulation_mode && config.collector.endpoint_url.empty()) {
    errors.push_back(
        "Collector endpoint_url is required unless simulation_mode is on");
    valid = false;
  }

  if (config.monitoring.enabled &&
      (config.monitoring.port < 1 || config.monitoring.port > 65535)) {
    errors.push_back("Monitoring port must be between 1 and 65535");
    valid = false;
  }

  if (config.persistence.enabled && config.persistence.uri.empty()) {
    errors.push_back("Persistence uri must not be empty when enabled");
    valid = false;
  }

  return valid;
}

namespace {

template <typename T>
void assign_number(const std::string &value, T &target) {
  target = Utils::string_to_number<T>(value).value_or(target);
}

void apply_retry_key(const std::string &key, const std::string &value,
                     RetryPolicyConfig &policy,
                     std::unordered_map<std::string, std::string> &custom) {
  if (key == Keys::RP_MAX_RETRIES)
    assign_number(value, policy.max_retries);
  else if (key == Keys::RP_BACKOFF_BASE_MS)
    assign_number(value, policy.backoff_base_ms);
  else if (key == Keys::RP_BACKOFF_CAP_MS)
    assign_number(value, policy.backoff_cap_ms);
  else
    custom[key] = value;
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging = default_logging_config();

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Attempting to load configuration from " << filepath);
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Could not open config file '" << filepath << "'.");
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Config line " << line_num
                         << ": invalid format (missing '='): " << trimmed_line);
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Config line " << line_num << ": empty key found.");
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::SIGNALS) {
          std::vector<std::string> signals;
          for (const auto &signal : Utils::split_and_trim(value, ','))
            signals.push_back(Utils::normalize_label(signal));
          config.signals = signals;
        } else if (key == Keys::SIMULATION_MODE)
          config.simulation_mode = string_to_bool(value);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Detection") {
        auto &dt = config.detection;
        if (key == Keys::DT_WINDOW_SIZE)
          assign_number(value, dt.window_size);
        else if (key == Keys::DT_EWMA_ALPHA)
          assign_number(value, dt.ewma_alpha);
        else if (key == Keys::DT_Z_THRESHOLD)
          assign_number(value, dt.z_threshold);
        else if (key == Keys::DT_EWMA_DEVIATION_THRESHOLD)
          assign_number(value, dt.ewma_deviation_threshold);
        else if (key == Keys::DT_EWMA_EPSILON)
          assign_number(value, dt.ewma_epsilon);
        else if (key == Keys::DT_PERCENTILE_FALLBACK_ENABLED)
          dt.percentile_fallback_enabled = string_to_bool(value);
        else if (key == Keys::DT_FALLBACK_PERCENTILE)
          assign_number(value, dt.fallback_percentile);
        else if (key == Keys::DT_FALLBACK_MIN_SAMPLES)
          assign_number(value, dt.fallback_min_samples);
        else if (key == Keys::DT_HISTORY_SEED_SAMPLES)
          assign_number(value, dt.history_seed_samples);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Alerting") {
        auto &al = config.alerting;
        if (key == Keys::AL_COOLDOWN_PERIOD_SECONDS)
          assign_number(value, al.cooldown_period_seconds);
        else if (key == Keys::AL_DISPATCH_TIMEOUT_MS)
          assign_number(value, al.dispatch_timeout_ms);
        else if (key == Keys::AL_STDOUT_ENABLED)
          al.stdout_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_ENABLED)
          al.file_enabled = string_to_bool(value);
        else if (key == Keys::AL_ALERT_OUTPUT_PATH)
          al.alert_output_path = value;
        else if (key == Keys::AL_SYSLOG_ENABLED)
          al.syslog_enabled = string_to_bool(value);
        else if (key == Keys::AL_HTTP_ENABLED)
          al.http_enabled = string_to_bool(value);
        else if (key == Keys::AL_HTTP_WEBHOOK_URL)
          al.http_webhook_url = value;
        else if (key == Keys::AL_MAX_RECENT_ALERTS)
          assign_number(value, al.max_recent_alerts);
        else if (key == Keys::AL_KNOWN_LOCATIONS)
          al.known_locations = Utils::split_and_trim(value, ',');
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Scheduler") {
        auto &sc = config.scheduler;
        if (key == Keys::SC_COLLECTION_INTERVAL_SECONDS)
          assign_number(value, sc.collection_interval_seconds);
        else if (key == Keys::SC_DISPATCH_RETRY_INTERVAL_SECONDS)
          assign_number(value, sc.dispatch_retry_interval_seconds);
        else if (key == Keys::SC_CLEANUP_INTERVAL_SECONDS)
          assign_number(value, sc.cleanup_interval_seconds);
        else if (key == Keys::SC_METRICS_REPORT_INTERVAL_SECONDS)
          assign_number(value, sc.metrics_report_interval_seconds);
        else if (key == Keys::SC_SHUTDOWN_TIMEOUT_SECONDS)
          assign_number(value, sc.shutdown_timeout_seconds);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "CollectionRetry") {
        apply_retry_key(key, value, config.collection_retry,
                        config.custom_settings);
      } else if (current_section == "DispatchRetry") {
        apply_retry_key(key, value, config.dispatch_retry,
                        config.custom_settings);

      } else if (current_section == "Collector") {
        if (key == Keys::CO_ENDPOINT_URL)
          config.collector.endpoint_url = value;
        else if (key == Keys::CO_TIMEOUT_MS)
          assign_number(value, config.collector.timeout_ms);
        else if (key == Keys::CO_LOOKBACK_SECONDS)
          assign_number(value, config.collector.lookback_seconds);
        else if (key == Keys::CO_VERIFY_TLS)
          config.collector.verify_tls = string_to_bool(value);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Persistence") {
        auto &pe = config.persistence;
        if (key == Keys::PE_ENABLED)
          pe.enabled = string_to_bool(value);
        else if (key == Keys::PE_URI)
          pe.uri = value;
        else if (key == Keys::PE_DATABASE)
          pe.database = value;
        else if (key == Keys::PE_ALERT_RETENTION_DAYS)
          assign_number(value, pe.alert_retention_days);
        else if (key == Keys::PE_METRIC_RETENTION_DAYS)
          assign_number(value, pe.metric_retention_days);
        else if (key == Keys::PE_WRITE_QUEUE_CAPACITY)
          assign_number(value, pe.write_queue_capacity);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Monitoring") {
        if (key == Keys::MO_ENABLED)
          config.monitoring.enabled = string_to_bool(value);
        else if (key == Keys::MO_HOST)
          config.monitoring.host = value;
        else if (key == Keys::MO_PORT)
          assign_number(value, config.monitoring.port);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Simulation") {
        if (key == Keys::SI_BASELINE_MEAN)
          assign_number(value, config.simulation.baseline_mean);
        else if (key == Keys::SI_BASELINE_JITTER)
          assign_number(value, config.simulation.baseline_jitter);
        else if (key == Keys::SI_SEED)
          assign_number(value, config.simulation.seed);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel level = string_to_log_level(value);
          for (const auto &pair : key_to_component_map)
            config.logging.log_levels[pair.second] = level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else
            LOG(LogLevel::WARN, LogComponent::CONFIG,
                "Config line " << line_num
                               << ": unknown logging component '" << key
                               << "'");
        }
      } else {
        config.custom_settings[current_section + "." + key] = value;
      }
    } catch (const std::exception &e) {
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Config line " << line_num << ": could not apply key '" << key
                         << "' - " << e.what());
    }
  }

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration parsed from " << filepath);
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    last_errors_ = {"Could not read configuration file: " + filepath};
    LOG(LogLevel::ERROR, LogComponent::CONFIG,
        "Failed to parse configuration file: "
            << filepath << ". Keeping existing settings.");
    return false;
  }

  return validate_and_swap(std::move(new_config));
}

bool ConfigManager::load_defaults() {
  auto new_config = std::make_shared<AppConfig>();
  new_config->logging = default_logging_config();
  return validate_and_swap(std::move(new_config));
}

bool ConfigManager::validate_and_swap(std::shared_ptr<AppConfig> new_config) {
  if (overrides_)
    overrides_(*new_config);

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    LOG(LogLevel::ERROR, LogComponent::CONFIG,
        "Configuration validation failed:");
    for (const auto &error : validation_errors)
      LOG(LogLevel::ERROR, LogComponent::CONFIG, "  - " << error);
    last_errors_ = std::move(validation_errors);
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = std::move(new_config);
  last_errors_.clear();
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated"
          << (config_filepath_.empty() ? "" : " from " + config_filepath_));
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
