#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>

#include "core/config.hpp"
#include "core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "crowdsense_config_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string createTestConfigFile(const std::string &content) {
    auto config_path = test_dir / "test_config.ini";
    std::ofstream file(config_path);
    file << content;
    file.close();
    return config_path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(ConfigTest, ParsesAllSections) {
  std::string config_content = R"(
signals = Flood, EARTHQUAKE ,  wild   fire
simulation_mode = false

[Detection]
window_size = 20
ewma_alpha = 0.2
z_threshold = 3.0
ewma_deviation_threshold = 0.75
percentile_fallback_enabled = no
fallback_percentile = 0.9
fallback_min_samples = 8

[Alerting]
cooldown_period_seconds = 600
file_enabled = true
alert_output_path = /tmp/alerts.jsonl
known_locations = Mumbai, Navi Mumbai ,Chennai

[Scheduler]
collection_interval_seconds = 30
dispatch_retry_interval_seconds = 15

[CollectionRetry]
max_retries = 5
backoff_base_ms = 250

[DispatchRetry]
max_retries = 2
backoff_base_ms = 500
backoff_cap_ms = 4000

[Collector]
endpoint_url = http://feeds.example.org:8080/v1/counts
lookback_seconds = 120
verify_tls = false

[Monitoring]
enabled = true
port = 9191

[Logging]
default_level = DEBUG
alert.dispatch = ERROR
)";

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(createTestConfigFile(config_content)));
  auto config = manager.get_config();

  EXPECT_EQ(config->signals,
            (std::vector<std::string>{"flood", "earthquake", "wild fire"}));
  EXPECT_FALSE(config->simulation_mode);

  EXPECT_EQ(config->detection.window_size, 20);
  EXPECT_DOUBLE_EQ(config->detection.ewma_alpha, 0.2);
  EXPECT_DOUBLE_EQ(config->detection.z_threshold, 3.0);
  EXPECT_DOUBLE_EQ(config->detection.ewma_deviation_threshold, 0.75);
  EXPECT_FALSE(config->detection.percentile_fallback_enabled);
  EXPECT_DOUBLE_EQ(config->detection.fallback_percentile, 0.9);
  EXPECT_EQ(config->detection.fallback_min_samples, 8u);

  EXPECT_EQ(config->alerting.cooldown_period_seconds, 600u);
  EXPECT_TRUE(config->alerting.file_enabled);
  EXPECT_EQ(config->alerting.alert_output_path, "/tmp/alerts.jsonl");
  EXPECT_EQ(config->alerting.known_locations,
            (std::vector<std::string>{"Mumbai", "Navi Mumbai", "Chennai"}));

  EXPECT_EQ(config->scheduler.collection_interval_seconds, 30u);
  EXPECT_EQ(config->scheduler.dispatch_retry_interval_seconds, 15u);

  // Retry policies are independent of each other
  EXPECT_EQ(config->collection_retry.max_retries, 5u);
  EXPECT_EQ(config->collection_retry.backoff_base_ms, 250u);
  EXPECT_EQ(config->dispatch_retry.max_retries, 2u);
  EXPECT_EQ(config->dispatch_retry.backoff_base_ms, 500u);
  EXPECT_EQ(config->dispatch_retry.backoff_cap_ms, 4000u);

  EXPECT_EQ(config->collector.endpoint_url,
            "http://feeds.example.org:8080/v1/counts");
  EXPECT_EQ(config->collector.lookback_seconds, 120u);
  EXPECT_FALSE(config->collector.verify_tls);
  EXPECT_TRUE(config->monitoring.enabled);
  EXPECT_EQ(config->monitoring.port, 9191);

  EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::DEBUG);
  EXPECT_EQ(config->logging.log_levels.at(LogComponent::ALERT_DISPATCH),
            LogLevel::ERROR);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(
      createTestConfigFile("simulation_mode = true\n")));
  auto config = manager.get_config();

  EXPECT_EQ(config->signals.size(), 9u);
  EXPECT_EQ(config->detection.window_size, 15);
  EXPECT_DOUBLE_EQ(config->detection.ewma_alpha, 0.3);
  EXPECT_DOUBLE_EQ(config->detection.z_threshold, 2.5);
  EXPECT_EQ(config->alerting.cooldown_period_seconds, 900u);
  EXPECT_EQ(config->dispatch_retry.backoff_base_ms, 2000u);
  EXPECT_TRUE(config->collector.verify_tls);
}

TEST_F(ConfigTest, UnknownKeysAndMalformedNumbersAreTolerated) {
  std::string config_content = R"(
simulation_mode = true
mystery = 42
no equals sign here

[Detection]
window_size = lots
z_threshold = 3.5

[Weather]
colour = blue
)";
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(createTestConfigFile(config_content)));
  auto config = manager.get_config();

  EXPECT_EQ(config->detection.window_size, 15);
  EXPECT_DOUBLE_EQ(config->detection.z_threshold, 3.5);
  EXPECT_EQ(config->custom_settings.at("mystery"), "42");
  EXPECT_EQ(config->custom_settings.at("Weather.colour"), "blue");
}

TEST_F(ConfigTest, InvalidDetectionSettingsAreFatal) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(
      "simulation_mode = true\n[Detection]\nwindow_size = 0\n")));
  EXPECT_FALSE(manager.last_errors().empty());

  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(
      "simulation_mode = true\n[Detection]\newma_alpha = 1.5\n")));
  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(
      "simulation_mode = true\n[Detection]\nz_threshold = -1\n")));

  // z over a 5-sample window never exceeds 2
  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(
      "simulation_mode = true\n[Detection]\nwindow_size = 5\n"
      "z_threshold = 2.5\n")));
  ASSERT_EQ(manager.last_errors().size(), 1u);
  EXPECT_NE(manager.last_errors()[0].find("unreachable"), std::string::npos);

  // The previous valid configuration stays in place
  EXPECT_EQ(manager.get_config()->detection.window_size, 15);
}

TEST_F(ConfigTest, LiveModeRequiresEndpoint) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration(
      createTestConfigFile("simulation_mode = false\n")));

  Config::ConfigManager with_override;
  with_override.set_overrides(
      [](Config::AppConfig &config) { config.simulation_mode = true; });
  EXPECT_TRUE(with_override.load_configuration(
      createTestConfigFile("simulation_mode = false\n")));
  EXPECT_TRUE(with_override.get_config()->simulation_mode);
}

TEST_F(ConfigTest, MissingFileFails) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
  ASSERT_EQ(manager.last_errors().size(), 1u);
}

TEST(ConfigValidationTest, RetryPolicyBounds) {
  std::vector<std::string> errors;
  Config::RetryPolicyConfig policy;
  EXPECT_TRUE(Config::validate_retry_policy_config("DispatchRetry", policy, errors));

  policy.backoff_cap_ms = 10;
  policy.backoff_base_ms = 100;
  EXPECT_FALSE(Config::validate_retry_policy_config("DispatchRetry", policy, errors));
  ASSERT_FALSE(errors.empty());
  EXPECT_NE(errors.back().find("DispatchRetry"), std::string::npos);
}

TEST(ConfigValidationTest, HttpChannelNeedsWebhook) {
  Config::AppConfig config;
  config.simulation_mode = true;
  config.alerting.http_enabled = true;
  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(config, errors));

  config.alerting.http_webhook_url = "https://hooks.example.org/alerts";
  errors.clear();
  EXPECT_TRUE(Config::validate_app_config(config, errors));
}
