#include "core/alert_manager.hpp"
#include "core/errors.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"
#include "io/alert_dispatch/base_notifier.hpp"
#include "io/db/base_alert_store.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

class MockNotifier : public INotifier {
public:
  bool send(const Alert &alert) override {
    std::lock_guard<std::mutex> lock(mutex);
    sent.push_back(alert);
    return succeed;
  }
  const char *get_name() const override { return "MockNotifier"; }

  size_t sent_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent.size();
  }

  std::atomic<bool> succeed{true};
  std::mutex mutex;
  std::vector<Alert> sent;
};

class ThrowingNotifier : public INotifier {
public:
  bool send(const Alert &) override { throw DispatchError("socket closed"); }
  const char *get_name() const override { return "ThrowingNotifier"; }
};

class FailingStore : public IAlertStore {
public:
  void store_alert(const Alert &) override {
    attempts++;
    throw PersistenceError("database offline");
  }
  void store_metric(const std::string &, double, uint64_t) override {}
  void store_sample(const std::string &, const Sample &) override {}
  std::vector<Alert> query_recent_alerts(const AlertFilter &) override {
    return {};
  }
  std::vector<Sample> query_signal_history(const std::string &,
                                           size_t) override {
    return {};
  }
  CleanupResult cleanup(const RetentionPolicy &) override { return {}; }
  const char *get_name() const override { return "FailingStore"; }

  int attempts = 0;
};

constexpr uint64_t kCooldownSeconds = 900;
constexpr uint64_t kCooldownMs = kCooldownSeconds * 1000;
constexpr uint64_t kStart = 1700000000000ULL;

Config::AppConfig test_config() {
  Config::AppConfig config;
  config.alerting.cooldown_period_seconds = kCooldownSeconds;
  config.dispatch_retry.max_retries = 3;
  config.dispatch_retry.backoff_base_ms = 1000;
  config.dispatch_retry.backoff_cap_ms = 60000;
  return config;
}

AnomalyEvent anomaly(const std::string &signal, uint64_t ts,
                     double z_score = 3.0) {
  AnomalyEvent event;
  event.signal = signal;
  event.timestamp_ms = ts;
  event.value = 50.0;
  event.z_score = z_score;
  event.ewma_deviation = 1.7;
  event.decision = Decision::Anomaly;
  event.confidence = {0.6, DetectionBasis::Statistical};
  event.source_tag = "Reports of " + signal;
  return event;
}

} // namespace

class AlertManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    notifier = std::make_shared<MockNotifier>();
    manager = std::make_unique<AlertManager>(test_config(), notifier, nullptr,
                                             &metrics);
  }

  MetricsRegistry metrics;
  std::shared_ptr<MockNotifier> notifier;
  std::unique_ptr<AlertManager> manager;
};

TEST_F(AlertManagerTest, IgnoresNonAnomalyEvents) {
  AnomalyEvent event = anomaly("flood", kStart);
  event.decision = Decision::Normal;
  EXPECT_FALSE(manager->consider(event, std::string("Mumbai")).has_value());
  event.decision = Decision::Insufficient;
  EXPECT_FALSE(manager->consider(event, std::string("Mumbai")).has_value());
  EXPECT_EQ(notifier->sent_count(), 0u);
}

TEST_F(AlertManagerTest, DispatchesNewAlert) {
  auto alert = manager->consider(anomaly("flood", kStart), std::string("Mumbai"));
  ASSERT_TRUE(alert.has_value());
  EXPECT_EQ(alert->status, AlertStatus::Dispatched);
  EXPECT_EQ(alert->disaster_type, "flood");
  EXPECT_EQ(alert->location, "Mumbai");
  EXPECT_EQ(alert->normalized_location, "mumbai");
  EXPECT_EQ(alert->dispatch_attempts, 1u);
  EXPECT_EQ(alert->created_at_ms, kStart);
  EXPECT_EQ(alert->dedup_key,
            "flood|mumbai|" + std::to_string(kStart / kCooldownMs));
  EXPECT_EQ(notifier->sent_count(), 1u);
  EXPECT_DOUBLE_EQ(metrics.value(MetricNames::ALERTS_SENT, {{"type", "flood"}}),
                   1.0);
}

TEST_F(AlertManagerTest, DuplicateWithinCooldownIsSuppressed) {
  auto first = manager->consider(anomaly("flood", kStart), std::string("Mumbai"));
  auto second = manager->consider(anomaly("flood", kStart + 60000),
                                  std::string("  MUMBAI "));
  ASSERT_TRUE(first && second);

  EXPECT_EQ(first->status, AlertStatus::Dispatched);
  EXPECT_EQ(second->status, AlertStatus::Suppressed);
  EXPECT_EQ(second->suppressed_by, first->id);
  EXPECT_EQ(second->dispatch_attempts, 0u);
  EXPECT_EQ(notifier->sent_count(), 1u);

  EXPECT_EQ(manager->get_alerts_by_status(AlertStatus::Dispatched).size(), 1u);
  EXPECT_EQ(manager->get_alerts_by_status(AlertStatus::Suppressed).size(), 1u);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::ALERTS_SUPPRESSED, {{"type", "flood"}}), 1.0);
}

TEST_F(AlertManagerTest, CooldownAppliesAcrossBucketBoundaries) {
  // Just before a bucket edge, then just after it
  const uint64_t edge = (kStart / kCooldownMs + 1) * kCooldownMs;
  auto first = manager->consider(anomaly("fire", edge - 1000), std::nullopt);
  auto second = manager->consider(anomaly("fire", edge + 1000), std::nullopt);
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->dedup_key, second->dedup_key);
  EXPECT_EQ(second->status, AlertStatus::Suppressed);
}

TEST_F(AlertManagerTest, NewAlertAfterCooldownElapses) {
  auto first = manager->consider(anomaly("flood", kStart), std::string("Chennai"));
  auto second = manager->consider(anomaly("flood", kStart + kCooldownMs),
                                  std::string("Chennai"));
  ASSERT_TRUE(first && second);
  EXPECT_EQ(second->status, AlertStatus::Dispatched);
  EXPECT_NE(first->id, second->id);
  EXPECT_EQ(notifier->sent_count(), 2u);
}

TEST_F(AlertManagerTest, LaterEventOfAnotherScopeDoesNotExpireCooldown) {
  auto first = manager->consider(anomaly("flood", kStart), std::string("Chennai"));
  auto other = manager->consider(anomaly("earthquake", kStart + kCooldownMs),
                                 std::string("Delhi"));
  auto late = manager->consider(anomaly("flood", kStart + 10000),
                                std::string("Chennai"));
  ASSERT_TRUE(first && other && late);
  EXPECT_EQ(first->status, AlertStatus::Dispatched);
  EXPECT_EQ(other->status, AlertStatus::Dispatched);
  EXPECT_EQ(late->status, AlertStatus::Suppressed);
  EXPECT_EQ(late->suppressed_by, first->id);
  EXPECT_EQ(late->dedup_key, first->dedup_key);
  EXPECT_EQ(notifier->sent_count(), 2u);
}

TEST_F(AlertManagerTest, OutOfOrderEventsNeverShareAnActiveDedupKey) {
  const uint64_t newest = kStart + kCooldownMs + kCooldownMs / 2;
  auto a = manager->consider(anomaly("flood", newest), std::string("Assam"));
  auto b = manager->consider(anomaly("flood", kStart), std::string("Assam"));
  auto c = manager->consider(anomaly("flood", kStart + 5000),
                             std::string("Assam"));
  auto d = manager->consider(anomaly("flood", newest - 1000),
                             std::string("Assam"));
  ASSERT_TRUE(a && b && c && d);
  EXPECT_EQ(a->status, AlertStatus::Dispatched);
  EXPECT_EQ(b->status, AlertStatus::Dispatched);
  EXPECT_EQ(c->status, AlertStatus::Suppressed);
  EXPECT_EQ(c->suppressed_by, b->id);
  EXPECT_EQ(d->status, AlertStatus::Suppressed);
  EXPECT_EQ(d->suppressed_by, a->id);

  std::set<std::string> keys;
  for (const auto &alert : manager->get_recent_alerts(10))
    if (alert.status != AlertStatus::Suppressed)
      EXPECT_TRUE(keys.insert(alert.dedup_key).second) << alert.dedup_key;
}

TEST_F(AlertManagerTest, DifferentLocationsOrTypesAreIndependent) {
  auto a = manager->consider(anomaly("flood", kStart), std::string("Chennai"));
  auto b = manager->consider(anomaly("flood", kStart), std::string("Kolkata"));
  auto c = manager->consider(anomaly("cyclone", kStart), std::string("Chennai"));
  ASSERT_TRUE(a && b && c);
  EXPECT_EQ(a->status, AlertStatus::Dispatched);
  EXPECT_EQ(b->status, AlertStatus::Dispatched);
  EXPECT_EQ(c->status, AlertStatus::Dispatched);
}

TEST_F(AlertManagerTest, MissingLocationBecomesUnknown) {
  auto alert = manager->consider(anomaly("storm", kStart), std::nullopt);
  ASSERT_TRUE(alert);
  EXPECT_EQ(alert->location, "Unknown");
  EXPECT_EQ(alert->normalized_location, "unknown");

  auto blank = manager->consider(anomaly("storm", kStart + 1), std::string("  "));
  ASSERT_TRUE(blank);
  EXPECT_EQ(blank->status, AlertStatus::Suppressed);
}

TEST_F(AlertManagerTest, SeverityFollowsZScore) {
  auto moderate = manager->consider(anomaly("a", kStart, 3.0), std::nullopt);
  auto major = manager->consider(anomaly("b", kStart, 4.0), std::nullopt);
  auto severe = manager->consider(anomaly("c", kStart, 5.0), std::nullopt);
  ASSERT_TRUE(moderate && major && severe);
  EXPECT_EQ(moderate->severity, AlertSeverity::Moderate);
  EXPECT_EQ(major->severity, AlertSeverity::Major);
  EXPECT_EQ(severe->severity, AlertSeverity::Severe);

  AnomalyEvent fallback = anomaly("d", kStart, 9.0);
  fallback.confidence = {0.5, DetectionBasis::PercentileFallback};
  auto from_fallback = manager->consider(fallback, std::nullopt);
  ASSERT_TRUE(from_fallback);
  EXPECT_EQ(from_fallback->severity, AlertSeverity::Moderate);
  EXPECT_EQ(from_fallback->basis, DetectionBasis::PercentileFallback);
}

TEST_F(AlertManagerTest, FailedDispatchStillBlocksDuplicates) {
  notifier->succeed = false;
  auto first = manager->consider(anomaly("flood", kStart), std::string("Delhi"));
  auto second =
      manager->consider(anomaly("flood", kStart + 1000), std::string("Delhi"));
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->status, AlertStatus::FailedDispatch);
  EXPECT_EQ(second->status, AlertStatus::Suppressed);
  EXPECT_EQ(notifier->sent_count(), 1u);
}

TEST_F(AlertManagerTest, RetriesWithBackoffUntilExhausted) {
  notifier->succeed = false;
  auto alert = manager->consider(anomaly("flood", kStart), std::string("Assam"));
  ASSERT_TRUE(alert);
  ASSERT_EQ(alert->status, AlertStatus::FailedDispatch);
  ASSERT_NE(alert->next_attempt_ms, 0u);
  EXPECT_EQ(manager->pending_retry_count(), 1u);

  // Nothing is due before the backoff elapses
  EXPECT_EQ(manager->retry_failed_dispatches(alert->last_attempt_ms), 0u);

  uint64_t now = alert->next_attempt_ms;
  for (uint32_t retry = 1; retry <= 3; ++retry) {
    ASSERT_EQ(manager->retry_failed_dispatches(now), 1u) << "retry " << retry;
    auto current = manager->find_alert(alert->id);
    ASSERT_TRUE(current);
    EXPECT_EQ(current->dispatch_attempts, 1u + retry);
    EXPECT_EQ(current->status, AlertStatus::FailedDispatch);
    if (retry < 3) {
      // base * 2^retry
      EXPECT_EQ(current->next_attempt_ms, now + (1000u << retry));
      now = current->next_attempt_ms;
    } else {
      EXPECT_EQ(current->next_attempt_ms, 0u);
    }
  }

  // Exhausted: never retried again
  EXPECT_EQ(manager->retry_failed_dispatches(now + 10'000'000), 0u);
  EXPECT_EQ(notifier->sent_count(), 4u);
  EXPECT_EQ(manager->pending_retry_count(), 0u);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::ALERTS_DISPATCH_EXHAUSTED, {{"type", "flood"}}),
      1.0);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::ALERTS_DISPATCH_FAILED, {{"type", "flood"}}),
      4.0);
}

TEST_F(AlertManagerTest, RetrySucceedsAfterTransientFailure) {
  notifier->succeed = false;
  auto alert = manager->consider(anomaly("flood", kStart), std::string("Kerala"));
  ASSERT_TRUE(alert);

  notifier->succeed = true;
  EXPECT_EQ(manager->retry_failed_dispatches(alert->next_attempt_ms), 1u);
  auto current = manager->find_alert(alert->id);
  ASSERT_TRUE(current);
  EXPECT_EQ(current->status, AlertStatus::Dispatched);
  EXPECT_EQ(current->dispatch_attempts, 2u);
  EXPECT_TRUE(current->last_error.empty());
  EXPECT_EQ(manager->pending_retry_count(), 0u);
}

TEST(AlertManagerErrorsTest, NotifierExceptionIsADispatchFailure) {
  MetricsRegistry metrics;
  AlertManager manager(test_config(), std::make_shared<ThrowingNotifier>(),
                       nullptr, &metrics);
  auto alert = manager.consider(anomaly("flood", kStart), std::nullopt);
  ASSERT_TRUE(alert);
  EXPECT_EQ(alert->status, AlertStatus::FailedDispatch);
  EXPECT_EQ(alert->last_error, "socket closed");
}

TEST(AlertManagerErrorsTest, PersistenceFailureNeverBlocksDispatch) {
  MetricsRegistry metrics;
  auto notifier = std::make_shared<MockNotifier>();
  auto store = std::make_shared<FailingStore>();
  AlertManager manager(test_config(), notifier, store, &metrics);

  auto alert = manager.consider(anomaly("flood", kStart), std::nullopt);
  ASSERT_TRUE(alert);
  EXPECT_EQ(alert->status, AlertStatus::Dispatched);
  EXPECT_GE(store->attempts, 1);
  EXPECT_GE(metrics.value(MetricNames::PERSISTENCE_ERRORS), 1.0);
}

TEST(AlertManagerErrorsTest, RequiresNotifier) {
  EXPECT_THROW({ AlertManager manager(test_config(), nullptr); },
               std::invalid_argument);
}

TEST(AlertManagerConcurrencyTest, ConcurrentDuplicatesDispatchOnce) {
  auto notifier = std::make_shared<MockNotifier>();
  AlertManager manager(test_config(), notifier);

  std::vector<std::thread> threads;
  for (int t = 0; t < 16; ++t) {
    threads.emplace_back([&manager, t] {
      manager.consider(anomaly("earthquake", kStart + t), std::string("Gujarat"));
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(notifier->sent_count(), 1u);
  EXPECT_EQ(manager.get_alerts_by_status(AlertStatus::Dispatched).size(), 1u);
  EXPECT_EQ(manager.get_alerts_by_status(AlertStatus::Suppressed).size(), 15u);
}

TEST(AlertManagerHistoryTest, RecentAlertsAreNewestFirstAndBounded) {
  auto config = test_config();
  config.alerting.max_recent_alerts = 3;
  AlertManager manager(config, std::make_shared<MockNotifier>());

  for (int i = 0; i < 5; ++i)
    manager.consider(anomaly("signal" + std::to_string(i), kStart + i),
                     std::nullopt);

  auto recent = manager.get_recent_alerts(10);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].disaster_type, "signal4");
  EXPECT_EQ(recent[2].disaster_type, "signal2");
  EXPECT_EQ(manager.get_recent_alerts(1).size(), 1u);
}
