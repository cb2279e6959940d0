#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

TEST(MetricsRegistryTest, CountersAccumulate) {
  MetricsRegistry metrics;
  metrics.increment(MetricNames::ALERTS_SENT);
  metrics.increment(MetricNames::ALERTS_SENT, 2.0);
  EXPECT_DOUBLE_EQ(metrics.value(MetricNames::ALERTS_SENT), 3.0);
  EXPECT_DOUBLE_EQ(metrics.value("never_touched_total"), 0.0);
}

TEST(MetricsRegistryTest, LabelledSeriesAreSeparate) {
  MetricsRegistry metrics;
  metrics.increment(MetricNames::ALERTS_CREATED, {{"type", "flood"}});
  metrics.increment(MetricNames::ALERTS_CREATED, {{"type", "flood"}});
  metrics.increment(MetricNames::ALERTS_CREATED, {{"type", "fire"}});

  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::ALERTS_CREATED, {{"type", "flood"}}), 2.0);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::ALERTS_CREATED, {{"type", "fire"}}), 1.0);
}

TEST(MetricsRegistryTest, GaugesHoldLastValue) {
  MetricsRegistry metrics;
  metrics.set_gauge(MetricNames::ALERTS_PENDING_RETRY, 4);
  metrics.set_gauge(MetricNames::ALERTS_PENDING_RETRY, 1);
  EXPECT_DOUBLE_EQ(metrics.value(MetricNames::ALERTS_PENDING_RETRY), 1.0);
}

TEST(MetricsRegistryTest, SnapshotIsAnIndependentCopy) {
  MetricsRegistry metrics;
  metrics.increment(MetricNames::TWEETS_PROCESSED, 10.0);
  metrics.set_gauge(MetricNames::LAST_ANOMALY_SCORE, 3.5, {{"signal", "flood"}});

  auto snapshot = metrics.snapshot();
  metrics.increment(MetricNames::TWEETS_PROCESSED, 5.0);

  EXPECT_DOUBLE_EQ(snapshot.at(MetricNames::TWEETS_PROCESSED), 10.0);
  EXPECT_DOUBLE_EQ(snapshot.at("last_anomaly_score{signal=\"flood\"}"), 3.5);
  EXPECT_DOUBLE_EQ(metrics.value(MetricNames::TWEETS_PROCESSED), 15.0);
}

TEST(MetricsRegistryTest, InvalidNamesAreIgnored) {
  MetricsRegistry metrics;
  EXPECT_NO_THROW(metrics.increment("not a valid name!"));
  EXPECT_NO_THROW(metrics.set_gauge("9starts_with_digit", 1.0));
  EXPECT_DOUBLE_EQ(metrics.value("not a valid name!"), 0.0);
}

TEST(MetricsRegistryTest, SerializesPrometheusText) {
  MetricsRegistry metrics;
  metrics.increment(MetricNames::ANOMALIES_DETECTED,
                    {{"signal", "flood"}, {"basis", "statistical"}});
  const std::string text = metrics.serialize();
  EXPECT_NE(text.find("# TYPE anomalies_detected_total counter"),
            std::string::npos);
  EXPECT_NE(text.find("signal=\"flood\""), std::string::npos);
}

TEST(MetricsRegistryTest, ConcurrentIncrementsAreNotLost) {
  MetricsRegistry metrics;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&metrics] {
      for (int i = 0; i < 1000; ++i)
        metrics.increment(MetricNames::SAMPLES_INGESTED, {{"signal", "fire"}});
    });
  }
  for (auto &thread : threads)
    thread.join();
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::SAMPLES_INGESTED, {{"signal", "fire"}}),
      8000.0);
}
