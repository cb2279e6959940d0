#include "core/config.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"
#include "detection/anomaly_detector.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using detection::AnomalyDetector;

namespace {

Config::DetectionConfig default_detection() {
  Config::DetectionConfig config;
  config.window_size = 15;
  config.ewma_alpha = 0.3;
  config.z_threshold = 2.5;
  config.ewma_deviation_threshold = 0.5;
  return config;
}

AnomalyEvent feed(AnomalyDetector &detector, const std::vector<double> &values,
                  uint64_t start_ts = 1000) {
  AnomalyEvent last;
  uint64_t ts = start_ts;
  for (double v : values)
    last = detector.ingest_and_evaluate(Sample(ts++, v));
  return last;
}

} // namespace

TEST(AnomalyDetectorTest, BaselineThenSpikeIsAnomaly) {
  AnomalyDetector detector("flood", default_detection());
  feed(detector, std::vector<double>(15, 5.0));

  AnomalyEvent event = detector.ingest_and_evaluate(Sample(2000, 50.0));
  EXPECT_EQ(event.decision, Decision::Anomaly);
  EXPECT_GT(event.z_score, 2.5);
  EXPECT_GT(event.ewma_deviation, 0.5);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::Statistical);
  EXPECT_GT(event.confidence.score, 0.5);
  EXPECT_LE(event.confidence.score, 1.0);
  EXPECT_EQ(event.signal, "flood");
  EXPECT_EQ(event.timestamp_ms, 2000u);
  EXPECT_DOUBLE_EQ(event.value, 50.0);
}

TEST(AnomalyDetectorTest, ConstantSignalIsAlwaysNormal) {
  AnomalyDetector detector("storm", default_detection());
  for (int i = 0; i < 60; ++i) {
    AnomalyEvent event = detector.ingest_and_evaluate(Sample(i, 12.0));
    if (i + 1 >= 15) {
      EXPECT_EQ(event.decision, Decision::Normal) << "tick " << i;
      EXPECT_NEAR(event.z_score, 0.0, 1e-12);
    } else {
      EXPECT_NE(event.decision, Decision::Anomaly);
    }
  }
}

TEST(AnomalyDetectorTest, FlatWindowNeverFiresOnTinyDeviation) {
  auto config = default_detection();
  config.ewma_deviation_threshold = 0.0;
  AnomalyDetector detector("fire", config);
  feed(detector, std::vector<double>(20, 5.0));

  // Stddev is far below the flatness tolerance
  AnomalyEvent event = detector.ingest_and_evaluate(Sample(99, 5.0 + 1e-12));
  EXPECT_EQ(event.decision, Decision::Normal);
  EXPECT_DOUBLE_EQ(event.z_score, 0.0);
  EXPECT_DOUBLE_EQ(event.confidence.score, 0.0);
}

TEST(AnomalyDetectorTest, WarmUpIsInsufficientWithoutFallback) {
  auto config = default_detection();
  config.percentile_fallback_enabled = false;
  AnomalyDetector detector("cyclone", config);

  for (int i = 0; i < 14; ++i) {
    AnomalyEvent event =
        detector.ingest_and_evaluate(Sample(i, i == 13 ? 500.0 : 5.0));
    EXPECT_EQ(event.decision, Decision::Insufficient);
    EXPECT_EQ(event.confidence.basis, DetectionBasis::WarmUp);
  }
}

TEST(AnomalyDetectorTest, NeverInsufficientOnceWindowIsFull) {
  AnomalyDetector detector("tsunami", default_detection());
  std::vector<double> values;
  for (int i = 0; i < 100; ++i)
    values.push_back(5.0 + (i % 3));

  uint64_t ts = 0;
  for (double v : values) {
    AnomalyEvent event = detector.ingest_and_evaluate(Sample(ts++, v));
    if (ts >= 15)
      EXPECT_NE(event.decision, Decision::Insufficient);
  }
}

TEST(AnomalyDetectorTest, RequiresBothZScoreAndEwmaDeviation) {
  // EWMA deviation threshold unreachable: z alone must not fire
  auto strict_ewma = default_detection();
  strict_ewma.ewma_deviation_threshold = 1000.0;
  AnomalyDetector ewma_blocked("flood", strict_ewma);
  feed(ewma_blocked, std::vector<double>(15, 5.0));
  AnomalyEvent event = ewma_blocked.ingest_and_evaluate(Sample(50, 50.0));
  EXPECT_GT(event.z_score, 2.5);
  EXPECT_EQ(event.decision, Decision::Normal);

  // z threshold unreachable: EWMA deviation alone must not fire
  auto strict_z = default_detection();
  strict_z.z_threshold = 100.0;
  AnomalyDetector z_blocked("flood", strict_z);
  feed(z_blocked, std::vector<double>(15, 5.0));
  event = z_blocked.ingest_and_evaluate(Sample(50, 50.0));
  EXPECT_GT(event.ewma_deviation, 0.5);
  EXPECT_EQ(event.decision, Decision::Normal);
}

TEST(AnomalyDetectorTest, ZScoreIsBoundedByWindowSize) {
  auto config = default_detection();
  config.window_size = 5;
  config.z_threshold = 1.9;

  std::vector<std::string> errors;
  EXPECT_TRUE(Config::validate_detection_config(config, errors));

  AnomalyDetector detector("flood", config);
  feed(detector, {4.0, 6.0, 5.0, 4.0, 6.0});
  AnomalyEvent event = detector.ingest_and_evaluate(Sample(99, 1e6));
  EXPECT_LE(event.z_score, std::sqrt(4.0) + 1e-6);
  EXPECT_GT(event.z_score, 1.9);
  EXPECT_EQ(event.decision, Decision::Anomaly);

  // No spike can reach 2.5 in a 5-sample window, so the config is refused
  config.z_threshold = 2.5;
  EXPECT_FALSE(Config::validate_detection_config(config, errors));
  ASSERT_FALSE(errors.empty());
  EXPECT_NE(errors.back().find("unreachable"), std::string::npos);
}

TEST(AnomalyDetectorTest, PercentileFallbackFiresWithCappedConfidence) {
  AnomalyDetector detector("earthquake", default_detection());
  // Five prior samples satisfy fallback_min_samples
  feed(detector, {4.0, 5.0, 6.0, 5.0, 4.0});

  AnomalyEvent event = detector.ingest_and_evaluate(Sample(100, 40.0));
  EXPECT_EQ(event.decision, Decision::Anomaly);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::PercentileFallback);
  EXPECT_GT(event.confidence.score, 0.0);
  EXPECT_LE(event.confidence.score, 0.5);
}

TEST(AnomalyDetectorTest, PercentileFallbackNeedsMinimumHistory) {
  AnomalyDetector detector("earthquake", default_detection());
  feed(detector, {4.0, 5.0, 6.0});

  AnomalyEvent event = detector.ingest_and_evaluate(Sample(100, 40.0));
  EXPECT_EQ(event.decision, Decision::Insufficient);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::WarmUp);
}

TEST(AnomalyDetectorTest, PercentileFallbackIgnoresValuesWithinHistory) {
  AnomalyDetector detector("earthquake", default_detection());
  feed(detector, {4.0, 5.0, 6.0, 5.0, 4.0, 6.0});

  AnomalyEvent event = detector.ingest_and_evaluate(Sample(100, 5.0));
  EXPECT_EQ(event.decision, Decision::Normal);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::PercentileFallback);
  EXPECT_DOUBLE_EQ(event.confidence.score, 0.0);
}

TEST(AnomalyDetectorTest, RejectsNonFiniteSamplesWithoutCorruptingState) {
  MetricsRegistry metrics;
  AnomalyDetector detector("landslide", default_detection(), &metrics);
  feed(detector, std::vector<double>(15, 5.0));
  const auto before = detector.state();

  AnomalyEvent event = detector.ingest_and_evaluate(
      Sample(500, std::numeric_limits<double>::quiet_NaN()));
  EXPECT_EQ(event.decision, Decision::Normal);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::Degraded);
  EXPECT_FALSE(detector.ingest(
      Sample(501, std::numeric_limits<double>::infinity())));

  const auto after = detector.state();
  EXPECT_EQ(after.window_count, before.window_count);
  EXPECT_DOUBLE_EQ(after.mean, before.mean);
  EXPECT_DOUBLE_EQ(after.ewma, before.ewma);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::SAMPLES_REJECTED, {{"signal", "landslide"}}),
      2.0);
  EXPECT_DOUBLE_EQ(
      metrics.value(MetricNames::SAMPLES_INGESTED, {{"signal", "landslide"}}),
      15.0);
}

TEST(AnomalyDetectorTest, OverflowingStatisticsDegradeToNormal) {
  MetricsRegistry metrics;
  AnomalyDetector detector("hurricane", default_detection(), &metrics);
  const double huge = std::numeric_limits<double>::max();
  std::vector<double> values(14, huge);
  values.push_back(-huge);

  AnomalyEvent event = feed(detector, values);
  EXPECT_EQ(event.decision, Decision::Normal);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::Degraded);
  EXPECT_GE(
      metrics.value(MetricNames::DETECTION_ERRORS, {{"signal", "hurricane"}}),
      1.0);
}

TEST(AnomalyDetectorTest, EvaluateOnEmptyDetectorIsInsufficient) {
  AnomalyDetector detector("tornado", default_detection());
  AnomalyEvent event = detector.evaluate();
  EXPECT_EQ(event.decision, Decision::Insufficient);
  EXPECT_EQ(event.signal, "tornado");
}

TEST(AnomalyDetectorTest, SeedHistoryFillsTheWindow) {
  AnomalyDetector detector("flood", default_detection());
  std::vector<Sample> history;
  for (int i = 0; i < 20; ++i)
    history.emplace_back(i, 5.0);
  history.emplace_back(20, std::numeric_limits<double>::quiet_NaN());

  EXPECT_EQ(detector.seed_history(history), 20u);
  const auto state = detector.state();
  EXPECT_EQ(state.window_count, 15u);
  EXPECT_EQ(state.window_size, 15u);
  EXPECT_DOUBLE_EQ(state.mean, 5.0);
  EXPECT_TRUE(state.ewma_initialized);

  // A restarted detector decides on the very next sample
  AnomalyEvent event = detector.ingest_and_evaluate(Sample(100, 50.0));
  EXPECT_EQ(event.decision, Decision::Anomaly);
  EXPECT_EQ(event.confidence.basis, DetectionBasis::Statistical);
}
