#include "detection/detector_registry.hpp"

#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

using detection::AnomalyDetector;
using detection::DetectorRegistry;

TEST(DetectorRegistryTest, OneDetectorPerNormalizedSignal) {
  DetectorRegistry registry(Config::DetectionConfig{});
  AnomalyDetector &a = registry.get_or_create("Flood");
  AnomalyDetector &b = registry.get_or_create("  flood ");
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(a.signal(), "flood");
  EXPECT_EQ(registry.size(), 1u);

  EXPECT_EQ(registry.find("FLOOD"), &a);
  EXPECT_EQ(registry.find("cyclone"), nullptr);
}

TEST(DetectorRegistryTest, SignalsAreSorted) {
  DetectorRegistry registry(Config::DetectionConfig{});
  registry.get_or_create("tsunami");
  registry.get_or_create("earthquake");
  registry.get_or_create("fire");

  EXPECT_EQ(registry.signals(),
            (std::vector<std::string>{"earthquake", "fire", "tsunami"}));
}

TEST(DetectorRegistryTest, SignalsAreIndependent) {
  DetectorRegistry registry(Config::DetectionConfig{});
  auto &flood = registry.get_or_create("flood");
  auto &fire = registry.get_or_create("fire");
  for (int i = 0; i < 10; ++i)
    flood.ingest(Sample(i, 3.0));

  EXPECT_EQ(flood.state().window_count, 10u);
  EXPECT_EQ(fire.state().window_count, 0u);
}

TEST(DetectorRegistryTest, ConcurrentCreationYieldsOneInstance) {
  DetectorRegistry registry(Config::DetectionConfig{});
  std::vector<std::thread> threads;
  std::vector<AnomalyDetector *> seen(8, nullptr);
  for (size_t t = 0; t < seen.size(); ++t) {
    threads.emplace_back([&registry, &seen, t] {
      auto &detector = registry.get_or_create("storm");
      for (int i = 0; i < 100; ++i)
        detector.ingest(Sample(i, 1.0));
      seen[t] = &detector;
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(std::set<AnomalyDetector *>(seen.begin(), seen.end()).size(), 1u);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.find("storm")->state().window_count, 15u);
}
