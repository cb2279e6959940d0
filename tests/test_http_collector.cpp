#include "core/errors.hpp"
#include "io/collectors/http_collector.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

TEST(HttpCollectorTest, ParsesAndOrdersSamples) {
  const std::string body = R"([
    {"timestamp_ms": 3000, "value": 7, "source": "Flooding in Mumbai"},
    {"timestamp_ms": 1000, "value": 5.5},
    {"timestamp_ms": 2000, "value": 6, "source": ""}
  ])";
  auto samples = HttpCollector::parse_samples(body);
  ASSERT_EQ(samples.size(), 3u);
  EXPECT_EQ(samples[0].timestamp_ms, 1000u);
  EXPECT_DOUBLE_EQ(samples[0].value, 5.5);
  EXPECT_TRUE(samples[0].source_tag.empty());
  EXPECT_EQ(samples[2].source_tag, "Flooding in Mumbai");
}

TEST(HttpCollectorTest, EmptyArrayIsValid) {
  EXPECT_TRUE(HttpCollector::parse_samples("[]").empty());
}

TEST(HttpCollectorTest, MalformedPayloadsAreCollectionErrors) {
  EXPECT_THROW(HttpCollector::parse_samples("not json"), CollectionError);
  EXPECT_THROW(HttpCollector::parse_samples(R"({"value": 1})"), CollectionError);
  EXPECT_THROW(HttpCollector::parse_samples(R"([{"value": 1}])"),
               CollectionError);
  EXPECT_THROW(
      HttpCollector::parse_samples(R"([{"timestamp_ms": 1, "value": "x"}])"),
      CollectionError);
}

TEST(HttpCollectorTest, RejectsBadEndpoint) {
  EXPECT_THROW(HttpCollector("feeds.example.org/v1", 1000),
               std::invalid_argument);
}

TEST(HttpCollectorTest, VerifiesCertificatesUnlessDisabled) {
  EXPECT_TRUE(HttpCollector("https://feeds.example.org/v1", 1000)
                  .verifies_certificates());
  EXPECT_FALSE(HttpCollector("https://feeds.example.org/v1", 1000, false)
                   .verifies_certificates());
}

TEST(HttpCollectorTest, UnreachableEndpointIsACollectionError) {
  // Port 9 on localhost is the discard service and is normally closed
  HttpCollector collector("http://127.0.0.1:9/counts", 200);
  EXPECT_THROW(collector.fetch("flood", {0, 1000}), CollectionError);
}
