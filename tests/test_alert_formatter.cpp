#include "utils/alert_formatter.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

Alert sample_alert() {
  Alert alert;
  alert.id = "alert-1700000000000-7";
  alert.disaster_type = "flood";
  alert.location = "Mumbai";
  alert.normalized_location = "mumbai";
  alert.severity = AlertSeverity::Major;
  alert.dedup_key = "flood|mumbai|1888888";
  alert.created_at_ms = 1700000000000ULL;
  alert.status = AlertStatus::FailedDispatch;
  alert.dispatch_attempts = 2;
  alert.last_attempt_ms = 1700000001000ULL;
  alert.next_attempt_ms = 1700000005000ULL;
  alert.last_error = "HTTP 503";
  alert.value = 48.0;
  alert.z_score = 3.987;
  alert.ewma_deviation = 1.25;
  alert.confidence = 0.8;
  alert.basis = DetectionBasis::Statistical;
  alert.source_tag = "Reports of flood near Mumbai";
  return alert;
}

} // namespace

TEST(AlertFormatterTest, MessageLayout) {
  EXPECT_EQ(AlertFormatter::format_alert_message(sample_alert()),
            "FLOOD - Mumbai\n\nSeverity: major | z=3.99 | count=48");
}

TEST(AlertFormatterTest, FractionalCountsKeepOneDecimal) {
  Alert alert = sample_alert();
  alert.value = 12.345;
  EXPECT_NE(AlertFormatter::format_alert_message(alert).find("count=12.3"),
            std::string::npos);
}

TEST(AlertFormatterTest, LongMessagesAreTruncated) {
  Alert alert = sample_alert();
  alert.location = std::string(300, 'x');
  const std::string message = AlertFormatter::format_alert_message(alert);
  EXPECT_EQ(message.size(), AlertFormatter::MAX_MESSAGE_LENGTH);
  EXPECT_EQ(message.substr(message.size() - 3), "...");
}

TEST(AlertFormatterTest, JsonCarriesDeliveryAndEvidence) {
  auto j = AlertFormatter::alert_to_json_object(sample_alert());
  EXPECT_EQ(j["id"], "alert-1700000000000-7");
  EXPECT_EQ(j["type"], "flood");
  EXPECT_EQ(j["severity"], "major");
  EXPECT_EQ(j["status"], "failed_dispatch");
  EXPECT_EQ(j["attempts"], 2);
  EXPECT_EQ(j["last_error"], "HTTP 503");
  EXPECT_FALSE(j.contains("suppressed_by"));
  EXPECT_EQ(j["evidence"]["basis"], "statistical");
  EXPECT_DOUBLE_EQ(j["evidence"]["z_score"].get<double>(), 3.987);
  EXPECT_EQ(j["message"],
            AlertFormatter::format_alert_message(sample_alert()));
}

TEST(AlertFormatterTest, ParsesWhatItWrites) {
  Alert original = sample_alert();
  original.status = AlertStatus::Suppressed;
  original.suppressed_by = "alert-1699999999000-3";
  original.basis = DetectionBasis::PercentileFallback;

  auto parsed = AlertFormatter::alert_from_json_object(
      nlohmann::json::parse(AlertFormatter::format_alert_to_json(original)));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->id, original.id);
  EXPECT_EQ(parsed->status, AlertStatus::Suppressed);
  EXPECT_EQ(parsed->suppressed_by, original.suppressed_by);
  EXPECT_EQ(parsed->basis, DetectionBasis::PercentileFallback);
  EXPECT_EQ(parsed->next_attempt_ms, original.next_attempt_ms);
  EXPECT_EQ(parsed->source_tag, original.source_tag);
}

TEST(AlertFormatterTest, RejectsIncompleteJson) {
  EXPECT_FALSE(AlertFormatter::alert_from_json_object(
                   nlohmann::json{{"type", "flood"}})
                   .has_value());
  EXPECT_FALSE(AlertFormatter::alert_from_json_object(
                   nlohmann::json{{"id", "a"},
                                  {"type", "flood"},
                                  {"created_at_ms", 1},
                                  {"severity", "apocalyptic"},
                                  {"status", "pending"}})
                   .has_value());
  EXPECT_FALSE(
      AlertFormatter::alert_from_json_object(nlohmann::json{{"id", 5},
                                                            {"type", "flood"},
                                                            {"created_at_ms", 1}})
          .has_value());
}
