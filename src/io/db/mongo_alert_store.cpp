#include "mongo_alert_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/alert_formatter.hpp"

#include <algorithm>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>
#include <cstdint>
#include <exception>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/replace.hpp>
#include <utility>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {
constexpr const char *ALERTS_COLLECTION = "alerts";
constexpr const char *METRICS_COLLECTION = "metrics";
constexpr const char *SAMPLES_COLLECTION = "signal_samples";

int64_t to_int64(uint64_t value) {
  return static_cast<int64_t>(
      std::min<uint64_t>(value, static_cast<uint64_t>(INT64_MAX)));
}

uint64_t cutoff(uint64_t now_ms, uint64_t max_age_ms) {
  return now_ms > max_age_ms ? now_ms - max_age_ms : 0;
}
} // namespace

MongoAlertStore::MongoAlertStore(std::shared_ptr<MongoManager> manager)
    : manager_(std::move(manager)) {
  ensure_indexes();
}

void MongoAlertStore::ensure_indexes() {
  try {
    auto client = manager_->get_client();
    auto db = manager_->database(client);
    db[ALERTS_COLLECTION].create_index(make_document(kvp("created_at_ms", -1)));
    db[METRICS_COLLECTION].create_index(
        make_document(kvp("name", 1), kvp("timestamp_ms", -1)));
    db[SAMPLES_COLLECTION].create_index(
        make_document(kvp("signal", 1), kvp("timestamp_ms", -1)));
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "Could not create MongoDB indexes: " << e.what());
  }
}

void MongoAlertStore::store_alert(const Alert &alert) {
  try {
    nlohmann::json j = AlertFormatter::alert_to_json_object(alert);
    j["_id"] = alert.id;
    auto doc = bsoncxx::from_json(j.dump());

    auto client = manager_->get_client();
    auto collection = manager_->database(client)[ALERTS_COLLECTION];
    mongocxx::options::replace options;
    options.upsert(true);
    collection.replace_one(make_document(kvp("_id", alert.id)), doc.view(),
                           options);
  } catch (const std::exception &e) {
    throw PersistenceError("store_alert " + alert.id + ": " + e.what());
  }
}

void MongoAlertStore::store_metric(const std::string &name, double value,
                                   uint64_t timestamp_ms) {
  try {
    auto client = manager_->get_client();
    auto collection = manager_->database(client)[METRICS_COLLECTION];
    collection.insert_one(make_document(kvp("name", name), kvp("value", value),
                                        kvp("timestamp_ms",
                                            to_int64(timestamp_ms))));
  } catch (const std::exception &e) {
    throw PersistenceError("store_metric " + name + ": " + e.what());
  }
}

void MongoAlertStore::store_sample(const std::string &signal,
                                   const Sample &sample) {
  try {
    auto client = manager_->get_client();
    auto collection = manager_->database(client)[SAMPLES_COLLECTION];
    collection.insert_one(make_document(
        kvp("signal", signal), kvp("timestamp_ms", to_int64(sample.timestamp_ms)),
        kvp("value", sample.value), kvp("source", sample.source_tag)));
  } catch (const std::exception &e) {
    throw PersistenceError("store_sample " + signal + ": " + e.what());
  }
}

std::vector<Alert>
MongoAlertStore::query_recent_alerts(const AlertFilter &filter) {
  bsoncxx::builder::basic::document query;
  if (filter.disaster_type)
    query.append(kvp("type", *filter.disaster_type));
  if (filter.normalized_location)
    query.append(kvp("normalized_location", *filter.normalized_location));
  if (filter.status)
    query.append(kvp("status", alert_status_to_string(*filter.status)));
  if (filter.since_ms > 0)
    query.append(kvp("created_at_ms",
                     make_document(kvp("$gte", to_int64(filter.since_ms)))));

  std::vector<Alert> alerts;
  try {
    auto client = manager_->get_client();
    auto collection = manager_->database(client)[ALERTS_COLLECTION];

    mongocxx::options::find options;
    options.sort(make_document(kvp("created_at_ms", -1)));
    options.limit(static_cast<int64_t>(filter.limit));

    for (auto &&doc : collection.find(query.view(), options)) {
      auto json = nlohmann::json::parse(
          bsoncxx::to_json(doc, bsoncxx::ExtendedJsonMode::k_relaxed));
      if (auto alert = AlertFormatter::alert_from_json_object(json))
        alerts.push_back(std::move(*alert));
      else
        LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
            "Skipping malformed alert document");
    }
  } catch (const std::exception &e) {
    throw PersistenceError(std::string("query_recent_alerts: ") + e.what());
  }
  return alerts;
}

std::vector<Sample> MongoAlertStore::query_signal_history(const std::string &signal,
                                                          size_t limit) {
  std::vector<Sample> samples;
  if (limit == 0)
    return samples;

  try {
    auto client = manager_->get_client();
    auto collection = manager_->database(client)[SAMPLES_COLLECTION];

    mongocxx::options::find options;
    options.sort(make_document(kvp("timestamp_ms", -1)));
    options.limit(static_cast<int64_t>(limit));

    for (auto &&doc : collection.find(make_document(kvp("signal", signal)),
                                      options)) {
      Sample sample;
      sample.timestamp_ms =
          static_cast<uint64_t>(doc["timestamp_ms"].get_int64().value);
      sample.value = doc["value"].get_double().value;
      auto source = doc["source"];
      if (source && source.type() == bsoncxx::type::k_string)
        sample.source_tag = std::string(source.get_string().value);
      samples.push_back(std::move(sample));
    }
  } catch (const std::exception &e) {
    throw PersistenceError("query_signal_history " + signal + ": " + e.what());
  }

  std::reverse(samples.begin(), samples.end());
  return samples;
}

CleanupResult MongoAlertStore::cleanup(const RetentionPolicy &policy) {
  CleanupResult result;
  try {
    auto client = manager_->get_client();
    auto db = manager_->database(client);

    auto older_than = [](const char *field, uint64_t cutoff_ms) {
      return make_document(
          kvp(field, make_document(kvp("$lt", to_int64(cutoff_ms)))));
    };

    if (auto r = db[ALERTS_COLLECTION].delete_many(older_than(
            "created_at_ms", cutoff(policy.now_ms, policy.alert_max_age_ms))))
      result.alerts_removed = static_cast<size_t>(r->deleted_count());
    if (auto r = db[METRICS_COLLECTION].delete_many(older_than(
            "timestamp_ms", cutoff(policy.now_ms, policy.metric_max_age_ms))))
      result.metrics_removed = static_cast<size_t>(r->deleted_count());
    if (auto r = db[SAMPLES_COLLECTION].delete_many(older_than(
            "timestamp_ms", cutoff(policy.now_ms, policy.sample_max_age_ms))))
      result.samples_removed = static_cast<size_t>(r->deleted_count());
  } catch (const std::exception &e) {
    throw PersistenceError(std::string("cleanup: ") + e.what());
  }

  LOG(LogLevel::INFO, LogComponent::IO_DATABASE,
      "Cleanup removed " << result.alerts_removed << " alerts, "
                         << result.metrics_removed << " metrics, "
                         << result.samples_removed << " samples");
  return result;
}
