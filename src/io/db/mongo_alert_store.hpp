#ifndef MONGO_ALERT_STORE_HPP
#define MONGO_ALERT_STORE_HPP

#include "base_alert_store.hpp"
#include "mongo_manager.hpp"

#include <memory>

// IAlertStore over three collections: alerts (keyed by alert id), metrics,
// and signal_samples.
class MongoAlertStore : public IAlertStore {
public:
  explicit MongoAlertStore(std::shared_ptr<MongoManager> manager);

  void store_alert(const Alert &alert) override;
  void store_metric(const std::string &name, double value,
                    uint64_t timestamp_ms) override;
  void store_sample(const std::string &signal, const Sample &sample) override;

  std::vector<Alert> query_recent_alerts(const AlertFilter &filter) override;
  std::vector<Sample> query_signal_history(const std::string &signal,
                                           size_t limit) override;

  CleanupResult cleanup(const RetentionPolicy &policy) override;

  const char *get_name() const override { return "MongoAlertStore"; }

private:
  void ensure_indexes();

  std::shared_ptr<MongoManager> manager_;
};

#endif // MONGO_ALERT_STORE_HPP
