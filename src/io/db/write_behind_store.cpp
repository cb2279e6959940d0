#include "write_behind_store.hpp"
#include "core/logger.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

WriteBehindStore::WriteBehindStore(std::shared_ptr<IAlertStore> inner,
                                   size_t capacity, MetricsRegistry *metrics)
    : inner_(std::move(inner)), metrics_(metrics), queue_(capacity) {
  if (!inner_)
    throw std::invalid_argument("WriteBehindStore requires a backing store");
  writer_thread_ = std::thread(&WriteBehindStore::writer_loop, this);
}

WriteBehindStore::~WriteBehindStore() { stop(); }

void WriteBehindStore::stop() {
  if (stopped_.exchange(true))
    return;
  queue_.shutdown();
  if (writer_thread_.joinable())
    writer_thread_.join();
  LOG(LogLevel::DEBUG, LogComponent::IO_DATABASE,
      "Write-behind store stopped (" << dropped_.load() << " dropped, "
                                     << failed_.load() << " failed)");
}

void WriteBehindStore::enqueue(PendingWrite write) {
  const std::string description = write.description;
  {
    // Counted first so flush() never sees completed_ overtake accepted_
    std::lock_guard<std::mutex> lock(progress_mutex_);
    accepted_++;
  }
  if (queue_.try_push(std::move(write)))
    return;

  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    accepted_--;
  }
  progress_cv_.notify_all();
  dropped_++;
  LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
      "Write queue full or stopped; dropped " << description);
  if (metrics_)
    metrics_->increment(MetricNames::PERSISTENCE_DROPPED);
}

void WriteBehindStore::store_alert(const Alert &alert) {
  enqueue({"alert " + alert.id,
           [alert](IAlertStore &store) { store.store_alert(alert); }});
}

void WriteBehindStore::store_metric(const std::string &name, double value,
                                    uint64_t timestamp_ms) {
  enqueue({"metric " + name, [name, value, timestamp_ms](IAlertStore &store) {
             store.store_metric(name, value, timestamp_ms);
           }});
}

void WriteBehindStore::store_sample(const std::string &signal,
                                    const Sample &sample) {
  enqueue({"sample for " + signal, [signal, sample](IAlertStore &store) {
             store.store_sample(signal, sample);
           }});
}

std::vector<Alert>
WriteBehindStore::query_recent_alerts(const AlertFilter &filter) {
  return inner_->query_recent_alerts(filter);
}

std::vector<Sample>
WriteBehindStore::query_signal_history(const std::string &signal,
                                       size_t limit) {
  return inner_->query_signal_history(signal, limit);
}

CleanupResult WriteBehindStore::cleanup(const RetentionPolicy &policy) {
  return inner_->cleanup(policy);
}

bool WriteBehindStore::flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(progress_mutex_);
  return progress_cv_.wait_for(lock, timeout,
                               [this] { return completed_ >= accepted_; });
}

void WriteBehindStore::writer_loop() {
  while (auto write = queue_.wait_and_pop()) {
    try {
      write->apply(*inner_);
    } catch (const std::exception &e) {
      failed_++;
      LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
          "Failed to persist " << write->description << ": " << e.what());
      if (metrics_)
        metrics_->increment(MetricNames::PERSISTENCE_ERRORS);
    }

    {
      std::lock_guard<std::mutex> lock(progress_mutex_);
      completed_++;
    }
    progress_cv_.notify_all();
  }
}
