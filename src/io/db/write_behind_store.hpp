#ifndef WRITE_BEHIND_STORE_HPP
#define WRITE_BEHIND_STORE_HPP

#include "base_alert_store.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class MetricsRegistry;

/**
 * Makes any store's writes asynchronous. Writes are queued and applied by a
 * background thread; a full queue drops the incoming write. Write failures
 * are logged and counted, never thrown. Reads and cleanup go straight to the
 * wrapped store.
 */
class WriteBehindStore : public IAlertStore {
public:
  WriteBehindStore(std::shared_ptr<IAlertStore> inner, size_t capacity,
                   MetricsRegistry *metrics = nullptr);
  ~WriteBehindStore() override;

  WriteBehindStore(const WriteBehindStore &) = delete;
  WriteBehindStore &operator=(const WriteBehindStore &) = delete;

  void store_alert(const Alert &alert) override;
  void store_metric(const std::string &name, double value,
                    uint64_t timestamp_ms) override;
  void store_sample(const std::string &signal, const Sample &sample) override;

  std::vector<Alert> query_recent_alerts(const AlertFilter &filter) override;
  std::vector<Sample> query_signal_history(const std::string &signal,
                                           size_t limit) override;
  CleanupResult cleanup(const RetentionPolicy &policy) override;

  const char *get_name() const override { return "WriteBehindStore"; }

  // Waits until every accepted write has been attempted.
  bool flush(std::chrono::milliseconds timeout);

  // Stops accepting writes, drains the queue and joins the writer.
  void stop();

  uint64_t dropped_count() const { return dropped_.load(); }
  uint64_t failed_count() const { return failed_.load(); }

private:
  struct PendingWrite {
    std::string description;
    std::function<void(IAlertStore &)> apply;
  };

  void enqueue(PendingWrite write);
  void writer_loop();

  std::shared_ptr<IAlertStore> inner_;
  MetricsRegistry *metrics_;
  ThreadSafeQueue<PendingWrite> queue_;
  std::thread writer_thread_;

  std::mutex progress_mutex_;
  std::condition_variable progress_cv_;
  uint64_t accepted_ = 0;
  uint64_t completed_ = 0;

  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<bool> stopped_{false};
};

#endif // WRITE_BEHIND_STORE_HPP
