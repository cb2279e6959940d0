#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "scheduled_task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

class MetricsRegistry;

namespace scheduling {

/**
 * Runs named periodic tasks, one worker thread per task.
 *
 * Per task: Idle -> Running -> Idle on success. On failure the task waits
 * base * 2^retry_count (capped) in RetryWait and runs again, until
 * retry_count reaches max_retries, after which it is Failed until reset().
 * A task is never run concurrently with itself; ticks that pass while it is
 * Running or RetryWait are dropped. The task's mutex is never held while
 * its body runs, so health() never waits on a task.
 */
class Scheduler {
public:
  explicit Scheduler(MetricsRegistry *metrics = nullptr);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  // Throws std::invalid_argument on a duplicate or empty name, a zero
  // interval, or a missing body. Tasks added after start() begin at once.
  void add_task(TaskSpec spec);
  bool remove_task(const std::string &name);

  void start();

  // Runs an Idle task now. Returns false if the task is unknown, already
  // Running, waiting to retry, or Failed.
  bool trigger(const std::string &name);

  // Returns a Failed task to Idle with a cleared retry count.
  bool reset(const std::string &name);
  size_t reset_failed();

  std::vector<TaskHealth> health() const;
  std::optional<TaskHealth> task_health(const std::string &name) const;

  /**
   * Stops every task cooperatively: no new runs start and bodies see their
   * cancellation token set. Waits until all workers exit or `timeout`
   * passes; workers still busy then are abandoned and logged.
   * @return true if every worker exited in time
   */
  bool shutdown(std::chrono::milliseconds timeout);

  bool is_running() const { return started_.load() && !stopped_.load(); }

private:
  struct Shared {
    MetricsRegistry *metrics = nullptr;
    std::mutex exit_mutex;
    std::condition_variable exit_cv;
    size_t live_workers = 0;
    std::atomic<int> failed_tasks{0};
  };

  struct TaskEntry {
    explicit TaskEntry(TaskSpec s) : spec(std::move(s)) {}

    const TaskSpec spec;
    mutable std::mutex mutex;
    std::condition_variable cv;

    TaskState state = TaskState::Idle;
    TaskStatus last_status = TaskStatus::NotRun;
    uint64_t last_run_ms = 0;
    uint32_t retry_count = 0;
    uint64_t run_count = 0;
    std::string last_error;
    bool trigger_requested = false;
    bool stop_requested = false;

    CancellationToken cancel;
    std::thread worker;
    std::atomic<bool> exited{false};
    std::atomic<bool> abandoned{false};
  };

  void spawn_worker(const std::shared_ptr<TaskEntry> &task);
  static void worker_loop(std::shared_ptr<TaskEntry> task,
                          std::shared_ptr<Shared> shared);
  static void record_outcome(TaskEntry &task, Shared &shared, bool ok,
                             const std::string &error);
  static TaskHealth snapshot_locked(const TaskEntry &task);
  static void stop_entry(TaskEntry &task);

  std::shared_ptr<Shared> shared_;

  mutable std::shared_mutex tasks_mutex_;
  std::map<std::string, std::shared_ptr<TaskEntry>> tasks_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
};

} // namespace scheduling

#endif // SCHEDULER_HPP
