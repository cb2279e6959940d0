#ifndef SCHEDULED_TASK_HPP
#define SCHEDULED_TASK_HPP

#include "retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace scheduling {

enum class TaskState { Idle, Running, RetryWait, Failed };
enum class TaskStatus { NotRun, Success, Failure };

inline const char *task_state_to_string(TaskState state) {
  switch (state) {
  case TaskState::Idle:
    return "idle";
  case TaskState::Running:
    return "running";
  case TaskState::RetryWait:
    return "retry_wait";
  case TaskState::Failed:
    return "failed";
  }
  return "unknown";
}

inline const char *task_status_to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::NotRun:
    return "not_run";
  case TaskStatus::Success:
    return "success";
  case TaskStatus::Failure:
    return "failure";
  }
  return "unknown";
}

/**
 * Cooperative cancellation flag shared between the scheduler and a task
 * body. Copies observe the same flag. Bodies check it at their natural
 * suspension points and return early once it is set.
 */
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  bool is_cancelled() const { return state_->cancelled.load(); }

  // Sleeps up to `duration`. Returns false if cancelled before it elapsed.
  bool sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration,
                                [this] { return state_->cancelled.load(); });
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };
  std::shared_ptr<State> state_;
};

// A task body signals failure by throwing.
using TaskBody = std::function<void(const CancellationToken &)>;

struct TaskSpec {
  std::string name;
  std::chrono::milliseconds interval{60000};
  bool run_immediately = false;
  RetryPolicy retry;
  TaskBody body;
};

// Point-in-time view of one task, as returned by the health check.
struct TaskHealth {
  std::string name;
  TaskState state = TaskState::Idle;
  TaskStatus last_status = TaskStatus::NotRun;
  uint64_t last_run_ms = 0;
  uint32_t retry_count = 0;
  uint32_t max_retries = 0;
  uint64_t run_count = 0;
  std::string last_error;
};

} // namespace scheduling

#endif // SCHEDULED_TASK_HPP
