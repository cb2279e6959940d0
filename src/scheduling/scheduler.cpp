#include "scheduler.hpp"
#include "core/logger.hpp"
#include "core/metric_names.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace scheduling {

Scheduler::Scheduler(MetricsRegistry *metrics)
    : shared_(std::make_shared<Shared>()) {
  shared_->metrics = metrics;
}

Scheduler::~Scheduler() {
  if (started_.load() && !stopped_.load())
    shutdown(std::chrono::seconds(10));
}

void Scheduler::add_task(TaskSpec spec) {
  if (spec.name.empty())
    throw std::invalid_argument("Task name must not be empty");
  if (spec.interval.count() <= 0)
    throw std::invalid_argument("Task '" + spec.name +
                                "' interval must be greater than 0");
  if (!spec.body)
    throw std::invalid_argument("Task '" + spec.name + "' has no body");

  std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
  if (stopped_.load())
    throw std::invalid_argument("Scheduler is shut down");
  if (tasks_.count(spec.name))
    throw std::invalid_argument("Task '" + spec.name + "' already exists");

  const std::string name = spec.name;
  auto entry = std::make_shared<TaskEntry>(std::move(spec));
  tasks_.emplace(name, entry);

  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Registered task '" << name << "' every "
                          << entry->spec.interval.count() << "ms (retries="
                          << entry->spec.retry.max_retries << ", immediate="
                          << (entry->spec.run_immediately ? "yes" : "no")
                          << ")");

  if (started_.load())
    spawn_worker(entry);
}

bool Scheduler::remove_task(const std::string &name) {
  std::shared_ptr<TaskEntry> entry;
  {
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end())
      return false;
    entry = it->second;
    tasks_.erase(it);
  }

  stop_entry(*entry);
  if (entry->worker.joinable()) {
    // A body removing its own task can't join itself
    if (entry->worker.get_id() == std::this_thread::get_id())
      entry->worker.detach();
    else
      entry->worker.join();
  }

  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Removed task '" << name << "'");
  return true;
}

void Scheduler::start() {
  std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
  if (stopped_.load() || started_.exchange(true))
    return;

  for (auto &[name, entry] : tasks_)
    spawn_worker(entry);

  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Scheduler started with " << tasks_.size() << " tasks");
}

void Scheduler::spawn_worker(const std::shared_ptr<TaskEntry> &task) {
  {
    std::lock_guard<std::mutex> lock(shared_->exit_mutex);
    shared_->live_workers++;
  }
  task->worker = std::thread(&Scheduler::worker_loop, task, shared_);
}

bool Scheduler::trigger(const std::string &name) {
  std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
  auto it = tasks_.find(name);
  if (it == tasks_.end())
    return false;

  auto &task = *it->second;
  {
    std::lock_guard<std::mutex> task_lock(task.mutex);
    if (task.stop_requested || task.state != TaskState::Idle ||
        task.trigger_requested) {
      LOG(LogLevel::DEBUG, LogComponent::SCHEDULER_TASK,
          "Trigger of '" << name << "' ignored in state "
                         << task_state_to_string(task.state));
      return false;
    }
    task.trigger_requested = true;
  }
  task.cv.notify_all();
  return true;
}

bool Scheduler::reset(const std::string &name) {
  std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
  auto it = tasks_.find(name);
  if (it == tasks_.end())
    return false;

  auto &task = *it->second;
  {
    std::lock_guard<std::mutex> task_lock(task.mutex);
    if (task.state != TaskState::Failed)
      return false;
    task.state = TaskState::Idle;
    task.retry_count = 0;
  }
  task.cv.notify_all();

  const int failed = --shared_->failed_tasks;
  if (shared_->metrics)
    shared_->metrics->set_gauge(MetricNames::TASKS_FAILED, failed);
  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Task '" << name << "' reset from Failed");
  return true;
}

size_t Scheduler::reset_failed() {
  std::vector<std::string> names;
  {
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    for (const auto &[name, entry] : tasks_)
      names.push_back(name);
  }

  size_t count = 0;
  for (const auto &name : names) {
    if (reset(name))
      count++;
  }
  return count;
}

TaskHealth Scheduler::snapshot_locked(const TaskEntry &task) {
  TaskHealth health;
  health.name = task.spec.name;
  health.state = task.state;
  health.last_status = task.last_status;
  health.last_run_ms = task.last_run_ms;
  health.retry_count = task.retry_count;
  health.max_retries = task.spec.retry.max_retries;
  health.run_count = task.run_count;
  health.last_error = task.last_error;
  return health;
}

std::vector<TaskHealth> Scheduler::health() const {
  std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
  std::vector<TaskHealth> result;
  result.reserve(tasks_.size());
  for (const auto &[name, entry] : tasks_) {
    std::lock_guard<std::mutex> task_lock(entry->mutex);
    result.push_back(snapshot_locked(*entry));
  }
  return result;
}

std::optional<TaskHealth>
Scheduler::task_health(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
  auto it = tasks_.find(name);
  if (it == tasks_.end())
    return std::nullopt;
  std::lock_guard<std::mutex> task_lock(it->second->mutex);
  return snapshot_locked(*it->second);
}

void Scheduler::stop_entry(TaskEntry &task) {
  {
    std::lock_guard<std::mutex> lock(task.mutex);
    task.stop_requested = true;
  }
  task.cancel.cancel();
  task.cv.notify_all();
}

bool Scheduler::shutdown(std::chrono::milliseconds timeout) {
  std::vector<std::shared_ptr<TaskEntry>> entries;
  {
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    if (stopped_.exchange(true))
      return true;
    for (const auto &[name, entry] : tasks_)
      entries.push_back(entry);
  }

  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Shutting down scheduler (" << entries.size() << " tasks, timeout "
                                  << timeout.count() << "ms)");

  for (auto &entry : entries)
    stop_entry(*entry);

  {
    std::unique_lock<std::mutex> lock(shared_->exit_mutex);
    shared_->exit_cv.wait_for(lock, timeout,
                              [this] { return shared_->live_workers == 0; });
  }

  bool clean = true;
  for (auto &entry : entries) {
    if (!entry->worker.joinable())
      continue;

    if (entry->exited.load()) {
      entry->worker.join();
      continue;
    }

    clean = false;
    entry->abandoned = true;
    entry->worker.detach();
    LOG(LogLevel::ERROR, LogComponent::SCHEDULER_LIFECYCLE,
        "Task '" << entry->spec.name
                 << "' did not stop within the shutdown timeout; abandoned");
    if (shared_->metrics)
      shared_->metrics->increment(MetricNames::TASKS_ABANDONED,
                                  {{"task", entry->spec.name}});
  }

  LOG(LogLevel::INFO, LogComponent::SCHEDULER_LIFECYCLE,
      "Scheduler stopped" << (clean ? "" : " with abandoned tasks"));
  return clean;
}

void Scheduler::record_outcome(TaskEntry &task, Shared &shared, bool ok,
                               const std::string &error) {
  MetricsRegistry *metrics = task.abandoned.load() ? nullptr : shared.metrics;
  const std::string &name = task.spec.name;

  if (metrics)
    metrics->increment(MetricNames::TASK_RUNS, {{"task", name}});

  if (ok) {
    if (task.retry_count > 0)
      LOG(LogLevel::INFO, LogComponent::SCHEDULER_TASK,
          "Task '" << name << "' recovered after " << task.retry_count
                   << " retries");
    task.state = TaskState::Idle;
    task.retry_count = 0;
    task.last_status = TaskStatus::Success;
    task.last_error.clear();
    return;
  }

  task.last_status = TaskStatus::Failure;
  task.last_error = error;
  if (metrics)
    metrics->increment(MetricNames::TASK_FAILURES, {{"task", name}});

  if (task.stop_requested) {
    task.state = TaskState::Idle;
    LOG(LogLevel::WARN, LogComponent::SCHEDULER_TASK,
        "Task '" << name << "' failed during shutdown: " << error);
    return;
  }

  if (task.retry_count < task.spec.retry.max_retries) {
    task.state = TaskState::RetryWait;
    LOG(LogLevel::WARN, LogComponent::SCHEDULER_TASK,
        "Task '" << name << "' failed (attempt " << task.retry_count + 1 << "/"
                 << task.spec.retry.max_retries + 1 << "): " << error);
    return;
  }

  task.state = TaskState::Failed;
  const int failed = ++shared.failed_tasks;
  LOG(LogLevel::ERROR, LogComponent::SCHEDULER_TASK,
      "Task '" << name << "' failed after " << task.retry_count
               << " retries and is now Failed: " << error);
  if (metrics) {
    metrics->set_gauge(MetricNames::TASKS_FAILED, failed);
    metrics->increment(MetricNames::ERRORS, {{"component", "scheduler"}});
  }
}

void Scheduler::worker_loop(std::shared_ptr<TaskEntry> task,
                            std::shared_ptr<Shared> shared) {
  using Clock = std::chrono::steady_clock;
  const auto interval = task->spec.interval;
  const std::string &name = task->spec.name;

  Clock::time_point tick = Clock::now();
  if (!task->spec.run_immediately)
    tick += interval;
  Clock::time_point next_run = tick;

  // Moves `tick` to the first boundary after `now`. Boundaries passed over
  // were missed and are dropped, never queued.
  auto skip_missed_ticks = [&](Clock::time_point now) {
    if (tick > now)
      return;
    const auto missed = (now - tick) / interval + 1;
    tick += interval * missed;
    LOG(LogLevel::DEBUG, LogComponent::SCHEDULER_TASK,
        "Task '" << name << "' dropped " << missed << " missed ticks");
    if (shared->metrics && !task->abandoned.load())
      shared->metrics->increment(MetricNames::TICKS_DROPPED, {{"task", name}},
                                 static_cast<double>(missed));
  };

  std::unique_lock<std::mutex> lock(task->mutex);
  while (!task->stop_requested) {
    if (task->state == TaskState::Failed) {
      task->cv.wait(lock, [&] {
        return task->stop_requested || task->state != TaskState::Failed;
      });
      if (task->stop_requested)
        break;
      skip_missed_ticks(Clock::now());
      next_run = tick;
      continue;
    }

    task->cv.wait_until(lock, next_run, [&] {
      return task->stop_requested || task->trigger_requested;
    });
    if (task->stop_requested)
      break;

    const bool manual = task->trigger_requested;
    if (!manual && Clock::now() < next_run)
      continue; // spurious wake-up

    task->trigger_requested = false;
    const bool scheduled_tick = !manual && task->state == TaskState::Idle;
    task->state = TaskState::Running;
    task->last_run_ms = Utils::get_current_time_ms();
    task->run_count++;
    lock.unlock();

    LOG(LogLevel::DEBUG, LogComponent::SCHEDULER_TASK,
        "Running task '" << name << "'" << (manual ? " (manual trigger)" : ""));

    bool ok = true;
    std::string error;
    try {
      task->spec.body(task->cancel);
    } catch (const std::exception &e) {
      ok = false;
      error = e.what();
    } catch (...) {
      ok = false;
      error = "unknown error";
    }

    lock.lock();
    record_outcome(*task, *shared, ok, error);

    const auto now = Clock::now();
    if (task->state == TaskState::RetryWait) {
      next_run = now + task->spec.retry.delay_for(task->retry_count);
      task->retry_count++;
      continue;
    }

    if (scheduled_tick)
      tick += interval;
    skip_missed_ticks(now);
    next_run = tick;
  }

  if (task->state == TaskState::RetryWait || task->state == TaskState::Running)
    task->state = TaskState::Idle;
  lock.unlock();

  LOG(LogLevel::DEBUG, LogComponent::SCHEDULER_LIFECYCLE,
      "Worker for task '" << name << "' exited");

  task->exited = true;
  {
    std::lock_guard<std::mutex> exit_lock(shared->exit_mutex);
    shared->live_workers--;
  }
  shared->exit_cv.notify_all();
}

} // namespace scheduling
