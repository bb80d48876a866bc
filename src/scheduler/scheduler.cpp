#include "execai/scheduler/scheduler.hpp"

#include "execai/observability/global.hpp"

#include <algorithm>
#include <system_error>

namespace execai::scheduler {

namespace {

std::string status_tag(const domain::ScheduleStatus status) {
  return std::string(domain::to_string(status));
}

void report_transition(const domain::Schedule &schedule, const domain::ScheduleStatus before) {
  if (schedule.status() != before) {
    observability::record_schedule_transition(schedule.id(), status_tag(before),
                                              status_tag(schedule.status()));
  }
}

} // namespace

Scheduler::Scheduler(executor::IExecutor &executor, SchedulerOptions options,
                     CommandMaterializer materializer)
    : executor_(executor), options_(options), materializer_(std::move(materializer)) {}

Scheduler::~Scheduler() {
  stop();
  drain();
}

common::Status Scheduler::add_schedule(domain::Schedule schedule) {
  if (schedule.is_terminal()) {
    return common::Status::error(common::ErrorCode::InvalidState,
                                 "cannot register schedule in state " +
                                     domain::label(domain::to_string(schedule.status())));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (find_locked(schedule.id()) != nullptr) {
    return common::Status::error(common::ErrorCode::InvalidState,
                                 "schedule already registered: " + schedule.id());
  }
  observability::record_schedule_added(schedule.id(), schedule.name());
  schedules_.push_back(std::move(schedule));
  observability::record_metric(
      observability::RegisteredSchedulesMetric{.count = schedules_.size()});
  return common::Status::success();
}

bool Scheduler::remove_schedule(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return erase_locked(id);
}

bool Scheduler::pause_schedule(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto *schedule = find_locked(id);
  if (schedule == nullptr) {
    return false;
  }
  const auto before = schedule->status();
  const bool changed = schedule->pause();
  report_transition(*schedule, before);
  return changed;
}

bool Scheduler::resume_schedule(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto *schedule = find_locked(id);
  if (schedule == nullptr) {
    return false;
  }
  const auto before = schedule->status();
  const bool changed = schedule->resume(common::utc_now());
  report_transition(*schedule, before);
  return changed;
}

std::optional<domain::Schedule> Scheduler::get_schedule(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto *schedule = find_locked(id); schedule != nullptr) {
    return *schedule;
  }
  return std::nullopt;
}

std::vector<domain::Schedule> Scheduler::list_schedules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return schedules_;
}

SchedulerStats Scheduler::stats() const {
  SchedulerStats stats;
  stats.running = is_running();

  std::lock_guard<std::mutex> lock(mutex_);
  stats.total_schedules = schedules_.size();
  stats.in_flight = in_flight_.size();
  for (const auto &schedule : schedules_) {
    if (schedule.status() == domain::ScheduleStatus::Paused) {
      ++stats.paused_schedules;
    }
    if (!schedule.is_active()) {
      continue;
    }
    ++stats.active_schedules;
    if (schedule.next_run().has_value() &&
        (!stats.next_execution.has_value() || *schedule.next_run() < *stats.next_execution)) {
      stats.next_execution = schedule.next_run();
    }
  }
  return stats;
}

std::vector<std::string> Scheduler::due_schedules(const common::Timestamp now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> due;
  for (const auto &schedule : schedules_) {
    if (schedule.should_execute(now) && !in_flight_.contains(schedule.id())) {
      due.push_back(schedule.id());
    }
  }
  return due;
}

std::size_t Scheduler::tick(const common::Timestamp now) {
  std::vector<domain::Schedule> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &schedule : schedules_) {
      if (schedule.should_execute(now) && !in_flight_.contains(schedule.id())) {
        due.push_back(schedule);
        in_flight_.insert(schedule.id());
      }
    }
  }
  observability::record_scheduler_tick(due.size());

  for (auto &snapshot : due) {
    const std::string id = snapshot.id();
    try {
      auto task = std::async(std::launch::async, [this, now, snapshot = std::move(snapshot)]() {
        dispatch(snapshot, now);
      });
      std::lock_guard<std::mutex> lock(tasks_mutex_);
      tasks_.push_back(std::move(task));
    } catch (const std::system_error &e) {
      finish_dispatch(id,
                      common::Status::error(common::ErrorCode::Dispatch,
                                            std::string("cannot start dispatch: ") + e.what()),
                      now);
    }
  }

  cleanup(now);
  prune_finished_tasks();
  return due.size();
}

void Scheduler::dispatch(const domain::Schedule &snapshot, const common::Timestamp fired_at) {
  common::Status outcome = common::Status::success();
  try {
    auto commands = materializer_(snapshot);
    if (!commands.ok()) {
      outcome = common::Status::error(common::ErrorCode::Dispatch, commands.error());
    } else {
      observability::record_schedule_fired(snapshot.id(), commands.value().size());
      for (auto &command : commands.value()) {
        auto result = executor_.execute(command);
        if (!result.ok()) {
          outcome = common::Status::error(common::ErrorCode::Dispatch,
                                          "execution of '" + command.parsed_command() +
                                              "' failed: " + result.error());
          break;
        }

        ResultCallback callback;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          callback = result_callback_;
        }
        if (callback) {
          try {
            callback(snapshot, result.value());
          } catch (const std::exception &e) {
            observability::record_warning("scheduler",
                                          std::string("result callback threw: ") + e.what());
          }
        }
      }
    }
  } catch (const std::exception &e) {
    outcome = common::Status::error(common::ErrorCode::Dispatch, e.what());
  }

  finish_dispatch(snapshot.id(), outcome, fired_at);
}

void Scheduler::finish_dispatch(const std::string &id, const common::Status &outcome,
                                const common::Timestamp fired_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  in_flight_.erase(id);

  // Removed while the dispatch was running.
  auto *schedule = find_locked(id);
  if (schedule == nullptr) {
    return;
  }

  const auto before = schedule->status();
  if (outcome.ok()) {
    // The next run is never at or before the instant this dispatch was due.
    schedule->record_successful_run(std::max(common::utc_now(), fired_at));
  } else {
    observability::record_error("scheduler", "schedule " + id + ": " + outcome.error());
    schedule->record_failed_dispatch();
  }
  report_transition(*schedule, before);

  // A COMPLETED or FAILED schedule leaves the active set as soon as its last dispatch is done.
  if (schedule->is_terminal()) {
    erase_locked(id);
  }
}

void Scheduler::cleanup(const common::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &schedule : schedules_) {
    if (schedule.is_active() && schedule.is_expired(now) && !in_flight_.contains(schedule.id())) {
      const auto before = schedule.status();
      schedule.complete();
      report_transition(schedule, before);
    }
  }

  const auto first_removed =
      std::remove_if(schedules_.begin(), schedules_.end(), [this](const domain::Schedule &s) {
        return s.is_terminal() && !in_flight_.contains(s.id());
      });
  for (auto it = first_removed; it != schedules_.end(); ++it) {
    observability::record_schedule_removed(it->id());
  }
  if (first_removed != schedules_.end()) {
    schedules_.erase(first_removed, schedules_.end());
    observability::record_metric(
        observability::RegisteredSchedulesMetric{.count = schedules_.size()});
  }
}

void Scheduler::prune_finished_tasks() {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                              [](const std::future<void> &task) {
                                return task.wait_for(std::chrono::seconds(0)) ==
                                       std::future_status::ready;
                              }),
               tasks_.end());
}

void Scheduler::drain() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    pending.swap(tasks_);
  }
  for (auto &task : pending) {
    task.wait();
  }
}

void Scheduler::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Scheduler::is_running() const { return running_; }

void Scheduler::set_result_callback(ResultCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  result_callback_ = std::move(callback);
}

void Scheduler::run_loop() {
  while (running_) {
    std::chrono::milliseconds wait = options_.poll_interval;
    try {
      tick(common::utc_now());
    } catch (const std::exception &e) {
      observability::record_error("scheduler", std::string("tick failed: ") + e.what());
      wait = options_.error_backoff;
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, wait, [this]() { return !running_; });
  }
}

bool Scheduler::erase_locked(const std::string &id) {
  const auto it = std::find_if(schedules_.begin(), schedules_.end(),
                               [&](const domain::Schedule &s) { return s.id() == id; });
  if (it == schedules_.end()) {
    return false;
  }
  schedules_.erase(it);
  observability::record_schedule_removed(id);
  observability::record_metric(
      observability::RegisteredSchedulesMetric{.count = schedules_.size()});
  return true;
}

domain::Schedule *Scheduler::find_locked(const std::string &id) {
  const auto it = std::find_if(schedules_.begin(), schedules_.end(),
                               [&](const domain::Schedule &s) { return s.id() == id; });
  return it == schedules_.end() ? nullptr : &*it;
}

const domain::Schedule *Scheduler::find_locked(const std::string &id) const {
  const auto it = std::find_if(schedules_.begin(), schedules_.end(),
                               [&](const domain::Schedule &s) { return s.id() == id; });
  return it == schedules_.end() ? nullptr : &*it;
}

} // namespace execai::scheduler
