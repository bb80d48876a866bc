#pragma once

#include "execai/common/result.hpp"
#include "execai/common/time.hpp"
#include "execai/domain/execution_result.hpp"
#include "execai/domain/schedule.hpp"
#include "execai/executor/executor.hpp"
#include "execai/scheduler/materializer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace execai::scheduler {

struct SchedulerOptions {
  std::chrono::milliseconds poll_interval{1000};
  /// Sleep after a tick that threw, instead of the poll interval.
  std::chrono::milliseconds error_backoff{5000};
};

struct SchedulerStats {
  bool running = false;
  std::size_t total_schedules = 0;
  std::size_t active_schedules = 0;
  std::size_t paused_schedules = 0;
  std::size_t in_flight = 0;
  /// Soonest next_run across ACTIVE schedules.
  std::optional<common::Timestamp> next_execution;
};

/// Called once per command run on behalf of a schedule, from the dispatch thread.
using ResultCallback =
    std::function<void(const domain::Schedule &, const domain::ExecutionResult &)>;

class Scheduler {
public:
  Scheduler(executor::IExecutor &executor, SchedulerOptions options = {},
            CommandMaterializer materializer = make_default_materializer());
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  [[nodiscard]] common::Status add_schedule(domain::Schedule schedule);
  /// Idempotent; true when something was removed. An in-flight dispatch is not cancelled.
  bool remove_schedule(const std::string &id);
  /// No-op (false) unless the schedule is ACTIVE.
  bool pause_schedule(const std::string &id);
  /// No-op (false) unless the schedule is PAUSED.
  bool resume_schedule(const std::string &id);

  [[nodiscard]] std::optional<domain::Schedule> get_schedule(const std::string &id) const;
  [[nodiscard]] std::vector<domain::Schedule> list_schedules() const;
  [[nodiscard]] SchedulerStats stats() const;

  /// Ids of schedules due at `now` with no dispatch in flight, in registration order.
  [[nodiscard]] std::vector<std::string> due_schedules(common::Timestamp now) const;

  /// One polling pass: dispatch everything due, then complete and drop expired schedules.
  /// A schedule that a dispatch leaves COMPLETED or FAILED is dropped when that dispatch ends.
  /// Returns the number of dispatches started.
  std::size_t tick(common::Timestamp now);
  /// Blocks until every dispatch started so far has finished its bookkeeping.
  void drain();

  void start();
  /// Stops the polling loop; dispatches already started keep running.
  void stop();
  [[nodiscard]] bool is_running() const;

  void set_result_callback(ResultCallback callback);

private:
  void run_loop();
  void dispatch(const domain::Schedule &snapshot, common::Timestamp fired_at);
  void finish_dispatch(const std::string &id, const common::Status &outcome,
                       common::Timestamp fired_at);
  void cleanup(common::Timestamp now);
  void prune_finished_tasks();
  bool erase_locked(const std::string &id);

  domain::Schedule *find_locked(const std::string &id);
  [[nodiscard]] const domain::Schedule *find_locked(const std::string &id) const;

  executor::IExecutor &executor_;
  SchedulerOptions options_;
  CommandMaterializer materializer_;

  mutable std::mutex mutex_;
  std::vector<domain::Schedule> schedules_;
  std::set<std::string> in_flight_;
  ResultCallback result_callback_;

  std::mutex tasks_mutex_;
  std::vector<std::future<void>> tasks_;

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace execai::scheduler
