#pragma once

#include "execai/observability/observer.hpp"

#include <memory>

namespace execai::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_execution_start(const std::string &command_id, const std::string &command_line);
void record_execution_end(const std::string &command_id, std::chrono::milliseconds duration,
                          std::optional<int> exit_code, bool success, bool timed_out);
void record_execution_cancelled(const std::string &command_id);
void record_schedule_added(const std::string &schedule_id, const std::string &name);
void record_schedule_removed(const std::string &schedule_id);
void record_schedule_fired(const std::string &schedule_id, std::size_t command_count);
void record_schedule_transition(const std::string &schedule_id, const std::string &from,
                                const std::string &to);
void record_scheduler_tick(std::size_t due);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace execai::observability
