#include "test_framework.hpp"

#include "execai/executor/executor.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <future>
#include <string>
#include <thread>

namespace {

execai::executor::ExecutorOptions fast_options() {
  execai::executor::ExecutorOptions options;
  options.grace_period = std::chrono::milliseconds(500);
  return options;
}

execai::domain::ExecutionResult run(execai::executor::Executor &executor,
                                    execai::domain::Command &command) {
  auto result = executor.execute(command);
  if (!result.ok()) {
    throw std::runtime_error("execute failed: " + result.error());
  }
  return std::move(result.value());
}

// The background subshell ignores SIGTERM, so only a SIGKILL to the whole group stops it.
std::string stubborn_descendant_line(const std::filesystem::path &dir) {
  return "(trap '' TERM; sleep 30) & echo $! > '" + (dir / "descendant.pid").string() +
         "'; echo $$ > '" + (dir / "leader.pid").string() + "'; sleep 30";
}

} // namespace

void register_executor_tests(std::vector<execai::tests::TestCase> &tests) {
  using execai::tests::require;
  namespace ex = execai::executor;
  namespace d = execai::domain;
  namespace t = execai::testing;

  tests.push_back({"executor_captures_stdout", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("echo hello");
                     const auto result = run(executor, command);
                     require(result.success && result.exit_code == 0, "echo should succeed");
                     require(result.stdout_text == "hello\n", "stdout: " + result.stdout_text);
                     require(result.completed_at.has_value(), "completed_at set");
                     require(result.memory_usage_mb.has_value(), "memory usage reported");
                     require(command.status() == d::CommandStatus::Completed, "command completed");
                     require(command.execution_time().has_value(), "execution time recorded");
                     require(command.stdout_text() == "hello\n", "command keeps stdout");
                   }});

  tests.push_back({"executor_nonzero_exit_and_stderr", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("echo oops 1>&2; exit 3");
                     const auto result = run(executor, command);
                     require(!result.success, "non-zero exit is a failure");
                     require(result.exit_code == 3, "exit code preserved");
                     require(result.stderr_text == "oops\n", "stderr: " + result.stderr_text);
                     require(result.stdout_text.empty(), "no stdout");
                     require(command.status() == d::CommandStatus::Failed, "command failed");
                   }});

  tests.push_back({"executor_missing_program_exits_127", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("execai-definitely-not-a-program");
                     const auto result = run(executor, command);
                     require(result.exit_code == 127, "shell reports 127 for unknown programs");
                     require(!result.stderr_text.empty(), "shell explains the failure");
                   }});

  tests.push_back({"executor_environment_is_merged", [] {
                     ex::Executor executor(fast_options());
                     d::CommandSpec spec;
                     spec.parsed_command = "echo \"$EXECAI_TEST_VALUE:${PATH:+has-path}\"";
                     spec.environment = {{"EXECAI_TEST_VALUE", "from-command"}};
                     auto command = d::Command::create(spec);
                     require(command.ok(), command.error());
                     const auto result = run(executor, command.value());
                     require(result.stdout_text == "from-command:has-path\n",
                             "stdout: " + result.stdout_text);
                     require(result.environment.at("EXECAI_TEST_VALUE") == "from-command",
                             "result records the overrides");
                   }});

  tests.push_back({"executor_runs_in_working_directory", [] {
                     t::TempWorkspace workspace;
                     workspace.create_file("marker.txt", "inside\n");
                     ex::Executor executor(fast_options());
                     d::CommandSpec spec;
                     spec.parsed_command = "cat marker.txt";
                     spec.working_directory = workspace.path().string();
                     auto command = d::Command::create(spec);
                     require(command.ok(), command.error());
                     const auto result = run(executor, command.value());
                     require(result.stdout_text == "inside\n", "stdout: " + result.stdout_text);
                     require(result.working_directory == workspace.path().string(),
                             "working directory recorded");
                   }});

  tests.push_back({"executor_missing_working_directory_is_launch_failure", [] {
                     ex::Executor executor(fast_options());
                     d::CommandSpec spec;
                     spec.parsed_command = "echo never";
                     spec.working_directory = "/nonexistent/execai/dir";
                     auto command = d::Command::create(spec);
                     require(command.ok(), command.error());
                     const auto result = run(executor, command.value());
                     require(!result.success, "launch failure is unsuccessful");
                     require(!result.exit_code.has_value(), "no exit code without a process");
                     require(!result.stderr_text.empty(), "reason reported");
                     require(command.value().status() == d::CommandStatus::Failed,
                             "command ends failed");
                     require(executor.running_count() == 0, "nothing left registered");
                   }});

  tests.push_back({"executor_timeout_kills_process_group", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("echo partial; sleep 10", 1);
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = run(executor, command);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.timed_out, "timeout flagged");
                     require(!result.success && result.exit_code == -1, "timeout exit code");
                     require(result.stdout_text.empty(), "stdout discarded on timeout");
                     require(result.stderr_text == "Command timed out after 1 seconds",
                             "stderr: " + result.stderr_text);
                     require(elapsed < std::chrono::seconds(5), "child terminated promptly");
                     require(command.status() == d::CommandStatus::Failed, "timed out commands fail");
                   }});

  tests.push_back({"executor_cancel_running_command", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("sleep 30");
                     const std::string handle = command.id();
                     auto pending = std::async(std::launch::async,
                                               [&] { return executor.execute(command); });
                     require(t::wait_until([&] { return executor.running_count() == 1; },
                                           std::chrono::seconds(5)),
                             "command should start");

                     require(executor.cancel(handle), "cancel should find the execution");
                     auto result = pending.get();
                     require(result.ok(), result.error());
                     require(result.value().cancelled, "cancelled flag");
                     require(result.value().exit_code == -1, "cancel exit code");
                     require(result.value().stderr_text.find("Command was cancelled") !=
                                 std::string::npos,
                             "stderr: " + result.value().stderr_text);
                     require(command.status() == d::CommandStatus::Cancelled, "command cancelled");
                     require(!executor.cancel(handle), "second cancel finds nothing");
                   }});

  tests.push_back({"executor_timeout_kills_descendants_ignoring_sigterm", [] {
                     t::TempWorkspace ws;
                     ex::Executor executor(fast_options());
                     auto command = t::make_command(stubborn_descendant_line(ws.path()), 1);
                     const auto result = run(executor, command);
                     require(result.timed_out, "timeout flagged");

                     const pid_t descendant =
                         t::read_pid_file(ws.path() / "descendant.pid", std::chrono::seconds(1));
                     const pid_t leader =
                         t::read_pid_file(ws.path() / "leader.pid", std::chrono::seconds(1));
                     require(!t::process_exists(leader), "shell leader gone");
                     require(!t::process_exists(descendant),
                             "descendant killed with the group before execute returns");
                   }});

  tests.push_back({"executor_cancel_kills_descendants_ignoring_sigterm", [] {
                     t::TempWorkspace ws;
                     ex::Executor executor(fast_options());
                     auto command = t::make_command(stubborn_descendant_line(ws.path()), 30);
                     auto pending = std::async(std::launch::async,
                                               [&] { return executor.execute(command); });
                     const pid_t descendant =
                         t::read_pid_file(ws.path() / "descendant.pid", std::chrono::seconds(5));
                     const pid_t leader =
                         t::read_pid_file(ws.path() / "leader.pid", std::chrono::seconds(5));
                     require(t::process_exists(descendant), "descendant running before cancel");

                     require(executor.cancel(command.id()), "cancel");
                     auto result = pending.get();
                     require(result.ok() && result.value().cancelled, "cancelled");
                     require(!t::process_exists(leader), "shell leader gone");
                     require(!t::process_exists(descendant),
                             "descendant killed with the group before execute returns");
                   }});

  tests.push_back({"executor_huge_timeout_never_expires", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("echo ok", 20'000'000'000);
                     const auto result = run(executor, command);
                     require(!result.timed_out, "no spurious timeout");
                     require(result.success && result.stdout_text == "ok\n",
                             "stdout: " + result.stdout_text);
                   }});

  tests.push_back({"executor_cancel_unknown_or_finished", [] {
                     ex::Executor executor(fast_options());
                     require(!executor.cancel("no-such-handle"), "unknown handle");
                     auto command = t::make_command("true");
                     (void)run(executor, command);
                     require(!executor.cancel(command.id()), "finished executions cannot be cancelled");
                   }});

  tests.push_back({"executor_lists_running_processes", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("sleep 30");
                     auto pending = std::async(std::launch::async,
                                               [&] { return executor.execute(command); });
                     require(t::wait_until([&] { return !executor.list_running().empty(); },
                                           std::chrono::seconds(5)),
                             "telemetry should appear");

                     const auto running = executor.list_running();
                     const auto it = running.find(command.id());
                     require(it != running.end(), "keyed by command id");
                     require(it->second.pid > 0 && t::process_exists(it->second.pid), "live pid");
                     require(it->second.command_line == "sleep 30", "command line");
                     require(!it->second.status.empty(), "kernel state");

                     require(executor.cancel(command.id()), "cancel");
                     require(pending.get().ok(), "execution returns");
                     require(executor.list_running().empty(), "nothing left running");
                   }});

  tests.push_back({"executor_rejects_dangerous_in_safe_mode", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("rm -rf /tmp/execai-never-created");
                     auto result = executor.execute(command);
                     require(!result.ok(), "dangerous command rejected");
                     require(result.code() == execai::common::ErrorCode::InvalidState,
                             "invalid state error");
                     require(result.error().find("rm ") != std::string::npos,
                             "matched pattern reported: " + result.error());
                     require(command.status() == d::CommandStatus::Pending,
                             "rejected command untouched");
                   }});

  tests.push_back({"executor_rejects_non_pending_command", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("echo once");
                     (void)run(executor, command);
                     auto again = executor.execute(command);
                     require(!again.ok() && again.code() == execai::common::ErrorCode::InvalidState,
                             "commands run at most once");
                   }});

  tests.push_back({"executor_output_limit_truncates", [] {
                     auto options = fast_options();
                     options.max_output_bytes = 16;
                     ex::Executor executor(options);
                     auto command = t::make_command("i=0; while [ $i -lt 200 ]; do echo line$i; "
                                                    "i=$((i+1)); done");
                     const auto result = run(executor, command);
                     require(result.success, "command itself succeeds");
                     require(result.stdout_text.find("[output truncated]") != std::string::npos,
                             "truncation marker present");
                     require(result.stdout_text.size() < 64, "captured output bounded");
                   }});

  tests.push_back({"executor_runs_concurrently", [] {
                     ex::Executor executor(fast_options());
                     std::vector<d::Command> commands;
                     for (int i = 0; i < 4; ++i) {
                       commands.push_back(t::make_command("sleep 1"));
                     }
                     const auto started = std::chrono::steady_clock::now();
                     std::vector<std::future<execai::common::Result<d::ExecutionResult>>> futures;
                     for (auto &command : commands) {
                       futures.push_back(std::async(std::launch::async,
                                                    [&executor, &command] {
                                                      return executor.execute(command);
                                                    }));
                     }
                     for (auto &future : futures) {
                       auto result = future.get();
                       require(result.ok() && result.value().success, "each sleep succeeds");
                     }
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(3),
                             "executions overlap");
                   }});

  tests.push_back({"executor_shutdown_terminates_and_rejects", [] {
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("sleep 30");
                     auto pending = std::async(std::launch::async,
                                               [&] { return executor.execute(command); });
                     require(t::wait_until([&] { return executor.running_count() == 1; },
                                           std::chrono::seconds(5)),
                             "command should start");
                     executor.shutdown();
                     require(executor.is_shut_down(), "shut down");
                     auto result = pending.get();
                     require(result.ok() && result.value().cancelled,
                             "in-flight execution is cancelled");

                     auto late = t::make_command("echo late");
                     auto rejected = executor.execute(late);
                     require(!rejected.ok(), "execute after shutdown fails");
                     require(rejected.code() == execai::common::ErrorCode::InvalidState,
                             "invalid state after shutdown");
                   }});

  tests.push_back({"executor_reports_observer_events", [] {
                     t::ObserverCapture capture;
                     ex::Executor executor(fast_options());
                     auto command = t::make_command("true");
                     (void)run(executor, command);
                     bool saw_start = false;
                     bool saw_end = false;
                     for (const auto &event : capture.observer().events()) {
                       if (const auto *start =
                               std::get_if<execai::observability::ExecutionStartEvent>(&event)) {
                         saw_start = start->command_id == command.id();
                       }
                       if (const auto *end =
                               std::get_if<execai::observability::ExecutionEndEvent>(&event)) {
                         saw_end = end->success && end->exit_code == 0;
                       }
                     }
                     require(saw_start && saw_end, "start and end events recorded");
                   }});
}
