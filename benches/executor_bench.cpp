#include "bench_common.hpp"

#include "execai/executor/executor.hpp"

void run_executor_benchmark() {
  execai::executor::Executor executor;
  execai::bench::run_bench("executor_spawn_true", 200, [&] {
    execai::domain::CommandSpec spec;
    spec.parsed_command = "true";
    auto command = execai::domain::Command::create(std::move(spec));
    if (command.ok()) {
      (void)executor.execute(command.value());
    }
  });
}
