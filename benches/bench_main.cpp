#include <iostream>

void run_config_benchmark();
void run_cron_benchmark();
void run_scheduler_benchmark();
void run_executor_benchmark();

int main() {
  std::cout << "execai benchmarks\n";
  run_config_benchmark();
  run_cron_benchmark();
  run_scheduler_benchmark();
  run_executor_benchmark();
  return 0;
}
