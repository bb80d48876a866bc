#include "bench_common.hpp"

#include "execai/config/config.hpp"

void run_config_benchmark() {
  execai::bench::run_bench("config_validate", 2000, [] {
    execai::config::Config config;
    (void)execai::config::validate_config(config);
  });

  const std::string rendered = execai::config::render_config(execai::config::Config{});
  execai::bench::run_bench("config_parse", 2000,
                           [&] { (void)execai::config::parse_config(rendered); });
}
