#include "execai/observability/factory.hpp"

#include "execai/common/fs.hpp"
#include "execai/observability/log_observer.hpp"
#include "execai/observability/noop_observer.hpp"

namespace execai::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const LogLevel level = parse_log_level(config.observability.level).value_or(LogLevel::Info);
  return std::make_unique<LogObserver>(level);
}

} // namespace execai::observability
