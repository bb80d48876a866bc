#pragma once

#include "execai/config/schema.hpp"
#include "execai/observability/observer.hpp"

#include <memory>

namespace execai::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace execai::observability
