#pragma once

#include "hostgate/config/schema.hpp"
#include "hostgate/observability/observer.hpp"

#include <memory>

namespace hostgate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hostgate::observability
