#pragma once

#include "paneguard/config/schema.hpp"
#include "paneguard/observability/observer.hpp"

#include <memory>

namespace paneguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace paneguard::observability
