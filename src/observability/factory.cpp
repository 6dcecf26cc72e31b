#include "paneguard/observability/factory.hpp"

#include "paneguard/common/fs.hpp"
#include "paneguard/observability/log_observer.hpp"
#include "paneguard/observability/multi_observer.hpp"
#include "paneguard/observability/noop_observer.hpp"

namespace paneguard::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    for (const auto &part : common::split(backend, ',')) {
      multi->add(single_backend(common::trim(part)));
    }
    return multi;
  }

  if (auto observer = single_backend(backend); observer != nullptr) {
    return observer;
  }
  return std::make_unique<LogObserver>();
}

} // namespace paneguard::observability
