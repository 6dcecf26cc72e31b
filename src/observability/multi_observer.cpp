#include "paneguard/observability/multi_observer.hpp"

#include <algorithm>

namespace paneguard::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  // "log,log" would otherwise print every line twice.
  const bool duplicate = std::any_of(observers_.begin(), observers_.end(), [&](const auto &existing) {
    return existing->name() == observer->name();
  });
  if (!duplicate) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

std::vector<std::string> MultiObserver::backend_names() const {
  std::vector<std::string> names;
  names.reserve(observers_.size());
  for (const auto &observer : observers_) {
    names.emplace_back(observer->name());
  }
  return names;
}

} // namespace paneguard::observability
