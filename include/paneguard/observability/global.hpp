#pragma once

#include "paneguard/observability/observer.hpp"

#include <memory>

namespace paneguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_execution(const std::string &operation, std::chrono::milliseconds duration,
                      bool success, const std::string &outcome);
void record_rejection(const std::string &operation, const std::string &stage,
                      const std::string &reason);
void record_audit_flush(std::uint64_t events, std::uint64_t bytes);
void record_audit_failure(const std::string &path, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace paneguard::observability
