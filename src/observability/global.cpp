#include "paneguard/observability/global.hpp"

#include <mutex>

namespace paneguard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

// Callers on other threads keep the observer alive until their call returns.
std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_execution(const std::string &operation, const std::chrono::milliseconds duration,
                      const bool success, const std::string &outcome) {
  record_event(ExecutionCompletedEvent{
      .operation = operation, .duration = duration, .success = success, .outcome = outcome});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_rejection(const std::string &operation, const std::string &stage,
                      const std::string &reason) {
  record_event(ExecutionRejectedEvent{.operation = operation, .stage = stage, .reason = reason});
}

void record_audit_flush(const std::uint64_t events, const std::uint64_t bytes) {
  record_event(AuditFlushedEvent{.events = events, .bytes = bytes});
}

void record_audit_failure(const std::string &path, const std::string &message) {
  record_event(AuditWriteFailureEvent{.path = path, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace paneguard::observability
