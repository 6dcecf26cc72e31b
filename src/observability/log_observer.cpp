#include "paneguard/observability/log_observer.hpp"

#include "paneguard/common/json_util.hpp"

#include <iostream>
#include <type_traits>

namespace paneguard::observability {

using common::json_quote;

LogObserver::LogObserver() : out_(std::cerr) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExecutionCompletedEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "exec.complete op=" + json_quote(evt.operation) + " outcome=" + evt.outcome +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ExecutionRejectedEvent>) {
          log_line("WARN", "exec.reject op=" + json_quote(evt.operation) + " stage=" + evt.stage +
                               " reason=" + json_quote(evt.reason));
        } else if constexpr (std::is_same_v<T, AuditFlushedEvent>) {
          log_line("DEBUG", "audit.flush events=" + std::to_string(evt.events) +
                                " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, AuditWriteFailureEvent>) {
          log_line("ERROR", "audit.write_failure path=" + json_quote(evt.path) +
                                " message=" + json_quote(evt.message));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + json_quote(evt.message));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line("DEBUG", "metric.exec_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, InFlightMetric>) {
          log_line("DEBUG", "metric.in_flight=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, AuditQueueDepthMetric>) {
          log_line("DEBUG", "metric.audit_queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, AuditDroppedMetric>) {
          log_line("WARN", "metric.audit_dropped=" + std::to_string(m.total));
        }
      },
      metric);
}

} // namespace paneguard::observability
