#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace paneguard::observability {

struct ExecutionCompletedEvent {
  std::string operation;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string outcome;
};

struct ExecutionRejectedEvent {
  std::string operation;
  std::string stage;
  std::string reason;
};

struct AuditFlushedEvent {
  std::uint64_t events = 0;
  std::uint64_t bytes = 0;
};

struct AuditWriteFailureEvent {
  std::string path;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ExecutionCompletedEvent, ExecutionRejectedEvent,
                                   AuditFlushedEvent, AuditWriteFailureEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct InFlightMetric {
  std::uint64_t count = 0;
};

struct AuditQueueDepthMetric {
  std::uint64_t depth = 0;
};

struct AuditDroppedMetric {
  std::uint64_t total = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, InFlightMetric, AuditQueueDepthMetric,
                                    AuditDroppedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace paneguard::observability
