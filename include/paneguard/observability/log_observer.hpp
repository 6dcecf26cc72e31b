#pragma once

#include "paneguard/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace paneguard::observability {

/// One line per event on `out`. Caller-supplied text is written as a quoted
/// JSON string so it cannot start a line of its own.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace paneguard::observability
