#pragma once

#include "paneguard/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace paneguard::observability {

/// Fans out to each distinct backend once.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] std::vector<std::string> backend_names() const;

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace paneguard::observability
