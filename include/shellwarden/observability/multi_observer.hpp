#pragma once

#include "shellwarden/observability/observer.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace shellwarden::observability {

/// Forwards every event and metric to each child in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace shellwarden::observability
