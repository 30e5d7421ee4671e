#pragma once

#include "shellwarden/observability/observer.hpp"

namespace shellwarden::observability {

/// Selected by `observability.backend = "none"`.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override { (void)event; }
  void record_metric(const ObserverMetric &metric) override { (void)metric; }
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace shellwarden::observability
