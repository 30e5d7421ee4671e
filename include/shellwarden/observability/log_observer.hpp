#pragma once

#include "shellwarden/observability/observer.hpp"

namespace shellwarden::observability {

/// Writes "[LEVEL] message" lines to stderr. Debug lines and metrics are
/// suppressed unless verbose.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(LogLevel level, const std::string &message) const;

  bool verbose_;
};

} // namespace shellwarden::observability
