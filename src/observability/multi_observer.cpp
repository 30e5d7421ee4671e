#include "shellwarden/observability/multi_observer.hpp"

namespace shellwarden::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace shellwarden::observability
