#include "shellwarden/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace shellwarden::observability {

void LogObserver::write(const LogLevel level, const std::string &message) const {
  if (level == LogLevel::Debug && !verbose_) {
    return;
  }
  std::cerr << "[" << log_level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          write(evt.level, evt.message);
        } else if constexpr (std::is_same_v<T, SandboxLifecycleEvent>) {
          std::string line = "sandbox." + evt.action + " id=" + evt.sandbox_id;
          if (!evt.image.empty()) {
            line += " image=" + evt.image;
          }
          write(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, SandboxExecEvent>) {
          write(LogLevel::Debug, "sandbox.exec id=" + evt.sandbox_id + " outcome=" + evt.outcome +
                                     " exit_code=" + std::to_string(evt.exit_code) +
                                     " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CommandRejectedEvent>) {
          write(LogLevel::Warn, "Unsafe command filtered out: " + evt.description +
                                    " (reason: " + evt.reasoning + ", risk: " + evt.risk_level +
                                    ")");
        } else if constexpr (std::is_same_v<T, CommandFilterEvent>) {
          write(LogLevel::Debug, "filter gated=" + std::to_string(evt.gated) +
                                     " known_safe=" + std::to_string(evt.known_safe) +
                                     " assessed=" + std::to_string(evt.assessed) +
                                     " rejected=" + std::to_string(evt.rejected));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecLatencyMetric>) {
          write(LogLevel::Debug, "metric.exec_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, AssessorLatencyMetric>) {
          write(LogLevel::Debug,
                "metric.assessor_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace shellwarden::observability
