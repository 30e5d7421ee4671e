#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace shellwarden::observability {

enum class LogLevel { Debug, Info, Warn, Error };

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string message;
};

struct SandboxLifecycleEvent {
  std::string action; // created, stopped, deleted
  std::string sandbox_id;
  std::string image;
};

struct SandboxExecEvent {
  std::string sandbox_id;
  std::string outcome;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
};

struct CommandRejectedEvent {
  std::string tool;
  std::string description;
  std::string reasoning;
  std::string risk_level;
};

struct CommandFilterEvent {
  std::size_t gated = 0;
  std::size_t known_safe = 0;
  std::size_t assessed = 0;
  std::size_t rejected = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LogEvent, SandboxLifecycleEvent, SandboxExecEvent,
                                   CommandRejectedEvent, CommandFilterEvent, ErrorEvent>;

struct ExecLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct AssessorLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<ExecLatencyMetric, AssessorLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view log_level_label(LogLevel level);

} // namespace shellwarden::observability
