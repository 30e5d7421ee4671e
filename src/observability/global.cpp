#include "shellwarden/observability/global.hpp"

#include <mutex>

namespace shellwarden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

std::string_view log_level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void log_debug(const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Debug, .message = message});
}

void log_info(const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Info, .message = message});
}

void log_warn(const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Warn, .message = message});
}

void record_sandbox_lifecycle(const std::string &action, const std::string &sandbox_id,
                              const std::string &image) {
  record_event(SandboxLifecycleEvent{.action = action, .sandbox_id = sandbox_id, .image = image});
}

void record_sandbox_exec(const std::string &sandbox_id, const std::string &outcome,
                         const int exit_code, const std::chrono::milliseconds duration) {
  record_event(SandboxExecEvent{.sandbox_id = sandbox_id,
                                .outcome = outcome,
                                .exit_code = exit_code,
                                .duration = duration});
  record_metric(ExecLatencyMetric{.latency = duration});
}

void record_command_rejected(const std::string &tool, const std::string &description,
                             const std::string &reasoning, const std::string &risk_level) {
  record_event(CommandRejectedEvent{.tool = tool,
                                    .description = description,
                                    .reasoning = reasoning,
                                    .risk_level = risk_level});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace shellwarden::observability
