#include "test_framework.hpp"

#include "shellwarden/config/schema.hpp"
#include "shellwarden/observability/factory.hpp"
#include "shellwarden/observability/global.hpp"
#include "shellwarden/observability/log_observer.hpp"
#include "shellwarden/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {

using shellwarden::testing::CapturingObserver;
using shellwarden::testing::ScopedCapture;
using shellwarden::tests::require;
using shellwarden::tests::require_contains;
using shellwarden::tests::TestCase;

namespace obs = shellwarden::observability;

/// Redirects std::cerr into a buffer for the guard's lifetime.
class StderrCapture {
public:
  StderrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(previous_); }

  StderrCapture(const StderrCapture &) = delete;
  StderrCapture &operator=(const StderrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

shellwarden::config::Config with_backend(const std::string &backend) {
  shellwarden::config::Config cfg;
  cfg.observability.backend = backend;
  return cfg;
}

} // namespace

void register_observability_tests(std::vector<TestCase> &tests) {
  tests.push_back({"observer_factory_backends", [] {
                     require(obs::create_observer(with_backend("none"))->name() == "none", "none");
                     require(obs::create_observer(with_backend(""))->name() == "none",
                             "empty backend is silent");
                     require(obs::create_observer(with_backend("log"))->name() == "log", "log");
                     require(obs::create_observer(with_backend(" LOG "))->name() == "log",
                             "backend is normalized");
                     require(obs::create_observer(with_backend("unknown"))->name() == "log",
                             "unknown backend falls back to log");

                     auto multi = obs::create_observer(with_backend("log, none"));
                     require(multi->name() == "multi", "comma list builds a multi observer");
                     const auto *as_multi = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(as_multi != nullptr && as_multi->size() == 2, "two children");
                   }});

  tests.push_back({"observer_log_level_labels", [] {
                     require(obs::log_level_label(obs::LogLevel::Debug) == "DEBUG", "debug");
                     require(obs::log_level_label(obs::LogLevel::Info) == "INFO", "info");
                     require(obs::log_level_label(obs::LogLevel::Warn) == "WARN", "warn");
                     require(obs::log_level_label(obs::LogLevel::Error) == "ERROR", "error");
                   }});

  tests.push_back({"observer_global_helpers_reach_installed_observer", [] {
                     ScopedCapture capture;
                     obs::log_info("hello");
                     obs::record_sandbox_lifecycle("created", "sbx-1", "node:20");
                     obs::record_sandbox_exec("sbx-1", "completed", 0,
                                              std::chrono::milliseconds(12));
                     obs::record_error("docker", "boom");

                     const auto events = capture.observer().events();
                     require(events.size() == 4, "four events");
                     const auto *log = std::get_if<obs::LogEvent>(&events[0]);
                     require(log != nullptr && log->message == "hello" &&
                                 log->level == obs::LogLevel::Info,
                             "log event");
                     const auto *lifecycle = std::get_if<obs::SandboxLifecycleEvent>(&events[1]);
                     require(lifecycle != nullptr && lifecycle->image == "node:20",
                             "lifecycle event");
                     const auto *error = std::get_if<obs::ErrorEvent>(&events[3]);
                     require(error != nullptr && error->component == "docker", "error event");
                     require(capture.observer().metric_count() == 1,
                             "exec records a latency metric");
                   }});

  tests.push_back({"observer_without_global_is_a_noop", [] {
                     obs::set_global_observer(nullptr);
                     obs::log_warn("dropped");
                     obs::record_metric(obs::ExecLatencyMetric{});
                     require(obs::get_global_observer() == nullptr, "still unset");
                   }});

  tests.push_back({"observer_multi_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<CapturingObserver>();
                     auto second = std::make_unique<CapturingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null child ignored");

                     multi.record_event(obs::LogEvent{.level = obs::LogLevel::Warn,
                                                      .message = "both"});
                     multi.record_metric(obs::AssessorLatencyMetric{});
                     require(first_ptr->events().size() == 1 && second_ptr->events().size() == 1,
                             "event delivered to both");
                     require(first_ptr->metric_count() == 1 && second_ptr->metric_count() == 1,
                             "metric delivered to both");
                   }});

  tests.push_back({"observer_log_writes_levels_to_stderr", [] {
                     obs::LogObserver quiet(false);
                     StderrCapture captured;
                     quiet.record_event(obs::LogEvent{.level = obs::LogLevel::Debug,
                                                      .message = "hidden"});
                     quiet.record_event(obs::CommandRejectedEvent{.tool = "shell",
                                                                  .description = "shell - rm x",
                                                                  .reasoning = "deletes files",
                                                                  .risk_level = "high"});
                     quiet.record_metric(obs::ExecLatencyMetric{});
                     const auto text = captured.text();
                     require(text.find("hidden") == std::string::npos, "debug suppressed");
                     require(text.find("metric.") == std::string::npos, "metrics suppressed");
                     require_contains(text,
                                      "[WARN] Unsafe command filtered out: shell - rm x "
                                      "(reason: deletes files, risk: high)",
                                      "rejection line");
                   }});

  tests.push_back({"observer_verbose_log_includes_debug", [] {
                     obs::LogObserver verbose(true);
                     StderrCapture captured;
                     verbose.record_event(obs::CommandFilterEvent{
                         .gated = 3, .known_safe = 1, .assessed = 2, .rejected = 1});
                     verbose.record_metric(
                         obs::AssessorLatencyMetric{.latency = std::chrono::milliseconds(40)});
                     const auto text = captured.text();
                     require_contains(text, "[DEBUG] filter gated=3 known_safe=1 assessed=2 rejected=1",
                                      "filter summary");
                     require_contains(text, "metric.assessor_latency_ms=40", "assessor latency");
                   }});
}
