#pragma once

#include "shellwarden/observability/observer.hpp"

#include <memory>

namespace shellwarden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void log_debug(const std::string &message);
void log_info(const std::string &message);
void log_warn(const std::string &message);

void record_sandbox_lifecycle(const std::string &action, const std::string &sandbox_id,
                              const std::string &image = "");
void record_sandbox_exec(const std::string &sandbox_id, const std::string &outcome, int exit_code,
                         std::chrono::milliseconds duration);
void record_command_rejected(const std::string &tool, const std::string &description,
                             const std::string &reasoning, const std::string &risk_level);
void record_error(const std::string &component, const std::string &message);

} // namespace shellwarden::observability
