#pragma once

#include "shellwarden/config/schema.hpp"
#include "shellwarden/observability/observer.hpp"

#include <memory>

namespace shellwarden::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace shellwarden::observability
