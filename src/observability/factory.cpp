#include "shellwarden/observability/factory.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/observability/log_observer.hpp"
#include "shellwarden/observability/multi_observer.hpp"
#include "shellwarden/observability/noop_observer.hpp"

#include <sstream>

namespace shellwarden::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const bool verbose) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "verbose" || backend == "debug") {
    return std::make_unique<LogObserver>(true);
  }
  return std::make_unique<LogObserver>(verbose);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const bool verbose = config.observability.verbose;
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (!p.empty()) {
        multi->add(create_single(p, verbose));
      }
    }
    return multi;
  }

  return create_single(backend, verbose);
}

} // namespace shellwarden::observability
