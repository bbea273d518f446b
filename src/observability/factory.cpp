#include "engram/observability/factory.hpp"

#include "engram/common/fs.hpp"
#include "engram/observability/log_observer.hpp"
#include "engram/observability/multi_observer.hpp"
#include "engram/observability/noop_observer.hpp"

#include <sstream>

namespace engram::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_shared<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_shared<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::to_lower(common::trim(part));
      if (p == "log") {
        multi->add(std::make_shared<LogObserver>());
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_shared<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_shared<LogObserver>();
}

} // namespace engram::observability
