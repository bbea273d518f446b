#pragma once

#include "engram/observability/observer.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace engram::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_commit(const std::string &record_id, const std::string &lobe,
                   const std::string &path, bool deduplicated = false);
void record_path_mutation(const std::string &action, const std::string &path,
                          const std::string &head, const std::string &outcome);
void record_recall(const std::string &record_id, const std::string &source, bool hit,
                   std::chrono::microseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace engram::observability
