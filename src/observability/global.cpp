#include "engram/observability/global.hpp"

#include <mutex>

namespace engram::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_commit(const std::string &record_id, const std::string &lobe,
                   const std::string &path, const bool deduplicated) {
  record_event(RecordCommittedEvent{
      .record_id = record_id, .lobe = lobe, .path = path, .deduplicated = deduplicated});
}

void record_path_mutation(const std::string &action, const std::string &path,
                          const std::string &head, const std::string &outcome) {
  record_event(
      PathMutationEvent{.action = action, .path = path, .head = head, .outcome = outcome});
}

void record_recall(const std::string &record_id, const std::string &source, const bool hit,
                   const std::chrono::microseconds latency) {
  record_event(RecallEvent{.record_id = record_id, .source = source, .hit = hit});
  record_metric(RecallLatencyMetric{.latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace engram::observability
