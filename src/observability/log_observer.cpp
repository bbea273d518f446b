#include "engram/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace engram::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string short_id(const std::string &id) { return id.substr(0, 12); }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RecordCommittedEvent>) {
          log_line("INFO", std::string(evt.deduplicated ? "record.dedupe" : "record.commit") +
                               " id=" + short_id(evt.record_id) + " lobe=" + evt.lobe +
                               (evt.path.empty() ? std::string() : " path=" + evt.path));
        } else if constexpr (std::is_same_v<T, PolicyDecisionEvent>) {
          log_line(evt.passed ? "INFO" : "WARN", "policy.decision category=" + evt.category +
                                                     " outcome=" + evt.outcome +
                                                     " risk=" + evt.risk);
        } else if constexpr (std::is_same_v<T, PathMutationEvent>) {
          log_line("INFO", "path." + evt.action + " path=" + evt.path +
                               " head=" + short_id(evt.head) + " outcome=" + evt.outcome);
        } else if constexpr (std::is_same_v<T, RecallEvent>) {
          log_line("DEBUG", "recall id=" + short_id(evt.record_id) + " source=" + evt.source +
                                " hit=" + (evt.hit ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CommitLatencyMetric>) {
          log_line("DEBUG", "metric.commit_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RecallLatencyMetric>) {
          log_line("DEBUG", "metric.recall_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, AncestryDepthMetric>) {
          log_line("DEBUG", "metric.ancestry_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

} // namespace engram::observability
