#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace engram::observability {

struct RecordCommittedEvent {
  std::string record_id;
  std::string lobe;
  std::string path;
  bool deduplicated = false;
};

struct PolicyDecisionEvent {
  std::string category;
  std::string outcome;
  std::string risk;
  bool passed = true;
};

struct PathMutationEvent {
  std::string action;
  std::string path;
  std::string head;
  std::string outcome;
};

struct RecallEvent {
  std::string record_id;
  std::string source;
  bool hit = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RecordCommittedEvent, PolicyDecisionEvent, PathMutationEvent,
                                   RecallEvent, ErrorEvent>;

struct CommitLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct RecallLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct AncestryDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<CommitLatencyMetric, RecallLatencyMetric, AncestryDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace engram::observability
