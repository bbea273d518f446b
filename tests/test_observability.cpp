#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"
#include "engram/observability/multi_observer.hpp"

#include <filesystem>
#include <mutex>

namespace {

namespace obs = engram::observability;

class CapturingObserver final : public obs::IObserver {
public:
  void record_event(const obs::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events.push_back(event);
  }
  void record_metric(const obs::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  template <typename T> std::size_t count_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &event : events) {
      n += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return n;
  }

  template <typename T> std::size_t count_metrics() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &metric : metrics) {
      n += std::holds_alternative<T>(metric) ? 1 : 0;
    }
    return n;
  }

  std::vector<obs::ObserverEvent> events;
  std::vector<obs::ObserverMetric> metrics;

private:
  std::mutex mutex_;
};

struct GlobalObserverGuard {
  std::shared_ptr<obs::IObserver> previous = obs::get_global_observer();
  ~GlobalObserverGuard() { obs::set_global_observer(previous); }
};

} // namespace

void register_observability_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;

  tests.push_back({"observability_factory_backends", [] {
                     engram::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,none";
                     require(obs::create_observer(config)->name() == "multi", "list -> multi");
                   }});

  tests.push_back({"observability_multi_fans_out", [] {
                     auto first = std::make_shared<CapturingObserver>();
                     auto second = std::make_shared<CapturingObserver>();
                     obs::MultiObserver multi;
                     multi.add(first);
                     multi.add(second);
                     multi.record_event(obs::ErrorEvent{"test", "boom"});
                     multi.record_metric(obs::AncestryDepthMetric{3});
                     require(first->events.size() == 1 && second->events.size() == 1,
                             "event should reach both observers");
                     require(first->metrics.size() == 1 && second->metrics.size() == 1,
                             "metric should reach both observers");
                   }});

  tests.push_back({"observability_global_helpers_route_to_observer", [] {
                     GlobalObserverGuard guard;
                     auto capture = std::make_shared<CapturingObserver>();
                     obs::set_global_observer(capture);
                     obs::record_commit("id", "notes", "");
                     obs::record_path_mutation("sprout", "main", "id", "ok");
                     obs::record_recall("id", "fast", true, std::chrono::microseconds(5));
                     obs::record_error("store", "disk full");
                     require(capture->count_events<obs::RecordCommittedEvent>() == 1, "commit event");
                     require(capture->count_events<obs::PathMutationEvent>() == 1, "path event");
                     require(capture->count_events<obs::RecallEvent>() == 1, "recall event");
                     require(capture->count_events<obs::ErrorEvent>() == 1, "error event");
                     require(capture->count_metrics<obs::RecallLatencyMetric>() == 1,
                             "recall latency metric");
                   }});

  tests.push_back({"observability_engine_emits_events", [] {
                     GlobalObserverGuard guard;
                     engram::testing::TempWorkspace temp;
                     engram::testing::EngineFixture fx(temp);
                     auto capture = std::make_shared<CapturingObserver>();
                     obs::set_global_observer(capture);

                     auto id = fx.engine->write("notes", "observed write");
                     require(id.ok(), id.error());
                     auto hit = fx.engine->read(id.value());
                     require(hit.ok(), hit.error());
                     auto base = fx.engine->sprout("observed", id.value());
                     require(base.ok(), base.error());

                     require(capture->count_events<obs::PolicyDecisionEvent>() == 1,
                             "policy decision event");
                     require(capture->count_events<obs::RecordCommittedEvent>() == 1,
                             "record committed event");
                     require(capture->count_events<obs::RecallEvent>() == 1, "recall event");
                     require(capture->count_events<obs::PathMutationEvent>() == 1,
                             "path mutation event");
                     require(capture->count_metrics<obs::CommitLatencyMetric>() == 1,
                             "commit latency metric");
                   }});

  tests.push_back({"observability_audit_failure_after_commit_is_an_error_event", [] {
                     GlobalObserverGuard guard;
                     engram::testing::TempWorkspace temp;
                     engram::testing::EngineFixture fx(temp);
                     auto id = fx.engine->write("notes", "seed for a path");
                     require(id.ok(), id.error());

                     auto capture = std::make_shared<CapturingObserver>();
                     obs::set_global_observer(capture);
                     // A directory in place of the log makes every append fail.
                     const auto log_path = fx.engine->workspace().audit().audit_path();
                     std::filesystem::remove(log_path);
                     std::filesystem::create_directory(log_path);

                     auto base = fx.engine->sprout("unlogged", id.value());
                     require(base.ok() && base.value() == id.value(),
                             "committed sprout reports success");
                     require(fx.engine->head("unlogged").value() == id.value(), "path exists");
                     require(capture->count_events<obs::ErrorEvent>() >= 1,
                             "audit failure surfaced as an error event");
                     require(capture->count_events<obs::PathMutationEvent>() == 1,
                             "mutation still reported");
                   }});

  tests.push_back({"observability_workspace_installs_configured_observer", [] {
                     GlobalObserverGuard guard;
                     engram::testing::TempWorkspace temp;
                     engram::testing::EngineFixture fx(temp);
                     const auto installed = obs::get_global_observer();
                     require(installed != nullptr, "workspace should install an observer");
                     require(installed->name() == "noop", "quiet config installs noop");
                   }});
}
