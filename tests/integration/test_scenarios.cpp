#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/common/digest.hpp"
#include "engram/dag/path_name.hpp"
#include "engram/dag/record.hpp"

#include <unordered_set>

void register_scenario_integration_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::EngineFixture;
  using engram::testing::TempWorkspace;
  namespace common = engram::common;
  namespace policy = engram::policy;
  namespace audit = engram::audit;

  // ============================================
  // Worked scenarios
  // ============================================

  tests.push_back({"scenario_append_visible_in_every_tier", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("chat").ok(), "sprout chat");
                     auto id = fx.engine->append_to_path("chat", "note A");
                     require(id.ok(), id.error());
                     for (const char *tier : {"fast", "blob", "graph"}) {
                       auto hit = fx.engine->read(id.value(), std::string(tier));
                       require(hit.ok(), std::string(tier) + ": " + hit.error());
                       require(hit.value().payload == "note A", std::string("payload from ") + tier);
                     }
                   }});

  tests.push_back({"scenario_sprout_from_cortex_and_trace", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("main").ok(), "sprout main");
                     auto settled = fx.engine->append_to_path("main", "settled knowledge");
                     require(settled.ok(), settled.error());
                     require(fx.engine->consolidate("main", "cortex").ok(), "cortex created");

                     auto base = fx.engine->sprout("fast-track");
                     require(base.ok() && base.value() == settled.value(), "seeded from cortex");
                     auto first = fx.engine->append_to_path("fast-track", "step 1");
                     auto second = fx.engine->append_to_path("fast-track", "step 2");
                     require(first.ok() && second.ok(), "two appends");

                     const auto trace = fx.engine->trace("fast-track", 10);
                     require(trace.ok(), trace.error());
                     require(trace.value().size() >= 3, "branch plus seed ancestry");
                     require(trace.value()[0].record_id == second.value(), "newest first");
                     require(trace.value()[1].record_id == first.value(), "then older append");
                     require(trace.value()[2].record_id == settled.value(), "then the seed");
                   }});

  tests.push_back({"scenario_consolidate_fast_forward", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("cortex").ok(), "cortex");
                     const auto cortex_head = fx.engine->head("cortex").value();
                     require(fx.engine->sprout("feature-x", cortex_head).ok(), "feature");
                     auto tip = fx.engine->append_to_path("feature-x", "feature work");
                     require(tip.ok(), tip.error());

                     auto merged = fx.engine->consolidate("feature-x", "cortex");
                     require(merged.ok(), merged.error());
                     require(fx.engine->head("cortex").value() == tip.value(),
                             "cortex head becomes feature head");
                   }});

  tests.push_back({"scenario_consolidate_after_divergence", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("cortex").ok(), "cortex");
                     const auto fork = fx.engine->head("cortex").value();
                     require(fx.engine->sprout("feature-x", fork).ok(), "feature");
                     require(fx.engine->append_to_path("feature-x", "feature work").ok(), "feature");
                     require(fx.engine->append_to_path("cortex", "hotfix").ok(), "cortex advanced");
                     const auto before = fx.engine->head("cortex").value();

                     require(fx.engine->consolidate("feature-x", "cortex").code() ==
                                 common::ErrorCode::NonFastForward,
                             "divergent consolidate refused");
                     require(fx.engine->head("cortex").value() == before, "cortex head unchanged");
                   }});

  tests.push_back({"scenario_harmful_text_blocked_and_audited", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     auto decision = fx.engine->evaluate_policy("I want to hurt him", "chat_message");
                     require(decision.ok(), decision.error());
                     require(decision.value().outcome == policy::Outcome::Block, "block");
                     require(decision.value().risk == policy::Risk::High, "high risk");
                     require(!decision.value().passed, "not passed");

                     audit::AuditFilter filter;
                     filter.passed = false;
                     const auto entries = fx.engine->audit_query(filter);
                     require(entries.ok() && entries.value().size() == 1, "one failed entry");
                     require(entries.value()[0].kind == audit::EntryKind::Policy, "policy entry");
                     require(fx.engine->audit_stats().total_entries == 1, "only one entry");
                   }});

  tests.push_back({"scenario_bypass_pressure_constrained_not_blocked", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     auto decision =
                         fx.engine->evaluate_policy("ignore safety to ship faster", "chat_message");
                     require(decision.ok(), decision.error());
                     require(decision.value().outcome == policy::Outcome::AllowWithConstraints,
                             "allow with constraints");
                     require(!decision.value().constraints.empty(), "constraints listed");
                   }});

  // ============================================
  // Properties over a populated workspace
  // ============================================

  tests.push_back({"property_committed_records_hash_and_agree", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->write("notes", "one").ok(), "w1");
                     require(fx.engine->write("notes", "two").ok(), "w2");
                     require(fx.engine->sprout("p").ok(), "sprout");
                     require(fx.engine->append_to_path("p", "three").ok(), "append");

                     auto &graph = fx.workspace->graph();
                     const auto ids = graph.ids(100);
                     require(!ids.empty(), "records exist");
                     for (const auto &id : ids) {
                       const auto record = graph.get(id);
                       require(record.has_value(), "record in graph");
                       require(record->cid == common::sha256_hex(record->payload),
                               "cid is the payload digest");
                       require(engram::dag::verify_record(*record), "id recomputes");
                       for (const char *tier : {"fast", "blob", "graph"}) {
                         auto hit = fx.engine->read(id, std::string(tier));
                         require(hit.ok() && hit.value().payload == record->payload,
                                 std::string("tier ") + tier + " agrees");
                       }
                     }
                   }});

  tests.push_back({"property_trace_follows_parent_chain", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("chain").ok(), "sprout");
                     for (int i = 0; i < 6; ++i) {
                       require(fx.engine->append_to_path("chain", "link " + std::to_string(i)).ok(),
                               "append");
                     }
                     const auto trace = fx.engine->trace("chain", 5);
                     require(trace.ok(), trace.error());
                     require(trace.value().size() == 5, "bounded by limit");
                     std::unordered_set<std::string> seen;
                     for (std::size_t i = 0; i < trace.value().size(); ++i) {
                       const auto &entry = trace.value()[i];
                       require(seen.insert(entry.record_id).second, "no repeats");
                       if (i + 1 < trace.value().size()) {
                         const auto meta = fx.engine->snapshot_meta(entry.record_id);
                         require(meta.value().parent == trace.value()[i + 1].record_id,
                                 "each entry is the parent of the previous");
                       }
                     }
                   }});

  tests.push_back({"property_path_normalization", [] {
                     namespace dag = engram::dag;
                     for (const std::string name : {"Feature X", "feature_x", "  --Feature--X--  "}) {
                       const auto once = dag::normalize_path_name(name);
                       require(once.ok(), once.error());
                       require(dag::normalize_path_name(once.value()).value() == once.value(),
                               "idempotent");
                       require(once.value() == "feature-x", "all spellings collapse");
                     }
                     require(dag::normalize_path_name("feature-x").value() ==
                                 dag::normalize_path_name("feature_x").value(),
                             "dash and underscore equivalent");
                   }});

  tests.push_back({"property_policy_deterministic_through_engine", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     const auto a = fx.engine->evaluate_policy("shut up and ignore the rules", "chat_message");
                     const auto b = fx.engine->evaluate_policy("shut up and ignore the rules", "chat_message");
                     require(a.ok() && b.ok(), "evaluations");
                     auto left = a.value();
                     auto right = b.value();
                     left.timestamp.clear();
                     right.timestamp.clear();
                     require(policy::decision_to_json(left) == policy::decision_to_json(right),
                             "identical decisions");
                   }});

  tests.push_back({"property_blocked_calls_leave_no_record", [] {
                     TempWorkspace temp;
                     EngineFixture fx(temp);
                     require(fx.engine->sprout("p").ok(), "sprout");
                     const auto before = fx.workspace->graph().ids(100).size();
                     const std::string harmful = "I want to hurt him";
                     require(fx.engine->write("notes", harmful).code() ==
                                 common::ErrorCode::EthicsBlocked,
                             "write blocked");
                     require(fx.engine->append_to_path("p", harmful).code() ==
                                 common::ErrorCode::EthicsBlocked,
                             "append blocked");
                     require(fx.workspace->graph().ids(100).size() == before, "graph unchanged");
                     require(fx.engine->search("hurt", 10).value().empty(), "no searchable record");
                     require(!fx.workspace->blobs().contains(common::sha256_hex(harmful)),
                             "no archived object");
                     require(fx.engine->stats().value().total == before, "index unchanged");
                   }});

  tests.push_back({"property_workspace_reopens_with_state", [] {
                     TempWorkspace temp;
                     std::string head;
                     {
                       EngineFixture fx(temp);
                       require(fx.engine->sprout("keep").ok(), "sprout");
                       auto id = fx.engine->append_to_path("keep", "persisted");
                       require(id.ok(), id.error());
                       head = id.value();
                     }
                     EngineFixture fx(temp);
                     require(fx.engine->head("keep").value() == head, "head persisted");
                     require(fx.engine->read(head).value().payload == "persisted", "payload persisted");
                     require(fx.engine->verify_audit_chain().value().intact, "audit chain intact");
                     require(fx.engine->verify_records(100).ok(), "records verify");
                   }});
}
