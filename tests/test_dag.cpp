#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/common/digest.hpp"
#include "engram/dag/graph_store.hpp"
#include "engram/dag/path_name.hpp"
#include "engram/dag/record.hpp"

namespace {

namespace dag = engram::dag;
namespace common = engram::common;

std::unique_ptr<dag::GraphStore> open_graph(const engram::testing::TempWorkspace &temp) {
  auto graph = dag::GraphStore::open(temp.path() / "graph.db", 1000);
  if (!graph.ok()) {
    throw std::runtime_error("graph open failed: " + graph.error());
  }
  return std::move(graph.value());
}

void insert(dag::GraphStore &graph, const dag::Record &record) {
  auto txn = graph.begin();
  if (!txn.ok()) {
    throw std::runtime_error(txn.error());
  }
  const auto inserted = txn.value().insert_record(record);
  if (!inserted.ok()) {
    throw std::runtime_error(inserted.error());
  }
  const auto committed = txn.value().commit();
  if (!committed.ok()) {
    throw std::runtime_error(committed.error());
  }
}

/// root <- a <- b, returned in that order.
std::vector<dag::Record> chain(dag::GraphStore &graph, const std::string &prefix, std::size_t n,
                               std::optional<std::string> parent = std::nullopt) {
  std::vector<dag::Record> out;
  for (std::size_t i = 0; i < n; ++i) {
    auto record = dag::make_record("notes", prefix + std::to_string(i),
                                   prefix + " payload " + std::to_string(i), parent);
    insert(graph, record);
    parent = record.id;
    out.push_back(std::move(record));
  }
  return out;
}

} // namespace

void register_dag_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::TempWorkspace;

  tests.push_back({"dag_record_id_recomputes", [] {
                     const auto record = dag::make_record("notes", "k", "hello", std::nullopt,
                                                          {{"source", "unit"}});
                     require(common::is_sha256_hex(record.id), "id is a digest");
                     require(record.cid == common::sha256_hex("hello"), "cid is payload digest");
                     require(dag::verify_record(record), "stored fields reproduce the id");
                     require(record.id == dag::compute_record_id("notes", "k", std::nullopt, "hello"),
                             "id ignores tags and created_at");
                   }});

  tests.push_back({"dag_record_id_depends_on_essential_fields", [] {
                     const auto base = dag::compute_record_id("notes", "k", std::nullopt, "hello");
                     require(base != dag::compute_record_id("chat", "k", std::nullopt, "hello"),
                             "lobe is essential");
                     require(base != dag::compute_record_id("notes", "k2", std::nullopt, "hello"),
                             "key is essential");
                     require(base != dag::compute_record_id("notes", "k", std::string("p"), "hello"),
                             "parent is essential");
                     // Length framing keeps field boundaries unambiguous.
                     require(dag::compute_record_id("ab", "c", std::nullopt, "x") !=
                                 dag::compute_record_id("a", "bc", std::nullopt, "x"),
                             "framing must separate fields");
                   }});

  tests.push_back({"dag_record_tamper_detected", [] {
                     auto record = dag::make_record("notes", "k", "hello", std::nullopt);
                     record.payload = "hellO";
                     require(!dag::verify_record(record), "payload change must break the id");
                   }});

  tests.push_back({"dag_tags_encode_decode", [] {
                     const dag::Tags tags{{"op", "append"}, {"note", "quote \" and\nnewline"}};
                     require(dag::decode_tags(dag::encode_tags(tags)) == tags, "tags round trip");
                     require(dag::decode_tags("{}").empty(), "empty object");
                   }});

  tests.push_back({"dag_path_name_normalization", [] {
                     const auto a = dag::normalize_path_name("feature-x");
                     const auto b = dag::normalize_path_name("feature_x");
                     const auto c = dag::normalize_path_name("  Feature X!! ");
                     require(a.ok() && b.ok() && c.ok(), "names should normalize");
                     require(a.value() == "feature-x", "canonical form");
                     require(a.value() == b.value() && b.value() == c.value(), "equivalent names");
                     require(dag::normalize_path_name("a__b--c").value() == "a-b-c",
                             "runs collapse");
                   }});

  tests.push_back({"dag_path_name_drops_non_ascii", [] {
                     const auto upper = dag::normalize_path_name("CAF\xC3\x89");
                     const auto lower = dag::normalize_path_name("caf\xC3\xA9");
                     require(upper.ok() && lower.ok(), "names should normalize");
                     require(upper.value() == "caf" && lower.value() == "caf",
                             "accented spellings resolve to one path");
                     const auto invalid = dag::normalize_path_name("a\xff\xfe");
                     require(invalid.ok() && invalid.value() == "a", "invalid utf-8 is dropped");
                     require(dag::normalize_path_name("Caf\xC3\xA9 Notes").value() == "caf-notes",
                             "separators kept around dropped bytes");
                     require(dag::normalize_path_name("\xC3\xA9\xC3\xA9").code() ==
                                 common::ErrorCode::InvalidPath,
                             "nothing ascii left");
                   }});

  tests.push_back({"dag_path_name_idempotent", [] {
                     for (const std::string name :
                          {"Hello World", "--x--", "Caf\xC3\xA9 Notes", "a.b.c", "UPPER_case"}) {
                       const auto once = dag::normalize_path_name(name);
                       require(once.ok(), once.error());
                       const auto twice = dag::normalize_path_name(once.value());
                       require(twice.ok() && twice.value() == once.value(),
                               "normalize must be idempotent for " + name);
                     }
                   }});

  tests.push_back({"dag_path_name_invalid", [] {
                     require(dag::normalize_path_name("").code() == common::ErrorCode::InvalidPath,
                             "empty name");
                     require(dag::normalize_path_name("!!!").code() == common::ErrorCode::InvalidPath,
                             "punctuation only");
                     require(dag::normalize_path_name(std::string(129, 'a')).code() ==
                                 common::ErrorCode::InvalidPath,
                             "too long");
                     require(dag::normalize_path_name(std::string(128, 'a')).ok(),
                             "128 bytes is allowed");
                   }});

  tests.push_back({"graph_insert_requires_parent", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto orphan =
                         dag::make_record("notes", "k", "orphan", std::string(64, 'f'));
                     auto txn = graph->begin();
                     require(txn.ok(), txn.error());
                     const auto inserted = txn.value().insert_record(orphan);
                     require(inserted.code() == common::ErrorCode::NotFound,
                             "missing parent must be rejected");
                   }});

  tests.push_back({"graph_duplicate_insert_reports_existing", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto record = dag::make_record("notes", "k", "once", std::nullopt);
                     insert(*graph, record);
                     auto txn = graph->begin();
                     require(txn.ok(), txn.error());
                     const auto again = txn.value().insert_record(record);
                     require(again.ok() && !again.value(), "duplicate insert returns false");
                     require(graph->record_count() == 1, "still one record");
                   }});

  tests.push_back({"graph_uncommitted_transaction_rolls_back", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto record = dag::make_record("notes", "k", "draft", std::nullopt);
                     {
                       auto txn = graph->begin();
                       require(txn.ok(), txn.error());
                       require(txn.value().insert_record(record).ok(), "staged insert");
                       require(txn.value().reset_path("draft", record.id).ok(), "staged path");
                     }
                     require(!graph->contains(record.id), "rolled back record not visible");
                     require(!graph->path("draft").has_value(), "rolled back path not visible");
                     graph.reset();
                     auto reopened = open_graph(temp);
                     require(reopened->record_count() == 0, "nothing persisted");
                   }});

  tests.push_back({"graph_head_cas", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto records = chain(*graph, "r", 3);
                     {
                       auto txn = graph->begin();
                       require(txn.ok(), txn.error());
                       require(txn.value().reset_path("main", records[0].id).ok(), "sprout");
                       require(txn.value().commit().ok(), "commit");
                     }
                     {
                       auto txn = graph->begin();
                       require(txn.ok(), txn.error());
                       require(txn.value().advance_head("main", records[0].id, records[1].id).ok(),
                               "advance from observed head");
                       require(txn.value().commit().ok(), "commit");
                     }
                     {
                       auto txn = graph->begin();
                       require(txn.ok(), txn.error());
                       const auto stale =
                           txn.value().advance_head("main", records[0].id, records[2].id);
                       require(stale.code() == common::ErrorCode::ConcurrentWriteConflict,
                               "stale expected head must conflict");
                     }
                     const auto info = graph->path("main");
                     require(info.has_value() && info->head == records[1].id, "head unchanged");
                     require(info->base == records[0].id, "base is the seed");
                   }});

  tests.push_back({"graph_create_path_conflicts_when_present", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto records = chain(*graph, "r", 1);
                     auto txn = graph->begin();
                     require(txn.ok(), txn.error());
                     require(txn.value().create_path("cortex", records[0].id, records[0].id).ok(),
                             "first create");
                     require(txn.value().create_path("cortex", records[0].id, records[0].id).code() ==
                                 common::ErrorCode::ConcurrentWriteConflict,
                             "second create conflicts");
                   }});

  tests.push_back({"graph_ancestry_bounded", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto records = chain(*graph, "r", 5);
                     require(graph->ancestor_distance(records[0].id, records[4].id, 10) ==
                                 std::optional<std::size_t>(4),
                             "distance along the chain");
                     require(graph->is_ancestor(records[2].id, records[2].id, 0),
                             "a record is its own ancestor");
                     require(!graph->is_ancestor(records[0].id, records[4].id, 3),
                             "depth bound respected");
                     require(!graph->is_ancestor(records[4].id, records[0].id, 10),
                             "descendant is not an ancestor");
                   }});

  tests.push_back({"graph_trace_order_and_limit", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto records = chain(*graph, "r", 4);
                     const auto trace = graph->trace_from(records[3].id, 10);
                     require(trace.size() == 4, "trace stops at the root");
                     for (std::size_t i = 0; i < trace.size(); ++i) {
                       require(trace[i].record_id == records[3 - i].id, "newest to oldest");
                     }
                     require(graph->trace_from(records[3].id, 2).size() == 2, "limit respected");
                     require(graph->trace_from(records[3].id, 0).empty(), "zero limit");
                   }});

  tests.push_back({"graph_reload_from_disk", [] {
                     TempWorkspace temp;
                     std::vector<dag::Record> records;
                     {
                       auto graph = open_graph(temp);
                       records = chain(*graph, "r", 3);
                       auto txn = graph->begin();
                       require(txn.ok(), txn.error());
                       require(txn.value().reset_path("main", records[2].id).ok(), "path");
                       require(txn.value().commit().ok(), "commit");
                     }
                     auto graph = open_graph(temp);
                     require(graph->record_count() == 3, "records reloaded");
                     const auto loaded = graph->get(records[1].id);
                     require(loaded.has_value() && loaded->payload == records[1].payload,
                             "payload reloaded");
                     require(dag::verify_record(*loaded), "reloaded record verifies");
                     require(graph->path("main").has_value(), "path reloaded");
                     require(graph->ids(10).front() == records[0].id, "ids in commit order");
                     require(graph->references_cid(records[0].cid), "cid references rebuilt");
                   }});

  tests.push_back({"graph_search_case_insensitive_newest_first", [] {
                     TempWorkspace temp;
                     auto graph = open_graph(temp);
                     const auto first = dag::make_record("notes", "a", "Rust and C++ notes", std::nullopt);
                     insert(*graph, first);
                     const auto second = dag::make_record("notes", "b", "more c++ NOTES here", first.id);
                     insert(*graph, second);
                     insert(*graph, dag::make_record("notes", "c", "unrelated", second.id));

                     const auto hits = graph->search({"notes", "C++"}, 10);
                     require(hits.size() == 2, "two records contain both words");
                     require(hits[0].id == second.id, "newest first");
                     require(graph->search({"notes"}, 1).size() == 1, "limit respected");
                   }});
}
