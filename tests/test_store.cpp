#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/common/digest.hpp"
#include "engram/dag/record.hpp"
#include "engram/store/blob_store.hpp"
#include "engram/store/fast_index.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <thread>

namespace {

namespace store = engram::store;
namespace dag = engram::dag;
namespace common = engram::common;

std::unique_ptr<store::FastIndex> open_index(const engram::testing::TempWorkspace &temp) {
  auto index = store::FastIndex::open(temp.path() / "index.db", 1000);
  if (!index.ok()) {
    throw std::runtime_error("index open failed: " + index.error());
  }
  return std::move(index.value());
}

void overwrite(const std::filesystem::path &path, const std::string &bytes) {
  std::ofstream out(path, std::ios::trunc | std::ios::binary);
  out << bytes;
}

} // namespace

void register_store_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::TempWorkspace;

  tests.push_back({"blob_put_get_dedupes", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 1024);
                     auto first = blobs.put("payload bytes");
                     require(first.ok(), first.error());
                     require(first.value().created, "first put creates the object");
                     require(first.value().cid == common::sha256_hex("payload bytes"),
                             "cid is the payload digest");
                     auto second = blobs.put("payload bytes");
                     require(second.ok() && !second.value().created, "second put is a no-op");
                     require(blobs.count().value() == 1, "one object stored");

                     auto bytes = blobs.get(first.value().cid);
                     require(bytes.ok(), bytes.error());
                     require(bytes.value() == "payload bytes", "exact bytes returned");
                     const auto path = blobs.object_path(first.value().cid);
                     require(path.parent_path().filename() == first.value().cid.substr(0, 2),
                             "objects are fanned out by prefix");
                   }});

  tests.push_back({"blob_binary_payload_exact", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 1024);
                     const std::string binary("a\0b\xff\n", 5);
                     auto put = blobs.put(binary);
                     require(put.ok(), put.error());
                     require(blobs.get(put.value().cid).value() == binary, "binary bytes kept");
                   }});

  tests.push_back({"blob_missing_is_not_found", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 1024);
                     require(blobs.get(common::sha256_hex("never stored")).code() ==
                                 common::ErrorCode::NotFound,
                             "missing object");
                     require(blobs.get("not-a-digest").code() == common::ErrorCode::NotFound,
                             "malformed key");
                   }});

  tests.push_back({"blob_corruption_detected_not_repaired", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 1024);
                     auto put = blobs.put("original");
                     require(put.ok(), put.error());
                     const auto path = blobs.object_path(put.value().cid);
                     overwrite(path, "tampered");
                     require(blobs.get(put.value().cid).code() == common::ErrorCode::IntegrityMismatch,
                             "corruption must surface");
                     require(blobs.verify(put.value().cid).code() ==
                                 common::ErrorCode::IntegrityMismatch,
                             "verify reports corruption");
                     require(std::filesystem::exists(path), "corrupt object is left in place");
                   }});

  tests.push_back({"blob_rejects_oversized_objects", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 4);
                     require(blobs.put("12345").code() == common::ErrorCode::InvalidArgument,
                             "oversized object rejected");
                     require(blobs.count().value() == 0, "nothing written");
                   }});

  tests.push_back({"blob_remove_uncommitted", [] {
                     TempWorkspace temp;
                     store::BlobStore blobs(temp.path() / "archive", 1024);
                     auto put = blobs.put("short lived");
                     require(put.ok(), put.error());
                     require(blobs.remove_uncommitted(put.value().cid).ok(), "remove");
                     require(!blobs.contains(put.value().cid), "object gone");
                   }});

  tests.push_back({"fast_index_insert_get", [] {
                     TempWorkspace temp;
                     auto index = open_index(temp);
                     const auto record =
                         dag::make_record("notes", "k", "indexed", std::nullopt, {{"source", "t"}});
                     auto inserted = index->insert(record);
                     require(inserted.ok() && inserted.value(), "first insert");
                     auto again = index->insert(record);
                     require(again.ok() && !again.value(), "duplicate insert reports existing");

                     auto loaded = index->get(record.id);
                     require(loaded.ok() && loaded.value().has_value(), "record found");
                     require(loaded.value()->payload == "indexed", "payload");
                     require(loaded.value()->tags.at("source") == "t", "tags kept");
                     require(!index->get("missing").value().has_value(), "miss is empty");
                   }});

  tests.push_back({"fast_index_lobe_stream_queries", [] {
                     TempWorkspace temp;
                     auto index = open_index(temp);
                     const auto a = dag::make_record("notes", "a", "first", std::nullopt);
                     const auto b = dag::make_record("notes", "b", "second", a.id);
                     const auto c = dag::make_record("chat", "c", "other lobe", std::nullopt);
                     for (const auto *r : {&a, &b, &c}) {
                       require(index->insert(*r).ok(), "insert");
                     }

                     require(index->latest_in_lobe("notes").value()->id == b.id, "latest in lobe");
                     require(!index->latest_in_lobe("empty").value().has_value(), "empty lobe");
                     const auto recent = index->recent("notes", 10).value();
                     require(recent == std::vector<std::string>{b.id, a.id}, "newest first");
                     require(index->recent("notes", 1).value().size() == 1, "limit");
                     require(index->find_payload_in_lobe("notes", "first").value() ==
                                 std::optional<std::string>(a.id),
                             "exact payload found");
                     require(!index->find_payload_in_lobe("chat", "first").value().has_value(),
                             "dedupe is per lobe");
                     require(index->all_ids(10).value().front() == a.id, "all ids oldest first");
                     require(index->cids(std::string("chat")).value().size() == 1, "cids per lobe");

                     const auto stats = index->stats(std::nullopt).value();
                     require(stats.total == 3, "total");
                     require(stats.by_lobe.at("notes") == 2 && stats.by_lobe.at("chat") == 1,
                             "by lobe");
                     require(!stats.last_updated.empty(), "last updated");
                     require(index->stats(std::string("chat")).value().total == 1, "lobe filter");
                   }});

  tests.push_back({"fast_index_pending_insert_rolls_back_when_dropped", [] {
                     TempWorkspace temp;
                     auto index = open_index(temp);
                     const auto record = dag::make_record("notes", "k", "temp", std::nullopt);
                     {
                       auto pending = index->begin_insert(record);
                       require(pending.ok() && pending.value().inserted(), "row staged");
                     }
                     require(index->count().value() == 0, "dropped insert leaves no row");
                     require(!index->get(record.id).value().has_value(), "not readable");
                   }});

  tests.push_back({"fast_index_pending_insert_commits", [] {
                     TempWorkspace temp;
                     auto index = open_index(temp);
                     const auto record = dag::make_record("notes", "k", "kept", std::nullopt);
                     {
                       auto pending = index->begin_insert(record);
                       require(pending.ok(), "row staged");
                       require(pending.value().commit().ok(), "commit");
                       require(!pending.value().commit().ok(), "second commit is refused");
                     }
                     require(index->get(record.id).value().has_value(), "row visible");

                     auto again = index->begin_insert(record);
                     require(again.ok() && !again.value().inserted(), "duplicate reports existing");
                     require(again.value().commit().ok(), "empty commit");
                     require(index->count().value() == 1, "still one row");
                   }});

  tests.push_back({"fast_index_readers_wait_for_pending_insert", [] {
                     TempWorkspace temp;
                     auto index = open_index(temp);
                     const auto record = dag::make_record("notes", "k", "late", std::nullopt);
                     auto pending = index->begin_insert(record);
                     require(pending.ok(), "row staged");

                     std::atomic<bool> seen{false};
                     std::thread reader([&] {
                       auto loaded = index->get(record.id);
                       seen = loaded.ok() && loaded.value().has_value();
                     });
                     std::this_thread::sleep_for(std::chrono::milliseconds(50));
                     require(pending.value().commit().ok(), "commit");
                     reader.join();
                     require(seen.load(), "reader observed the row only once committed");
                   }});

  tests.push_back({"fast_index_persists", [] {
                     TempWorkspace temp;
                     const auto record = dag::make_record("notes", "k", "durable", std::nullopt);
                     {
                       auto index = open_index(temp);
                       require(index->insert(record).ok(), "insert");
                     }
                     auto index = open_index(temp);
                     require(index->get(record.id).value().has_value(), "row survives reopen");
                     require(index->health_check(), "health check");
                   }});
}
