#pragma once

#include "engram/common/result.hpp"
#include "engram/dag/record.hpp"
#include "engram/store/sqlite_db.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram::dag {

struct PathInfo {
  std::string name;
  std::string head;
  std::string base;
  std::string created_at;
  std::string updated_at;
};

struct TraceEntry {
  std::string record_id;
  std::string timestamp;
  std::string lobe;
  std::string key;
};

/// Append-only record graph plus the named path heads pointing into it.
///
/// Records and paths persist in SQLite (`nodes`, `paths`) and are mirrored in
/// an in-memory arena keyed by id. Readers only touch the arena. Mutations go
/// through a Transaction, which becomes visible to readers after commit.
class GraphStore {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  class Transaction {
  public:
    Transaction(Transaction &&other) noexcept;
    Transaction &operator=(Transaction &&) = delete;
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    ~Transaction();

    [[nodiscard]] common::Result<bool> insert_record(const Record &record);
    [[nodiscard]] common::Status create_path(const std::string &name, const std::string &head,
                                             const std::string &base);
    [[nodiscard]] common::Status reset_path(const std::string &name, const std::string &head);
    [[nodiscard]] common::Status advance_head(const std::string &name,
                                              const std::string &expected_head,
                                              const std::string &new_head);
    [[nodiscard]] common::Status commit();

  private:
    friend class GraphStore;
    Transaction(GraphStore &store, std::unique_lock<std::mutex> lock);

    [[nodiscard]] bool record_known(const std::string &id) const;
    [[nodiscard]] std::optional<PathInfo> current_path(const std::string &name) const;

    GraphStore *store_;
    std::unique_lock<std::mutex> lock_;
    bool active_ = true;
    std::vector<std::pair<Record, std::int64_t>> staged_records_;
    std::map<std::string, PathInfo> staged_paths_;
  };

  GraphStore(Passkey, std::unique_ptr<store::SqliteDb> db) : db_(std::move(db)) {}

  [[nodiscard]] static common::Result<std::unique_ptr<GraphStore>>
  open(const std::filesystem::path &db_path, std::uint32_t busy_timeout_ms);

  [[nodiscard]] common::Result<Transaction> begin();

  [[nodiscard]] std::optional<Record> get(const std::string &id) const;
  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] bool references_cid(const std::string &cid) const;
  [[nodiscard]] std::size_t record_count() const;
  [[nodiscard]] std::vector<std::string> ids(std::size_t limit) const;

  [[nodiscard]] std::optional<PathInfo> path(const std::string &name) const;
  [[nodiscard]] std::vector<PathInfo> list_paths() const;

  [[nodiscard]] std::optional<std::size_t> ancestor_distance(const std::string &ancestor,
                                                             const std::string &descendant,
                                                             std::size_t max_depth) const;
  [[nodiscard]] bool is_ancestor(const std::string &ancestor, const std::string &descendant,
                                 std::size_t max_depth) const;

  [[nodiscard]] std::vector<TraceEntry> trace_from(const std::string &head,
                                                   std::size_t limit) const;

  [[nodiscard]] std::vector<Record> search(const std::vector<std::string> &words,
                                           std::size_t limit) const;

  [[nodiscard]] bool health_check();

private:
  struct Node {
    Record record;
    std::int64_t seq = 0;
  };

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status load();
  void publish(std::vector<std::pair<Record, std::int64_t>> records,
               std::map<std::string, PathInfo> paths);

  std::unique_ptr<store::SqliteDb> db_;
  std::mutex txn_mutex_;
  mutable std::shared_mutex arena_mutex_;
  std::unordered_map<std::string, Node> arena_;
  std::unordered_map<std::string, std::size_t> cid_refs_;
  std::map<std::string, PathInfo> paths_;
};

} // namespace engram::dag
