#include "engram/dag/graph_store.hpp"

#include "engram/common/clock.hpp"
#include "engram/common/fs.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>
#include <unordered_set>

namespace engram::dag {

using store::Statement;

common::Result<std::unique_ptr<GraphStore>> GraphStore::open(const std::filesystem::path &db_path,
                                                             const std::uint32_t busy_timeout_ms) {
  using OpenResult = common::Result<std::unique_ptr<GraphStore>>;
  auto db = store::SqliteDb::open(db_path, busy_timeout_ms);
  if (!db.ok()) {
    return OpenResult::failure(db.status());
  }

  auto graph = std::make_unique<GraphStore>(Passkey{}, std::move(db.value()));
  auto status = graph->init_schema();
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  status = graph->load();
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(graph));
}

common::Status GraphStore::init_schema() {
  auto status = db_->exec(R"(
CREATE TABLE IF NOT EXISTS nodes (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  cid TEXT NOT NULL,
  lobe TEXT NOT NULL,
  key TEXT NOT NULL,
  parent TEXT REFERENCES nodes(id),
  payload BLOB NOT NULL,
  created_at TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '{}'
);
)");
  if (!status.ok()) {
    return status;
  }
  status = db_->exec("CREATE INDEX IF NOT EXISTS nodes_parent ON nodes(parent);");
  if (!status.ok()) {
    return status;
  }
  return db_->exec(R"(
CREATE TABLE IF NOT EXISTS paths (
  name TEXT PRIMARY KEY,
  head TEXT NOT NULL REFERENCES nodes(id),
  base TEXT NOT NULL REFERENCES nodes(id),
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Status GraphStore::load() {
  std::unique_lock<std::shared_mutex> lock(arena_mutex_);
  arena_.clear();
  cid_refs_.clear();
  paths_.clear();

  Statement nodes(*db_, "SELECT seq, id, cid, lobe, key, parent, payload, created_at, tags "
                        "FROM nodes ORDER BY seq ASC");
  if (!nodes.prepared()) {
    return store::sqlite_error(*db_, "prepare node load");
  }
  int rc = SQLITE_ROW;
  while ((rc = nodes.step()) == SQLITE_ROW) {
    Node node;
    node.seq = nodes.column_int64(0);
    node.record.id = nodes.column_text(1);
    node.record.cid = nodes.column_text(2);
    node.record.lobe = nodes.column_text(3);
    node.record.key = nodes.column_text(4);
    node.record.parent = nodes.column_optional_text(5);
    node.record.payload = nodes.column_blob(6);
    node.record.created_at = nodes.column_text(7);
    node.record.tags = decode_tags(nodes.column_text(8));
    ++cid_refs_[node.record.cid];
    std::string id = node.record.id;
    arena_.emplace(std::move(id), std::move(node));
  }
  if (rc != SQLITE_DONE) {
    return store::sqlite_error(*db_, "load nodes");
  }

  Statement paths(*db_, "SELECT name, head, base, created_at, updated_at FROM paths");
  if (!paths.prepared()) {
    return store::sqlite_error(*db_, "prepare path load");
  }
  while ((rc = paths.step()) == SQLITE_ROW) {
    PathInfo info{.name = paths.column_text(0),
                  .head = paths.column_text(1),
                  .base = paths.column_text(2),
                  .created_at = paths.column_text(3),
                  .updated_at = paths.column_text(4)};
    std::string name = info.name;
    paths_.emplace(std::move(name), std::move(info));
  }
  if (rc != SQLITE_DONE) {
    return store::sqlite_error(*db_, "load paths");
  }
  return common::Status::success();
}

common::Result<GraphStore::Transaction> GraphStore::begin() {
  std::unique_lock<std::mutex> lock(txn_mutex_);
  const auto status = db_->exec("BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return common::Result<Transaction>::failure(status);
  }
  return common::Result<Transaction>::success(Transaction(*this, std::move(lock)));
}

GraphStore::Transaction::Transaction(GraphStore &store, std::unique_lock<std::mutex> lock)
    : store_(&store), lock_(std::move(lock)) {}

GraphStore::Transaction::Transaction(Transaction &&other) noexcept
    : store_(other.store_), lock_(std::move(other.lock_)), active_(other.active_),
      staged_records_(std::move(other.staged_records_)),
      staged_paths_(std::move(other.staged_paths_)) {
  other.active_ = false;
}

GraphStore::Transaction::~Transaction() {
  if (!active_) {
    return;
  }
  const auto status = store_->db_->exec("ROLLBACK;");
  if (!status.ok()) {
    observability::record_error("graph", "rollback failed: " + status.error());
  }
}

bool GraphStore::Transaction::record_known(const std::string &id) const {
  for (const auto &[record, seq] : staged_records_) {
    if (record.id == id) {
      return true;
    }
  }
  return store_->contains(id);
}

std::optional<PathInfo> GraphStore::Transaction::current_path(const std::string &name) const {
  if (const auto it = staged_paths_.find(name); it != staged_paths_.end()) {
    return it->second;
  }
  return store_->path(name);
}

common::Result<bool> GraphStore::Transaction::insert_record(const Record &record) {
  if (!active_) {
    return common::Result<bool>::failure(common::ErrorCode::Internal, "transaction is closed");
  }
  if (record_known(record.id)) {
    return common::Result<bool>::success(false);
  }
  if (record.parent.has_value() && !record_known(*record.parent)) {
    return common::Result<bool>::failure(common::ErrorCode::NotFound,
                                         "parent " + *record.parent + " does not exist");
  }

  auto &db = *store_->db_;
  Statement stmt(db, R"(
INSERT INTO nodes(id, cid, lobe, key, parent, payload, created_at, tags)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
)");
  if (!stmt.prepared()) {
    return common::Result<bool>::failure(store::sqlite_error(db, "prepare node insert"));
  }
  stmt.bind_text(1, record.id);
  stmt.bind_text(2, record.cid);
  stmt.bind_text(3, record.lobe);
  stmt.bind_text(4, record.key);
  stmt.bind_optional_text(5, record.parent);
  stmt.bind_blob(6, record.payload);
  stmt.bind_text(7, record.created_at);
  stmt.bind_text(8, encode_tags(record.tags));
  if (stmt.step() != SQLITE_DONE) {
    return common::Result<bool>::failure(store::sqlite_error(db, "insert node " + record.id));
  }
  staged_records_.emplace_back(record, sqlite3_last_insert_rowid(db.handle()));
  return common::Result<bool>::success(true);
}

common::Status GraphStore::Transaction::create_path(const std::string &name,
                                                    const std::string &head,
                                                    const std::string &base) {
  if (!record_known(head) || !record_known(base)) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "path '" + name + "' would point at an unknown record");
  }

  auto &db = *store_->db_;
  const std::string now = common::now_rfc3339();
  Statement stmt(db, R"(
INSERT INTO paths(name, head, base, created_at, updated_at) VALUES(?1, ?2, ?3, ?4, ?4)
ON CONFLICT(name) DO NOTHING
)");
  if (!stmt.prepared()) {
    return store::sqlite_error(db, "prepare path insert");
  }
  stmt.bind_text(1, name);
  stmt.bind_text(2, head);
  stmt.bind_text(3, base);
  stmt.bind_text(4, now);
  if (stmt.step() != SQLITE_DONE) {
    return store::sqlite_error(db, "create path " + name);
  }
  if (sqlite3_changes(db.handle()) == 0) {
    return common::Status::error(common::ErrorCode::ConcurrentWriteConflict,
                                 "path '" + name + "' was created concurrently");
  }
  staged_paths_[name] =
      PathInfo{.name = name, .head = head, .base = base, .created_at = now, .updated_at = now};
  return common::Status::success();
}

common::Status GraphStore::Transaction::reset_path(const std::string &name,
                                                   const std::string &head) {
  if (!record_known(head)) {
    return common::Status::error(common::ErrorCode::NotFound, "record " + head + " not found");
  }

  auto &db = *store_->db_;
  const std::string now = common::now_rfc3339();
  Statement stmt(db, R"(
INSERT INTO paths(name, head, base, created_at, updated_at) VALUES(?1, ?2, ?2, ?3, ?3)
ON CONFLICT(name) DO UPDATE SET head = excluded.head, base = excluded.base,
  updated_at = excluded.updated_at
)");
  if (!stmt.prepared()) {
    return store::sqlite_error(db, "prepare path reset");
  }
  stmt.bind_text(1, name);
  stmt.bind_text(2, head);
  stmt.bind_text(3, now);
  if (stmt.step() != SQLITE_DONE) {
    return store::sqlite_error(db, "reset path " + name);
  }

  const auto existing = current_path(name);
  staged_paths_[name] = PathInfo{.name = name,
                                 .head = head,
                                 .base = head,
                                 .created_at = existing.has_value() ? existing->created_at : now,
                                 .updated_at = now};
  return common::Status::success();
}

common::Status GraphStore::Transaction::advance_head(const std::string &name,
                                                     const std::string &expected_head,
                                                     const std::string &new_head) {
  if (!record_known(new_head)) {
    return common::Status::error(common::ErrorCode::NotFound, "record " + new_head + " not found");
  }

  auto &db = *store_->db_;
  const std::string now = common::now_rfc3339();
  Statement stmt(db, "UPDATE paths SET head = ?1, updated_at = ?2 WHERE name = ?3 AND head = ?4");
  if (!stmt.prepared()) {
    return store::sqlite_error(db, "prepare head update");
  }
  stmt.bind_text(1, new_head);
  stmt.bind_text(2, now);
  stmt.bind_text(3, name);
  stmt.bind_text(4, expected_head);
  if (stmt.step() != SQLITE_DONE) {
    return store::sqlite_error(db, "advance head of " + name);
  }
  if (sqlite3_changes(db.handle()) == 0) {
    return common::Status::error(common::ErrorCode::ConcurrentWriteConflict,
                                 "head of '" + name + "' moved since it was read");
  }

  auto info = current_path(name);
  if (!info.has_value()) {
    return common::Status::error(common::ErrorCode::Internal,
                                 "path '" + name + "' updated but not cached");
  }
  info->head = new_head;
  info->updated_at = now;
  staged_paths_[name] = std::move(*info);
  return common::Status::success();
}

common::Status GraphStore::Transaction::commit() {
  if (!active_) {
    return common::Status::error(common::ErrorCode::Internal, "transaction is closed");
  }
  const auto status = store_->db_->exec("COMMIT;");
  if (!status.ok()) {
    return status;
  }
  active_ = false;
  store_->publish(std::move(staged_records_), std::move(staged_paths_));
  lock_.unlock();
  return common::Status::success();
}

void GraphStore::publish(std::vector<std::pair<Record, std::int64_t>> records,
                         std::map<std::string, PathInfo> paths) {
  std::unique_lock<std::shared_mutex> lock(arena_mutex_);
  for (auto &[record, seq] : records) {
    ++cid_refs_[record.cid];
    std::string id = record.id;
    arena_.emplace(std::move(id), Node{.record = std::move(record), .seq = seq});
  }
  for (auto &[name, info] : paths) {
    paths_[name] = std::move(info);
  }
}

std::optional<Record> GraphStore::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  const auto it = arena_.find(id);
  if (it == arena_.end()) {
    return std::nullopt;
  }
  return it->second.record;
}

bool GraphStore::contains(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  return arena_.contains(id);
}

bool GraphStore::references_cid(const std::string &cid) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  return cid_refs_.contains(cid);
}

std::size_t GraphStore::record_count() const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  return arena_.size();
}

std::vector<std::string> GraphStore::ids(const std::size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  std::vector<const Node *> nodes;
  nodes.reserve(arena_.size());
  for (const auto &[id, node] : arena_) {
    nodes.push_back(&node);
  }
  std::sort(nodes.begin(), nodes.end(),
            [](const Node *lhs, const Node *rhs) { return lhs->seq < rhs->seq; });

  std::vector<std::string> out;
  for (std::size_t i = 0; i < nodes.size() && i < limit; ++i) {
    out.push_back(nodes[i]->record.id);
  }
  return out;
}

std::optional<PathInfo> GraphStore::path(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  const auto it = paths_.find(name);
  if (it == paths_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PathInfo> GraphStore::list_paths() const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  std::vector<PathInfo> out;
  out.reserve(paths_.size());
  for (const auto &[name, info] : paths_) {
    out.push_back(info);
  }
  return out;
}

std::optional<std::size_t> GraphStore::ancestor_distance(const std::string &ancestor,
                                                         const std::string &descendant,
                                                         const std::size_t max_depth) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  std::string current = descendant;
  for (std::size_t depth = 0; depth <= max_depth; ++depth) {
    if (current == ancestor) {
      return depth;
    }
    const auto it = arena_.find(current);
    if (it == arena_.end() || !it->second.record.parent.has_value()) {
      return std::nullopt;
    }
    current = *it->second.record.parent;
  }
  return std::nullopt;
}

bool GraphStore::is_ancestor(const std::string &ancestor, const std::string &descendant,
                             const std::size_t max_depth) const {
  return ancestor_distance(ancestor, descendant, max_depth).has_value();
}

std::vector<TraceEntry> GraphStore::trace_from(const std::string &head,
                                               const std::size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  std::vector<TraceEntry> out;
  std::unordered_set<std::string> visited;
  std::optional<std::string> current = head;
  while (current.has_value() && out.size() < limit) {
    if (!visited.insert(*current).second) {
      break;
    }
    const auto it = arena_.find(*current);
    if (it == arena_.end()) {
      break;
    }
    const Record &record = it->second.record;
    out.push_back(TraceEntry{.record_id = record.id,
                             .timestamp = record.created_at,
                             .lobe = record.lobe,
                             .key = record.key});
    current = record.parent;
  }
  return out;
}

std::vector<Record> GraphStore::search(const std::vector<std::string> &words,
                                       const std::size_t limit) const {
  std::vector<std::string> needles;
  for (const auto &word : words) {
    if (auto lowered = common::to_lower(common::trim(word)); !lowered.empty()) {
      needles.push_back(std::move(lowered));
    }
  }
  if (needles.empty() || limit == 0) {
    return {};
  }

  std::vector<const Node *> hits;
  std::shared_lock<std::shared_mutex> lock(arena_mutex_);
  for (const auto &[id, node] : arena_) {
    const std::string haystack = common::to_lower(node.record.payload);
    const bool all = std::all_of(needles.begin(), needles.end(), [&](const std::string &needle) {
      return haystack.find(needle) != std::string::npos;
    });
    if (all) {
      hits.push_back(&node);
    }
  }
  std::sort(hits.begin(), hits.end(),
            [](const Node *lhs, const Node *rhs) { return lhs->seq > rhs->seq; });

  std::vector<Record> out;
  for (std::size_t i = 0; i < hits.size() && i < limit; ++i) {
    out.push_back(hits[i]->record);
  }
  return out;
}

bool GraphStore::health_check() {
  std::lock_guard<std::mutex> lock(txn_mutex_);
  return db_->exec("SELECT 1 FROM nodes LIMIT 1;").ok();
}

} // namespace engram::dag
