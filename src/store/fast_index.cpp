#include "engram/store/fast_index.hpp"

#include "engram/common/digest.hpp"
#include "engram/observability/global.hpp"

namespace engram::store {

namespace {

constexpr const char *RECORD_COLUMNS =
    "id, cid, lobe, key, parent, payload, created_at, tags";

} // namespace

common::Result<std::unique_ptr<FastIndex>> FastIndex::open(const std::filesystem::path &db_path,
                                                           const std::uint32_t busy_timeout_ms) {
  using OpenResult = common::Result<std::unique_ptr<FastIndex>>;
  auto db = SqliteDb::open(db_path, busy_timeout_ms);
  if (!db.ok()) {
    return OpenResult::failure(db.status());
  }

  auto index = std::make_unique<FastIndex>(Passkey{}, std::move(db.value()));
  const auto status = index->init_schema();
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(index));
}

common::Status FastIndex::init_schema() {
  auto status = db_->exec(R"(
CREATE TABLE IF NOT EXISTS records (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  cid TEXT NOT NULL,
  lobe TEXT NOT NULL,
  key TEXT NOT NULL,
  parent TEXT,
  payload BLOB NOT NULL,
  created_at TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '{}'
);
)");
  if (!status.ok()) {
    return status;
  }
  status = db_->exec("CREATE INDEX IF NOT EXISTS records_lobe ON records(lobe, seq);");
  if (!status.ok()) {
    return status;
  }
  return db_->exec("CREATE INDEX IF NOT EXISTS records_cid ON records(cid);");
}

dag::Record FastIndex::row_to_record(const Statement &stmt) {
  dag::Record record;
  record.id = stmt.column_text(0);
  record.cid = stmt.column_text(1);
  record.lobe = stmt.column_text(2);
  record.key = stmt.column_text(3);
  record.parent = stmt.column_optional_text(4);
  record.payload = stmt.column_blob(5);
  record.created_at = stmt.column_text(6);
  record.tags = dag::decode_tags(stmt.column_text(7));
  return record;
}

common::Result<std::optional<dag::Record>> FastIndex::fetch_one(Statement &stmt,
                                                                const std::string &context) {
  using FetchResult = common::Result<std::optional<dag::Record>>;
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return FetchResult::success(row_to_record(stmt));
  }
  if (rc == SQLITE_DONE) {
    return FetchResult::success(std::nullopt);
  }
  return FetchResult::failure(sqlite_error(*db_, context));
}

FastIndex::PendingInsert::PendingInsert(FastIndex &index, std::unique_lock<std::mutex> lock,
                                        const bool inserted)
    : index_(&index), lock_(std::move(lock)), inserted_(inserted) {}

FastIndex::PendingInsert::PendingInsert(PendingInsert &&other) noexcept
    : index_(other.index_), lock_(std::move(other.lock_)), active_(other.active_),
      inserted_(other.inserted_) {
  other.active_ = false;
}

FastIndex::PendingInsert::~PendingInsert() {
  if (!active_) {
    return;
  }
  const auto status = index_->db_->exec("ROLLBACK;");
  if (!status.ok()) {
    observability::record_error("fast_index", "rollback failed: " + status.error());
  }
}

common::Status FastIndex::PendingInsert::commit() {
  if (!active_) {
    return common::Status::error(common::ErrorCode::Internal, "index insert is closed");
  }
  const auto status = index_->db_->exec("COMMIT;");
  if (!status.ok()) {
    return status;
  }
  active_ = false;
  lock_.unlock();
  return common::Status::success();
}

common::Result<bool> FastIndex::insert(const dag::Record &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return insert_row(record);
}

common::Result<FastIndex::PendingInsert> FastIndex::begin_insert(const dag::Record &record) {
  using PendingResult = common::Result<PendingInsert>;
  std::unique_lock<std::mutex> lock(mutex_);
  const auto status = db_->exec("BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return PendingResult::failure(status);
  }
  auto inserted = insert_row(record);
  if (!inserted.ok()) {
    if (const auto rolled_back = db_->exec("ROLLBACK;"); !rolled_back.ok()) {
      observability::record_error("fast_index", "rollback failed: " + rolled_back.error());
    }
    return PendingResult::failure(inserted.status());
  }
  return PendingResult::success(PendingInsert(*this, std::move(lock), inserted.value()));
}

common::Result<bool> FastIndex::insert_row(const dag::Record &record) {
  Statement stmt(*db_, R"(
INSERT INTO records(id, cid, lobe, key, parent, payload, created_at, tags)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
ON CONFLICT(id) DO NOTHING
)");
  if (!stmt.prepared()) {
    return common::Result<bool>::failure(sqlite_error(*db_, "prepare insert"));
  }
  stmt.bind_text(1, record.id);
  stmt.bind_text(2, record.cid);
  stmt.bind_text(3, record.lobe);
  stmt.bind_text(4, record.key);
  stmt.bind_optional_text(5, record.parent);
  stmt.bind_blob(6, record.payload);
  stmt.bind_text(7, record.created_at);
  stmt.bind_text(8, dag::encode_tags(record.tags));
  if (stmt.step() != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite_error(*db_, "insert record " + record.id));
  }
  return common::Result<bool>::success(sqlite3_changes(db_->handle()) > 0);
}

common::Result<std::optional<dag::Record>> FastIndex::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM records WHERE id = ?1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.prepared()) {
    return common::Result<std::optional<dag::Record>>::failure(sqlite_error(*db_, "prepare get"));
  }
  stmt.bind_text(1, id);
  return fetch_one(stmt, "get " + id);
}

common::Result<std::optional<dag::Record>> FastIndex::latest_in_lobe(const std::string &lobe) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql = std::string("SELECT ") + RECORD_COLUMNS +
                          " FROM records WHERE lobe = ?1 ORDER BY seq DESC LIMIT 1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.prepared()) {
    return common::Result<std::optional<dag::Record>>::failure(
        sqlite_error(*db_, "prepare latest_in_lobe"));
  }
  stmt.bind_text(1, lobe);
  return fetch_one(stmt, "latest in lobe " + lobe);
}

common::Result<std::optional<std::string>>
FastIndex::find_payload_in_lobe(const std::string &lobe, const std::string &payload) {
  using FindResult = common::Result<std::optional<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  // cid narrows the scan; the payload comparison guards against collisions.
  Statement stmt(*db_, R"(
SELECT id, payload FROM records WHERE lobe = ?1 AND cid = ?2 ORDER BY seq DESC
)");
  if (!stmt.prepared()) {
    return FindResult::failure(sqlite_error(*db_, "prepare dedupe lookup"));
  }
  stmt.bind_text(1, lobe);
  stmt.bind_text(2, common::sha256_hex(payload));
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    if (stmt.column_blob(1) == payload) {
      return FindResult::success(stmt.column_text(0));
    }
  }
  if (rc == SQLITE_DONE) {
    return FindResult::success(std::nullopt);
  }
  return FindResult::failure(sqlite_error(*db_, "dedupe lookup"));
}

common::Result<std::vector<std::string>> FastIndex::recent(const std::string &lobe,
                                                           const std::size_t limit) {
  using IdsResult = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(*db_, "SELECT id FROM records WHERE lobe = ?1 ORDER BY seq DESC LIMIT ?2");
  if (!stmt.prepared()) {
    return IdsResult::failure(sqlite_error(*db_, "prepare recent"));
  }
  stmt.bind_text(1, lobe);
  stmt.bind_int64(2, static_cast<std::int64_t>(limit));

  std::vector<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  if (rc != SQLITE_DONE) {
    return IdsResult::failure(sqlite_error(*db_, "recent"));
  }
  return IdsResult::success(std::move(ids));
}

common::Result<std::vector<std::string>> FastIndex::all_ids(const std::size_t limit) {
  using IdsResult = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(*db_, "SELECT id FROM records ORDER BY seq ASC LIMIT ?1");
  if (!stmt.prepared()) {
    return IdsResult::failure(sqlite_error(*db_, "prepare all_ids"));
  }
  stmt.bind_int64(1, static_cast<std::int64_t>(limit));

  std::vector<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  if (rc != SQLITE_DONE) {
    return IdsResult::failure(sqlite_error(*db_, "all_ids"));
  }
  return IdsResult::success(std::move(ids));
}

common::Result<std::vector<std::string>> FastIndex::cids(const std::optional<std::string> &lobe) {
  using IdsResult = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(*db_, lobe.has_value() ? "SELECT cid FROM records WHERE lobe = ?1"
                                        : "SELECT cid FROM records");
  if (!stmt.prepared()) {
    return IdsResult::failure(sqlite_error(*db_, "prepare cids"));
  }
  if (lobe.has_value()) {
    stmt.bind_text(1, *lobe);
  }

  std::vector<std::string> cids;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    cids.push_back(stmt.column_text(0));
  }
  if (rc != SQLITE_DONE) {
    return IdsResult::failure(sqlite_error(*db_, "cids"));
  }
  return IdsResult::success(std::move(cids));
}

common::Result<IndexStats> FastIndex::stats(const std::optional<std::string> &lobe) {
  std::lock_guard<std::mutex> lock(mutex_);
  IndexStats stats;

  Statement grouped(*db_, lobe.has_value()
                              ? "SELECT lobe, COUNT(*), MAX(created_at) FROM records "
                                "WHERE lobe = ?1 GROUP BY lobe"
                              : "SELECT lobe, COUNT(*), MAX(created_at) FROM records GROUP BY lobe");
  if (!grouped.prepared()) {
    return common::Result<IndexStats>::failure(sqlite_error(*db_, "prepare stats"));
  }
  if (lobe.has_value()) {
    grouped.bind_text(1, *lobe);
  }

  int rc = SQLITE_ROW;
  while ((rc = grouped.step()) == SQLITE_ROW) {
    const auto count = static_cast<std::size_t>(grouped.column_int64(1));
    stats.by_lobe[grouped.column_text(0)] = count;
    stats.total += count;
    const std::string updated = grouped.column_text(2);
    if (updated > stats.last_updated) {
      stats.last_updated = updated;
    }
  }
  if (rc != SQLITE_DONE) {
    return common::Result<IndexStats>::failure(sqlite_error(*db_, "stats"));
  }
  return common::Result<IndexStats>::success(std::move(stats));
}

common::Result<std::size_t> FastIndex::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(*db_, "SELECT COUNT(*) FROM records");
  if (!stmt.prepared() || stmt.step() != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(sqlite_error(*db_, "count"));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(stmt.column_int64(0)));
}

bool FastIndex::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_->exec("SELECT 1 FROM records LIMIT 1;").ok();
}

} // namespace engram::store
