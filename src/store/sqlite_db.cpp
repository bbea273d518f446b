#include "engram/store/sqlite_db.hpp"

#include "engram/common/fs.hpp"

namespace engram::store {

common::Result<std::unique_ptr<SqliteDb>> SqliteDb::open(const std::filesystem::path &path,
                                                         const std::uint32_t busy_timeout_ms) {
  using OpenResult = common::Result<std::unique_ptr<SqliteDb>>;
  if (path.has_parent_path()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return OpenResult::failure(dir.status());
    }
  }

  sqlite3 *raw = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.string().c_str(), &raw, flags, nullptr) != SQLITE_OK) {
    const std::string message = raw == nullptr ? "out of memory" : sqlite3_errmsg(raw);
    if (raw != nullptr) {
      sqlite3_close(raw);
    }
    return OpenResult::failure(common::ErrorCode::StorageUnavailable,
                               "cannot open " + path.string() + ": " + message);
  }

  auto db = std::make_unique<SqliteDb>(Passkey{}, path, raw);
  sqlite3_busy_timeout(raw, static_cast<int>(busy_timeout_ms));

  auto status = db->exec("PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  status = db->exec("PRAGMA synchronous=NORMAL;");
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(db));
}

SqliteDb::~SqliteDb() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteDb::exec(const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 path_.filename().string() + ": " + msg);
  }
  return common::Status::success();
}

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_); }

Statement::Statement(SqliteDb &db, const char *sql) {
  if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::bind_text(const int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_optional_text(const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind_text(index, *value);
  } else {
    sqlite3_bind_null(stmt_, index);
  }
}

void Statement::bind_blob(const int index, const std::string &bytes) {
  sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void Statement::bind_int64(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_, index, value);
}

int Statement::step() { return sqlite3_step(stmt_); }

std::string Statement::column_text(const int index) const {
  const auto *text = sqlite3_column_text(stmt_, index);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::column_optional_text(const int index) const {
  if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(index);
}

std::string Statement::column_blob(const int index) const {
  const void *blob = sqlite3_column_blob(stmt_, index);
  const int bytes = sqlite3_column_bytes(stmt_, index);
  if (blob == nullptr || bytes <= 0) {
    return "";
  }
  return std::string(static_cast<const char *>(blob), static_cast<std::size_t>(bytes));
}

std::int64_t Statement::column_int64(const int index) const {
  return sqlite3_column_int64(stmt_, index);
}

common::Status sqlite_error(const SqliteDb &db, const std::string &context) {
  return common::Status::error(common::ErrorCode::StorageUnavailable,
                               context + ": " + db.last_error());
}

} // namespace engram::store
