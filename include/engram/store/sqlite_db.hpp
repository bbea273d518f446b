#pragma once

#include "engram/common/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace engram::store {

class SqliteDb {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  SqliteDb(Passkey, std::filesystem::path path, sqlite3 *db) : path_(std::move(path)), db_(db) {}

  [[nodiscard]] static common::Result<std::unique_ptr<SqliteDb>>
  open(const std::filesystem::path &path, std::uint32_t busy_timeout_ms);

  ~SqliteDb();
  SqliteDb(const SqliteDb &) = delete;
  SqliteDb &operator=(const SqliteDb &) = delete;

  [[nodiscard]] common::Status exec(const std::string &sql);
  [[nodiscard]] sqlite3 *handle() const { return db_; }
  [[nodiscard]] std::string last_error() const;
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
};

class Statement {
public:
  Statement(SqliteDb &db, const char *sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool prepared() const { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind_text(int index, const std::string &value);
  void bind_optional_text(int index, const std::optional<std::string> &value);
  void bind_blob(int index, const std::string &bytes);
  void bind_int64(int index, std::int64_t value);

  [[nodiscard]] int step();

  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
  [[nodiscard]] std::string column_blob(int index) const;
  [[nodiscard]] std::int64_t column_int64(int index) const;

private:
  sqlite3_stmt *stmt_ = nullptr;
};

[[nodiscard]] common::Status sqlite_error(const SqliteDb &db, const std::string &context);

} // namespace engram::store
