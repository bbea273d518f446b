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
#include <string>
#include <vector>

namespace engram::store {

struct IndexStats {
  std::size_t total = 0;
  std::map<std::string, std::size_t> by_lobe;
  std::string last_updated;
};

class FastIndex {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  // An inserted row held in an open index.db transaction. Readers of the
  // index block until it is committed or rolled back.
  class PendingInsert {
  public:
    PendingInsert(PendingInsert &&other) noexcept;
    PendingInsert &operator=(PendingInsert &&) = delete;
    PendingInsert(const PendingInsert &) = delete;
    PendingInsert &operator=(const PendingInsert &) = delete;
    ~PendingInsert();

    [[nodiscard]] bool inserted() const { return inserted_; }
    [[nodiscard]] common::Status commit();

  private:
    friend class FastIndex;
    PendingInsert(FastIndex &index, std::unique_lock<std::mutex> lock, bool inserted);

    FastIndex *index_;
    std::unique_lock<std::mutex> lock_;
    bool active_ = true;
    bool inserted_ = false;
  };

  FastIndex(Passkey, std::unique_ptr<SqliteDb> db) : db_(std::move(db)) {}

  [[nodiscard]] static common::Result<std::unique_ptr<FastIndex>>
  open(const std::filesystem::path &db_path, std::uint32_t busy_timeout_ms);

  [[nodiscard]] common::Result<bool> insert(const dag::Record &record);
  [[nodiscard]] common::Result<PendingInsert> begin_insert(const dag::Record &record);

  [[nodiscard]] common::Result<std::optional<dag::Record>> get(const std::string &id);
  [[nodiscard]] common::Result<std::optional<dag::Record>> latest_in_lobe(const std::string &lobe);
  [[nodiscard]] common::Result<std::optional<std::string>>
  find_payload_in_lobe(const std::string &lobe, const std::string &payload);
  [[nodiscard]] common::Result<std::vector<std::string>> recent(const std::string &lobe,
                                                                std::size_t limit);
  [[nodiscard]] common::Result<std::vector<std::string>> all_ids(std::size_t limit);
  [[nodiscard]] common::Result<std::vector<std::string>> cids(const std::optional<std::string> &lobe);
  [[nodiscard]] common::Result<IndexStats> stats(const std::optional<std::string> &lobe);
  [[nodiscard]] common::Result<std::size_t> count();
  [[nodiscard]] bool health_check();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<bool> insert_row(const dag::Record &record);
  [[nodiscard]] static dag::Record row_to_record(const Statement &stmt);
  [[nodiscard]] common::Result<std::optional<dag::Record>> fetch_one(Statement &stmt,
                                                                     const std::string &context);

  std::unique_ptr<SqliteDb> db_;
  std::mutex mutex_;
};

} // namespace engram::store
