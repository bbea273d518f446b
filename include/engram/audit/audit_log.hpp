#pragma once

#include "engram/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engram::audit {

enum class EntryKind { Policy, Graph, Store };

[[nodiscard]] std::string entry_kind_name(EntryKind kind);
[[nodiscard]] std::optional<EntryKind> parse_entry_kind(const std::string &name);

struct AuditEntry {
  std::uint64_t seq = 0;
  std::string timestamp;
  EntryKind kind = EntryKind::Policy;
  std::string action;
  std::string outcome;
  std::optional<std::string> path;
  std::optional<std::string> record_id;
  std::string detail;
  std::optional<bool> passed;
  std::optional<std::string> risk;
  std::optional<std::string> category;
  std::vector<std::string> constraints;
  bool requires_escalation = false;
  std::optional<std::string> ruleset_digest;
  std::string prev_hash;
  std::string hash;
};

struct AuditFilter {
  std::optional<EntryKind> kind;
  std::optional<std::string> action;
  std::optional<std::string> outcome;
  std::optional<std::string> path;
  std::optional<std::string> record_id;
  std::optional<bool> passed;
  std::optional<std::string> since;
  std::optional<std::string> until;
  std::size_t limit = 0;

  [[nodiscard]] bool matches(const AuditEntry &entry) const;
};

struct AuditStats {
  std::uint64_t total_entries = 0;
  std::uint64_t violation_count = 0;
  std::uint64_t evaluation_count = 0;
  std::uint64_t mutation_count = 0;
};

struct ChainVerification {
  bool intact = true;
  std::uint64_t entries = 0;
  std::optional<std::uint64_t> first_broken_seq;
  std::string message;
};

[[nodiscard]] bool is_violation(const AuditEntry &entry);

[[nodiscard]] std::string entry_to_json(const AuditEntry &entry);
[[nodiscard]] common::Result<AuditEntry> entry_from_json(const std::string &line);

/// Append-only, hash-chained JSONL log of every policy decision and graph
/// mutation. Entries are never edited or pruned.
class AuditLog {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  AuditLog(Passkey, const std::filesystem::path &logbook_dir, std::size_t preview_len);

  [[nodiscard]] static common::Result<std::unique_ptr<AuditLog>>
  open(const std::filesystem::path &logbook_dir, std::size_t preview_len);

  [[nodiscard]] common::Result<AuditEntry> append(AuditEntry entry);

  [[nodiscard]] common::Result<std::vector<AuditEntry>> query(const AuditFilter &filter) const;
  [[nodiscard]] AuditStats stats() const;
  [[nodiscard]] common::Result<ChainVerification> verify_chain() const;

  [[nodiscard]] std::string preview(const std::string &text) const;

  [[nodiscard]] const std::filesystem::path &audit_path() const { return audit_path_; }
  [[nodiscard]] const std::filesystem::path &violations_path() const { return violations_path_; }
  [[nodiscard]] bool health_check() const;

private:

  [[nodiscard]] common::Status recover();
  void count(const AuditEntry &entry);

  std::filesystem::path audit_path_;
  std::filesystem::path violations_path_;
  std::size_t preview_len_;

  mutable std::mutex mutex_;
  std::uint64_t last_seq_ = 0;
  std::string last_hash_;
  std::string last_timestamp_;
  AuditStats stats_;
};

} // namespace engram::audit
