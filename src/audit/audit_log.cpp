#include "engram/audit/audit_log.hpp"

#include "engram/common/clock.hpp"
#include "engram/common/digest.hpp"
#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"

#include <algorithm>
#include <fstream>
#include <functional>

namespace engram::audit {

namespace {

const std::string GENESIS_HASH(64, '0');
constexpr const char *HASH_FIELD = ",\"hash\":\"";

std::string canonical_json(const AuditEntry &entry) {
  common::JsonWriter writer;
  writer.unsigned_integer("seq", entry.seq)
      .string("timestamp", entry.timestamp)
      .string("kind", entry_kind_name(entry.kind))
      .string("action", entry.action)
      .string("outcome", entry.outcome);
  if (entry.path.has_value()) {
    writer.string("path", *entry.path);
  }
  if (entry.record_id.has_value()) {
    writer.string("record_id", *entry.record_id);
  }
  writer.string("detail", entry.detail);
  if (entry.passed.has_value()) {
    writer.boolean("passed", *entry.passed);
  }
  if (entry.risk.has_value()) {
    writer.string("risk", *entry.risk);
  }
  if (entry.category.has_value()) {
    writer.string("category", *entry.category);
  }
  writer.raw("constraints", common::json_string_array(entry.constraints))
      .boolean("requires_escalation", entry.requires_escalation);
  if (entry.ruleset_digest.has_value()) {
    writer.string("ruleset_digest", *entry.ruleset_digest);
  }
  writer.string("prev_hash", entry.prev_hash);
  return writer.str();
}

std::string chain_hash(const std::string &prev_hash, const std::string &canonical) {
  return common::sha256_hex(prev_hash + canonical);
}

std::optional<std::string> optional_string(const std::string &json, const std::string &field) {
  if (!common::json_has_field(json, field)) {
    return std::nullopt;
  }
  return common::json_get_string(json, field);
}

common::Status for_each_line(const std::filesystem::path &path,
                             const std::function<common::Status(const std::string &)> &fn) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Status::success();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "unable to open " + path.string());
  }
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    auto status = fn(line);
    if (!status.ok()) {
      return status;
    }
  }
  if (in.bad()) {
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "read failed: " + path.string());
  }
  return common::Status::success();
}

} // namespace

std::string entry_kind_name(const EntryKind kind) {
  switch (kind) {
  case EntryKind::Policy:
    return "policy";
  case EntryKind::Graph:
    return "graph";
  case EntryKind::Store:
    return "store";
  }
  return "policy";
}

std::optional<EntryKind> parse_entry_kind(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "policy") {
    return EntryKind::Policy;
  }
  if (normalized == "graph") {
    return EntryKind::Graph;
  }
  if (normalized == "store") {
    return EntryKind::Store;
  }
  return std::nullopt;
}

bool is_violation(const AuditEntry &entry) {
  if (entry.kind != EntryKind::Policy) {
    return false;
  }
  return (entry.passed.has_value() && !*entry.passed) ||
         (entry.risk.has_value() && *entry.risk == "high");
}

bool AuditFilter::matches(const AuditEntry &entry) const {
  if (kind.has_value() && entry.kind != *kind) {
    return false;
  }
  if (action.has_value() && entry.action != *action) {
    return false;
  }
  if (outcome.has_value() && entry.outcome != *outcome) {
    return false;
  }
  if (path.has_value() && entry.path != path) {
    return false;
  }
  if (record_id.has_value() && entry.record_id != record_id) {
    return false;
  }
  if (passed.has_value() && entry.passed != passed) {
    return false;
  }
  if (since.has_value() && entry.timestamp < *since) {
    return false;
  }
  if (until.has_value() && entry.timestamp > *until) {
    return false;
  }
  return true;
}

std::string entry_to_json(const AuditEntry &entry) {
  std::string json = canonical_json(entry);
  json.pop_back();
  json += HASH_FIELD + entry.hash + "\"}";
  return json;
}

common::Result<AuditEntry> entry_from_json(const std::string &line) {
  using EntryResult = common::Result<AuditEntry>;
  const std::string seq = common::json_get_number(line, "seq");
  const auto kind = parse_entry_kind(common::json_get_string(line, "kind"));
  if (seq.empty() || !kind.has_value()) {
    return EntryResult::failure(common::ErrorCode::IntegrityMismatch,
                                "malformed audit entry: " + line.substr(0, 80));
  }

  AuditEntry entry;
  try {
    entry.seq = std::stoull(seq);
  } catch (const std::exception &) {
    return EntryResult::failure(common::ErrorCode::IntegrityMismatch,
                                "malformed audit seq: " + seq);
  }
  entry.timestamp = common::json_get_string(line, "timestamp");
  entry.kind = *kind;
  entry.action = common::json_get_string(line, "action");
  entry.outcome = common::json_get_string(line, "outcome");
  entry.path = optional_string(line, "path");
  entry.record_id = optional_string(line, "record_id");
  entry.detail = common::json_get_string(line, "detail");
  if (common::json_has_field(line, "passed")) {
    entry.passed = common::json_get_bool(line, "passed", true);
  }
  entry.risk = optional_string(line, "risk");
  entry.category = optional_string(line, "category");
  entry.constraints = common::json_get_string_array(line, "constraints");
  entry.requires_escalation = common::json_get_bool(line, "requires_escalation", false);
  entry.ruleset_digest = optional_string(line, "ruleset_digest");
  entry.prev_hash = common::json_get_string(line, "prev_hash");
  entry.hash = common::json_get_string(line, "hash");
  return EntryResult::success(std::move(entry));
}

AuditLog::AuditLog(Passkey, const std::filesystem::path &logbook_dir,
                   const std::size_t preview_len)
    : audit_path_(logbook_dir / "audit.jsonl"),
      violations_path_(logbook_dir / "violations.jsonl"), preview_len_(preview_len),
      last_hash_(GENESIS_HASH) {}

common::Result<std::unique_ptr<AuditLog>> AuditLog::open(const std::filesystem::path &logbook_dir,
                                                         const std::size_t preview_len) {
  using OpenResult = common::Result<std::unique_ptr<AuditLog>>;
  const auto dir = common::ensure_dir(logbook_dir);
  if (!dir.ok()) {
    return OpenResult::failure(dir.status());
  }

  auto log = std::make_unique<AuditLog>(Passkey{}, logbook_dir, preview_len);
  const auto status = log->recover();
  if (!status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(log));
}

common::Status AuditLog::recover() {
  return for_each_line(audit_path_, [this](const std::string &line) {
    const auto entry = entry_from_json(line);
    if (!entry.ok()) {
      // verify_chain() reports the damage; appends continue after the last good entry.
      return common::Status::success();
    }
    last_seq_ = entry.value().seq;
    last_hash_ = entry.value().hash;
    if (entry.value().timestamp > last_timestamp_) {
      last_timestamp_ = entry.value().timestamp;
    }
    count(entry.value());
    return common::Status::success();
  });
}

void AuditLog::count(const AuditEntry &entry) {
  ++stats_.total_entries;
  if (entry.kind == EntryKind::Policy) {
    ++stats_.evaluation_count;
  } else {
    ++stats_.mutation_count;
  }
  if (is_violation(entry)) {
    ++stats_.violation_count;
  }
}

common::Result<AuditEntry> AuditLog::append(AuditEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);

  entry.seq = last_seq_ + 1;
  entry.timestamp = common::now_rfc3339();
  if (entry.timestamp < last_timestamp_) {
    entry.timestamp = last_timestamp_;
  }
  entry.detail = preview(entry.detail);
  entry.prev_hash = last_hash_;
  entry.hash = chain_hash(entry.prev_hash, canonical_json(entry));

  const std::string line = entry_to_json(entry);
  const auto written = common::append_line(audit_path_, line);
  if (!written.ok()) {
    return common::Result<AuditEntry>::failure(written);
  }

  last_seq_ = entry.seq;
  last_hash_ = entry.hash;
  last_timestamp_ = entry.timestamp;
  count(entry);

  if (is_violation(entry)) {
    const auto mirrored = common::append_line(violations_path_, line);
    if (!mirrored.ok()) {
      return common::Result<AuditEntry>::failure(mirrored);
    }
  }
  return common::Result<AuditEntry>::success(std::move(entry));
}

common::Result<std::vector<AuditEntry>> AuditLog::query(const AuditFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AuditEntry> matches;
  const auto status = for_each_line(audit_path_, [&](const std::string &line) {
    auto entry = entry_from_json(line);
    if (entry.ok() && filter.matches(entry.value())) {
      matches.push_back(std::move(entry.value()));
    }
    return common::Status::success();
  });
  if (!status.ok()) {
    return common::Result<std::vector<AuditEntry>>::failure(status);
  }

  if (filter.limit > 0 && matches.size() > filter.limit) {
    matches.erase(matches.begin(),
                  matches.begin() + static_cast<std::ptrdiff_t>(matches.size() - filter.limit));
  }
  return common::Result<std::vector<AuditEntry>>::success(std::move(matches));
}

AuditStats AuditLog::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

common::Result<ChainVerification> AuditLog::verify_chain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ChainVerification report;
  std::string expected_prev = GENESIS_HASH;
  std::uint64_t expected_seq = 1;

  const auto status = for_each_line(audit_path_, [&](const std::string &line) {
    if (!report.intact) {
      return common::Status::success();
    }
    ++report.entries;
    const auto entry = entry_from_json(line);
    const auto hash_pos = line.rfind(HASH_FIELD);
    if (!entry.ok() || hash_pos == std::string::npos) {
      report.intact = false;
      report.first_broken_seq = expected_seq;
      report.message = "unparseable entry";
      return common::Status::success();
    }

    const AuditEntry &current = entry.value();
    const std::string canonical = line.substr(0, hash_pos) + "}";
    if (current.seq != expected_seq) {
      report.message = "sequence gap: expected " + std::to_string(expected_seq);
    } else if (current.prev_hash != expected_prev) {
      report.message = "prev_hash does not match the previous entry";
    } else if (chain_hash(current.prev_hash, canonical) != current.hash) {
      report.message = "entry content does not match its hash";
    } else {
      expected_prev = current.hash;
      ++expected_seq;
      return common::Status::success();
    }
    report.intact = false;
    report.first_broken_seq = current.seq;
    return common::Status::success();
  });
  if (!status.ok()) {
    return common::Result<ChainVerification>::failure(status);
  }
  return common::Result<ChainVerification>::success(std::move(report));
}

std::string AuditLog::preview(const std::string &text) const {
  std::string out;
  out.reserve(std::min(text.size(), preview_len_));
  for (const char ch : text) {
    out.push_back(ch == '\n' || ch == '\r' || ch == '\t' ? ' ' : ch);
  }
  if (out.size() <= preview_len_) {
    return out;
  }
  std::size_t cut = preview_len_;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  out.resize(cut);
  out += "...";
  return out;
}

bool AuditLog::health_check() const {
  std::error_code ec;
  return std::filesystem::is_directory(audit_path_.parent_path(), ec);
}

} // namespace engram::audit
