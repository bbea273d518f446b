#pragma once

#include "engram/audit/audit_log.hpp"
#include "engram/common/result.hpp"
#include "engram/dag/graph_store.hpp"
#include "engram/dag/record.hpp"
#include "engram/policy/engine.hpp"
#include "engram/recall/resolver.hpp"
#include "engram/runtime/workspace.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engram::runtime {

struct Stats {
  std::size_t total = 0;
  std::size_t archived_count = 0;
  std::map<std::string, std::size_t> by_lobe;
  std::string last_updated;
};

struct LatestRecord {
  std::string record_id;
  std::string payload;
  dag::Tags meta;
};

struct Citation {
  std::string record_id;
  std::optional<std::string> source;
  std::vector<recall::Tier> tiers;
};

struct SnapshotMeta {
  std::string record_id;
  std::string cid;
  std::string lobe;
  std::string key;
  std::optional<std::string> parent;
  std::string created_at;
  dag::Tags tags;
};

struct IntegrityReport {
  bool fast_index_present = false;
  bool blob_store_present = false;
  bool graph_present = false;
  bool audit_log_present = false;

  [[nodiscard]] bool healthy() const {
    return fast_index_present && blob_store_present && graph_present && audit_log_present;
  }
};

struct RecordFailure {
  std::string record_id;
  common::ErrorCode code = common::ErrorCode::None;
  std::string message;
};

struct RecordVerification {
  std::size_t checked = 0;
  std::vector<RecordFailure> failures;

  [[nodiscard]] bool ok() const { return failures.empty(); }
};

/// Operation surface over one workspace. Shared by threads: policy checks,
/// blob writes and ancestry walks run concurrently, while graph, index and
/// audit commits are serialized. Once a mutation has committed, a failed audit
/// append is reported as an observer error and the call still succeeds.
class Engine {
public:
  explicit Engine(Workspace &workspace);

  [[nodiscard]] common::Result<std::string> write(const std::string &lobe,
                                                  const std::string &payload,
                                                  const std::optional<std::string> &key = std::nullopt);
  [[nodiscard]] common::Result<recall::RecallHit>
  read(const std::string &id, const std::optional<std::string> &prefer = std::nullopt);
  [[nodiscard]] common::Result<std::vector<recall::RecallOutcome>>
  read_many(const std::vector<std::string> &ids,
            const std::optional<std::string> &prefer = std::nullopt);
  [[nodiscard]] common::Result<std::vector<std::string>> recent(const std::string &lobe,
                                                                std::size_t n);
  [[nodiscard]] common::Result<Stats> stats(const std::optional<std::string> &lobe = std::nullopt);

  [[nodiscard]] common::Result<policy::Decision> evaluate_policy(const std::string &text,
                                                                 const std::string &purpose);

  [[nodiscard]] common::Result<std::string>
  sprout(const std::string &path, const std::optional<std::string> &base = std::nullopt,
         const std::optional<std::string> &lobe = std::nullopt);
  [[nodiscard]] common::Result<std::string> append_to_path(const std::string &path,
                                                           const std::string &payload,
                                                           const dag::Tags &meta = {});
  [[nodiscard]] common::Result<std::string> consolidate(const std::string &src,
                                                        const std::string &dst = "");
  [[nodiscard]] common::Result<std::string> merge(const std::string &src, const std::string &dst,
                                                  const std::string &note);

  [[nodiscard]] common::Result<std::vector<dag::TraceEntry>> trace(const std::string &path,
                                                                   std::size_t limit);
  [[nodiscard]] common::Result<LatestRecord> latest_on_path(const std::string &path);
  [[nodiscard]] common::Result<std::string> head(const std::string &path) const;
  [[nodiscard]] bool path_exists(const std::string &path) const;
  [[nodiscard]] std::vector<dag::PathInfo> list_paths() const;
  [[nodiscard]] common::Result<bool> is_ancestor(const std::string &ancestor,
                                                 const std::string &descendant) const;

  [[nodiscard]] common::Result<std::vector<Citation>> cite_sources(const std::string &id_or_path);
  [[nodiscard]] common::Result<std::vector<dag::Record>> search(const std::string &query,
                                                                std::size_t limit);
  [[nodiscard]] common::Result<SnapshotMeta> snapshot_meta(const std::string &id) const;

  [[nodiscard]] common::Result<std::vector<audit::AuditEntry>>
  audit_query(const audit::AuditFilter &filter) const;
  [[nodiscard]] audit::AuditStats audit_stats() const;
  [[nodiscard]] common::Result<audit::ChainVerification> verify_audit_chain() const;

  [[nodiscard]] IntegrityReport integrity_check();
  [[nodiscard]] RecordVerification verify_records(std::size_t limit);

  [[nodiscard]] Workspace &workspace() { return workspace_; }

private:
  struct HeadUpdate {
    std::string path;
    std::string expected_head;
  };

  [[nodiscard]] common::Result<policy::Decision> evaluate_and_audit(const std::string &text,
                                                                    const std::string &purpose);
  [[nodiscard]] common::Result<std::string>
  write_locked(const std::string &lobe, const std::string &payload, const std::string &key,
               const store::PutOutcome &blob);
  /// Caller holds commit_mutex_. The index row commits only after the graph
  /// has committed and published; an earlier failure undoes every tier.
  [[nodiscard]] common::Status commit_record(const dag::Record &record,
                                             const store::PutOutcome &blob,
                                             const std::optional<HeadUpdate> &head_update);
  void discard_blob(const store::PutOutcome &blob);
  [[nodiscard]] common::Result<std::string> fast_forward(const std::string &action,
                                                         const std::string &src,
                                                         const std::string &dst,
                                                         const std::string &note);
  [[nodiscard]] common::Result<std::string> resolve_sprout_base(const std::string &name,
                                                                const std::optional<std::string> &base,
                                                                const std::string &lobe);
  [[nodiscard]] common::Result<recall::Prefer>
  resolve_prefer(const std::optional<std::string> &prefer) const;

  [[nodiscard]] common::Status audit_mutation(audit::EntryKind kind, const std::string &action,
                                              const std::string &outcome,
                                              const std::optional<std::string> &path,
                                              const std::optional<std::string> &record_id,
                                              const std::string &detail);

  Workspace &workspace_;
  std::mutex commit_mutex_;
};

} // namespace engram::runtime
