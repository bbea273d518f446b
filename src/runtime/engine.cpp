#include "engram/runtime/engine.hpp"

#include "engram/common/fs.hpp"
#include "engram/dag/path_name.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <set>
#include <sstream>
#include <unordered_set>

namespace engram::runtime {

namespace {

using IdResult = common::Result<std::string>;

constexpr const char *DEFAULT_APPEND_LOBE = "dag";

std::chrono::microseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

std::string default_memory_key() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H_%M_%S", &tm);
  return std::string(buffer) + "_memory.txt";
}

std::string outcome_for(const common::ErrorCode code) {
  switch (code) {
  case common::ErrorCode::None:
    return "ok";
  case common::ErrorCode::ConcurrentWriteConflict:
    return "conflict";
  default:
    return std::string(common::error_code_name(code));
  }
}

std::optional<std::string> tag_value(const dag::Tags &tags, const std::string &name) {
  const auto it = tags.find(name);
  if (it == tags.end() || common::trim(it->second).empty()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace

Engine::Engine(Workspace &workspace) : workspace_(workspace) {}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

IdResult Engine::write(const std::string &lobe, const std::string &payload,
                       const std::optional<std::string> &key) {
  const auto started = std::chrono::steady_clock::now();
  const auto &cfg = workspace_.config();
  const std::string target_lobe =
      common::trim(lobe).empty() ? cfg.dag.default_write_lobe : common::trim(lobe);

  if (payload.empty()) {
    return IdResult::failure(common::ErrorCode::InvalidArgument, "payload must not be empty");
  }

  auto decision = evaluate_and_audit(payload, "memory_storage");
  if (!decision.ok()) {
    return IdResult::propagate(decision);
  }
  if (decision.value().outcome == policy::Outcome::Block) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    const auto audited = audit_mutation(audit::EntryKind::Store, "write", "ethics_blocked",
                                        std::nullopt, std::nullopt, decision.value().reason);
    if (!audited.ok()) {
      return IdResult::failure(audited);
    }
    return IdResult::failure(common::ErrorCode::EthicsBlocked, decision.value().reason);
  }

  auto blob = workspace_.blobs().put(payload);
  if (!blob.ok()) {
    observability::record_error("store", blob.error());
    std::lock_guard<std::mutex> lock(commit_mutex_);
    (void)audit_mutation(audit::EntryKind::Store, "write", outcome_for(blob.code()), std::nullopt,
                         std::nullopt, blob.error());
    return IdResult::propagate(blob);
  }

  const std::string record_key =
      key.has_value() && !common::trim(*key).empty() ? *key : default_memory_key();

  IdResult id = [&] {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    return write_locked(target_lobe, payload, record_key, blob.value());
  }();
  if (id.ok()) {
    observability::record_metric(observability::CommitLatencyMetric{elapsed_since(started)});
  }
  return id;
}

IdResult Engine::write_locked(const std::string &lobe, const std::string &payload,
                              const std::string &key, const store::PutOutcome &blob) {
  auto &fast = workspace_.fast_index();

  if (workspace_.config().storage.dedupe_exact) {
    auto existing = fast.find_payload_in_lobe(lobe, payload);
    if (!existing.ok()) {
      discard_blob(blob);
      return IdResult::propagate(existing);
    }
    if (existing.value().has_value()) {
      const std::string id = *existing.value();
      // The record already exists; a failed audit append is reported as an error event.
      (void)audit_mutation(audit::EntryKind::Store, "write", "dedupe", std::nullopt, id,
                           "identical payload already stored in lobe " + lobe);
      observability::record_commit(id, lobe, "", true);
      return IdResult::success(id);
    }
  }

  auto parent = fast.latest_in_lobe(lobe);
  if (!parent.ok()) {
    discard_blob(blob);
    return IdResult::propagate(parent);
  }
  std::optional<std::string> parent_id;
  if (parent.value().has_value()) {
    parent_id = parent.value()->id;
  }

  const auto record = dag::make_record(lobe, key, payload, parent_id);
  const auto committed = commit_record(record, blob, std::nullopt);
  if (!committed.ok()) {
    observability::record_error("engine", committed.error());
    (void)audit_mutation(audit::EntryKind::Store, "write", outcome_for(committed.code()),
                         std::nullopt, record.id, committed.error());
    return IdResult::failure(committed);
  }

  // Committed to every tier. Failing the call now would invite a duplicate
  // retry, so a failed audit append only surfaces as an error event.
  (void)audit_mutation(audit::EntryKind::Store, "write", "ok", std::nullopt, record.id,
                       lobe + "/" + key);
  observability::record_commit(record.id, lobe, "");
  return IdResult::success(record.id);
}

common::Status Engine::commit_record(const dag::Record &record, const store::PutOutcome &blob,
                                     const std::optional<HeadUpdate> &head_update) {
  auto &graph = workspace_.graph();
  auto &fast = workspace_.fast_index();
  auto &blobs = workspace_.blobs();

  // A failed commit on another thread may have removed an object this
  // record shares; removals only happen under the commit mutex.
  if (!blobs.contains(blob.cid)) {
    auto again = blobs.put(record.payload);
    if (!again.ok()) {
      return again.status();
    }
  }

  // The index row stays in an open index.db transaction until the graph has
  // committed and published, so fast readers never see a record the graph
  // does not hold yet.
  common::Status result = common::Status::success();
  bool graph_committed = false;
  {
    auto txn = graph.begin();
    if (!txn.ok()) {
      result = txn.status();
    } else {
      auto inserted = txn.value().insert_record(record);
      if (!inserted.ok()) {
        result = inserted.status();
      }
      if (result.ok() && head_update.has_value()) {
        result = txn.value().advance_head(head_update->path, head_update->expected_head,
                                          record.id);
      }
      if (result.ok()) {
        auto indexed = fast.begin_insert(record);
        if (!indexed.ok()) {
          result = indexed.status();
        } else {
          result = txn.value().commit();
          if (result.ok()) {
            graph_committed = true;
            result = indexed.value().commit();
          }
        }
        // Leaving this scope rolls back an uncommitted index insert.
      }
    }
    // Leaving this scope rolls back an uncommitted graph transaction.
  }

  if (result.ok()) {
    return result;
  }
  if (graph_committed) {
    observability::record_error("fast_index", "deferred insert failed: " + result.error());
    const auto repaired = fast.insert(record);
    if (repaired.ok()) {
      return common::Status::success();
    }
    return common::Status::error(repaired.code(), "record " + record.id +
                                                      " committed to the graph but not indexed: " +
                                                      repaired.error());
  }
  discard_blob(blob);
  return result;
}

void Engine::discard_blob(const store::PutOutcome &blob) {
  if (!blob.created || workspace_.graph().references_cid(blob.cid)) {
    return;
  }
  if (const auto removed = workspace_.blobs().remove_uncommitted(blob.cid); !removed.ok()) {
    observability::record_error("blob_store", removed.error());
  }
}

common::Result<recall::Prefer>
Engine::resolve_prefer(const std::optional<std::string> &prefer) const {
  if (prefer.has_value() && !common::trim(*prefer).empty()) {
    return recall::parse_prefer(*prefer);
  }
  return recall::parse_prefer(workspace_.config().recall.default_prefer);
}

common::Result<recall::RecallHit> Engine::read(const std::string &id,
                                               const std::optional<std::string> &prefer) {
  using HitResult = common::Result<recall::RecallHit>;
  const auto mode = resolve_prefer(prefer);
  if (!mode.ok()) {
    return HitResult::propagate(mode);
  }

  const auto started = std::chrono::steady_clock::now();
  auto hit = workspace_.resolver().recall(id, mode.value());
  observability::record_recall(id, hit.ok() ? recall::tier_name(hit.value().source) : "",
                               hit.ok(), elapsed_since(started));
  if (hit.code() == common::ErrorCode::IntegrityMismatch) {
    observability::record_error("recall", hit.error());
  }
  return hit;
}

common::Result<std::vector<recall::RecallOutcome>>
Engine::read_many(const std::vector<std::string> &ids, const std::optional<std::string> &prefer) {
  using BatchResult = common::Result<std::vector<recall::RecallOutcome>>;
  const auto mode = resolve_prefer(prefer);
  if (!mode.ok()) {
    return BatchResult::propagate(mode);
  }
  return BatchResult::success(workspace_.resolver().recall_many(ids, mode.value()));
}

common::Result<std::vector<std::string>> Engine::recent(const std::string &lobe,
                                                        const std::size_t n) {
  const std::string target =
      common::trim(lobe).empty() ? workspace_.config().dag.default_write_lobe : common::trim(lobe);
  return workspace_.fast_index().recent(target, n);
}

common::Result<Stats> Engine::stats(const std::optional<std::string> &lobe) {
  auto index_stats = workspace_.fast_index().stats(lobe);
  if (!index_stats.ok()) {
    return common::Result<Stats>::propagate(index_stats);
  }
  auto cids = workspace_.fast_index().cids(lobe);
  if (!cids.ok()) {
    return common::Result<Stats>::propagate(cids);
  }

  Stats out;
  out.total = index_stats.value().total;
  out.by_lobe = index_stats.value().by_lobe;
  out.last_updated = index_stats.value().last_updated;
  for (const auto &cid : cids.value()) {
    if (workspace_.blobs().contains(cid)) {
      ++out.archived_count;
    }
  }
  return common::Result<Stats>::success(std::move(out));
}

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

common::Result<policy::Decision> Engine::evaluate_policy(const std::string &text,
                                                         const std::string &purpose) {
  return evaluate_and_audit(text, purpose);
}

common::Result<policy::Decision> Engine::evaluate_and_audit(const std::string &text,
                                                            const std::string &purpose) {
  auto decision = workspace_.policy().evaluate(text, purpose);

  audit::AuditEntry entry;
  entry.kind = audit::EntryKind::Policy;
  entry.action = "evaluate";
  entry.outcome = policy::outcome_name(decision.outcome);
  entry.passed = decision.passed;
  entry.risk = policy::risk_name(decision.risk);
  entry.category = policy::intent_category_name(decision.category);
  entry.constraints.assign(decision.constraints.begin(), decision.constraints.end());
  entry.requires_escalation = decision.requires_escalation;
  entry.ruleset_digest = decision.ruleset_digest;
  entry.detail = decision.reason + ": " + text;

  auto stored = workspace_.audit().append(std::move(entry));
  if (!stored.ok()) {
    observability::record_error("audit", stored.error());
    return common::Result<policy::Decision>::propagate(stored);
  }
  decision.timestamp = stored.value().timestamp;

  observability::record_event(observability::PolicyDecisionEvent{
      policy::intent_category_name(decision.category), policy::outcome_name(decision.outcome),
      policy::risk_name(decision.risk), decision.passed});
  return common::Result<policy::Decision>::success(std::move(decision));
}

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

IdResult Engine::resolve_sprout_base(const std::string &name,
                                     const std::optional<std::string> &base,
                                     const std::string &lobe) {
  auto &graph = workspace_.graph();

  if (base.has_value() && !common::trim(*base).empty()) {
    const std::string wanted = common::trim(*base);
    if (graph.contains(wanted)) {
      return IdResult::success(wanted);
    }
    if (const auto base_path = dag::normalize_path_name(wanted); base_path.ok()) {
      if (const auto info = graph.path(base_path.value()); info.has_value()) {
        return IdResult::success(info->head);
      }
    }
    return IdResult::failure(common::ErrorCode::NotFound,
                             "base '" + wanted + "' is neither a record nor a path");
  }

  if (const auto canonical = dag::normalize_path_name(workspace_.config().dag.canonical_path);
      canonical.ok()) {
    if (const auto cortex = graph.path(canonical.value()); cortex.has_value()) {
      return IdResult::success(cortex->head);
    }
  }

  auto latest = workspace_.fast_index().latest_in_lobe(lobe);
  if (!latest.ok()) {
    return IdResult::propagate(latest);
  }
  if (latest.value().has_value()) {
    return IdResult::success(latest.value()->id);
  }
  return write(lobe, "Seed: auto-seeded base for lobe '" + lobe + "'");
}

IdResult Engine::sprout(const std::string &path, const std::optional<std::string> &base,
                        const std::optional<std::string> &lobe) {
  const auto name = dag::normalize_path_name(path);
  if (!name.ok()) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    (void)audit_mutation(audit::EntryKind::Graph, "sprout", outcome_for(name.code()), path,
                         std::nullopt, name.error());
    return IdResult::propagate(name);
  }

  const bool explicit_base = base.has_value() && !common::trim(*base).empty();
  if (!explicit_base) {
    // Re-sprouting without a base leaves the path and its seed untouched.
    if (const auto existing = workspace_.graph().path(name.value()); existing.has_value()) {
      std::lock_guard<std::mutex> lock(commit_mutex_);
      (void)audit_mutation(audit::EntryKind::Graph, "sprout", "ok", name.value(), existing->base,
                           "already sprouted from " + existing->base);
      observability::record_path_mutation("sprout", name.value(), existing->base, "ok");
      return IdResult::success(existing->base);
    }
  }

  const std::string seed_lobe = lobe.has_value() && !common::trim(*lobe).empty()
                                    ? common::trim(*lobe)
                                    : workspace_.config().dag.default_seed_lobe;
  auto base_id = resolve_sprout_base(name.value(), base, seed_lobe);

  std::lock_guard<std::mutex> lock(commit_mutex_);
  if (!base_id.ok()) {
    (void)audit_mutation(audit::EntryKind::Graph, "sprout", outcome_for(base_id.code()),
                         name.value(), std::nullopt, base_id.error());
    return base_id;
  }

  common::Status status = common::Status::success();
  {
    auto txn = workspace_.graph().begin();
    if (!txn.ok()) {
      status = txn.status();
    } else {
      status = txn.value().reset_path(name.value(), base_id.value());
      if (status.ok()) {
        status = txn.value().commit();
      }
    }
  }
  if (!status.ok()) {
    (void)audit_mutation(audit::EntryKind::Graph, "sprout", outcome_for(status.code()),
                         name.value(), base_id.value(), status.error());
    return IdResult::failure(status);
  }

  (void)audit_mutation(audit::EntryKind::Graph, "sprout", "ok", name.value(), base_id.value(),
                       "seeded from " + base_id.value());
  observability::record_path_mutation("sprout", name.value(), base_id.value(), "ok");
  return base_id;
}

IdResult Engine::append_to_path(const std::string &path, const std::string &payload,
                                const dag::Tags &meta) {
  const auto started = std::chrono::steady_clock::now();

  const auto fail = [&](const std::string &subject, const common::ErrorCode code,
                        const std::string &message,
                        const std::optional<std::string> &record_id = std::nullopt) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    (void)audit_mutation(audit::EntryKind::Graph, "append", outcome_for(code), subject, record_id,
                         message);
    observability::record_path_mutation("append", subject, "", outcome_for(code));
    return IdResult::failure(code, message);
  };

  const auto name = dag::normalize_path_name(path);
  if (!name.ok()) {
    return fail(path, name.code(), name.error());
  }
  const auto info = workspace_.graph().path(name.value());
  if (!info.has_value()) {
    return fail(name.value(), common::ErrorCode::NotFound,
                "path '" + name.value() + "' has not been sprouted");
  }
  if (payload.empty()) {
    return fail(name.value(), common::ErrorCode::InvalidArgument, "payload must not be empty");
  }

  auto decision = evaluate_and_audit(payload, "path_append");
  if (!decision.ok()) {
    return IdResult::propagate(decision);
  }
  if (decision.value().outcome == policy::Outcome::Block) {
    return fail(name.value(), common::ErrorCode::EthicsBlocked, decision.value().reason);
  }

  dag::Tags tags = meta;
  tags["op"] = "append";
  tags["path"] = name.value();
  tags["base"] = info->base;
  tags["actor"] = "core";
  const std::string lobe = tag_value(meta, "lobe").value_or(DEFAULT_APPEND_LOBE);
  const std::string key = tag_value(meta, "key").value_or("path/" + name.value());

  const auto record = dag::make_record(lobe, key, payload, info->head, std::move(tags));

  auto blob = workspace_.blobs().put(payload);
  if (!blob.ok()) {
    observability::record_error("store", blob.error());
    return fail(name.value(), blob.code(), blob.error());
  }

  std::lock_guard<std::mutex> lock(commit_mutex_);
  const auto committed =
      commit_record(record, blob.value(), HeadUpdate{name.value(), info->head});
  if (!committed.ok()) {
    (void)audit_mutation(audit::EntryKind::Graph, "append", outcome_for(committed.code()),
                         name.value(), record.id, committed.error());
    observability::record_path_mutation("append", name.value(), info->head,
                                        outcome_for(committed.code()));
    return IdResult::failure(committed);
  }

  // The head has moved; a retry after a failed audit append would append twice.
  (void)audit_mutation(audit::EntryKind::Graph, "append", "ok", name.value(), record.id, payload);
  observability::record_commit(record.id, lobe, name.value());
  observability::record_path_mutation("append", name.value(), record.id, "ok");
  observability::record_metric(observability::CommitLatencyMetric{elapsed_since(started)});
  return IdResult::success(record.id);
}

IdResult Engine::consolidate(const std::string &src, const std::string &dst) {
  return fast_forward("consolidate", src, dst, "");
}

IdResult Engine::merge(const std::string &src, const std::string &dst, const std::string &note) {
  return fast_forward("merge", src, dst, note);
}

IdResult Engine::fast_forward(const std::string &action, const std::string &src,
                              const std::string &dst, const std::string &note) {
  const auto &dag_cfg = workspace_.config().dag;
  auto &graph = workspace_.graph();

  const auto fail = [&](const std::string &subject, const std::string &outcome,
                        const common::ErrorCode code, const std::string &message) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    (void)audit_mutation(audit::EntryKind::Graph, action, outcome, subject, std::nullopt, message);
    observability::record_path_mutation(action, subject, "", outcome);
    return IdResult::failure(code, message);
  };

  const auto src_name = dag::normalize_path_name(src);
  if (!src_name.ok()) {
    return fail(src, "error", src_name.code(), src_name.error());
  }
  const auto dst_name = dag::normalize_path_name(common::trim(dst).empty() ? dag_cfg.canonical_path
                                                                            : dst);
  if (!dst_name.ok()) {
    return fail(dst, "error", dst_name.code(), dst_name.error());
  }

  const auto source = graph.path(src_name.value());
  if (!source.has_value()) {
    return fail(src_name.value(), "error", common::ErrorCode::NotFound,
                "path '" + src_name.value() + "' has not been sprouted");
  }
  std::string detail = src_name.value() + " -> " + dst_name.value();
  if (!note.empty()) {
    detail += ": " + note;
  }

  const auto target = graph.path(dst_name.value());
  std::optional<std::size_t> distance;
  if (target.has_value() && target->head != source->head) {
    distance = graph.ancestor_distance(target->head, source->head, dag_cfg.max_ancestry_depth);
    if (!distance.has_value()) {
      if (action == "merge") {
        return fail(dst_name.value(), "unsupported", common::ErrorCode::Unsupported,
                    "multi-parent merge not supported");
      }
      return fail(dst_name.value(), "non_fast_forward", common::ErrorCode::NonFastForward,
                  "'" + dst_name.value() + "' head is not an ancestor of '" + src_name.value() +
                      "' head");
    }
    observability::record_metric(observability::AncestryDepthMetric{*distance});
  }

  std::lock_guard<std::mutex> lock(commit_mutex_);
  common::Status status = common::Status::success();
  if (!target.has_value() || target->head != source->head) {
    auto txn = graph.begin();
    if (!txn.ok()) {
      status = txn.status();
    } else {
      status = target.has_value()
                   ? txn.value().advance_head(dst_name.value(), target->head, source->head)
                   : txn.value().create_path(dst_name.value(), source->head, source->head);
      if (status.ok()) {
        status = txn.value().commit();
      }
    }
  } else {
    detail += " (already up to date)";
  }

  if (!status.ok()) {
    const std::string outcome =
        status.code() == common::ErrorCode::ConcurrentWriteConflict ? "conflict" : "error";
    (void)audit_mutation(audit::EntryKind::Graph, action, outcome, dst_name.value(), source->head,
                         status.error());
    observability::record_path_mutation(action, dst_name.value(), source->head, outcome);
    return IdResult::failure(status);
  }

  (void)audit_mutation(audit::EntryKind::Graph, action, "ok", dst_name.value(), source->head,
                       detail);
  observability::record_path_mutation(action, dst_name.value(), source->head, "ok");
  return IdResult::success(source->head);
}

common::Result<std::vector<dag::TraceEntry>> Engine::trace(const std::string &path,
                                                           const std::size_t limit) {
  using TraceResult = common::Result<std::vector<dag::TraceEntry>>;
  const auto tip = head(path);
  if (!tip.ok()) {
    return TraceResult::propagate(tip);
  }
  const std::size_t capped = std::min(limit, workspace_.config().dag.max_trace_limit);
  return TraceResult::success(workspace_.graph().trace_from(tip.value(), capped));
}

common::Result<LatestRecord> Engine::latest_on_path(const std::string &path) {
  using LatestResult = common::Result<LatestRecord>;
  const auto tip = head(path);
  if (!tip.ok()) {
    return LatestResult::propagate(tip);
  }

  auto hit = read(tip.value(), std::nullopt);
  if (!hit.ok()) {
    return LatestResult::propagate(hit);
  }
  const auto record = workspace_.graph().get(tip.value());
  if (!record.has_value()) {
    return LatestResult::failure(common::ErrorCode::IntegrityMismatch,
                                 "path head " + tip.value() + " is missing from the graph");
  }

  LatestRecord out;
  out.record_id = record->id;
  out.payload = std::move(hit.value().payload);
  out.meta = record->tags;
  out.meta.insert_or_assign("lobe", record->lobe);
  out.meta.insert_or_assign("key", record->key);
  out.meta.insert_or_assign("cid", record->cid);
  out.meta.insert_or_assign("created_at", record->created_at);
  if (record->parent.has_value()) {
    out.meta.insert_or_assign("parent", *record->parent);
  }
  return LatestResult::success(std::move(out));
}

IdResult Engine::head(const std::string &path) const {
  const auto name = dag::normalize_path_name(path);
  if (!name.ok()) {
    return IdResult::propagate(name);
  }
  const auto info = workspace_.graph().path(name.value());
  if (!info.has_value()) {
    return IdResult::failure(common::ErrorCode::NotFound,
                             "path '" + name.value() + "' has not been sprouted");
  }
  return IdResult::success(info->head);
}

bool Engine::path_exists(const std::string &path) const { return head(path).ok(); }

std::vector<dag::PathInfo> Engine::list_paths() const { return workspace_.graph().list_paths(); }

common::Result<bool> Engine::is_ancestor(const std::string &ancestor,
                                         const std::string &descendant) const {
  auto &graph = workspace_.graph();
  for (const auto *id : {&ancestor, &descendant}) {
    if (!graph.contains(*id)) {
      return common::Result<bool>::failure(common::ErrorCode::NotFound, "unknown record " + *id);
    }
  }
  return common::Result<bool>::success(
      graph.is_ancestor(ancestor, descendant, workspace_.config().dag.max_ancestry_depth));
}

// ---------------------------------------------------------------------------
// Provenance
// ---------------------------------------------------------------------------

common::Result<std::vector<Citation>> Engine::cite_sources(const std::string &id_or_path) {
  using CiteResult = common::Result<std::vector<Citation>>;
  auto &graph = workspace_.graph();

  std::string start = common::trim(id_or_path);
  if (!graph.contains(start)) {
    const auto tip = head(start);
    if (!tip.ok()) {
      return CiteResult::failure(common::ErrorCode::NotFound,
                                 "'" + start + "' is neither a record nor a path");
    }
    start = tip.value();
  }

  std::vector<Citation> out;
  std::unordered_set<std::string> seen;
  std::optional<std::string> current = start;
  std::size_t steps = 0;
  const std::size_t max_depth = workspace_.config().dag.max_ancestry_depth;
  while (current.has_value() && steps <= max_depth && seen.insert(*current).second) {
    const auto record = graph.get(*current);
    if (!record.has_value()) {
      break;
    }
    const auto source = tag_value(record->tags, "source");
    if (record->id == start || source.has_value()) {
      out.push_back(Citation{record->id, source, workspace_.resolver().tiers_holding(record->id)});
    }
    current = record->parent;
    ++steps;
  }
  return CiteResult::success(std::move(out));
}

common::Result<std::vector<dag::Record>> Engine::search(const std::string &query,
                                                        const std::size_t limit) {
  using SearchResult = common::Result<std::vector<dag::Record>>;
  std::vector<std::string> words;
  std::istringstream stream(query);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  if (words.empty()) {
    return SearchResult::failure(common::ErrorCode::InvalidArgument, "search query is empty");
  }
  const std::size_t capped = std::min(limit, workspace_.config().dag.max_trace_limit);
  return SearchResult::success(workspace_.graph().search(words, capped));
}

common::Result<SnapshotMeta> Engine::snapshot_meta(const std::string &id) const {
  const auto record = workspace_.graph().get(id);
  if (!record.has_value()) {
    return common::Result<SnapshotMeta>::failure(common::ErrorCode::NotFound,
                                                 "unknown record " + id);
  }
  SnapshotMeta meta;
  meta.record_id = record->id;
  meta.cid = record->cid;
  meta.lobe = record->lobe;
  meta.key = record->key;
  meta.parent = record->parent;
  meta.created_at = record->created_at;
  meta.tags = record->tags;
  return common::Result<SnapshotMeta>::success(std::move(meta));
}

// ---------------------------------------------------------------------------
// Audit and integrity
// ---------------------------------------------------------------------------

common::Result<std::vector<audit::AuditEntry>>
Engine::audit_query(const audit::AuditFilter &filter) const {
  return workspace_.audit().query(filter);
}

audit::AuditStats Engine::audit_stats() const { return workspace_.audit().stats(); }

common::Result<audit::ChainVerification> Engine::verify_audit_chain() const {
  return workspace_.audit().verify_chain();
}

IntegrityReport Engine::integrity_check() {
  IntegrityReport report;
  report.fast_index_present = workspace_.fast_index().health_check();
  report.blob_store_present = workspace_.blobs().health_check();
  report.graph_present = workspace_.graph().health_check();
  report.audit_log_present = workspace_.audit().health_check();
  return report;
}

RecordVerification Engine::verify_records(const std::size_t limit) {
  RecordVerification out;
  auto &graph = workspace_.graph();
  for (const auto &id : graph.ids(limit)) {
    ++out.checked;
    const auto record = graph.get(id);
    if (!record.has_value() || !dag::verify_record(*record)) {
      out.failures.push_back(RecordFailure{id, common::ErrorCode::IntegrityMismatch,
                                           "stored fields do not reproduce the record id"});
      continue;
    }
    if (const auto agreed = workspace_.resolver().check_agreement(id); !agreed.ok()) {
      out.failures.push_back(RecordFailure{id, agreed.code(), agreed.error()});
    }
  }
  if (!out.ok()) {
    observability::record_error("integrity", std::to_string(out.failures.size()) +
                                                 " record(s) failed verification");
  }
  return out;
}

common::Status Engine::audit_mutation(const audit::EntryKind kind, const std::string &action,
                                      const std::string &outcome,
                                      const std::optional<std::string> &path,
                                      const std::optional<std::string> &record_id,
                                      const std::string &detail) {
  audit::AuditEntry entry;
  entry.kind = kind;
  entry.action = action;
  entry.outcome = outcome;
  entry.path = path;
  entry.record_id = record_id;
  entry.detail = detail;
  const auto stored = workspace_.audit().append(std::move(entry));
  if (!stored.ok()) {
    observability::record_error("audit", stored.error());
    return stored.status();
  }
  return common::Status::success();
}

} // namespace engram::runtime
