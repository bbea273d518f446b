#include "engram/runtime/workspace.hpp"

#include "engram/common/fs.hpp"
#include "engram/config/config.hpp"
#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"

namespace engram::runtime {

namespace {

using WorkspaceResult = common::Result<std::unique_ptr<Workspace>>;

constexpr const char *LOCK_FILE = ".engram.lock";

} // namespace

Workspace::Workspace(Passkey, std::filesystem::path root, config::Config config)
    : root_(std::move(root)), config_(std::move(config)) {}

WorkspaceResult Workspace::open(const WorkspaceOptions &options) {
  auto root = config::resolve_root(options.root);
  if (!root.ok()) {
    return WorkspaceResult::failure(root.status());
  }

  config::Config cfg;
  if (options.config.has_value()) {
    cfg = *options.config;
  } else {
    auto loaded = config::load_config(root.value());
    if (!loaded.ok()) {
      return WorkspaceResult::failure(loaded.status());
    }
    cfg = std::move(loaded.value());
  }
  auto warnings = config::validate_config(cfg);
  if (!warnings.ok()) {
    return WorkspaceResult::failure(warnings.status());
  }

  auto ws = std::make_unique<Workspace>(Passkey{}, root.value(), std::move(cfg));
  ws->warnings_ = std::move(warnings.value());

  ws->lock_ = std::make_unique<WriterLock>(ws->root_ / LOCK_FILE);
  if (auto locked = ws->lock_->acquire(); !locked.ok()) {
    return WorkspaceResult::failure(locked);
  }

  observability::set_global_observer(observability::create_observer(ws->config_));
  for (const auto &warning : ws->warnings_) {
    observability::record_error("config", warning);
  }

  for (const char *dir : {"cache", "archive", "dag", "logbook", "contracts"}) {
    if (auto made = common::ensure_dir(ws->root_ / dir); !made.ok()) {
      return WorkspaceResult::failure(common::ErrorCode::StorageUnavailable, made.error());
    }
  }

  const auto &storage = ws->config_.storage;
  auto fast = store::FastIndex::open(ws->root_ / "cache" / "index.db", storage.busy_timeout_ms);
  if (!fast.ok()) {
    return WorkspaceResult::failure(fast.status());
  }
  ws->fast_ = std::move(fast.value());

  ws->blobs_ = std::make_unique<store::BlobStore>(ws->root_ / "archive", storage.max_object_bytes);

  auto graph = dag::GraphStore::open(ws->root_ / "dag" / "graph.db", storage.busy_timeout_ms);
  if (!graph.ok()) {
    return WorkspaceResult::failure(graph.status());
  }
  ws->graph_ = std::move(graph.value());

  auto audit_log = audit::AuditLog::open(ws->root_ / "logbook", ws->config_.audit.preview_len);
  if (!audit_log.ok()) {
    return WorkspaceResult::failure(audit_log.status());
  }
  ws->audit_ = std::move(audit_log.value());

  const auto &policy_cfg = ws->config_.policy;
  auto rules = policy::load_verified_rule_set(ws->root_ / "contracts", policy_cfg.ruleset_file,
                                              policy_cfg.locked);
  if (!rules.ok()) {
    return WorkspaceResult::failure(rules.status());
  }
  ws->ruleset_path_ = rules.value().path;

  if (rules.value().restored) {
    audit::AuditEntry entry;
    entry.kind = audit::EntryKind::Store;
    entry.action = "ruleset_restored";
    entry.outcome = "ok";
    entry.detail = ws->ruleset_path_.string();
    entry.ruleset_digest = rules.value().rule_set.digest;
    auto appended = ws->audit_->append(std::move(entry));
    if (!appended.ok()) {
      return WorkspaceResult::failure(appended.status());
    }
    observability::record_error("policy", "rule set artifact was modified and has been restored");
  }

  policy::PolicyOptions policy_options;
  policy_options.enabled = policy_cfg.enabled;
  if (!common::trim(policy_cfg.block_threshold).empty()) {
    policy_options.block_threshold = policy::parse_severity(policy_cfg.block_threshold);
  }
  ws->policy_ = std::make_unique<policy::PolicyEngine>(std::move(rules.value().rule_set),
                                                       policy_options);

  ws->resolver_ = std::make_unique<recall::Resolver>(*ws->fast_, *ws->blobs_, *ws->graph_,
                                                     ws->config_.recall.verify_tiers);

  return WorkspaceResult::success(std::move(ws));
}

} // namespace engram::runtime
