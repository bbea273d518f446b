#pragma once

#include "engram/audit/audit_log.hpp"
#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"
#include "engram/dag/graph_store.hpp"
#include "engram/policy/canon.hpp"
#include "engram/policy/engine.hpp"
#include "engram/recall/resolver.hpp"
#include "engram/runtime/writer_lock.hpp"
#include "engram/store/blob_store.hpp"
#include "engram/store/fast_index.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram::runtime {

struct WorkspaceOptions {
  std::optional<std::filesystem::path> root;
  std::optional<config::Config> config;
};

/// Everything that lives under one workspace root. Holding a Workspace means
/// holding the root's writer lock; the lock is released last on destruction.
class Workspace {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  Workspace(Passkey, std::filesystem::path root, config::Config config);

  [[nodiscard]] static common::Result<std::unique_ptr<Workspace>>
  open(const WorkspaceOptions &options = {});

  Workspace(const Workspace &) = delete;
  Workspace &operator=(const Workspace &) = delete;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::vector<std::string> &config_warnings() const { return warnings_; }
  [[nodiscard]] const std::filesystem::path &ruleset_path() const { return ruleset_path_; }

  [[nodiscard]] store::FastIndex &fast_index() { return *fast_; }
  [[nodiscard]] store::BlobStore &blobs() { return *blobs_; }
  [[nodiscard]] dag::GraphStore &graph() { return *graph_; }
  [[nodiscard]] audit::AuditLog &audit() { return *audit_; }
  [[nodiscard]] const policy::PolicyEngine &policy() const { return *policy_; }
  [[nodiscard]] const recall::Resolver &resolver() const { return *resolver_; }

private:
  std::filesystem::path root_;
  config::Config config_;
  std::vector<std::string> warnings_;
  std::filesystem::path ruleset_path_;

  std::unique_ptr<WriterLock> lock_;
  std::unique_ptr<store::FastIndex> fast_;
  std::unique_ptr<store::BlobStore> blobs_;
  std::unique_ptr<dag::GraphStore> graph_;
  std::unique_ptr<audit::AuditLog> audit_;
  std::unique_ptr<policy::PolicyEngine> policy_;
  std::unique_ptr<recall::Resolver> resolver_;
};

} // namespace engram::runtime
