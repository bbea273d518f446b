#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace engram::config {

struct StorageConfig {
  std::uint64_t max_object_bytes = 16ULL * 1024 * 1024;
  bool dedupe_exact = true;
  std::uint32_t busy_timeout_ms = 5000;
};

struct DagConfig {
  std::string canonical_path = "cortex";
  std::string default_seed_lobe = "chat";
  std::string default_write_lobe = "notes";
  std::size_t max_ancestry_depth = 10'000;
  std::size_t max_trace_limit = 1'000;
};

struct PolicyConfig {
  bool enabled = true;
  bool locked = true;
  std::string ruleset_file = "nonviolence.toml";
  // Empty means the threshold declared by the rule set itself.
  std::string block_threshold;
};

struct RecallConfig {
  std::string default_prefer = "auto";
  bool verify_tiers = true;
};

struct AuditConfig {
  bool enabled = true;
  std::size_t preview_len = 120;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  DagConfig dag;
  PolicyConfig policy;
  RecallConfig recall;
  AuditConfig audit;
  ObservabilityConfig observability;
};

} // namespace engram::config
