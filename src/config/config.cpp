#include "engram/config/config.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/toml.hpp"
#include "engram/dag/path_name.hpp"
#include "engram/policy/rule.hpp"

#include <cstdlib>
#include <sstream>

namespace engram::config {

namespace {

constexpr const char *ROOT_FOLDER = ".engram";
constexpr const char *CONFIG_FILENAME = "config.toml";

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_known_prefer(const std::string &prefer) {
  static const char *const known[] = {"auto", "fast", "hot", "blob", "archive", "graph", "dag"};
  for (const char *candidate : known) {
    if (prefer == candidate) {
      return true;
    }
  }
  return false;
}

bool is_known_backend(const std::string &backend) {
  std::stringstream stream(backend);
  std::string part;
  bool any = false;
  while (std::getline(stream, part, ',')) {
    const std::string p = common::to_lower(common::trim(part));
    if (p != "log" && p != "none" && p != "noop") {
      return false;
    }
    any = true;
  }
  return any || common::trim(backend).empty();
}

} // namespace

common::Result<std::filesystem::path>
resolve_root(const std::optional<std::filesystem::path> &explicit_root) {
  if (explicit_root.has_value() && !explicit_root->empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(explicit_root->string())));
  }
  if (const auto env = env_value("ENGRAM_ROOT"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / ROOT_FOLDER);
}

std::filesystem::path config_path(const std::filesystem::path &root) {
  if (const auto env = env_value("ENGRAM_CONFIG_PATH"); env.has_value()) {
    return std::filesystem::path(common::expand_path(*env));
  }
  return root / CONFIG_FILENAME;
}

void apply_env_overrides(Config &config) {
  if (const auto backend = env_value("ENGRAM_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
  if (const auto locked = env_value("ENGRAM_POLICY_LOCKED"); locked.has_value()) {
    const std::string normalized = common::to_lower(common::trim(*locked));
    if (normalized == "0" || normalized == "false" || normalized == "no") {
      config.policy.locked = false;
    } else if (normalized == "1" || normalized == "true" || normalized == "yes") {
      config.policy.locked = true;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;

  config.storage.max_object_bytes =
      doc.get_u64("storage.max_object_bytes", config.storage.max_object_bytes);
  config.storage.dedupe_exact = doc.get_bool("storage.dedupe_exact", config.storage.dedupe_exact);
  config.storage.busy_timeout_ms = static_cast<std::uint32_t>(
      doc.get_u64("storage.busy_timeout_ms", config.storage.busy_timeout_ms));

  config.dag.canonical_path = doc.get_string("dag.canonical_path", config.dag.canonical_path);
  config.dag.default_seed_lobe =
      doc.get_string("dag.default_seed_lobe", config.dag.default_seed_lobe);
  config.dag.default_write_lobe =
      doc.get_string("dag.default_write_lobe", config.dag.default_write_lobe);
  config.dag.max_ancestry_depth = static_cast<std::size_t>(
      doc.get_u64("dag.max_ancestry_depth", config.dag.max_ancestry_depth));
  config.dag.max_trace_limit =
      static_cast<std::size_t>(doc.get_u64("dag.max_trace_limit", config.dag.max_trace_limit));

  config.policy.enabled = doc.get_bool("policy.enabled", config.policy.enabled);
  config.policy.locked = doc.get_bool("policy.locked", config.policy.locked);
  config.policy.ruleset_file = doc.get_string("policy.ruleset_file", config.policy.ruleset_file);
  config.policy.block_threshold =
      doc.get_string("policy.block_threshold", config.policy.block_threshold);

  config.recall.default_prefer =
      common::to_lower(doc.get_string("recall.default_prefer", config.recall.default_prefer));
  config.recall.verify_tiers = doc.get_bool("recall.verify_tiers", config.recall.verify_tiers);

  config.audit.enabled = doc.get_bool("audit.enabled", config.audit.enabled);
  config.audit.preview_len =
      static_cast<std::size_t>(doc.get_u64("audit.preview_len", config.audit.preview_len));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &root) {
  const std::filesystem::path path = config_path(root);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.status());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }
  Config config = parsed.value();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const std::filesystem::path &root, const Config &config) {
  std::ostringstream file;
  file << "[storage]\n";
  file << "max_object_bytes = " << config.storage.max_object_bytes << "\n";
  file << "dedupe_exact = " << bool_to_toml(config.storage.dedupe_exact) << "\n";
  file << "busy_timeout_ms = " << config.storage.busy_timeout_ms << "\n\n";

  file << "[dag]\n";
  file << "canonical_path = " << common::quote_toml_string(config.dag.canonical_path) << "\n";
  file << "default_seed_lobe = " << common::quote_toml_string(config.dag.default_seed_lobe)
       << "\n";
  file << "default_write_lobe = " << common::quote_toml_string(config.dag.default_write_lobe)
       << "\n";
  file << "max_ancestry_depth = " << config.dag.max_ancestry_depth << "\n";
  file << "max_trace_limit = " << config.dag.max_trace_limit << "\n\n";

  file << "[policy]\n";
  file << "enabled = " << bool_to_toml(config.policy.enabled) << "\n";
  file << "locked = " << bool_to_toml(config.policy.locked) << "\n";
  file << "ruleset_file = " << common::quote_toml_string(config.policy.ruleset_file) << "\n";
  file << "block_threshold = " << common::quote_toml_string(config.policy.block_threshold)
       << "\n\n";

  file << "[recall]\n";
  file << "default_prefer = " << common::quote_toml_string(config.recall.default_prefer) << "\n";
  file << "verify_tiers = " << bool_to_toml(config.recall.verify_tiers) << "\n\n";

  file << "[audit]\n";
  file << "enabled = " << bool_to_toml(config.audit.enabled) << "\n";
  file << "preview_len = " << config.audit.preview_len << "\n\n";

  file << "[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  const auto ensured = common::ensure_dir(root);
  if (!ensured.ok()) {
    return ensured.status();
  }
  return common::write_file_atomic(config_path(root), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.storage.max_object_bytes == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "storage.max_object_bytes must be greater than zero");
  }
  if (config.storage.busy_timeout_ms == 0) {
    warnings.push_back("storage.busy_timeout_ms = 0 makes concurrent readers fail fast");
  }

  const auto canonical = dag::normalize_path_name(config.dag.canonical_path);
  if (!canonical.ok()) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "dag.canonical_path is not a valid path name: " +
                                 config.dag.canonical_path);
  }
  if (canonical.value() != config.dag.canonical_path) {
    warnings.push_back("dag.canonical_path will be used as '" + canonical.value() + "'");
  }
  if (common::trim(config.dag.default_seed_lobe).empty() ||
      common::trim(config.dag.default_write_lobe).empty()) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "dag default lobes must not be empty");
  }
  if (config.dag.max_ancestry_depth == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "dag.max_ancestry_depth must be greater than zero");
  }
  if (config.dag.max_trace_limit == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "dag.max_trace_limit must be greater than zero");
  }

  if (common::trim(config.policy.ruleset_file).empty() ||
      config.policy.ruleset_file.find('/') != std::string::npos ||
      config.policy.ruleset_file.find("..") != std::string::npos) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "policy.ruleset_file must be a plain file name");
  }
  if (!common::trim(config.policy.block_threshold).empty() &&
      !policy::parse_severity(config.policy.block_threshold).has_value()) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid policy.block_threshold: " + config.policy.block_threshold);
  }
  if (!config.policy.enabled) {
    warnings.push_back("policy.enabled = false: every write is allowed");
  }

  if (!is_known_prefer(common::to_lower(config.recall.default_prefer))) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid recall.default_prefer: " + config.recall.default_prefer);
  }

  if (!config.audit.enabled) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "audit.enabled = false is not supported: the audit log cannot be "
                             "disabled");
  }
  if (config.audit.preview_len == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "audit.preview_len must be greater than zero");
  }

  if (!is_known_backend(config.observability.backend)) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid observability.backend: " + config.observability.backend);
  }

  return Warnings::success(std::move(warnings));
}

} // namespace engram::config
