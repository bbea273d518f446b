#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/config/config.hpp"

void register_config_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace cfg = engram::config;
  namespace common = engram::common;
  using engram::testing::EnvGuard;
  using engram::testing::TempWorkspace;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.storage.max_object_bytes == 16ULL * 1024 * 1024,
                             "max_object_bytes default");
                     require(config.storage.dedupe_exact, "dedupe default");
                     require(config.dag.canonical_path == "cortex", "canonical default");
                     require(config.dag.default_seed_lobe == "chat", "seed lobe default");
                     require(config.dag.max_ancestry_depth == 10000, "ancestry default");
                     require(config.policy.locked, "policy locked by default");
                     require(config.recall.default_prefer == "auto", "prefer default");
                     require(config.audit.preview_len == 120, "preview default");
                     require(cfg::validate_config(config).ok(), "defaults should validate");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     auto parsed = cfg::parse_config("[storage]\n"
                                                     "dedupe_exact = false\n"
                                                     "[dag]\n"
                                                     "max_trace_limit = 25\n"
                                                     "[recall]\n"
                                                     "default_prefer = \"Blob\"\n"
                                                     "[policy]\n"
                                                     "block_threshold = \"critical\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(!config.storage.dedupe_exact, "dedupe override");
                     require(config.dag.max_trace_limit == 25, "trace limit override");
                     require(config.recall.default_prefer == "blob", "prefer lower-cased");
                     require(config.policy.block_threshold == "critical", "threshold override");
                     require(config.dag.canonical_path == "cortex", "untouched keys keep defaults");
                   }});

  tests.push_back({"config_validate_rejects_bad_values", [] {
                     cfg::Config config;
                     config.recall.default_prefer = "nearest";
                     require(cfg::validate_config(config).code() ==
                                 common::ErrorCode::InvalidArgument,
                             "unknown prefer should be rejected");

                     config = cfg::Config{};
                     config.dag.max_trace_limit = 0;
                     require(!cfg::validate_config(config).ok(), "zero trace limit rejected");

                     config = cfg::Config{};
                     config.policy.block_threshold = "severe";
                     require(!cfg::validate_config(config).ok(), "bad severity rejected");

                     config = cfg::Config{};
                     config.dag.canonical_path = "***";
                     require(!cfg::validate_config(config).ok(), "bad canonical path rejected");

                     config = cfg::Config{};
                     config.audit.enabled = false;
                     require(!cfg::validate_config(config).ok(), "audit cannot be disabled");

                     config = cfg::Config{};
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown backend rejected");
                   }});

  tests.push_back({"config_validate_warns_on_unnormalized_canonical", [] {
                     cfg::Config config;
                     config.dag.canonical_path = "Main Line";
                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(!warnings.value().empty(), "expected a normalization warning");
                   }});

  tests.push_back({"config_save_load_roundtrip", [] {
                     TempWorkspace temp;
                     EnvGuard config_env("ENGRAM_CONFIG_PATH", std::nullopt);
                     EnvGuard locked_env("ENGRAM_POLICY_LOCKED", std::nullopt);
                     EnvGuard backend_env("ENGRAM_OBSERVABILITY", std::nullopt);

                     cfg::Config config;
                     config.dag.default_seed_lobe = "journal";
                     config.storage.max_object_bytes = 4096;
                     config.policy.locked = false;
                     require(cfg::save_config(temp.path(), config).ok(), "save failed");

                     auto loaded = cfg::load_config(temp.path());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().dag.default_seed_lobe == "journal", "seed lobe lost");
                     require(loaded.value().storage.max_object_bytes == 4096, "max bytes lost");
                     require(!loaded.value().policy.locked, "locked flag lost");
                   }});

  tests.push_back({"config_missing_file_uses_defaults", [] {
                     TempWorkspace temp;
                     EnvGuard config_env("ENGRAM_CONFIG_PATH", std::nullopt);
                     EnvGuard backend_env("ENGRAM_OBSERVABILITY", std::nullopt);
                     auto loaded = cfg::load_config(temp.path());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().observability.backend == "log", "default backend");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     TempWorkspace temp;
                     EnvGuard config_env("ENGRAM_CONFIG_PATH", std::nullopt);
                     EnvGuard backend_env("ENGRAM_OBSERVABILITY", "none");
                     EnvGuard locked_env("ENGRAM_POLICY_LOCKED", "false");
                     auto loaded = cfg::load_config(temp.path());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().observability.backend == "none", "backend override");
                     require(!loaded.value().policy.locked, "locked override");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     TempWorkspace temp;
                     temp.create_file("elsewhere.toml", "[dag]\ncanonical_path = \"trunk\"\n");
                     EnvGuard config_env("ENGRAM_CONFIG_PATH",
                                         (temp.path() / "elsewhere.toml").string());
                     require(cfg::config_path(temp.path()) == temp.path() / "elsewhere.toml",
                             "config path should follow env");
                     auto loaded = cfg::load_config(temp.path() / "root");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().dag.canonical_path == "trunk", "env config not read");
                   }});

  tests.push_back({"config_resolve_root_order", [] {
                     EnvGuard root_env("ENGRAM_ROOT", "/tmp/engram-env-root");
                     auto explicit_root = cfg::resolve_root(std::filesystem::path("/tmp/explicit"));
                     require(explicit_root.ok(), explicit_root.error());
                     require(explicit_root.value() == "/tmp/explicit", "explicit root wins");
                     auto env_root = cfg::resolve_root();
                     require(env_root.ok(), env_root.error());
                     require(env_root.value() == "/tmp/engram-env-root", "env root used");
                   }});

  tests.push_back({"config_rejects_malformed_toml", [] {
                     TempWorkspace temp;
                     EnvGuard config_env("ENGRAM_CONFIG_PATH", std::nullopt);
                     temp.create_file("config.toml", "[storage\nmax_object_bytes = 1\n");
                     const auto loaded = cfg::load_config(temp.path());
                     require(!loaded.ok(), "malformed TOML should fail");
                   }});
}
