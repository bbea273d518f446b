#pragma once

#include "engram/common/result.hpp"
#include "engram/policy/rule.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace engram::policy {

constexpr const char *CANONICAL_RULESET_FILE = "nonviolence.toml";

[[nodiscard]] std::optional<std::string> embedded_rule_set_text(const std::string &file_name);

struct LoadedRuleSet {
  RuleSet rule_set;
  std::filesystem::path path;
  bool seeded = false;
  bool restored = false;
};

/// Reads `<contracts_dir>/<file_name>`. Known artifacts are compared with the
/// embedded copy: in locked mode a modified file is overwritten with it, in
/// unlocked mode local edits are used as they are.
[[nodiscard]] common::Result<LoadedRuleSet>
load_verified_rule_set(const std::filesystem::path &contracts_dir, const std::string &file_name,
                       bool locked);

} // namespace engram::policy
