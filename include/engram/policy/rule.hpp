#pragma once

#include "engram/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace engram::policy {

enum class Severity { None, Low, Medium, High, Critical };

[[nodiscard]] std::optional<Severity> parse_severity(const std::string &value);
[[nodiscard]] std::string severity_name(Severity severity);

enum class RuleEffect { Violation, Allow, AllowWithConstraints };

enum class IntentCategory {
  ChatMessage,
  MemoryStorage,
  MetadataAccess,
  ReflectionUpdate,
  PathAppend,
  Other,
};

[[nodiscard]] IntentCategory classify_intent(const std::string &purpose);
[[nodiscard]] std::string intent_category_name(IntentCategory category);
[[nodiscard]] std::optional<IntentCategory> parse_intent_category(const std::string &name);

struct Rule {
  std::string id;
  std::string group;
  Severity severity = Severity::Medium;
  RuleEffect effect = RuleEffect::Violation;
  std::vector<IntentCategory> applies_to;
  std::vector<std::string> matches_any;
  std::vector<std::string> contains_any;
  std::vector<std::string> constraints;
  std::optional<std::string> violation_code;
  std::optional<std::string> action_suggestion;

  [[nodiscard]] bool applies(IntentCategory category) const;
  [[nodiscard]] bool matches(const std::string &normalized_text) const;
  [[nodiscard]] int specificity() const;
};

struct RuleSet {
  std::string name;
  std::string version;
  std::string description;
  Severity block_threshold = Severity::High;
  std::vector<Rule> rules;
  std::string digest;
};

/// Drops control characters and zero-width code points, lower-cases ASCII
/// and collapses whitespace runs to one space.
[[nodiscard]] std::string normalize_for_rules(const std::string &text);

[[nodiscard]] common::Result<RuleSet> parse_rule_set(const std::string &toml_text);

} // namespace engram::policy
