#pragma once

#include "engram/policy/rule.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace engram::policy {

enum class Outcome { Allow, AllowWithConstraints, Block };
enum class Risk { Low, Medium, High };

[[nodiscard]] std::string outcome_name(Outcome outcome);
[[nodiscard]] std::string risk_name(Risk risk);

struct Decision {
  IntentCategory category = IntentCategory::Other;
  Outcome outcome = Outcome::Allow;
  bool passed = true;
  Risk risk = Risk::Low;
  std::set<std::string> constraints;
  bool requires_escalation = false;
  std::string reason;
  std::optional<std::string> violation_code;
  std::optional<std::string> action_suggestion;
  std::vector<std::string> violated_rules;
  std::string ruleset_name;
  std::string ruleset_version;
  std::string ruleset_digest;
  std::string timestamp;

  bool operator==(const Decision &) const = default;
};

[[nodiscard]] std::string decision_to_json(const Decision &decision);

struct PolicyOptions {
  bool enabled = true;
  std::optional<Severity> block_threshold;
};

class PolicyEngine {
public:
  PolicyEngine(RuleSet rule_set, PolicyOptions options);

  [[nodiscard]] Decision evaluate(const std::string &text, const std::string &purpose) const;

  [[nodiscard]] const RuleSet &rule_set() const { return rule_set_; }
  [[nodiscard]] Severity block_threshold() const { return block_threshold_; }
  [[nodiscard]] bool enabled() const { return options_.enabled; }

private:
  [[nodiscard]] Decision base_decision(IntentCategory category) const;

  RuleSet rule_set_;
  PolicyOptions options_;
  Severity block_threshold_;
};

} // namespace engram::policy
