#include "engram/policy/engine.hpp"

#include "engram/common/json_util.hpp"

#include <algorithm>

namespace engram::policy {

namespace {

constexpr const char *FALLBACK_CONSTRAINT = "review_content";

std::string optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "null";
}

} // namespace

std::string outcome_name(const Outcome outcome) {
  switch (outcome) {
  case Outcome::Allow:
    return "allow";
  case Outcome::AllowWithConstraints:
    return "allow_with_constraints";
  case Outcome::Block:
    return "block";
  }
  return "allow";
}

std::string risk_name(const Risk risk) {
  switch (risk) {
  case Risk::Low:
    return "low";
  case Risk::Medium:
    return "medium";
  case Risk::High:
    return "high";
  }
  return "low";
}

std::string decision_to_json(const Decision &decision) {
  common::JsonWriter writer;
  writer.string("category", intent_category_name(decision.category))
      .string("outcome", outcome_name(decision.outcome))
      .boolean("passed", decision.passed)
      .string("risk", risk_name(decision.risk))
      .raw("constraints", common::json_string_array(std::vector<std::string>(
                              decision.constraints.begin(), decision.constraints.end())))
      .boolean("requires_escalation", decision.requires_escalation)
      .string("reason", decision.reason)
      .raw("violation_code", optional_json(decision.violation_code))
      .raw("action_suggestion", optional_json(decision.action_suggestion))
      .raw("violated_rules", common::json_string_array(decision.violated_rules))
      .string("ruleset_name", decision.ruleset_name)
      .string("ruleset_version", decision.ruleset_version)
      .string("ruleset_digest", decision.ruleset_digest)
      .string("timestamp", decision.timestamp);
  return writer.str();
}

PolicyEngine::PolicyEngine(RuleSet rule_set, PolicyOptions options)
    : rule_set_(std::move(rule_set)), options_(options),
      block_threshold_(options.block_threshold.value_or(rule_set_.block_threshold)) {}

Decision PolicyEngine::base_decision(const IntentCategory category) const {
  Decision decision;
  decision.category = category;
  decision.ruleset_name = rule_set_.name;
  decision.ruleset_version = rule_set_.version;
  decision.ruleset_digest = rule_set_.digest;
  return decision;
}

Decision PolicyEngine::evaluate(const std::string &text, const std::string &purpose) const {
  const IntentCategory category = classify_intent(purpose);
  Decision decision = base_decision(category);

  if (!options_.enabled) {
    decision.reason = "policy_disabled";
    return decision;
  }

  const std::string normalized = normalize_for_rules(text);

  // Allowlist entries take precedence over every violation.
  for (const auto &rule : rule_set_.rules) {
    if (rule.effect == RuleEffect::Violation || !rule.applies(category) ||
        !rule.matches(normalized)) {
      continue;
    }
    decision.constraints.insert(rule.constraints.begin(), rule.constraints.end());
    decision.outcome =
        decision.constraints.empty() ? Outcome::Allow : Outcome::AllowWithConstraints;
    decision.reason = "matched allowlisted rule '" + rule.id + "'";
    return decision;
  }

  std::vector<const Rule *> violations;
  for (const auto &rule : rule_set_.rules) {
    if (rule.effect == RuleEffect::Violation && rule.applies(category) &&
        rule.matches(normalized)) {
      violations.push_back(&rule);
    }
  }

  if (violations.empty()) {
    decision.reason = "no violations detected";
    return decision;
  }

  // Highest severity wins, then phrase over keyword matches, then rule order.
  const Rule *primary = violations.front();
  std::set<std::string> groups;
  for (const Rule *rule : violations) {
    decision.violated_rules.push_back(rule->id);
    groups.insert(rule->group);
    if (rule->severity > primary->severity ||
        (rule->severity == primary->severity && rule->specificity() > primary->specificity())) {
      primary = rule;
    }
    if (rule->constraints.empty()) {
      decision.constraints.insert(FALLBACK_CONSTRAINT);
    } else {
      decision.constraints.insert(rule->constraints.begin(), rule->constraints.end());
    }
  }

  decision.violation_code = primary->violation_code;
  decision.action_suggestion = primary->action_suggestion;
  decision.reason = "violated " + std::to_string(violations.size()) + " rule(s); primary '" +
                    primary->id + "' (" + severity_name(primary->severity) + ")";

  if (primary->severity >= block_threshold_) {
    decision.outcome = Outcome::Block;
    decision.passed = false;
    decision.risk = Risk::High;
    decision.requires_escalation = true;
    return decision;
  }

  decision.outcome = Outcome::AllowWithConstraints;
  decision.risk = primary->severity == Severity::Low ? Risk::Low : Risk::Medium;
  decision.requires_escalation = groups.size() > 1;
  return decision;
}

} // namespace engram::policy
