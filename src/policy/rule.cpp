#include "engram/policy/rule.hpp"

#include "engram/common/digest.hpp"
#include "engram/common/fs.hpp"
#include "engram/common/toml.hpp"

#include <algorithm>
#include <cctype>

namespace engram::policy {

namespace {

// UTF-8 encodings of U+200B, U+200C, U+200D, U+2060 and U+FEFF.
constexpr const char *ZERO_WIDTH[] = {"\xE2\x80\x8B", "\xE2\x80\x8C", "\xE2\x80\x8D",
                                      "\xE2\x81\xA0", "\xEF\xBB\xBF"};

bool zero_width_at(const std::string &text, std::size_t pos) {
  for (const char *sequence : ZERO_WIDTH) {
    if (text.compare(pos, 3, sequence) == 0) {
      return true;
    }
  }
  return false;
}

common::Result<Rule> parse_rule(const common::TomlDocument &doc, const std::size_t index) {
  const std::string prefix = "rules." + std::to_string(index) + ".";
  Rule rule;
  rule.id = doc.get_string(prefix + "id");
  if (common::trim(rule.id).empty()) {
    return common::Result<Rule>::failure(common::ErrorCode::InvalidArgument,
                                         "rule #" + std::to_string(index) + " has no id");
  }
  const std::string where = "rule '" + rule.id + "'";
  rule.group = doc.get_string(prefix + "group", rule.id);

  const std::string severity = doc.get_string(prefix + "severity", "medium");
  const auto parsed_severity = parse_severity(severity);
  if (!parsed_severity.has_value()) {
    return common::Result<Rule>::failure(common::ErrorCode::InvalidArgument,
                                         where + ": invalid severity '" + severity + "'");
  }
  rule.severity = *parsed_severity;

  const std::string effect = common::to_lower(doc.get_string(prefix + "effect", "violation"));
  if (effect == "violation" || effect == "deny") {
    rule.effect = RuleEffect::Violation;
  } else if (effect == "allow") {
    rule.effect = RuleEffect::Allow;
  } else if (effect == "allow_with_constraints") {
    rule.effect = RuleEffect::AllowWithConstraints;
  } else {
    return common::Result<Rule>::failure(common::ErrorCode::InvalidArgument,
                                         where + ": invalid effect '" + effect + "'");
  }
  // A severity of none marks an allowlist entry.
  if (rule.effect == RuleEffect::Violation && rule.severity == Severity::None) {
    rule.effect = RuleEffect::Allow;
  }

  for (const auto &category : doc.get_string_array(prefix + "applies_to")) {
    const auto parsed = parse_intent_category(category);
    if (!parsed.has_value()) {
      return common::Result<Rule>::failure(common::ErrorCode::InvalidArgument,
                                           where + ": unknown category '" + category + "'");
    }
    rule.applies_to.push_back(*parsed);
  }

  for (const auto &phrase : doc.get_string_array(prefix + "matches_any")) {
    if (auto normalized = normalize_for_rules(phrase); !normalized.empty()) {
      rule.matches_any.push_back(std::move(normalized));
    }
  }
  for (const auto &keyword : doc.get_string_array(prefix + "contains_any")) {
    if (auto normalized = normalize_for_rules(keyword); !normalized.empty()) {
      rule.contains_any.push_back(std::move(normalized));
    }
  }
  if (rule.matches_any.empty() && rule.contains_any.empty()) {
    return common::Result<Rule>::failure(common::ErrorCode::InvalidArgument,
                                         where + ": needs matches_any or contains_any");
  }

  for (const auto &constraint : doc.get_string_array(prefix + "constraints")) {
    if (auto trimmed = common::trim(constraint); !trimmed.empty()) {
      rule.constraints.push_back(std::move(trimmed));
    }
  }

  if (doc.has(prefix + "violation_code")) {
    rule.violation_code = doc.get_string(prefix + "violation_code");
  }
  if (doc.has(prefix + "action_suggestion")) {
    rule.action_suggestion = doc.get_string(prefix + "action_suggestion");
  }
  return common::Result<Rule>::success(std::move(rule));
}

} // namespace

std::optional<Severity> parse_severity(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "none") {
    return Severity::None;
  }
  if (normalized == "low") {
    return Severity::Low;
  }
  if (normalized == "medium") {
    return Severity::Medium;
  }
  if (normalized == "high") {
    return Severity::High;
  }
  if (normalized == "critical") {
    return Severity::Critical;
  }
  return std::nullopt;
}

std::string severity_name(const Severity severity) {
  switch (severity) {
  case Severity::None:
    return "none";
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "none";
}

IntentCategory classify_intent(const std::string &purpose) {
  const std::string normalized = common::to_lower(common::trim(purpose));
  if (normalized == "chat_message" || normalized == "chat") {
    return IntentCategory::ChatMessage;
  }
  if (normalized == "memory_storage" || normalized == "remember" || normalized == "write") {
    return IntentCategory::MemoryStorage;
  }
  if (normalized == "metadata_access" || normalized == "stats") {
    return IntentCategory::MetadataAccess;
  }
  if (normalized == "reflection_update") {
    return IntentCategory::ReflectionUpdate;
  }
  if (normalized == "path_append" || normalized == "replay_append") {
    return IntentCategory::PathAppend;
  }
  return IntentCategory::Other;
}

std::string intent_category_name(const IntentCategory category) {
  switch (category) {
  case IntentCategory::ChatMessage:
    return "chat_message";
  case IntentCategory::MemoryStorage:
    return "memory_storage";
  case IntentCategory::MetadataAccess:
    return "metadata_access";
  case IntentCategory::ReflectionUpdate:
    return "reflection_update";
  case IntentCategory::PathAppend:
    return "path_append";
  case IntentCategory::Other:
    return "other";
  }
  return "other";
}

std::optional<IntentCategory> parse_intent_category(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "other") {
    return IntentCategory::Other;
  }
  const IntentCategory category = classify_intent(normalized);
  if (category == IntentCategory::Other) {
    return std::nullopt;
  }
  return category;
}

bool Rule::applies(const IntentCategory category) const {
  return applies_to.empty() ||
         std::find(applies_to.begin(), applies_to.end(), category) != applies_to.end();
}

bool Rule::matches(const std::string &normalized_text) const {
  for (const auto &phrase : matches_any) {
    if (normalized_text.find(phrase) != std::string::npos) {
      return true;
    }
  }
  for (const auto &keyword : contains_any) {
    if (normalized_text.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

int Rule::specificity() const {
  if (!matches_any.empty()) {
    return 2;
  }
  return contains_any.empty() ? 0 : 1;
}

std::string normalize_for_rules(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto uch = static_cast<unsigned char>(text[i]);
    if (uch >= 0x80) {
      if (zero_width_at(text, i)) {
        i += 2;
        continue;
      }
    } else if (std::isspace(uch) != 0) {
      pending_space = true;
      continue;
    } else if (std::iscntrl(uch) != 0) {
      continue;
    }

    if (pending_space && !out.empty()) {
      out.push_back(' ');
    }
    pending_space = false;
    out.push_back(static_cast<char>(uch < 0x80 ? std::tolower(uch) : uch));
  }
  return out;
}

common::Result<RuleSet> parse_rule_set(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<RuleSet>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  RuleSet set;
  set.name = doc.get_string("name");
  set.version = doc.get_string("version");
  set.description = doc.get_string("description");
  if (common::trim(set.name).empty() || common::trim(set.version).empty()) {
    return common::Result<RuleSet>::failure(common::ErrorCode::InvalidArgument,
                                            "rule set needs a name and a version");
  }

  const std::string threshold = doc.get_string("block_threshold", "high");
  const auto parsed_threshold = parse_severity(threshold);
  if (!parsed_threshold.has_value() || *parsed_threshold == Severity::None) {
    return common::Result<RuleSet>::failure(common::ErrorCode::InvalidArgument,
                                            "invalid block_threshold '" + threshold + "'");
  }
  set.block_threshold = *parsed_threshold;

  const std::size_t count = doc.table_array_size("rules");
  set.rules.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto rule = parse_rule(doc, i);
    if (!rule.ok()) {
      return common::Result<RuleSet>::failure(rule.status());
    }
    set.rules.push_back(std::move(rule.value()));
  }

  set.digest = common::sha256_hex(toml_text);
  return common::Result<RuleSet>::success(std::move(set));
}

} // namespace engram::policy
