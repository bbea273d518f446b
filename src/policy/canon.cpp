#include "engram/policy/canon.hpp"

#include "engram/common/digest.hpp"
#include "engram/common/fs.hpp"

namespace engram::policy {

namespace {

constexpr const char *NONVIOLENCE_TOML = R"toml(# Canonical non-violence contract.
name = "nonviolence"
version = "1.2.0"
description = "Blocks content that plans or incites harm; constrains unsafe or hostile requests."
block_threshold = "high"

[[rules]]
id = "allow_safety_help"
group = "allowlist"
effect = "allow"
severity = "none"
matches_any = ["how do i stay safe", "self-defense class", "de-escalate a conflict"]

[[rules]]
id = "allow_fiction"
group = "allowlist"
effect = "allow_with_constraints"
severity = "none"
matches_any = ["in my novel", "for a short story", "in the screenplay"]
constraints = ["keep_fictional_framing"]

[[rules]]
id = "harm_to_others"
group = "violence"
severity = "high"
matches_any = [
  "hurt him", "hurt her", "hurt them", "hurt someone",
  "kill him", "kill her", "kill them", "kill someone",
  "beat him up", "beat her up", "make them suffer",
]
contains_any = ["murder", "kidnap"]
violation_code = "harm.violence"
action_suggestion = "Refuse, de-escalate, and point to support resources."
constraints = ["refuse_harmful_request", "offer_support_resources"]

[[rules]]
id = "self_harm"
group = "self_harm"
severity = "critical"
matches_any = ["hurt myself", "kill myself", "end my life"]
violation_code = "harm.self"
action_suggestion = "Respond with care and share crisis resources."
constraints = ["offer_support_resources"]

[[rules]]
id = "weapons"
group = "violence"
severity = "high"
matches_any = ["build a bomb", "make a bomb", "untraceable gun"]
violation_code = "harm.weapons"
action_suggestion = "Refuse and explain the safety concern."
constraints = ["refuse_harmful_request"]

[[rules]]
id = "bypass_safety"
group = "safety_bypass"
severity = "medium"
matches_any = ["ignore safety", "bypass safety", "disable safety", "skip the safety checks"]
violation_code = "safety.bypass"
action_suggestion = "Keep safeguards in place and propose a safer path to the goal."
constraints = ["suggest_safer_alternative", "request_clarification"]

[[rules]]
id = "pressure"
group = "pressure"
severity = "low"
matches_any = ["ship faster", "cut corners", "at any cost", "no time to test"]
violation_code = "process.pressure"
action_suggestion = "Acknowledge the urgency and suggest a short cooldown before acting."
constraints = ["suggest_cooldown"]

[[rules]]
id = "hostile_language"
group = "tone"
severity = "low"
applies_to = ["chat_message", "memory_storage", "path_append", "reflection_update"]
contains_any = ["idiot", "shut up", "i hate you"]
violation_code = "tone.hostile"
constraints = ["soften_language"]
)toml";

} // namespace

std::optional<std::string> embedded_rule_set_text(const std::string &file_name) {
  if (file_name == CANONICAL_RULESET_FILE) {
    return std::string(NONVIOLENCE_TOML);
  }
  return std::nullopt;
}

common::Result<LoadedRuleSet>
load_verified_rule_set(const std::filesystem::path &contracts_dir, const std::string &file_name,
                       const bool locked) {
  using LoadResult = common::Result<LoadedRuleSet>;
  LoadedRuleSet loaded;
  loaded.path = contracts_dir / file_name;
  const auto embedded = embedded_rule_set_text(file_name);

  std::string text;
  auto on_disk = common::read_file(loaded.path);
  if (on_disk.ok()) {
    text = on_disk.value();
    if (embedded.has_value() && common::sha256_hex(text) != common::sha256_hex(*embedded) &&
        locked) {
      const auto restored = common::write_file_atomic(loaded.path, *embedded);
      if (!restored.ok()) {
        return LoadResult::failure(restored);
      }
      text = *embedded;
      loaded.restored = true;
    }
  } else if (on_disk.code() == common::ErrorCode::NotFound && embedded.has_value()) {
    const auto seeded = common::write_file_atomic(loaded.path, *embedded);
    if (!seeded.ok()) {
      return LoadResult::failure(seeded);
    }
    text = *embedded;
    loaded.seeded = true;
  } else {
    return LoadResult::failure(on_disk.code(), "rule set " + loaded.path.string() + ": " +
                                                   on_disk.error());
  }

  auto parsed = parse_rule_set(text);
  if (!parsed.ok()) {
    return LoadResult::failure(parsed.code(),
                               loaded.path.filename().string() + ": " + parsed.error());
  }
  loaded.rule_set = std::move(parsed.value());
  return LoadResult::success(std::move(loaded));
}

} // namespace engram::policy
